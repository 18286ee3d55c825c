#include "sandbox/go_judge.hpp"
#include <curl/curl.h>
#include <fmt/format.h>
#include <glog/logging.h>
#include <boost/assign.hpp>
#include <map>
#include "common/defer.hpp"
#include "common/exceptions.hpp"

namespace arbiter::sandbox {
using namespace std;
using namespace std::chrono;
using namespace nlohmann;

// clang-format off
static const map<string, execution_status> status_string = boost::assign::map_list_of
    ("Accepted", execution_status::SUCCESS)
    ("Time Limit Exceeded", execution_status::TIME_LIMIT_EXCEEDED)
    ("Memory Limit Exceeded", execution_status::MEMORY_LIMIT_EXCEEDED)
    ("Output Limit Exceeded", execution_status::RUNTIME_ERROR)
    ("Nonzero Exit Status", execution_status::RUNTIME_ERROR)
    ("Signalled", execution_status::RUNTIME_ERROR)
    ("File Error", execution_status::SANDBOX_ERROR)
    ("Internal Error", execution_status::SANDBOX_ERROR);
// clang-format on

static int64_t to_nanoseconds(milliseconds ms) {
    return duration_cast<nanoseconds>(ms).count();
}

execution_status parse_status(const string &status) {
    auto it = status_string.find(status);
    if (it == status_string.end()) return execution_status::SANDBOX_ERROR;
    return it->second;
}

json encode_request(const execution_request &request) {
    json copy_in = json::object();
    for (auto &[name, file] : request.copy_in) {
        if (file.cached())
            copy_in[name] = {{"fileId", file.file_id}};
        else
            copy_in[name] = {{"content", file.content}};
    }

    // 多要一个字节，这样沙箱返回的内容超过上限时可以判断出发生了截断
    json files = json::array({{{"content", request.stdin_content}},
                              {{"name", "stdout"}, {"max", request.stdout_limit + 1}},
                              {{"name", "stderr"}, {"max", request.stderr_limit + 1}}});

    json cmd = {
        {"args", request.args},
        {"env", request.env},
        {"files", files},
        {"cpuLimit", to_nanoseconds(request.cpu_time_limit)},
        {"clockLimit", to_nanoseconds(request.wall_time_limit)},
        {"memoryLimit", request.memory_limit},
        {"stackLimit", request.stack_limit ? request.stack_limit : request.memory_limit},
        {"procLimit", request.proc_limit},
        {"copyIn", copy_in},
        {"copyOut", {"stdout", "stderr"}}};
    if (!request.copy_out_cached.empty())
        cmd["copyOutCached"] = request.copy_out_cached;

    return {{"cmd", json::array({cmd})}};
}

string serialize_request(const execution_request &request) {
    try {
        return encode_request(request).dump(-1, ' ', false, json::error_handler_t::strict);
    } catch (json::type_error &ex) {
        throw internal_error(string("sandbox request carries bytes that are not UTF-8: ") + ex.what());
    }
}

static bool truncate(string &content, uint64_t limit) {
    if (content.size() <= limit) return false;
    content.resize(limit);
    return true;
}

execution_result decode_result(const json &reply, const execution_request &request) {
    if (!reply.is_array() || reply.size() != 1 || !reply[0].is_object())
        throw sandbox_unavailable("unexpected reply from sandbox: " + reply.dump(-1, ' ', false, json::error_handler_t::replace));

    const json &j = reply[0];
    execution_result result;
    try {
        string status = j.at("status").get<string>();
        result.status = parse_status(status);
        if (status == "Output Limit Exceeded") result.truncated = true;

        int exit_status = j.value("exitStatus", 0);
        if (status == "Signalled") {
            result.signal = exit_status;
            result.exit_code = -1;
        } else {
            result.exit_code = exit_status;
        }

        result.cpu_time = duration_cast<milliseconds>(nanoseconds(j.value("time", int64_t(0))));
        result.wall_time = duration_cast<milliseconds>(nanoseconds(j.value("runTime", int64_t(0))));
        result.memory = j.value("memory", uint64_t(0));

        if (j.contains("files") && j["files"].is_object()) {
            result.output = j["files"].value("stdout", "");
            result.error = j["files"].value("stderr", "");
        }
        if (j.contains("fileIds") && j["fileIds"].is_object())
            result.cached_files = j["fileIds"].get<map<string, string>>();

        result.internal_error = j.value("error", "");
    } catch (json::exception &ex) {
        throw sandbox_unavailable(string("unable to decode sandbox reply: ") + ex.what());
    }

    if (truncate(result.output, request.stdout_limit)) result.truncated = true;
    if (truncate(result.error, request.stderr_limit)) result.truncated = true;

    if (result.status == execution_status::SANDBOX_ERROR && result.internal_error.empty())
        result.internal_error = j.value("status", "unknown sandbox status");
    return result;
}

go_judge::go_judge(string url, milliseconds guard_time)
    : url(move(url)), guard_time(guard_time) {
    while (!this->url.empty() && this->url.back() == '/') this->url.pop_back();
}

namespace {

struct response_buffer {
    string body;
    size_t limit;
    bool overflow = false;
};

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
    auto *buffer = static_cast<response_buffer *>(userdata);
    size_t length = size * nmemb;
    if (buffer->body.size() + length > buffer->limit) {
        buffer->overflow = true;
        return 0;  // 令 curl 以 CURLE_WRITE_ERROR 结束传输
    }
    buffer->body.append(ptr, length);
    return length;
}

int progress_callback(void *clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto *token = static_cast<const cancellation_token *>(clientp);
    return token && token->is_cancelled() ? 1 : 0;
}

}  // namespace

string go_judge::perform(const string &method, const string &path, const string &body,
                         milliseconds timeout, size_t response_limit, const cancellation_token *token) {
    string address = url + path;
    CURL *curl = curl_easy_init();
    if (!curl) throw sandbox_unavailable("unable to initialize curl for " + address);
    defer { curl_easy_cleanup(curl); };

    struct curl_slist *headers = curl_slist_append(nullptr, "Content-Type: application/json");
    defer { curl_slist_free_all(headers); };

    response_buffer buffer;
    buffer.limit = response_limit;
    char error_buffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl, CURLOPT_URL, address.c_str());
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    if (!body.empty()) {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    }
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &buffer);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, const_cast<void *>(static_cast<const void *>(token)));

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_ABORTED_BY_CALLBACK) {
        if (token) token->throw_if_cancelled();
        throw judge_timeout("sandbox call to " + address + " was abandoned");
    }
    if (res == CURLE_OPERATION_TIMEDOUT) {
        if (token) token->throw_if_cancelled();
        throw sandbox_unavailable(fmt::format("sandbox {} did not respond within {}ms", address, timeout.count()));
    }
    if (buffer.overflow)
        throw sandbox_unavailable(fmt::format("reply of {} exceeds {} bytes", address, response_limit));
    if (res != CURLE_OK)
        throw sandbox_unavailable(fmt::format("unable to reach sandbox {}: {}", address,
                                              error_buffer[0] ? error_buffer : curl_easy_strerror(res)));

    long code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
    if (code >= 400)
        throw sandbox_unavailable(fmt::format("sandbox {} returned HTTP {}: {}", address, code, buffer.body.substr(0, 256)));
    return buffer.body;
}

execution_result go_judge::execute(const execution_request &request, const cancellation_token &token) {
    token.throw_if_cancelled();
    if (request.args.empty()) throw internal_error("sandbox request has no command");

    milliseconds timeout = request.wall_time_limit + guard_time;
    if (token.has_deadline()) timeout = min(timeout, token.remaining());
    if (timeout.count() <= 0) {
        token.throw_if_cancelled();
        timeout = milliseconds(1);
    }

    // JSON 转义最多使输出膨胀到 6 倍
    size_t response_limit = 6 * (request.stdout_limit + request.stderr_limit) + (1 << 20);

    string body = serialize_request(request);
    DLOG(INFO) << "Sandbox run " << request.args.front() << " with timeout " << timeout.count() << "ms";
    string reply = perform("POST", "/run", body, timeout, response_limit, &token);

    json j;
    try {
        j = json::parse(reply);
    } catch (json::exception &ex) {
        throw sandbox_unavailable(string("sandbox returned malformed JSON: ") + ex.what());
    }
    return decode_result(j, request);
}

void go_judge::remove_file(const string &file_id) {
    perform("DELETE", "/file/" + file_id, "", guard_time, 1 << 20, nullptr);
}

}  // namespace arbiter::sandbox
