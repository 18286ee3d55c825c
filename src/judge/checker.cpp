#include "judge/checker.hpp"
#include <glog/logging.h>
#include <vector>
#include "common/exceptions.hpp"

namespace arbiter {
using namespace std;
using sandbox::execution_request;
using sandbox::execution_result;
using sandbox::sandbox_file;

const char *CHECKER_LANGUAGE = "cpp";

static const string CHECKER_SOURCE = "checker.cpp";
static const string CHECKER_ARTIFACT = "checker";

checker::~checker() = default;

void checker::release() noexcept {}

static vector<string> split_lines(const string &text) {
    string body = text;
    if (!body.empty() && body.back() == '\n') body.pop_back();

    vector<string> lines;
    size_t start = 0;
    while (true) {
        size_t end = body.find('\n', start);
        string line = body.substr(start, end == string::npos ? string::npos : end - start);
        size_t last = line.find_last_not_of(" \t\r");
        line.erase(last == string::npos ? 0 : last + 1);
        lines.push_back(move(line));
        if (end == string::npos) break;
        start = end + 1;
    }
    return lines;
}

bool text_checker::tolerant_equal(const string &expected, const string &output) {
    return split_lines(expected) == split_lines(output);
}

check_result text_checker::check(const string &, const optional<string> &expected,
                                 const string &output, const cancellation_token &) {
    if (!expected) return {verdict::CHECKER_ERROR, "no expected output to compare with"};
    if (tolerant_equal(*expected, output)) return {verdict::ACCEPTED, ""};
    return {verdict::WRONG_ANSWER, ""};
}

special_checker::special_checker(string source, const language &toolchain, sandbox::sandbox &engine, checker_options options)
    : source(move(source)), toolchain(toolchain), engine(engine), options(move(options)) {
    this->toolchain.source_name = CHECKER_SOURCE;
    this->toolchain.artifact_name = CHECKER_ARTIFACT;
}

special_checker::~special_checker() {
    release();
}

void special_checker::compile(const cancellation_token &token) {
    execution_request request;
    request.args = toolchain.compile_args(options.workdir);
    request.args.push_back("-I" + options.include_dir);
    request.env = toolchain.env;
    request.cpu_time_limit = toolchain.compile_time_limit;
    request.wall_time_limit = toolchain.compile_time_limit * 2;
    request.memory_limit = toolchain.compile_memory_limit;
    request.stdout_limit = options.output_limit;
    request.stderr_limit = options.output_limit;
    request.copy_in[CHECKER_SOURCE] = sandbox_file::from_content(source);
    request.copy_out_cached = {CHECKER_ARTIFACT};

    execution_result result = engine.execute(request, token);
    if (result.status == execution_status::SANDBOX_ERROR)
        throw internal_error("sandbox failed to compile checker: " + result.internal_error);

    compiled = true;
    if (result.success() && result.cached_files.count(CHECKER_ARTIFACT)) {
        artifact_id = result.cached_files.at(CHECKER_ARTIFACT);
        return;
    }

    compile_error = result.error.empty() ? result.output : result.error;
    if (result.status == execution_status::TIME_LIMIT_EXCEEDED)
        compile_error = "checker compilation exceeded the time limit\n" + compile_error;
    else if (result.success())
        compile_error = "compiler produced no checker executable\n" + compile_error;
    if (compile_error.empty()) compile_error = get_display_message(result.status);
    LOG(WARNING) << "Checker compilation failed: " << compile_error;
}

check_result special_checker::check(const string &input, const optional<string> &expected,
                                    const string &output, const cancellation_token &token) {
    if (!compiled) compile(token);
    if (!compile_error.empty())
        return {verdict::CHECKER_ERROR, "checker compilation failed\n" + compile_error};

    execution_request request;
    request.args = toolchain.run_args(options.workdir);
    request.args.insert(request.args.end(), {"input.txt", "output.txt", "answer.txt"});
    request.env = toolchain.env;
    request.cpu_time_limit = options.time_limit;
    request.wall_time_limit = options.time_limit * 2;
    request.memory_limit = options.memory_limit;
    request.stdout_limit = options.output_limit;
    request.stderr_limit = options.output_limit;
    request.copy_in[CHECKER_ARTIFACT] = sandbox_file::from_cache(artifact_id);
    request.copy_in["input.txt"] = sandbox_file::from_content(input);
    request.copy_in["output.txt"] = sandbox_file::from_content(output);
    request.copy_in["answer.txt"] = sandbox_file::from_content(expected.value_or(""));

    execution_result result = engine.execute(request, token);
    string message = result.error.empty() ? result.output : result.error;
    switch (result.status) {
        case execution_status::SUCCESS:
            return {verdict::ACCEPTED, message};
        case execution_status::RUNTIME_ERROR:
            if (result.signal < 0 && (result.exit_code == 1 || result.exit_code == 2))
                return {verdict::WRONG_ANSWER, message};
            if (result.signal >= 0)
                return {verdict::CHECKER_ERROR, "checker was killed by signal " + to_string(result.signal) + "\n" + message};
            return {verdict::CHECKER_ERROR, "checker exited with code " + to_string(result.exit_code) + "\n" + message};
        case execution_status::TIME_LIMIT_EXCEEDED:
        case execution_status::MEMORY_LIMIT_EXCEEDED:
            return {verdict::CHECKER_ERROR, string("checker ") + get_display_message(result.status) + "\n" + message};
        case execution_status::SANDBOX_ERROR:
        default:
            throw internal_error("sandbox failed to run checker: " + result.internal_error);
    }
}

void special_checker::release() noexcept {
    if (artifact_id.empty()) return;
    try {
        engine.remove_file(artifact_id);
    } catch (std::exception &ex) {
        LOG(WARNING) << "Unable to remove checker artifact " << artifact_id << ": " << ex.what();
    }
    artifact_id.clear();
}

unique_ptr<checker> make_checker(const optional<string> &source, const language_registry &registry,
                                 sandbox::sandbox &engine, const checker_options &options) {
    if (source) return make_unique<special_checker>(*source, registry.find(CHECKER_LANGUAGE), engine, options);
    return make_unique<text_checker>();
}

}  // namespace arbiter
