#include "judge/report.hpp"
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"

namespace arbiter {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, test_case &value) {
    value.input = get_value<string>(j, "input");
    if (j.contains("output") && !j.at("output").is_null())
        value.output = get_value<string>(j, "output");
    if (j.contains("time_limit") && !j.at("time_limit").is_null())
        value.time_limit = chrono::milliseconds(get_value<int64_t>(j, "time_limit"));
    if (j.contains("memory_limit") && !j.at("memory_limit").is_null())
        value.memory_limit = get_value<uint64_t>(j, "memory_limit");
}

void from_json(const json &j, submission &value) {
    value.language = get_value<string>(j, "language");
    value.source = get_value<string>(j, "source");
    value.time_limit = chrono::milliseconds(get_value<int64_t>(j, "time_limit"));
    value.memory_limit = get_value<uint64_t>(j, "memory_limit");

    bool judge_all = false;
    assign_optional(j, judge_all, "judge_all");
    value.mode = judge_all ? judge_mode::ALL_CASES : judge_mode::SHORT_CIRCUIT;

    if (j.contains("checker") && !j.at("checker").is_null())
        value.checker = get_value<string>(j, "checker");

    if (!j.contains("test_cases") || !j.at("test_cases").is_array())
        throw build_invalid_argument(j, "test_cases");
    for (auto &tc : j.at("test_cases")) {
        test_case data;
        from_json(tc, data);
        value.test_cases.push_back(move(data));
    }
}

void to_json(json &j, const case_result &value) {
    j = {{"verdict", get_display_message(value.status)},
         {"time", value.execution.cpu_time.count()},
         {"memory", value.execution.memory},
         {"exit_code", value.execution.exit_code},
         {"signal", value.execution.signal},
         {"message", value.message}};
}

void to_json(json &j, const submission_verdict &value) {
    j = {{"verdict", get_display_message(value.status)},
         {"time", value.time.count()},
         {"memory", value.memory},
         {"cases", value.cases},
         {"compile_log", value.compile_log}};
}

submission parse_submission(const json &j) {
    if (!j.is_object()) throw client_error("submission must be a JSON object");
    try {
        submission submit;
        from_json(j, submit);
        return submit;
    } catch (invalid_argument &ex) {
        throw client_error(string("malformed submission: ") + ex.what());
    } catch (json::exception &ex) {
        throw client_error(string("malformed submission: ") + ex.what());
    }
}

vector<json> split_submissions(const json &j) {
    if (j.is_object()) return {j};
    if (!j.is_array()) throw client_error("expected a submission object or an array of submissions");
    return j.get<vector<json>>();
}

json judged_report(const string &id, const submission_verdict &result) {
    json j = result;
    j["id"] = id;
    j["category"] = "judged";
    j["error"] = nullptr;
    return j;
}

static json error_report(const string &id, const char *category, const string &message) {
    return {{"id", id},
            {"category", category},
            {"verdict", nullptr},
            {"time", nullptr},
            {"memory", nullptr},
            {"cases", json::array()},
            {"compile_log", ""},
            {"error", message}};
}

json client_error_report(const string &id, const string &message) {
    return error_report(id, "client_error", message);
}

json infrastructure_error_report(const string &id, const string &message) {
    return error_report(id, "infrastructure_error", message);
}

}  // namespace arbiter
