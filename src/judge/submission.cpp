#include "judge/submission.hpp"
#include <fmt/format.h>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"
#include "judge/checker.hpp"

namespace arbiter {
using namespace std;

const chrono::milliseconds MAX_TIME_LIMIT = chrono::hours(1);
const uint64_t MAX_MEMORY_LIMIT = 64ull << 30;  // 64G

static void check_limits(chrono::milliseconds time_limit, uint64_t memory_limit, const string &owner) {
    if (time_limit.count() <= 0)
        throw client_error("time limit of " + owner + " must be positive");
    if (time_limit > MAX_TIME_LIMIT)
        throw client_error(fmt::format("time limit of {} exceeds {}ms", owner, MAX_TIME_LIMIT.count()));
    if (memory_limit == 0)
        throw client_error("memory limit of " + owner + " must be positive");
    if (memory_limit > MAX_MEMORY_LIMIT)
        throw client_error(fmt::format("memory limit of {} exceeds {} bytes", owner, MAX_MEMORY_LIMIT));
}

static void check_text(const string &text, const string &name) {
    if (!nlohmann::is_valid_utf8(text))
        throw client_error(name + " is not valid UTF-8");
}

chrono::milliseconds submission::case_time_limit(const test_case &tc) const {
    return tc.time_limit.value_or(time_limit);
}

uint64_t submission::case_memory_limit(const test_case &tc) const {
    return tc.memory_limit.value_or(memory_limit);
}

void validate(const submission &submit, const language_registry &registry) {
    if (!registry.contains(submit.language))
        throw client_error("unknown language " + submit.language);
    if (submit.source.empty())
        throw client_error("source code is empty");
    check_text(submit.source, "source code");
    if (submit.test_cases.empty())
        throw client_error("submission has no test case");
    check_limits(submit.time_limit, submit.memory_limit, "submission");
    if (submit.checker && submit.checker->empty())
        throw client_error("checker source is empty");
    if (submit.checker) check_text(*submit.checker, "checker source");
    if (submit.checker && !registry.contains(CHECKER_LANGUAGE))
        throw client_error(string("checker requires language ") + CHECKER_LANGUAGE);

    for (size_t i = 0; i < submit.test_cases.size(); ++i) {
        auto &tc = submit.test_cases[i];
        string name = "test case " + to_string(i);
        check_limits(submit.case_time_limit(tc), submit.case_memory_limit(tc), name);
        check_text(tc.input, "input of " + name);
        if (tc.output) check_text(*tc.output, "output of " + name);
        if (!submit.checker && !tc.output)
            throw client_error(name + " has no expected output and no checker is given");
    }
}

}  // namespace arbiter
