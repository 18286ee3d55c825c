#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace arbiter {
using namespace std;

// clang-format off
static const unordered_map<verdict, const char *> verdict_string = boost::assign::map_list_of
    (verdict::ACCEPTED, "Accepted")
    (verdict::WRONG_ANSWER, "Wrong Answer")
    (verdict::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded")
    (verdict::MEMORY_LIMIT_EXCEEDED, "Memory Limit Exceeded")
    (verdict::RUNTIME_ERROR, "Runtime Error")
    (verdict::OUTPUT_LIMIT_EXCEEDED, "Output Limit Exceeded")
    (verdict::CHECKER_ERROR, "Checker Error")
    (verdict::COMPILATION_ERROR, "Compilation Error");

static const unordered_map<execution_status, const char *> execution_status_string = boost::assign::map_list_of
    (execution_status::SUCCESS, "Success")
    (execution_status::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded")
    (execution_status::MEMORY_LIMIT_EXCEEDED, "Memory Limit Exceeded")
    (execution_status::RUNTIME_ERROR, "Runtime Error")
    (execution_status::SANDBOX_ERROR, "Sandbox Error");

static const unordered_map<verdict, int> verdict_severity = boost::assign::map_list_of
    (verdict::ACCEPTED, 0)
    (verdict::CHECKER_ERROR, 1)
    (verdict::OUTPUT_LIMIT_EXCEEDED, 2)
    (verdict::WRONG_ANSWER, 3)
    (verdict::TIME_LIMIT_EXCEEDED, 4)
    (verdict::MEMORY_LIMIT_EXCEEDED, 5)
    (verdict::RUNTIME_ERROR, 6)
    (verdict::COMPILATION_ERROR, 7);
// clang-format on

const char *get_display_message(verdict stat) {
    return verdict_string.at(stat);
}

const char *get_display_message(execution_status stat) {
    return execution_status_string.at(stat);
}

int severity(verdict stat) {
    return verdict_severity.at(stat);
}

verdict most_severe(verdict a, verdict b) {
    return severity(b) > severity(a) ? b : a;
}

}  // namespace arbiter
