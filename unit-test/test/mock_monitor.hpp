#pragma once

#include "gmock/gmock.h"
#include "monitor/monitor.hpp"

namespace arbiter::test {

struct mock_monitor : public monitor {
    MOCK_METHOD(void, start_submission, (const submission &submit), (override));
    MOCK_METHOD(void, worker_state_changed, (int worker_id, worker_state state, const std::string &information), (override));
    MOCK_METHOD(void, end_submission, (const submission &submit, verdict result), (override));
    MOCK_METHOD(void, report_error, (const submission &submit, const std::string &message), (override));
    MOCK_METHOD(void, reject_submission, (const std::string &message), (override));
};

}  // namespace arbiter::test
