#include "monitor/monitor.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace arbiter {
using namespace std;

// clang-format off
static const unordered_map<worker_state, const char *> worker_state_string = boost::assign::map_list_of
    (worker_state::START, "start")
    (worker_state::JUDGING, "judging")
    (worker_state::IDLE, "idle")
    (worker_state::STOPPED, "stopped")
    (worker_state::CRASHED, "crashed");
// clang-format on

const char *get_display_message(worker_state state) {
    return worker_state_string.at(state);
}

monitor::~monitor() {}

void monitor::start_submission(const submission &) {}

void monitor::worker_state_changed(int, worker_state, const string &) {}

void monitor::end_submission(const submission &, verdict) {}

void monitor::report_error(const submission &, const string &) {}

void monitor::reject_submission(const string &) {}

}  // namespace arbiter
