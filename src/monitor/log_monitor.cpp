#include "monitor/log_monitor.hpp"
#include <glog/logging.h>

namespace arbiter {
using namespace std;

void log_monitor::start_submission(const submission &submit) {
    LOG(INFO) << "Start judging " << submit;
}

void log_monitor::worker_state_changed(int worker_id, worker_state state, const string &info) {
    {
        lock_guard<mutex> guard(mut);
        switch (state) {
            case worker_state::JUDGING:
                ++stats.active_workers;
                break;
            case worker_state::IDLE:
                if (stats.active_workers > 0) --stats.active_workers;
                break;
            default:
                break;
        }
    }

    if (state == worker_state::CRASHED)
        LOG(ERROR) << "Worker " << worker_id << " crashed: " << info;
    else
        DLOG(INFO) << "Worker " << worker_id << " is " << get_display_message(state);
}

void log_monitor::end_submission(const submission &submit, verdict result) {
    {
        lock_guard<mutex> guard(mut);
        ++stats.judged;
        ++stats.verdicts[result];
    }
    LOG(INFO) << submit << " judged: " << get_display_message(result);
}

void log_monitor::report_error(const submission &submit, const string &message) {
    {
        lock_guard<mutex> guard(mut);
        ++stats.infrastructure_errors;
    }
    LOG(ERROR) << "Infrastructure failure while judging " << submit << ": " << message;
}

void log_monitor::reject_submission(const string &message) {
    {
        lock_guard<mutex> guard(mut);
        ++stats.client_errors;
    }
    LOG(WARNING) << "Rejected submission: " << message;
}

judge_statistics log_monitor::statistics() const {
    lock_guard<mutex> guard(mut);
    return stats;
}

}  // namespace arbiter
