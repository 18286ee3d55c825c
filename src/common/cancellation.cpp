#include "common/cancellation.hpp"
#include "common/exceptions.hpp"

namespace arbiter {
using namespace std;
using namespace std::chrono;

cancellation_token::cancellation_token()
    : cancelled(false), limited(false), until(clock::time_point::max()) {}

cancellation_token::cancellation_token(clock::time_point deadline)
    : cancelled(false), limited(true), until(deadline) {}

cancellation_token cancellation_token::after(milliseconds timeout) {
    if (timeout.count() <= 0) return cancellation_token();
    return cancellation_token(clock::now() + timeout);
}

void cancellation_token::cancel() {
    {
        lock_guard<mutex> guard(mut);
        cancelled = true;
    }
    cond.notify_all();
}

bool cancellation_token::is_cancelled() const {
    return cancelled || (limited && clock::now() >= until);
}

void cancellation_token::throw_if_cancelled() const {
    if (cancelled) throw judge_timeout("judging was cancelled");
    if (limited && clock::now() >= until) throw judge_timeout("judging exceeded the submission time ceiling");
}

bool cancellation_token::has_deadline() const {
    return limited;
}

milliseconds cancellation_token::remaining() const {
    if (!limited) return milliseconds::max();
    auto left = duration_cast<milliseconds>(until - clock::now());
    return left.count() > 0 ? left : milliseconds(0);
}

bool cancellation_token::sleep_for(milliseconds duration) const {
    unique_lock<mutex> lock(mut);
    auto wake = clock::now() + duration;
    if (limited && until < wake) {
        cond.wait_until(lock, until, [this] { return cancelled.load(); });
        return false;
    }
    cond.wait_until(lock, wake, [this] { return cancelled.load(); });
    return !is_cancelled();
}

}  // namespace arbiter
