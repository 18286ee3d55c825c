#include "common/semaphore.hpp"
#include <stdexcept>
#include "common/exceptions.hpp"

namespace arbiter {
using namespace std;

// 没有截止时间的 token 被 cancel 时不会通知信号量，因此需要定期醒来检查
static const chrono::milliseconds POLL_INTERVAL(20);

semaphore::semaphore(size_t count) : total(count), count(count) {
    if (count == 0) throw invalid_argument("semaphore requires at least one slot");
}

void semaphore::acquire() {
    unique_lock<mutex> lock(mut);
    cond.wait(lock, [this] { return count > 0; });
    --count;
}

bool semaphore::acquire(const cancellation_token &token) {
    unique_lock<mutex> lock(mut);
    while (count == 0) {
        if (token.is_cancelled()) return false;
        cond.wait_for(lock, min(POLL_INTERVAL, token.remaining()));
    }
    if (token.is_cancelled()) return false;
    --count;
    return true;
}

void semaphore::release() {
    {
        lock_guard<mutex> lock(mut);
        if (count >= total) throw logic_error("semaphore released more times than acquired");
        ++count;
    }
    cond.notify_one();
}

size_t semaphore::available() const {
    lock_guard<mutex> lock(mut);
    return count;
}

size_t semaphore::capacity() const {
    return total;
}

semaphore_guard::semaphore_guard(semaphore &sem) : sem(sem) {
    sem.acquire();
}

semaphore_guard::semaphore_guard(semaphore &sem, const cancellation_token &token) : sem(sem) {
    if (!sem.acquire(token)) {
        token.throw_if_cancelled();
        throw judge_timeout("cancelled while waiting for a sandbox slot");
    }
}

semaphore_guard::~semaphore_guard() {
    sem.release();
}

}  // namespace arbiter
