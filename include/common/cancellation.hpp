#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace arbiter {

/**
 * @brief 一个提交的取消标记
 * 提交进入评测队列时创建，截止时间为入队时间加上评测总时间上限。
 * 超过截止时间或者被手动取消后，评测流程会在下一次状态转移时进入 ERRORED，
 * 正在进行的沙箱调用会被放弃。
 */
struct cancellation_token {
    using clock = std::chrono::steady_clock;

    /**
     * @brief 没有截止时间的取消标记
     */
    cancellation_token();

    explicit cancellation_token(clock::time_point deadline);

    cancellation_token(const cancellation_token &) = delete;
    cancellation_token &operator=(const cancellation_token &) = delete;

    /**
     * @brief 以当前时间加上 timeout 作为截止时间，timeout 非正数时表示不限时
     */
    static cancellation_token after(std::chrono::milliseconds timeout);

    void cancel();

    /**
     * @return 是否已经被取消或者已经超过截止时间
     */
    bool is_cancelled() const;

    /**
     * @brief 如果已经被取消，抛出 judge_timeout
     */
    void throw_if_cancelled() const;

    bool has_deadline() const;

    /**
     * @brief 距离截止时间还有多久，没有截止时间时返回 milliseconds::max()
     */
    std::chrono::milliseconds remaining() const;

    /**
     * @brief 等待一段时间，被取消时提前返回
     * @return 若等待期间被取消，返回 false
     */
    bool sleep_for(std::chrono::milliseconds duration) const;

private:
    std::atomic<bool> cancelled;
    bool limited;
    clock::time_point until;
    mutable std::mutex mut;
    mutable std::condition_variable cond;
};

}  // namespace arbiter
