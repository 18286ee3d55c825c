#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include "common/cancellation.hpp"

namespace arbiter {

/**
 * @brief 计数信号量，用来限制同时进行的沙箱调用数
 * 槽位用完时 acquire 会阻塞，而不是失败，从而对评测流程形成背压。
 */
struct semaphore {
    explicit semaphore(std::size_t count);

    semaphore(const semaphore &) = delete;
    semaphore &operator=(const semaphore &) = delete;

    /**
     * @brief 获取一个槽位，阻塞直到有空闲槽位为止
     */
    void acquire();

    /**
     * @brief 获取一个槽位，阻塞直到有空闲槽位或者 token 被取消为止
     * @return 若 token 被取消而没有获得槽位，返回 false
     */
    bool acquire(const cancellation_token &token);

    void release();

    /**
     * @brief 当前空闲的槽位数
     */
    std::size_t available() const;

    /**
     * @brief 槽位总数
     */
    std::size_t capacity() const;

private:
    const std::size_t total;
    std::size_t count;
    mutable std::mutex mut;
    std::condition_variable cond;
};

/**
 * @brief 在作用域内占有一个信号量槽位，析构时无条件释放
 * 获取槽位时 token 被取消会抛出 judge_timeout，此时不会占有槽位。
 */
struct semaphore_guard {
    explicit semaphore_guard(semaphore &sem);
    semaphore_guard(semaphore &sem, const cancellation_token &token);
    semaphore_guard(const semaphore_guard &) = delete;
    semaphore_guard &operator=(const semaphore_guard &) = delete;
    ~semaphore_guard();

private:
    semaphore &sem;
};

}  // namespace arbiter
