#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <thread>
#include <vector>
#include "common/cancellation.hpp"
#include "common/concurrent_queue.hpp"
#include "common/semaphore.hpp"
#include "judge/pipeline.hpp"
#include "judge/submission.hpp"
#include "monitor/monitor.hpp"
#include "sandbox/bounded_sandbox.hpp"
#include "toolchain/language.hpp"

/**
 * 评测服务相关函数
 * 提交通过 submit 进入评测队列，按照进入队列的顺序（FIFO）被 worker 取出评测。
 *
 * 两个并发上限：
 * 1. workers：同时评测的提交数，即 worker 线程数，其余提交在队列中等待；
 * 2. parallelism：同时进行的沙箱调用数，所有 worker 共享，用完时沙箱调用阻塞等待。
 * 一个提交在同一时刻最多只有一个沙箱调用，因此 parallelism 不应超过 workers。
 */
namespace arbiter {

struct worker_options {
    /**
     * @brief 同时评测的提交数
     */
    std::size_t workers = 4;

    /**
     * @brief 同时进行的沙箱调用数
     */
    std::size_t parallelism = 4;

    /**
     * @brief 沙箱不可用时单次调用最多重试的次数
     */
    int sandbox_retries = 2;

    std::chrono::milliseconds retry_backoff{200};

    /**
     * @brief 提交从进入队列到评测完成的总时间上限，0 表示不限
     */
    std::chrono::milliseconds submission_timeout{0};

    pipeline_options pipeline;
};

struct worker_pool {
    /**
     * @param registry 语言表，生命周期必须长于 worker_pool
     * @param engine 实际执行程序的沙箱，生命周期必须长于 worker_pool
     * @throw std::invalid_argument workers 或 parallelism 为 0
     */
    worker_pool(const language_registry &registry, sandbox::sandbox &engine, worker_options options);
    ~worker_pool();

    worker_pool(const worker_pool &) = delete;
    worker_pool &operator=(const worker_pool &) = delete;

    /**
     * @brief 注册监控器
     * 必须在 start 之前调用
     */
    void register_monitor(std::unique_ptr<monitor> &&monitor);

    /**
     * @brief 启动 worker 线程
     */
    void start();

    /**
     * @brief 停止所有的 worker
     * 调用后不再接受新提交，worker 会评测完队列中剩余的提交后退出。
     * 该函数会阻塞直到所有 worker 线程退出为止。
     */
    void stop();

    /**
     * @brief 提交评测
     * 提交在进入队列前检查，不合法的提交直接抛出异常，不会占用沙箱资源。
     * @return 评测结果，评测系统故障时 future 中保存 infrastructure_error
     * @throw client_error 提交不合法
     */
    std::future<submission_verdict> submit(submission submit);

    /**
     * @brief 提交评测并等待评测结果
     * @throw client_error 提交不合法
     * @throw infrastructure_error 评测系统故障
     */
    submission_verdict judge(submission submit);

    /**
     * @brief 正在评测的提交数
     */
    std::size_t active() const;

    /**
     * @brief 在队列中等待的提交数
     */
    std::size_t pending();

private:
    struct job {
        std::unique_ptr<submission> submit;
        std::unique_ptr<cancellation_token> token;
        std::promise<submission_verdict> result;
    };

    const language_registry &registry;
    worker_options options;
    semaphore slots;
    sandbox::bounded_sandbox bounded;

    std::vector<std::unique_ptr<monitor>> monitors;
    std::vector<std::thread> threads;
    concurrent_queue<job> queue;
    std::atomic<unsigned> next_judge_id{0};
    std::atomic<std::size_t> judging{0};

    void worker_loop(int worker_id);
    void judge_job(int worker_id, job &j);
    void call_monitor(int worker_id, const std::function<void(monitor &)> &callback);
};

}  // namespace arbiter
