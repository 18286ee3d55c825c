#pragma once

#include <string>
#include "common/status.hpp"
#include "judge/submission.hpp"
#include "worker_state.hpp"

namespace arbiter {

/**
 * @brief 执行监控行为
 * 所有的回调都有空的默认实现，子类只需要覆盖自己关心的事件。
 * 回调可能在多个 worker 线程中同时调用，实现必须是线程安全的。
 */
struct monitor {
    virtual ~monitor();

    /**
     * @brief 监控上报当前已经开始评测一个提交
     */
    virtual void start_submission(const submission &submit);

    /**
     * @brief 监控上报当前某个 Worker 的状态
     * @param worker_id Worker 编号
     * @param state Worker 的新状态
     * @param information 如果 Worker 崩溃，则为错误原因，用于日志记录
     */
    virtual void worker_state_changed(int worker_id, worker_state state, const std::string &information);

    /**
     * @brief 监控上报当前已经完成一个提交的评测
     * @param submit 提交
     * @param result 提交的评测结果
     */
    virtual void end_submission(const submission &submit, verdict result);

    /**
     * @brief 监控上报一个提交因为评测系统的故障而没有得到评测结果
     * @param submit 提交
     * @param message 错误信息
     */
    virtual void report_error(const submission &submit, const std::string &message);

    /**
     * @brief 监控上报一个提交在进入评测队列之前被拒绝
     * @param message 拒绝原因
     */
    virtual void reject_submission(const std::string &message);
};

}  // namespace arbiter
