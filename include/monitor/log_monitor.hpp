#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include "monitor/monitor.hpp"

namespace arbiter {

/**
 * @brief 评测统计
 * 评测结果、客户端错误、基础设施错误分开计数，以便运维单独针对基础设施错误报警，
 * 不和选手的评测结果分布混在一起。
 */
struct judge_statistics {
    std::size_t judged = 0;
    std::size_t client_errors = 0;
    std::size_t infrastructure_errors = 0;
    std::size_t active_workers = 0;
    std::map<verdict, std::size_t> verdicts;
};

/**
 * @brief 将监控事件写入 glog 日志，并统计各类结果的数量
 */
struct log_monitor : public monitor {
    void start_submission(const submission &submit) override;

    void worker_state_changed(int worker_id, worker_state state, const std::string &information) override;

    void end_submission(const submission &submit, verdict result) override;

    void report_error(const submission &submit, const std::string &message) override;

    void reject_submission(const std::string &message) override;

    judge_statistics statistics() const;

private:
    mutable std::mutex mut;
    judge_statistics stats;
};

}  // namespace arbiter
