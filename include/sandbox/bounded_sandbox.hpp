#pragma once

#include <chrono>
#include "common/semaphore.hpp"
#include "sandbox/sandbox.hpp"

namespace arbiter::sandbox {

/**
 * @brief 限制并发调用数并在沙箱不可用时重试的沙箱包装
 * 每次调用沙箱之前获取一个槽位，调用结束（包括抛出异常和被取消）时释放。
 * 槽位用完时调用会阻塞等待，而不是失败。
 *
 * 只有 sandbox_unavailable 会被重试，选手程序的执行结果不会被重试。
 * 两次重试之间不占用槽位。
 */
struct bounded_sandbox : public sandbox {
    /**
     * @param engine 实际执行请求的沙箱
     * @param slots 全局的沙箱并发槽位
     * @param retries 沙箱不可用时最多重试的次数，0 表示不重试
     * @param backoff 两次重试之间的等待时间
     */
    bounded_sandbox(sandbox &engine, semaphore &slots, int retries, std::chrono::milliseconds backoff);

    execution_result execute(const execution_request &request, const cancellation_token &token) override;

    void remove_file(const std::string &file_id) override;

private:
    sandbox &engine;
    semaphore &slots;
    int retries;
    std::chrono::milliseconds backoff;
};

}  // namespace arbiter::sandbox
