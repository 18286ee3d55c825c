#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <string>
#include "common/cancellation.hpp"
#include "judge/checker.hpp"
#include "judge/submission.hpp"
#include "sandbox/sandbox.hpp"
#include "toolchain/language.hpp"

namespace arbiter {

/**
 * @brief 评测流程的状态
 *
 * QUEUED -> COMPILING -> RUNNING(i) -> CHECKING(i) -> FINALIZING -> DONE
 * 解释型语言跳过 COMPILING 直接进入 RUNNING(0)；
 * 编译失败直接进入 DONE，不评测任何测试点；
 * 任何状态下遇到沙箱不可用、内部错误或者评测被取消都会进入 ERRORED。
 */
enum class pipeline_state {
    QUEUED,
    COMPILING,
    RUNNING,
    CHECKING,
    FINALIZING,
    DONE,
    ERRORED
};

const char *get_display_message(pipeline_state);

struct pipeline_options {
    /**
     * @brief 选手程序标准输出的上限，超出视为 OUTPUT_LIMIT_EXCEEDED
     */
    std::uint64_t output_limit = 64ull << 20;

    /**
     * @brief 标准错误输出以及编译器输出的上限
     */
    std::uint64_t stderr_limit = 64ull << 10;

    int proc_limit = 64;

    /**
     * @brief 时钟时间限制 = CPU 时间限制 * wall_time_factor
     */
    double wall_time_factor = 1.5;

    std::string workdir = "/w";

    checker_options checker;
};

/**
 * @brief 一个提交的评测流程
 * 评测流程是一个显式的状态机，每次调用 step 前进一步，每一步最多调用一次沙箱。
 * 评测流程持有选手程序和比较器的编译产物，结束时（包括出错时）从沙箱中删除。
 *
 * 提交、语言表、沙箱和取消标记的生命周期必须长于评测流程。
 */
struct judge_pipeline {
    /**
     * @throw client_error 提交的语言不存在
     */
    judge_pipeline(const submission &submit, const language_registry &registry, sandbox::sandbox &engine,
                   pipeline_options options, const cancellation_token &token);
    ~judge_pipeline();

    judge_pipeline(const judge_pipeline &) = delete;
    judge_pipeline &operator=(const judge_pipeline &) = delete;

    pipeline_state state() const;

    /**
     * @brief 当前正在评测的测试点下标，只在 RUNNING、CHECKING 状态下有意义
     */
    std::size_t case_index() const;

    /**
     * @brief 执行一次状态转移
     * 不会抛出异常，基础设施错误会使状态转移到 ERRORED，异常保存在 error() 中。
     */
    void step();

    /**
     * @brief 执行评测直到 DONE 或 ERRORED
     * @return 评测结果
     * @throw infrastructure_error 评测流程进入 ERRORED 时重新抛出保存的异常
     */
    submission_verdict run();

    /**
     * @brief 进入 ERRORED 的原因
     */
    std::exception_ptr error() const;

private:
    const submission &submit;
    const language &lang;
    sandbox::sandbox &engine;
    pipeline_options options;
    const cancellation_token &token;
    std::unique_ptr<checker> judge_checker;

    pipeline_state current = pipeline_state::QUEUED;
    std::size_t index = 0;
    std::string artifact_id;
    case_result pending;
    submission_verdict outcome;
    std::exception_ptr failure;

    void start();
    void compile();
    void run_case();
    void check_case();
    void finalize();

    void record(case_result &&result);
    void advance();
    void fail(std::exception_ptr ex);
    void release_artifacts() noexcept;
};

}  // namespace arbiter
