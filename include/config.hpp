#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

/**
 * 进程级别的配置，在进程启动时由 main 从命令行参数或者环境变量中读取，
 * 之后只读。评测核心不直接读取这些变量，由 main 构造 worker_options 传入。
 */
namespace arbiter {

/**
 * @brief 同时评测的提交数，即 worker 线程数
 */
extern std::size_t JUDGE_WORKERS;

/**
 * @brief 同时进行的沙箱调用数，不应超过 JUDGE_WORKERS
 * go-judge 自身也有并发上限，这个值应与其 -parallelism 参数一致
 */
extern std::size_t GJ_PARALLELISM;

/**
 * @brief go-judge 的地址，比如 http://localhost:5050
 */
extern std::string SANDBOX_URL;

/**
 * @brief 沙箱不可用时单次调用的重试次数
 */
extern int SANDBOX_RETRIES;

/**
 * @brief 在沙箱时钟时间限制之上额外等待的毫秒数，超过后认为沙箱无响应
 */
extern int SANDBOX_GUARD_TIME;

/**
 * @brief 提交从进入队列到评测完成的总时间上限（毫秒），0 表示不限
 */
extern int SUBMISSION_TIMEOUT;

/**
 * @brief 比较器头文件（testlib.h）所在目录，该目录必须在沙箱中可见
 */
extern std::filesystem::path CHECKER_INCLUDE_DIR;

/**
 * @brief 比较器运行的时间限制（毫秒）
 */
extern int CHECKER_TIME_LIMIT;

/**
 * @brief 比较器运行的内存限制（字节）
 */
extern std::uint64_t CHECKER_MEM_LIMIT;

/**
 * @brief 选手程序标准输出的上限（字节）
 */
extern std::uint64_t OUTPUT_LIMIT;

/**
 * @brief 标准错误输出以及编译器输出的上限（字节）
 */
extern std::uint64_t STDERR_LIMIT;

extern int PROC_LIMIT;

}  // namespace arbiter
