#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "common/cancellation.hpp"
#include "common/status.hpp"

namespace arbiter::sandbox {

/**
 * @brief 拷贝进沙箱工作目录的文件
 * 要么直接给出文件内容，要么引用沙箱中缓存的文件（比如编译产物）
 */
struct sandbox_file {
    std::string content;

    /**
     * @brief 沙箱缓存文件的 id，非空时忽略 content
     */
    std::string file_id;

    static sandbox_file from_content(std::string content);

    static sandbox_file from_cache(std::string file_id);

    bool cached() const;
};

/**
 * @brief 一次沙箱调用的请求
 * 每次调用都重新构造，不会在多次调用之间共享
 */
struct execution_request {
    /**
     * @brief 要执行的命令，argv[0] 为可执行文件路径
     */
    std::vector<std::string> args;

    /**
     * @brief 环境变量，格式为 KEY=VALUE
     */
    std::vector<std::string> env;

    /**
     * @brief 标准输入的内容
     */
    std::string stdin_content;

    /**
     * @brief CPU 时间限制
     */
    std::chrono::milliseconds cpu_time_limit{1000};

    /**
     * @brief 时钟时间限制，一般比 CPU 时间限制宽松，用来处理 sleep 等不占用 CPU 的情况
     */
    std::chrono::milliseconds wall_time_limit{2000};

    /**
     * @brief 内存限制（单位为字节）
     */
    std::uint64_t memory_limit = 256ull << 20;

    /**
     * @brief 栈空间限制（单位为字节），0 表示与内存限制相同
     */
    std::uint64_t stack_limit = 0;

    /**
     * @brief 最多允许的进程（线程）数
     */
    int proc_limit = 64;

    /**
     * @brief 标准输出最多保留的字节数，超出部分被截断
     */
    std::uint64_t stdout_limit = 64ull << 20;

    /**
     * @brief 标准错误输出最多保留的字节数
     */
    std::uint64_t stderr_limit = 64ull << 10;

    /**
     * @brief 执行前拷贝进工作目录的文件，键为文件名
     */
    std::map<std::string, sandbox_file> copy_in;

    /**
     * @brief 执行结束后需要缓存在沙箱中的文件名，比如编译产物
     */
    std::vector<std::string> copy_out_cached;
};

/**
 * @brief 一次沙箱调用的结果
 */
struct execution_result {
    execution_status status = execution_status::SANDBOX_ERROR;

    /**
     * @brief 进程返回值，因信号退出时为 -1
     */
    int exit_code = -1;

    /**
     * @brief 终止进程的信号，正常退出时为 -1
     */
    int signal = -1;

    std::chrono::milliseconds wall_time{0};

    /**
     * @brief CPU 时间，多线程程序会累加所有线程的 CPU 时间
     */
    std::chrono::milliseconds cpu_time{0};

    /**
     * @brief 内存使用峰值（单位为字节）
     */
    std::uint64_t memory = 0;

    /**
     * @brief 标准输出，长度不超过请求中的 stdout_limit
     */
    std::string output;

    /**
     * @brief 标准错误输出，长度不超过请求中的 stderr_limit
     */
    std::string error;

    /**
     * @brief 标准输出或标准错误输出是否被截断
     */
    bool truncated = false;

    /**
     * @brief 沙箱报告的错误信息
     */
    std::string internal_error;

    /**
     * @brief copy_out_cached 中的文件在沙箱中的缓存 id
     */
    std::map<std::string, std::string> cached_files;

    bool success() const;
};

/**
 * @brief 沙箱的抽象，评测流程只通过这个接口执行程序
 * 实现必须是线程安全的，多个评测流程会并发调用同一个实例。
 */
struct sandbox {
    virtual ~sandbox();

    /**
     * @brief 在沙箱中执行一个程序，阻塞直到执行结束
     * 选手程序自身的失败通过 execution_result::status 返回，不会抛出异常。
     * @throw sandbox_unavailable 无法与沙箱通信
     * @throw judge_timeout token 在调用期间被取消
     */
    virtual execution_result execute(const execution_request &request, const cancellation_token &token) = 0;

    /**
     * @brief 删除沙箱中缓存的文件
     * @throw sandbox_unavailable 无法与沙箱通信
     */
    virtual void remove_file(const std::string &file_id) = 0;
};

}  // namespace arbiter::sandbox
