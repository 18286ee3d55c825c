#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include "common/cancellation.hpp"
#include "common/status.hpp"
#include "sandbox/sandbox.hpp"
#include "toolchain/language.hpp"

/**
 * 这个头文件包含比较器
 * 1. text_checker: 默认的文本比较，忽略行末空白字符和文末的一个换行符
 * 2. special_checker: 出题人提供的比较程序（special judge），在沙箱中运行
 */
namespace arbiter {

/**
 * @brief 比较的结果
 * verdict 只可能是 ACCEPTED、WRONG_ANSWER、CHECKER_ERROR
 */
struct check_result {
    verdict status = verdict::ACCEPTED;

    /**
     * @brief 比较器给出的信息，比如 testlib 的输出
     */
    std::string message;
};

struct checker {
    virtual ~checker();

    /**
     * @brief 比较选手程序的输出
     * @param input 测试点的输入数据
     * @param expected 测试点的标准输出，可能不存在
     * @param output 选手程序的输出
     * @param token 提交的取消标记
     * @throw infrastructure_error 沙箱不可用或者评测被取消
     */
    virtual check_result check(const std::string &input, const std::optional<std::string> &expected,
                               const std::string &output, const cancellation_token &token) = 0;

    /**
     * @brief 释放比较器在沙箱中占用的资源，失败时只记录日志
     */
    virtual void release() noexcept;
};

/**
 * @brief 默认的文本比较
 * 比较规则：
 * 1. 每一行行末的空格、制表符、\r 会被忽略；
 * 2. 文件末尾的一个换行符会被忽略；
 * 3. 其他任何字节差异，包括多出来的空行，都视为 WRONG_ANSWER。
 */
struct text_checker : public checker {
    check_result check(const std::string &input, const std::optional<std::string> &expected,
                       const std::string &output, const cancellation_token &token) override;

    /**
     * @brief 按照上面的比较规则判断两段文本是否相同
     */
    static bool tolerant_equal(const std::string &expected, const std::string &output);
};

/**
 * @brief 运行比较器的配置
 */
struct checker_options {
    /**
     * @brief testlib 等比较器头文件所在的目录，编译比较器时作为 -I 参数传入
     */
    std::string include_dir = "/lib/testlib";

    std::chrono::milliseconds time_limit{10000};

    /**
     * @brief 比较器运行时的内存限制（单位为字节）
     */
    std::uint64_t memory_limit = 512ull << 20;

    std::uint64_t output_limit = 64ull << 10;

    std::string workdir = "/w";
};

/**
 * @brief 出题人提供的比较程序
 * 比较器在第一次使用时编译，编译产物缓存在沙箱中直到本对象析构为止，
 * 因此一个提交的所有测试点共享同一份编译产物。
 *
 * 比较器的调用方式为 checker input.txt output.txt answer.txt，
 * 返回值 0 表示 ACCEPTED，1 或 2 表示 WRONG_ANSWER（testlib 的 WA 和 PE），
 * 其他返回值、被信号终止、超时、超内存均为 CHECKER_ERROR。
 * 比较器编译失败时所有测试点都是 CHECKER_ERROR，不会算作选手的错误。
 */
struct special_checker : public checker {
    /**
     * @param source 比较器源代码
     * @param toolchain 编译比较器使用的工具链，一般是 cpp
     * @param engine 执行编译和比较的沙箱
     */
    special_checker(std::string source, const language &toolchain, sandbox::sandbox &engine, checker_options options);
    ~special_checker() override;

    special_checker(const special_checker &) = delete;
    special_checker &operator=(const special_checker &) = delete;

    check_result check(const std::string &input, const std::optional<std::string> &expected,
                       const std::string &output, const cancellation_token &token) override;

    /**
     * @brief 删除沙箱中缓存的比较器编译产物
     */
    void release() noexcept override;

private:
    std::string source;
    language toolchain;
    sandbox::sandbox &engine;
    checker_options options;

    bool compiled = false;
    std::string artifact_id;
    std::string compile_error;

    void compile(const cancellation_token &token);
};

/**
 * @brief 编译比较器使用的语言
 */
extern const char *CHECKER_LANGUAGE;

/**
 * @brief 根据提交是否给出比较器选择比较方式
 * @param source 比较器源代码，为空时使用 text_checker
 * @param registry 用来查找编译比较器的工具链
 * @throw client_error 给出了比较器，但是没有 C++ 工具链
 */
std::unique_ptr<checker> make_checker(const std::optional<std::string> &source, const language_registry &registry,
                                      sandbox::sandbox &engine, const checker_options &options);

}  // namespace arbiter
