#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "sandbox/sandbox.hpp"
#include "toolchain/language.hpp"

/**
 * 这个头文件包含提交信息以及评测结果
 * 1. test_case 类（表示一个测试点）
 * 2. submission 类（表示一个选手提交）
 * 3. case_result 类（表示一个测试点的评测结果）
 * 4. submission_verdict 类（表示整个提交的评测结果）
 */
namespace arbiter {

/**
 * @brief 表示一个测试点
 * 测试点属于提交，评测期间只读
 */
struct test_case {
    /**
     * @brief 作为选手程序标准输入的数据
     */
    std::string input;

    /**
     * @brief 标准输出数据
     * 使用比较器时可以为空，此时比较器的 answer.txt 为空文件
     */
    std::optional<std::string> output;

    /**
     * @brief 本测试点单独的时间限制，为空时使用提交的时间限制
     */
    std::optional<std::chrono::milliseconds> time_limit;

    /**
     * @brief 本测试点单独的内存限制（单位为字节），为空时使用提交的内存限制
     */
    std::optional<std::uint64_t> memory_limit;
};

/**
 * @brief 评测模式
 */
enum class judge_mode {
    /**
     * @brief 遇到第一个未通过的测试点就停止评测，返回该测试点的结果
     */
    SHORT_CIRCUIT,

    /**
     * @brief 评测所有测试点，返回最严重的结果
     */
    ALL_CASES
};

/**
 * @brief 一个选手提交
 * 进入评测队列后不再修改
 */
struct submission {
    /**
     * @brief 进入评测队列时分配的唯一编号
     */
    unsigned judge_id = 0;

    /**
     * @brief 提交的语言 id，参见 language_registry
     */
    std::string language;

    /**
     * @brief 选手代码
     */
    std::string source;

    std::chrono::milliseconds time_limit{1000};

    /**
     * @brief 内存限制（单位为字节）
     */
    std::uint64_t memory_limit = 256ull << 20;

    /**
     * @brief 按顺序评测的测试点
     */
    std::vector<test_case> test_cases;

    /**
     * @brief 比较器源代码（C++），为空时使用默认的文本比较
     */
    std::optional<std::string> checker;

    judge_mode mode = judge_mode::SHORT_CIRCUIT;

    std::chrono::milliseconds case_time_limit(const test_case &tc) const;

    std::uint64_t case_memory_limit(const test_case &tc) const;
};

/**
 * @brief 提交以及测试点允许的最大时间限制（1 小时）
 */
extern const std::chrono::milliseconds MAX_TIME_LIMIT;

/**
 * @brief 提交以及测试点允许的最大内存限制（64GB）
 */
extern const std::uint64_t MAX_MEMORY_LIMIT;

/**
 * @brief 检查提交是否可以评测
 * 在提交进入评测队列之前调用，此时不会占用任何沙箱资源
 * 源代码、比较器以及测试数据都会以 JSON 字符串发送给沙箱，因此必须是合法的 UTF-8
 * @throw client_error 未知的语言、源代码为空、没有测试点、限制不合法或超过上限、
 * 数据不是 UTF-8、没有比较器时缺少标准输出
 */
void validate(const submission &submit, const language_registry &registry);

template <typename T>
T &operator<<(T &os, const submission &submit) {
    os << "Submission[" << submit.judge_id << ":" << submit.language << "]";
    return os;
}

/**
 * @brief 一个测试点的评测结果
 */
struct case_result {
    verdict status = verdict::ACCEPTED;

    /**
     * @brief 选手程序的执行结果
     */
    sandbox::execution_result execution;

    /**
     * @brief 比较器输出的信息或者出错原因
     */
    std::string message;
};

/**
 * @brief 整个提交的评测结果
 * 评测流程结束后返回给调用方，评测流程本身随后被销毁
 */
struct submission_verdict {
    unsigned judge_id = 0;

    verdict status = verdict::ACCEPTED;

    /**
     * @brief 已经评测的测试点的结果，按照测试点顺序排列
     * 编译错误时为空，短路模式下只包含评测过的测试点
     */
    std::vector<case_result> cases;

    /**
     * @brief 所有已评测的测试点中最长的 CPU 时间
     */
    std::chrono::milliseconds time{0};

    /**
     * @brief 所有已评测的测试点中最大的内存使用（单位为字节）
     */
    std::uint64_t memory = 0;

    /**
     * @brief 编译器输出，只有编译型语言才有
     */
    std::string compile_log;
};

}  // namespace arbiter
