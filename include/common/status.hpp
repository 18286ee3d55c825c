#pragma once

namespace arbiter {

/**
 * @brief 表示数据点或整个提交的评测结果
 * 枚举值的顺序没有含义，严重程度参见 severity
 */
enum class verdict {
    /**
     * @brief 用户程序本测试点评测通过
     * 默认比较器会忽略行末空白字符以及文末的一个换行符
     */
    ACCEPTED = 0,

    /**
     * @brief 答案错误
     * 对于 testlib 风格的比较器，格式错误（退出码 2）也会返回 WA
     */
    WRONG_ANSWER = 1,

    /**
     * @brief 用户程序运行时间超出限制
     * CPU 时间超出限制，或者时钟时间超出沙箱给定的上限
     */
    TIME_LIMIT_EXCEEDED = 2,

    /**
     * @brief 用户程序运行内存超限
     */
    MEMORY_LIMIT_EXCEEDED = 3,

    /**
     * @brief 用户程序出现运行时错误
     * 返回值非零，或者因为信号而崩溃
     */
    RUNTIME_ERROR = 4,

    /**
     * @brief 用户程序输出内容过多，输出被截断
     */
    OUTPUT_LIMIT_EXCEEDED = 5,

    /**
     * @brief 比较程序编译失败、出错或超时
     * 这是出题时的错误，不能算作选手的错误，需要和 WA 区分开
     */
    CHECKER_ERROR = 6,

    /**
     * @brief 用户程序编译错误
     * 编译失败时不会评测任何测试点
     */
    COMPILATION_ERROR = 7
};

/**
 * @brief 沙箱执行一个程序之后的状态
 */
enum class execution_status {
    SUCCESS = 0,
    TIME_LIMIT_EXCEEDED = 1,
    MEMORY_LIMIT_EXCEEDED = 2,
    RUNTIME_ERROR = 3,

    /**
     * @brief 沙箱内部错误，比如拷贝文件失败
     * 评测流程遇到这种状态时会进入 ERRORED，不会当作选手的运行时错误
     */
    SANDBOX_ERROR = 4
};

const char *get_display_message(verdict);

const char *get_display_message(execution_status);

/**
 * @brief 评测结果的严重程度，越大越严重
 * COMPILATION_ERROR > RUNTIME_ERROR > MEMORY_LIMIT_EXCEEDED > TIME_LIMIT_EXCEEDED
 * > WRONG_ANSWER > OUTPUT_LIMIT_EXCEEDED > CHECKER_ERROR > ACCEPTED
 */
int severity(verdict);

/**
 * @brief 返回两个评测结果中更严重的那个，严重程度相同时返回 a
 */
verdict most_severe(verdict a, verdict b);

}  // namespace arbiter
