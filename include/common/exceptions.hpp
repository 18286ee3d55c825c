#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace arbiter {

struct judge_exception : std::exception {
    judge_exception();
    explicit judge_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const judge_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示提交本身不合法，比如未知的语言、缺少测试数据
 * 客户端错误会在提交进入评测队列之前直接返回给调用方，
 * 此时不会占用任何沙箱资源。
 */
struct client_error : public judge_exception {
    client_error();
    explicit client_error(const std::string &message);
};

/**
 * @brief 表示评测系统自身的故障，与选手程序无关
 * 监控系统会单独统计这一类错误，以免和选手的评测结果分布混在一起。
 */
struct infrastructure_error : public judge_exception {
    infrastructure_error();
    explicit infrastructure_error(const std::string &message);
};

/**
 * @brief 沙箱不可用
 * 网络错误（通常由 CURL 产生）、沙箱无响应、沙箱返回了无法解析的结果
 */
struct sandbox_unavailable : public infrastructure_error {
    sandbox_unavailable();
    explicit sandbox_unavailable(const std::string &message);
};

/**
 * @brief 提交从进入队列到评测完成的总时间超过上限，或者评测被取消
 * 与选手程序的 TIME_LIMIT_EXCEEDED 不同，这是评测系统的问题
 */
struct judge_timeout : public infrastructure_error {
    judge_timeout();
    explicit judge_timeout(const std::string &message);
};

/**
 * @brief 表示评测系统的内部错误
 * 一般是沙箱报告了内部错误，或者评测流程本身出现了问题
 */
struct internal_error : public infrastructure_error {
    internal_error();
    explicit internal_error(const std::string &message);
};

}  // namespace arbiter
