#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <string>
#include "sandbox/sandbox.hpp"

/**
 * go-judge 沙箱的 REST 接口
 * POST /run           执行命令，请求体为 {"cmd": [...]}，返回每条命令的执行结果
 * DELETE /file/{id}   删除缓存的文件
 *
 * 时间单位为纳秒，内存单位为字节。
 */
namespace arbiter::sandbox {

/**
 * @brief 将执行请求编码为 go-judge 的 /run 请求体
 */
nlohmann::json encode_request(const execution_request &request);

/**
 * @brief 将执行请求序列化为 /run 的请求体
 * 内容原样发送，不会把非 UTF-8 字节替换成 U+FFFD
 * @throw internal_error 请求中的内容不是合法的 UTF-8
 */
std::string serialize_request(const execution_request &request);

/**
 * @brief 解析 go-judge 的 /run 返回值
 * 标准输出和标准错误输出会按照 request 中的上限截断，无论沙箱实际返回了多少内容。
 * @param reply /run 返回的 JSON 数组
 * @param request 对应的请求
 * @throw sandbox_unavailable 返回值格式不正确
 */
execution_result decode_result(const nlohmann::json &reply, const execution_request &request);

/**
 * @brief 将 go-judge 的状态字符串转换为执行状态
 * 未知的状态都视为沙箱内部错误
 */
execution_status parse_status(const std::string &status);

/**
 * @brief 通过 HTTP 调用 go-judge 的沙箱客户端
 * 每次调用都创建新的 CURL 句柄，因此可以被多个线程同时使用。
 */
struct go_judge : public sandbox {
    /**
     * @param url 沙箱地址，比如 http://localhost:5050
     * @param guard_time 在请求的时钟时间限制之上额外等待的时间，
     * 超过后认为沙箱已经无响应
     */
    go_judge(std::string url, std::chrono::milliseconds guard_time);

    execution_result execute(const execution_request &request, const cancellation_token &token) override;

    void remove_file(const std::string &file_id) override;

private:
    std::string url;
    std::chrono::milliseconds guard_time;

    std::string perform(const std::string &method, const std::string &path, const std::string &body,
                        std::chrono::milliseconds timeout, std::size_t response_limit,
                        const cancellation_token *token);
};

}  // namespace arbiter::sandbox
