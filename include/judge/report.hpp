#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "judge/submission.hpp"

/**
 * 提交和评测结果的 JSON 格式
 *
 * 提交：
 * {
 *   "id": "可选，原样出现在评测结果中",
 *   "language": "cpp",
 *   "source": "...",
 *   "time_limit": 1000,         // 毫秒
 *   "memory_limit": 268435456,  // 字节
 *   "judge_all": false,         // 是否评测所有测试点
 *   "checker": "...",           // 可选，比较器源代码
 *   "test_cases": [{"input": "...", "output": "...", "time_limit": 2000, "memory_limit": 0}]
 * }
 *
 * 评测结果：
 * {
 *   "id": "...",
 *   "category": "judged" | "client_error" | "infrastructure_error",
 *   "verdict": "Accepted", "time": 12, "memory": 1048576,
 *   "cases": [{"verdict", "time", "memory", "exit_code", "signal", "message"}],
 *   "compile_log": "...",
 *   "error": "..."
 * }
 */
namespace arbiter {

void from_json(const nlohmann::json &j, test_case &value);

void from_json(const nlohmann::json &j, submission &value);

void to_json(nlohmann::json &j, const case_result &value);

void to_json(nlohmann::json &j, const submission_verdict &value);

/**
 * @brief 解析一个提交
 * @throw client_error 提交的格式不正确
 */
submission parse_submission(const nlohmann::json &j);

/**
 * @brief 解析一个提交或者一个提交数组
 * @throw client_error 提交的格式不正确
 */
std::vector<nlohmann::json> split_submissions(const nlohmann::json &j);

/**
 * @brief 提交得到评测结果时的报告
 */
nlohmann::json judged_report(const std::string &id, const submission_verdict &result);

/**
 * @brief 提交被拒绝时的报告
 */
nlohmann::json client_error_report(const std::string &id, const std::string &message);

/**
 * @brief 评测系统故障时的报告
 */
nlohmann::json infrastructure_error_report(const std::string &id, const std::string &message);

}  // namespace arbiter
