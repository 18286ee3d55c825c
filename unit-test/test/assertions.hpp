#pragma once

#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include "gtest/gtest.h"

/**
 * @brief 比较两个 JSON 文档，失败时输出两边的内容以及 JSON Patch 形式的差异
 * 报告、提交等 JSON 文档直接比较时 gtest 只能打印出难以阅读的单行文本。
 */
inline ::testing::AssertionResult compareJson(bool expect_equal,
                                              const char *actual_expression, const char *expected_expression,
                                              const nlohmann::json &actual, const nlohmann::json &expected) {
    if ((actual == expected) == expect_equal) return ::testing::AssertionSuccess();

    auto pretty = [](const nlohmann::json &j) {
        return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    };
    std::ostringstream ss;
    ss << actual_expression << (expect_equal ? " differs from " : " should differ from ")
       << expected_expression << std::endl
       << "Actual:" << std::endl
       << pretty(actual) << std::endl
       << "Expected:" << std::endl
       << pretty(expected) << std::endl;
    if (expect_equal) ss << "Patch to expected:" << std::endl << pretty(nlohmann::json::diff(actual, expected));
    return ::testing::AssertionFailure() << ss.str();
}

inline ::testing::AssertionResult jsonEqual(const char *lhs_expression, const char *rhs_expression,
                                            const nlohmann::json &lhs, const nlohmann::json &rhs) {
    return compareJson(true, lhs_expression, rhs_expression, lhs, rhs);
}

inline ::testing::AssertionResult jsonNotEqual(const char *lhs_expression, const char *rhs_expression,
                                               const nlohmann::json &lhs, const nlohmann::json &rhs) {
    return compareJson(false, lhs_expression, rhs_expression, lhs, rhs);
}

#define EXPECT_JSON_EQ(obj1, obj2) EXPECT_PRED_FORMAT2(jsonEqual, obj1, obj2)

#define EXPECT_JSON_NE(obj1, obj2) EXPECT_PRED_FORMAT2(jsonNotEqual, obj1, obj2)

#define ASSERT_JSON_EQ(obj1, obj2) ASSERT_PRED_FORMAT2(jsonEqual, obj1, obj2)
