#pragma once

#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include "gtest/gtest.h"

/**
 * gtest predicate formatters for JSON documents, printing both documents
 * and their JSON patch on failure.
 */
inline std::string describe_json_mismatch(const char *lhs_expression, const char *rhs_expression,
                                          const nlohmann::json &lhs, const nlohmann::json &rhs,
                                          bool expect_equal) {
    std::stringstream ss;
    ss << std::endl
       << "      Expected: " << lhs_expression << std::endl
       << "      Which is: " << lhs.dump(2) << std::endl
       << (expect_equal ? "To be equal to: " : "Not to be equal to: ") << rhs_expression << std::endl
       << "      Which is: " << rhs.dump(2) << std::endl;
    if (expect_equal)
        ss << "    Difference: " << nlohmann::json::diff(lhs, rhs).dump(2);
    return ss.str();
}

inline ::testing::AssertionResult json_equal(const char *lhs_expression, const char *rhs_expression,
                                             const nlohmann::json &lhs, const nlohmann::json &rhs) {
    if (lhs == rhs) return ::testing::AssertionSuccess();
    return ::testing::AssertionFailure() << describe_json_mismatch(lhs_expression, rhs_expression, lhs, rhs, true);
}

inline ::testing::AssertionResult json_not_equal(const char *lhs_expression, const char *rhs_expression,
                                                 const nlohmann::json &lhs, const nlohmann::json &rhs) {
    if (lhs != rhs) return ::testing::AssertionSuccess();
    return ::testing::AssertionFailure() << describe_json_mismatch(lhs_expression, rhs_expression, lhs, rhs, false);
}

#define EXPECT_JSON_EQ(obj1, obj2) EXPECT_PRED_FORMAT2(json_equal, obj1, obj2)
#define EXPECT_JSON_NE(obj1, obj2) EXPECT_PRED_FORMAT2(json_not_equal, obj1, obj2)
#define ASSERT_JSON_EQ(obj1, obj2) ASSERT_PRED_FORMAT2(json_equal, obj1, obj2)
