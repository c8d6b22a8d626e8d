#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "config.hpp"
#include "judge/execution.hpp"
#include "judge/policy.hpp"
#include "judge/submission.hpp"
#include "judge/validator.hpp"

namespace pysandbox {

NLOHMANN_JSON_SERIALIZE_ENUM(outcome, {
    {outcome::REJECTED, "rejected"},
    {outcome::COMPLETED, "completed"},
    {outcome::TIMED_OUT, "timed_out"},
    {outcome::RESOURCE_EXCEEDED, "resource_exceeded"},
    {outcome::RUNTIME_FAILURE, "runtime_failure"},
    {outcome::SANDBOX_ERROR, "sandbox_error"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(violation_kind, {
    {violation_kind::FORBIDDEN_IMPORT, "forbidden_import"},
    {violation_kind::FORBIDDEN_CALL, "forbidden_call"},
    {violation_kind::FORBIDDEN_ATTRIBUTE_ACCESS, "forbidden_attribute_access"},
    {violation_kind::SYNTAX_ERROR, "syntax_error"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(submission_status, {
    {submission_status::PASSED, "passed"},
    {submission_status::FAILED, "failed"},
    {submission_status::ERRORED, "errored"},
})

void to_json(nlohmann::json &j, const violation &v);
void to_json(nlohmann::json &j, const execution_limits &limits);
void to_json(nlohmann::json &j, const execution_result &result);

/**
 * JSON messages exchanged with the grading orchestrator.
 * Parsing functions throw std::invalid_argument naming the offending field.
 */
namespace protocol {

/**
 * @brief { "source": str, "stdin"?: str, "limits"?: {partial limits} }
 */
struct execute_request {
    std::string source;
    std::optional<std::string> stdin_data;
    limits_override limits;
};

/**
 * @brief { "id"?: str, "source": str, "test_cases": [...], "limits"?: {partial limits} }
 */
struct grade_request {
    std::optional<std::string> id;
    std::string source;
    std::vector<test_case> test_cases;
    limits_override limits;
};

limits_override parse_limits(const nlohmann::json &j);

execute_request parse_execute_request(const nlohmann::json &j);

grade_request parse_grade_request(const nlohmann::json &j);

nlohmann::json execution_response(const execution_result &result);

/**
 * @param reveal_hidden keep input, expected output and captured output of
 * hidden cases, only for the orchestrator
 */
nlohmann::json submission_response(const submission &submit, const grade_request &request, bool reveal_hidden);

nlohmann::json validation_response(const validation_report &report);

/**
 * @brief effective default limits and ceilings
 */
nlohmann::json limits_response(const sandbox_config &config);

/**
 * @brief the active deny-lists
 */
nlohmann::json policy_response(const validation_policy &policy);

/**
 * @brief serialize a response on one line
 * Captured output is arbitrary bytes, invalid UTF-8 becomes U+FFFD.
 */
std::string dump(const nlohmann::json &j);

}  // namespace protocol
}  // namespace pysandbox
