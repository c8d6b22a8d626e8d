#pragma once

#include <chrono>
#include <string>
#include <vector>
#include "common/cancellation.hpp"
#include "judge/executor.hpp"
#include "judge/submission.hpp"
#include "judge/validator.hpp"

namespace pysandbox {

/**
 * @brief canonical form of program output used for comparison
 * CRLF becomes LF, trailing blanks of every line and trailing empty lines
 * are removed.
 */
std::string normalize_output(const std::string &output);

/**
 * @brief runs a submission against its test cases and scores it
 * 1. validate once, a rejected submission is never executed
 * 2. execute every case in order, each in a fresh process
 * 3. retry a SANDBOX_ERROR once after the backoff, stop grading when it
 *    happens again
 * 4. score = 100 * sum(weights of passed cases) / sum(weights)
 */
class grader {
public:
    /**
     * @param check validator run before any execution
     * @param exec executor of the cases, must outlive the grader
     * @param retry_backoff pause before the retry of a SANDBOX_ERROR
     */
    grader(const validator &check, const executor &exec, std::chrono::milliseconds retry_backoff);

    /**
     * @throw std::invalid_argument when a weight is not positive or a limit is invalid
     * @throw execution_cancelled when cancel fires during a case
     */
    submission grade(const std::string &source, const std::vector<test_case> &cases,
                     const execution_limits &limits, const cancellation_token *cancel = nullptr) const;

private:
    execution_result run_case(const execution_request &request, const cancellation_token *cancel) const;

    const validator &check;
    const executor &exec;
    std::chrono::milliseconds retry_backoff;
};

}  // namespace pysandbox
