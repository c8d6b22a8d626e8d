#pragma once

#include <optional>
#include <string>
#include <vector>
#include "judge/execution.hpp"

namespace pysandbox {

/**
 * @brief one input/expected-output pair of an exercise
 */
struct test_case {
    /**
     * @brief optional label shown to the student
     */
    std::optional<std::string> name;

    /**
     * @brief fed to stdin, no stdin when absent
     */
    std::optional<std::string> input;

    std::string expected_output;

    /**
     * @brief hidden cases are run and scored like the others, only the
     * student view of the protocol leaves their data out
     */
    bool hidden = false;

    /**
     * @brief share of the score, must be positive
     */
    double weight = 1.0;
};

struct test_result {
    /**
     * @brief index of the test case, absent for the result of a rejected submission
     */
    std::optional<size_t> index;

    execution_result result;

    bool passed = false;
};

/**
 * @brief graded submission, assembled once all cases ran or grading stopped
 */
struct submission {
    std::vector<test_result> test_results;

    /**
     * @brief weighted percentage of passed cases, in [0, 100]
     */
    double score = 0;

    submission_status status = submission_status::FAILED;

    size_t passed_count = 0;
    size_t total_count = 0;

    /**
     * @brief sum of the durations of the executed cases
     */
    int64_t duration_ms = 0;
};

}  // namespace pysandbox
