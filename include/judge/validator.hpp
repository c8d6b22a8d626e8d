#pragma once

#include <set>
#include <string>
#include <vector>
#include "judge/execution.hpp"
#include "judge/policy.hpp"

namespace pysandbox {

/**
 * @brief everything the static check found in one source
 */
struct validation_report {
    /**
     * @brief ordered by line, without duplicates
     */
    std::vector<violation> violations;

    /**
     * @brief top-level packages of the rejected imports
     */
    std::set<std::string> blocked_imports;

    /**
     * @brief names of the rejected calls and attribute accesses
     */
    std::set<std::string> blocked_operations;

    bool safe() const;
};

/**
 * @brief static pre-execution gate
 * Parses the submission with the CPython parser of the embedded
 * interpreter and walks the syntax tree, nothing of the submission is
 * executed. Deterministic and side-effect free, safe to share between
 * threads once constructed. Requires a live python_runtime.
 */
class validator {
public:
    explicit validator(validation_policy policy);

    /**
     * @brief static check of source
     * @return violations ordered by line, empty when the source may run.
     * A source that does not parse yields exactly one SYNTAX_ERROR.
     * @throw sandbox_error when the embedded interpreter itself fails
     */
    std::vector<violation> validate(const std::string &source) const;

    /**
     * @brief validate with the names of what was blocked
     */
    validation_report inspect(const std::string &source) const;

    const validation_policy &policy() const;

private:
    validation_policy rules;
};

}  // namespace pysandbox
