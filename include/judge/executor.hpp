#pragma once

#include <filesystem>
#include "common/cancellation.hpp"
#include "config.hpp"
#include "judge/execution.hpp"

namespace pysandbox {

/**
 * @brief runs already validated code and classifies what happened
 */
struct executor {
    virtual ~executor();

    /**
     * @brief run request.source once in a fresh process
     * Expected conditions (timeouts, crashes, resource breaches) are
     * reported as the outcome of the result, infrastructure failures as a
     * SANDBOX_ERROR result.
     * @param cancel optional token, killing the child when it fires
     * @throw std::invalid_argument when the limits are not positive and finite
     * @throw execution_cancelled after the child was killed and reaped
     */
    virtual execution_result execute(const execution_request &request, const cancellation_token *cancel = nullptr) const = 0;
};

/**
 * @brief executor running the configured Python interpreter under runguard
 * Each call owns its scratch directory, child process and pipes, so one
 * instance may be used by many threads at once.
 */
class sandbox_executor : public executor {
public:
    explicit sandbox_executor(sandbox_config config);

    execution_result execute(const execution_request &request, const cancellation_token *cancel = nullptr) const override;

    const sandbox_config &config() const;

private:
    sandbox_config cfg;
    std::filesystem::path python;
};

}  // namespace pysandbox
