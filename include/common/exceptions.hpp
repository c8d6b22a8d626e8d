#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace pysandbox {

/**
 * @brief base of the sandbox exceptions, captures a stack trace for the log
 */
struct sandbox_exception : std::exception {
    sandbox_exception();
    explicit sandbox_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const sandbox_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief infrastructure failure of the sandbox itself
 * Pipe/fork/exec failures, scratch directory errors, signal delivery
 * failures. This is the only failure kind a caller may retry.
 */
struct sandbox_error : public sandbox_exception {
    sandbox_error();
    explicit sandbox_error(const std::string &message);
};

/**
 * @brief the caller cancelled an execution before it finished
 * Thrown after the child process group is killed and the scratch
 * directory is removed.
 */
struct execution_cancelled : public sandbox_exception {
    execution_cancelled();
    explicit execution_cancelled(const std::string &message);
};

/**
 * @brief invalid configuration value (environment, option, policy file)
 */
struct config_error : public sandbox_exception {
    config_error();
    explicit config_error(const std::string &message);
};

}  // namespace pysandbox
