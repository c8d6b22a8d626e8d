#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"

/**
 * Data model shared by the validator, the executor and the grader:
 * 1. execution_limits (resource ceilings of one execution)
 * 2. violation (a statically detected policy breach)
 * 3. execution_request / execution_result (one execution)
 */
namespace pysandbox {

/**
 * @brief resource ceilings of one execution
 * Every field is finite and positive, there is no unbounded mode.
 */
struct execution_limits {
    /**
     * @brief CPU-time ceiling in seconds
     * Enforced by RLIMIT_CPU in the child: SIGXCPU at the soft limit,
     * SIGKILL one second later.
     */
    double cpu_time_seconds = 5;

    /**
     * @brief real-time ceiling in seconds
     * Enforced by the supervisor, independently of CPU accounting.
     */
    double wall_clock_seconds = 5;

    /**
     * @brief address space ceiling in bytes (RLIMIT_AS)
     */
    int64_t max_memory_bytes = 50 * 1024 * 1024;

    /**
     * @brief per stream cap of captured stdout/stderr in bytes
     */
    int64_t max_output_bytes = 10 * 1024;

    /**
     * @brief file descriptor ceiling (RLIMIT_NOFILE)
     */
    int max_open_files = 10;

    /**
     * @brief process ceiling of the sandbox user (RLIMIT_NPROC)
     */
    int max_processes = 1;

    /**
     * @brief largest file the program may write in its scratch directory (RLIMIT_FSIZE)
     */
    int64_t max_file_bytes = 1024 * 1024;

    /**
     * @brief check every field is positive and finite
     * @throw std::invalid_argument naming the offending field
     */
    void verify() const;

    /**
     * @brief lower every field to at most the one of ceiling
     * @return true if some field was lowered
     */
    bool clamp(const execution_limits &ceiling);
};

bool operator==(const execution_limits &a, const execution_limits &b);

/**
 * @brief partial override of execution_limits carried by a request
 */
struct limits_override {
    std::optional<double> cpu_time_seconds;
    std::optional<double> wall_clock_seconds;
    std::optional<int64_t> max_memory_bytes;
    std::optional<int64_t> max_output_bytes;
    std::optional<int> max_open_files;
    std::optional<int> max_processes;
    std::optional<int64_t> max_file_bytes;

    /**
     * @brief apply the set fields on top of defaults
     */
    execution_limits apply(const execution_limits &defaults) const;
};

struct violation {
    violation_kind kind;

    /**
     * @brief human readable location and name, e.g. "import os at line 3"
     */
    std::string detail;

    /**
     * @brief 1-based source line, 0 when unknown
     */
    int line = 0;
};

bool operator==(const violation &a, const violation &b);
bool operator<(const violation &a, const violation &b);

/**
 * @brief one execution of untrusted code, created per invocation
 */
struct execution_request {
    std::string source;
    std::optional<std::string> stdin_data;
    execution_limits limits;
};

/**
 * @brief faithful, bounded report of one execution
 * Built once by the executor (or by the grader for a rejection) and never
 * mutated afterwards.
 */
struct execution_result {
    pysandbox::outcome outcome = pysandbox::outcome::SANDBOX_ERROR;

    /**
     * @brief captured stdout, at most max_output_bytes long
     */
    std::string stdout_data;

    /**
     * @brief captured stderr of the child only, at most max_output_bytes long
     */
    std::string stderr_data;

    bool truncated_stdout = false;
    bool truncated_stderr = false;

    /**
     * @brief present for COMPLETED and RUNTIME_FAILURE only
     * 128 + signal number when a runtime failure was a signal.
     */
    std::optional<int> exit_code;

    /**
     * @brief wall-clock duration in milliseconds
     */
    int64_t duration_ms = 0;

    /**
     * @brief user + system CPU time in milliseconds
     */
    int64_t cpu_time_ms = 0;

    /**
     * @brief peak resident set size in bytes, 0 when unknown
     */
    int64_t memory_used_bytes = 0;

    /**
     * @brief signal that terminated the child, if any
     */
    std::optional<int> signal;

    /**
     * @brief populated only when outcome == REJECTED
     */
    std::vector<violation> violations;

    /**
     * @brief short host-side description, only for SANDBOX_ERROR
     */
    std::string internal_error;
};

}  // namespace pysandbox
