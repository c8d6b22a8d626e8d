#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "judge/execution.hpp"

namespace pysandbox {

/**
 * @brief configuration of the sandbox, loaded once at start-up
 * Environment variables (SANDBOX_*) first, then command-line options of
 * the pysandbox executable on top. Immutable once handed to the executor.
 */
struct sandbox_config {
    /**
     * @brief limits applied when a request does not override them
     * SANDBOX_CPU_TIME_SECONDS, SANDBOX_WALL_CLOCK_SECONDS,
     * SANDBOX_MAX_MEMORY_BYTES, SANDBOX_MAX_OUTPUT_BYTES,
     * SANDBOX_MAX_OPEN_FILES, SANDBOX_MAX_PROCESSES, SANDBOX_MAX_FILE_BYTES
     */
    execution_limits default_limits;

    /**
     * @brief upper bounds of request overrides, larger values are clamped
     */
    execution_limits limit_ceilings = {
        30,                  // cpu_time_seconds
        30,                  // wall_clock_seconds
        512 * 1024 * 1024,   // max_memory_bytes
        1024 * 1024,         // max_output_bytes
        64,                  // max_open_files
        16,                  // max_processes
        64 * 1024 * 1024     // max_file_bytes
    };

    /**
     * @brief the Python interpreter running submissions (SANDBOX_PYTHON)
     * Must not be a wrapper script: the child may not be allowed to fork.
     */
    std::filesystem::path python_executable;

    /**
     * @brief parent of the per-execution scratch directories (SANDBOX_SCRATCH_DIR)
     * Defaults to the system temporary directory.
     */
    std::filesystem::path scratch_root;

    /**
     * @brief host environment variables passed to the child (SANDBOX_ENV_ALLOWLIST)
     * Nothing else of the host environment is inherited.
     */
    std::vector<std::string> env_allowlist;

    /**
     * @brief install the syscall filter denying sockets (SANDBOX_SECCOMP)
     */
    bool use_seccomp = true;

    /**
     * @brief move the child into a new network namespace (SANDBOX_NETWORK_NAMESPACE)
     * Requires CAP_SYS_ADMIN, otherwise every spawn fails.
     */
    bool use_network_namespace = false;

    /**
     * @brief JSON file replacing the built-in deny-lists (SANDBOX_POLICY_FILE)
     */
    std::optional<std::filesystem::path> policy_file;

    /**
     * @brief pause before the single retry of a SandboxError (SANDBOX_RETRY_BACKOFF_MS)
     */
    std::chrono::milliseconds retry_backoff{200};

    /**
     * @brief number of worker threads of the batch command (SANDBOX_WORKERS)
     */
    std::size_t workers = 1;

    /**
     * @brief raise the ceilings to at least the default limits
     * The operator's own defaults are never clamped.
     */
    void fit_ceilings();

    /**
     * @brief check the configuration is usable
     * @throw config_error
     */
    void verify() const;
};

/**
 * @brief build the configuration from SANDBOX_* environment variables
 * @throw config_error when a variable holds an invalid value
 */
sandbox_config load_config_from_env();

}  // namespace pysandbox
