#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "common/cancellation.hpp"
#include "runguard_options.hpp"

namespace pysandbox::runguard {

/**
 * @brief everything observed about one supervised run
 */
struct run_metadata {
    /**
     * @brief exit status, or 128 + signal when the child was killed
     */
    int exitcode = 0;

    /**
     * @brief signal that terminated the child
     */
    std::optional<int> signal;

    double wall_time = 0;  // seconds
    double user_time = 0;  // seconds
    double sys_time = 0;   // seconds

    /**
     * @brief peak resident set size in bytes
     */
    int64_t memory_bytes = 0;

    bool wall_limit_exceeded = false;
    bool cpu_limit_exceeded = false;
    bool cancelled = false;

    /**
     * @brief the supervisor sent SIGTERM/SIGKILL to the child's group
     */
    bool terminated = false;

    std::string stdout_data, stderr_data;

    /**
     * @brief last bytes of stderr, kept even when the capture is truncated
     */
    std::string stderr_tail;

    bool stdout_truncated = false;
    bool stderr_truncated = false;
    size_t stdin_bytes = 0;
    size_t stdout_bytes = 0;
    size_t stderr_bytes = 0;
};

/**
 * @brief run the command of opt in a supervised child process
 * 1. compile the syscall filter, prepare argv/envp, create the pipes
 * 2. fork, the child:
 *    1. starts a new session so its whole process group can be killed at once
 *    2. connects stdin/stdout/stderr to the pipes, marks every other fd close-on-exec
 *    3. changes to the working directory
 *    4. installs rlimits (CPU, address space, fsize, nofile, nproc, core)
 *    5. optionally unshares the network namespace
 *    6. installs the syscall filter and calls execve
 *    Any failing step is reported through a close-on-exec pipe, the command
 *    never runs without its ceilings.
 * 3. the supervisor polls the output pipes, the stdin pipe, a pidfd of the
 *    child and the cancellation descriptor until the child exits, the wall
 *    deadline passes or the caller cancels. Output above stream_size is read
 *    and discarded.
 * 4. on deadline or cancellation the group gets SIGTERM, then SIGKILL 100ms later
 * 5. the child is reaped with wait4 for its resource usage, the whole group
 *    is killed so no grandchild survives, the pipes are drained.
 * Uses no signal handlers and no timers, so it can run on many threads at once.
 * @param cancel optional, polled for cancellation
 * @throw sandbox_error on any infrastructure failure, the child is killed
 * and reaped before
 */
run_metadata runit(const runguard_options &opt, const cancellation_token *cancel = nullptr);

}  // namespace pysandbox::runguard
