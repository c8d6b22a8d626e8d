#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pysandbox::runguard {

struct time_limit {
    double soft, hard;
};

/**
 * @brief what to run and under which ceilings
 * Every negative limit means "leave the inherited value".
 */
struct runguard_options {
    /**
     * @brief argv of the child, command[0] must be an absolute path
     */
    std::vector<std::string> command;

    /**
     * @brief working directory of the child
     */
    std::string work_dir;

    /**
     * @brief complete environment of the child as KEY=VALUE entries
     * Nothing of the supervisor's environment is inherited.
     */
    std::vector<std::string> env;

    /**
     * @brief bytes fed to the child's stdin, stdin is closed afterwards
     * Without data the child sees an empty stdin.
     */
    std::optional<std::string> stdin_data;

    bool use_wall_limit = false;
    struct time_limit wall_limit;  // wall clock time
    bool use_cpu_limit = false;
    struct time_limit cpu_limit;  // CPU time

    int64_t memory_limit = -1;  // RLIMIT_AS in bytes
    int64_t file_limit = -1;    // RLIMIT_FSIZE in bytes
    int nofile = -1;            // RLIMIT_NOFILE
    int nproc = -1;             // RLIMIT_NPROC
    int64_t stream_size = -1;   // cap of captured stdout/stderr, each
    bool no_core_dumps = true;

    /**
     * @brief deny sockets and other escape-prone syscalls with EACCES
     */
    bool use_seccomp = true;

    /**
     * @brief move the child into an empty network namespace
     */
    bool new_network_namespace = false;
};

}  // namespace pysandbox::runguard
