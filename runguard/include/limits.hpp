#pragma once

#include <linux/filter.h>
#include <vector>
#include "runguard_options.hpp"

namespace pysandbox::runguard {

/**
 * @brief compiled syscall filter, ready to be installed after fork
 */
struct seccomp_program {
    std::vector<struct sock_filter> filter;
};

/**
 * @brief compile the syscall filter of the child with libseccomp
 * Everything is allowed except socket creation and use, tracing other
 * processes, leaving the process group, namespace and mount manipulation,
 * kernel keyrings, BPF, module loading, and signalling processes other than
 * the child's own group. Those fail with EACCES (EPERM for kill) instead of killing the
 * child so the program sees an ordinary OSError.
 * Runs in the supervisor: libseccomp allocates, which is not allowed
 * between fork and exec.
 * @throw sandbox_error
 */
seccomp_program build_seccomp_filter();

/**
 * Limit current process resources usage.
 * Runs in the forked child: async-signal-safe, no allocation, no logging.
 * @return nullptr on success, otherwise the name of the failed step, errno set
 */
const char *set_restrictions(const runguard_options &opt);

/**
 * Limit syscalls
 * Sets PR_SET_NO_NEW_PRIVS and installs program. Must be the last step
 * before execve. Async-signal-safe.
 * @return nullptr on success, otherwise the name of the failed step, errno set
 */
const char *set_seccomp(const seccomp_program &program);

}  // namespace pysandbox::runguard
