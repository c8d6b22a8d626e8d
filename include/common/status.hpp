#pragma once

namespace pysandbox {

/**
 * @brief terminal classification of one execution
 */
enum class outcome {
    /**
     * @brief the validator found violations, the code never ran
     */
    REJECTED = 0,

    /**
     * @brief the program exited with status 0
     */
    COMPLETED = 1,

    /**
     * @brief the wall-clock deadline or the CPU-time ceiling was hit
     */
    TIMED_OUT = 2,

    /**
     * @brief memory, open files or file size ceiling was breached
     * Python reports address space exhaustion as MemoryError and fd
     * exhaustion as OSError errno 24, native code usually dies by
     * SIGSEGV/SIGBUS, the kernel OOM killer by SIGKILL.
     */
    RESOURCE_EXCEEDED = 3,

    /**
     * @brief the program itself failed (uncaught exception, nonzero exit)
     * stderr holds the traceback. A normal grading outcome, not a fault.
     */
    RUNTIME_FAILURE = 4,

    /**
     * @brief infrastructure failure, the only retryable outcome
     */
    SANDBOX_ERROR = 5
};

/**
 * @brief kind of a statically detected policy violation
 */
enum class violation_kind {
    FORBIDDEN_IMPORT = 0,
    FORBIDDEN_CALL = 1,
    FORBIDDEN_ATTRIBUTE_ACCESS = 2,
    SYNTAX_ERROR = 3
};

/**
 * @brief aggregated status of a graded submission
 */
enum class submission_status {
    /**
     * @brief every test case passed
     */
    PASSED = 0,

    /**
     * @brief at least one test case failed, no infrastructure error
     */
    FAILED = 1,

    /**
     * @brief the code was rejected or a SandboxError survived the retry
     */
    ERRORED = 2
};

const char *get_display_message(outcome);

const char *get_display_message(violation_kind);

const char *get_display_message(submission_status);

}  // namespace pysandbox
