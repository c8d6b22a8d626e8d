#pragma once

#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include "common/cancellation.hpp"
#include "common/concurrent_queue.hpp"
#include "config.hpp"
#include "judge/executor.hpp"
#include "judge/validator.hpp"

/**
 * Batch grading service.
 * The main thread reads grading jobs, one JSON grade request per line,
 * and pushes them to the job queue. Every worker pops a job, grades it and
 * writes the response as one JSON line tagged with the job id, so
 * responses appear in completion order. An empty job tells a worker to
 * exit once the input is exhausted.
 */
namespace pysandbox {

struct grading_job {
    /**
     * @brief 1-based input line, the id of a job without one
     */
    size_t line_number;

    std::string request;
};

/**
 * @brief what every worker shares, read-only apart from the output stream
 */
struct worker_context {
    const validator &check;
    const executor &exec;
    const sandbox_config &config;

    /**
     * @brief fired on SIGINT/SIGTERM, kills every running child
     */
    const cancellation_token *cancel = nullptr;

    bool reveal_hidden = false;

    std::ostream &out;
    std::mutex &out_mutex;
};

struct batch_summary {
    size_t jobs = 0;

    /**
     * @brief jobs answered with an error instead of a submission
     */
    size_t rejected_requests = 0;

    /**
     * @brief submissions stopped by a SandboxError that survived the retry
     */
    size_t sandbox_errors = 0;

    bool cancelled = false;
};

enum class job_result {
    GRADED,
    INVALID_REQUEST,
    SANDBOX_ERROR,
    CANCELLED
};

/**
 * @brief grade one job
 * @param response set to the JSON line answering the job
 */
job_result process_job(const grading_job &job, const worker_context &ctx, std::string &response);

/**
 * @brief start a worker thread consuming jobs until it pops an empty one
 */
std::thread start_worker(size_t worker_id, concurrent_queue<std::optional<grading_job>> &job_queue,
                         const worker_context &ctx, batch_summary &summary, std::mutex &summary_mutex);

/**
 * @brief grade every line of in on a pool of workers
 * Stops reading when ctx.cancel fires, jobs already queued are answered
 * with a cancellation error.
 */
batch_summary run_batch(std::istream &in, size_t workers, const worker_context &ctx);

}  // namespace pysandbox
