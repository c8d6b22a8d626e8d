#include "worker.hpp"
#include <glog/logging.h>
#include <istream>
#include <ostream>
#include <vector>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"
#include "judge/grader.hpp"
#include "server/protocol.hpp"

namespace pysandbox {
using namespace std;
using namespace nlohmann;

// queued jobs per worker thread while a batch is read
const size_t jobs_per_worker = 4;

static string error_response(const json &id, const string &message) {
    return protocol::dump({{"id", id}, {"error", message}});
}

job_result process_job(const grading_job &job, const worker_context &ctx, string &response) {
    json id = to_string(job.line_number);
    try {
        json j = json::parse(job.request);
        if (j.is_object() && exists(j, "id")) id = j.at("id");

        auto request = protocol::parse_grade_request(j);
        if (!request.id) request.id = id.get<string>();

        grader g(ctx.check, ctx.exec, ctx.config.retry_backoff);
        auto submit = g.grade(request.source, request.test_cases,
                              request.limits.apply(ctx.config.default_limits), ctx.cancel);
        response = protocol::dump(protocol::submission_response(submit, request, ctx.reveal_hidden));

        if (submit.status == submission_status::ERRORED && !submit.test_results.empty() &&
            submit.test_results.back().result.outcome == outcome::SANDBOX_ERROR)
            return job_result::SANDBOX_ERROR;
        return job_result::GRADED;
    } catch (json::exception &e) {
        LOG(WARNING) << "Job at line " << job.line_number << " is not valid JSON: " << e.what();
        response = error_response(id, string("invalid JSON: ") + e.what());
        return job_result::INVALID_REQUEST;
    } catch (invalid_argument &e) {
        LOG(WARNING) << "Job at line " << job.line_number << " is malformed: " << e.what();
        response = error_response(id, e.what());
        return job_result::INVALID_REQUEST;
    } catch (execution_cancelled &e) {
        response = error_response(id, e.what());
        return job_result::CANCELLED;
    } catch (sandbox_error &e) {
        LOG(ERROR) << "Job at line " << job.line_number << " failed: " << e;
        response = error_response(id, e.what());
        return job_result::SANDBOX_ERROR;
    }
}

static void worker_loop(size_t worker_id, concurrent_queue<optional<grading_job>> &job_queue,
                        const worker_context &ctx, batch_summary &summary, mutex &summary_mutex) {
    LOG(INFO) << "Worker " << worker_id << " started";
    while (true) {
        auto job = job_queue.pop();
        if (!job) break;

        string response;
        job_result result;
        if (ctx.cancel && ctx.cancel->is_cancelled()) {
            response = error_response(to_string(job->line_number), execution_cancelled().what());
            result = job_result::CANCELLED;
        } else {
            result = process_job(*job, ctx, response);
        }

        {
            scoped_lock lock(ctx.out_mutex);
            ctx.out << response << '\n';
            ctx.out.flush();
        }
        {
            scoped_lock lock(summary_mutex);
            ++summary.jobs;
            if (result == job_result::INVALID_REQUEST) ++summary.rejected_requests;
            if (result == job_result::SANDBOX_ERROR) ++summary.sandbox_errors;
            if (result == job_result::CANCELLED) summary.cancelled = true;
        }
    }
    LOG(INFO) << "Worker " << worker_id << " stopped";
}

thread start_worker(size_t worker_id, concurrent_queue<optional<grading_job>> &job_queue,
                    const worker_context &ctx, batch_summary &summary, mutex &summary_mutex) {
    return thread([worker_id, &job_queue, &ctx, &summary, &summary_mutex] {
        worker_loop(worker_id, job_queue, ctx, summary, summary_mutex);
    });
}

batch_summary run_batch(istream &in, size_t workers, const worker_context &ctx) {
    if (workers == 0) workers = 1;

    // the reader stays a few jobs ahead of the workers
    concurrent_queue<optional<grading_job>> job_queue(jobs_per_worker * workers);
    batch_summary summary;
    mutex summary_mutex;

    vector<thread> threads;
    for (size_t i = 0; i < workers; ++i)
        threads.push_back(start_worker(i, job_queue, ctx, summary, summary_mutex));

    string line;
    size_t line_number = 0;
    while (getline(in, line)) {
        ++line_number;
        if (line.find_first_not_of(" \t\r") == string::npos) continue;
        if (ctx.cancel && ctx.cancel->is_cancelled()) {
            LOG(WARNING) << "Batch cancelled, no more jobs are read";
            break;
        }
        job_queue.push(grading_job{line_number, move(line)});
    }

    // one stop marker per worker, queued behind every job
    for (size_t i = 0; i < workers; ++i) job_queue.push(nullopt);
    for (auto &thd : threads) thd.join();

    scoped_lock lock(summary_mutex);
    if (ctx.cancel && ctx.cancel->is_cancelled()) summary.cancelled = true;
    LOG(INFO) << "Batch finished: " << summary.jobs << " jobs, " << summary.rejected_requests
              << " malformed, " << summary.sandbox_errors << " sandbox errors";
    return summary;
}

}  // namespace pysandbox
