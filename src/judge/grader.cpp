#include "judge/grader.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <string.h>
#include <boost/algorithm/string/replace.hpp>
#include <cmath>
#include <stdexcept>
#include <thread>
#include "common/exceptions.hpp"

namespace pysandbox {
using namespace std;

string normalize_output(const string &output) {
    string text = boost::algorithm::replace_all_copy(output, "\r\n", "\n");

    vector<string> lines;
    size_t begin = 0;
    while (begin <= text.size()) {
        size_t end = text.find('\n', begin);
        if (end == string::npos) end = text.size();
        string line = text.substr(begin, end - begin);
        line.erase(line.find_last_not_of(" \t\r\f\v") + 1);
        lines.push_back(move(line));
        begin = end + 1;
    }
    while (!lines.empty() && lines.back().empty()) lines.pop_back();

    string result;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i) result += '\n';
        result += lines[i];
    }
    return result;
}

grader::grader(const validator &check, const executor &exec, chrono::milliseconds retry_backoff)
    : check(check), exec(exec), retry_backoff(retry_backoff) {}

/**
 * @brief sleep for the backoff, waking up early on cancellation
 */
static void backoff(chrono::milliseconds duration, const cancellation_token *cancel) {
    if (!cancel) {
        this_thread::sleep_for(duration);
        return;
    }
    struct pollfd pfd = {cancel->fd(), POLLIN, 0};
    if (poll(&pfd, 1, (int)duration.count()) < 0 && errno != EINTR)
        throw sandbox_error(fmt::format("waiting for retry backoff: {}", strerror(errno)));
    if (cancel->is_cancelled()) throw execution_cancelled();
}

execution_result grader::run_case(const execution_request &request, const cancellation_token *cancel) const {
    execution_result result = exec.execute(request, cancel);
    if (result.outcome != outcome::SANDBOX_ERROR) return result;

    LOG(WARNING) << "Sandbox error (" << result.internal_error << "), retrying once in "
                 << retry_backoff.count() << "ms";
    backoff(retry_backoff, cancel);
    return exec.execute(request, cancel);
}

submission grader::grade(const string &source, const vector<test_case> &cases,
                         const execution_limits &limits, const cancellation_token *cancel) const {
    limits.verify();
    double total_weight = 0;
    for (size_t i = 0; i < cases.size(); ++i) {
        if (!(cases[i].weight > 0) || !isfinite(cases[i].weight))
            throw invalid_argument(fmt::format("test case {} has a weight that is not positive and finite", i));
        total_weight += cases[i].weight;
    }

    submission submit;
    submit.total_count = cases.size();

    auto violations = check.validate(source);
    if (!violations.empty()) {
        test_result rejected;
        rejected.result.outcome = outcome::REJECTED;
        rejected.result.violations = move(violations);
        submit.test_results.push_back(move(rejected));
        submit.status = submission_status::ERRORED;
        submit.score = 0;
        LOG(INFO) << "Submission rejected before execution";
        return submit;
    }

    double passed_weight = 0;
    bool errored = false;
    for (size_t i = 0; i < cases.size(); ++i) {
        auto &testcase = cases[i];
        execution_request request = {source, testcase.input, limits};

        test_result current;
        current.index = i;
        current.result = run_case(request, cancel);
        current.passed = current.result.outcome == outcome::COMPLETED &&
                         normalize_output(current.result.stdout_data) == normalize_output(testcase.expected_output);

        submit.duration_ms += current.result.duration_ms;
        if (current.passed) {
            ++submit.passed_count;
            passed_weight += testcase.weight;
        }

        bool sandbox_failed = current.result.outcome == outcome::SANDBOX_ERROR;
        submit.test_results.push_back(move(current));
        if (sandbox_failed) {
            LOG(ERROR) << "Sandbox error persisted on test case " << i << ", grading stopped";
            errored = true;
            break;
        }
    }

    submit.score = total_weight > 0 ? 100 * passed_weight / total_weight : 0;
    if (errored)
        submit.status = submission_status::ERRORED;
    else if (!cases.empty() && submit.passed_count == cases.size())
        submit.status = submission_status::PASSED;
    else
        submit.status = submission_status::FAILED;

    LOG(INFO) << fmt::format("Submission graded: {} with score {:.2f} ({}/{} passed)",
                             get_display_message(submit.status), submit.score, submit.passed_count, submit.total_count);
    return submit;
}

}  // namespace pysandbox
