#include "judge/executor.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <signal.h>
#include <boost/algorithm/string/predicate.hpp>
#include <cmath>
#include <system_error>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "run.hpp"

namespace pysandbox {
using namespace std;

executor::~executor() = default;

sandbox_executor::sandbox_executor(sandbox_config config)
    : cfg(move(config)) {
    python = cfg.python_executable;
    // execve does not search PATH
    if (!python.empty() && !python.is_absolute()) {
        auto found = find_executable(python.string());
        if (found.empty())
            LOG(WARNING) << "Python interpreter " << python << " not found on PATH";
        else
            python = found;
    }
}

const sandbox_config &sandbox_executor::config() const {
    return cfg;
}

/**
 * @brief last non-empty line of stderr, where Python puts the exception
 */
static string last_line(const string &text) {
    size_t end = text.find_last_not_of(" \t\r\n");
    if (end == string::npos) return "";
    size_t begin = text.rfind('\n', end);
    begin = begin == string::npos ? 0 : begin + 1;
    return text.substr(begin, end - begin + 1);
}

/**
 * @brief did the program die of one of its resource ceilings
 */
static bool resource_exhausted(const runguard::run_metadata &meta) {
    if (meta.signal) {
        switch (*meta.signal) {
            case SIGXFSZ:
            case SIGSEGV:
            case SIGBUS:
                return true;
            case SIGKILL:
                // not sent by the supervisor nor by the CPU hard limit: OOM killer
                return !meta.terminated && !meta.cpu_limit_exceeded;
            case SIGABRT:
                return meta.stderr_tail.find("MemoryError") != string::npos ||
                       meta.stderr_tail.find("Cannot allocate memory") != string::npos ||
                       meta.stderr_tail.find("out of memory") != string::npos;
            default:
                return false;
        }
    }

    if (meta.exitcode == 0) return false;
    string line = last_line(meta.stderr_tail);
    return boost::algorithm::starts_with(line, "MemoryError") ||
           line.find("[Errno 24]") != string::npos ||  // EMFILE
           line.find("[Errno 27]") != string::npos;    // EFBIG, Python ignores SIGXFSZ
}

static execution_result classify(const runguard::run_metadata &meta) {
    execution_result result;
    result.stdout_data = meta.stdout_data;
    result.stderr_data = meta.stderr_data;
    result.truncated_stdout = meta.stdout_truncated;
    result.truncated_stderr = meta.stderr_truncated;
    result.duration_ms = llround(meta.wall_time * 1000);
    result.cpu_time_ms = llround((meta.user_time + meta.sys_time) * 1000);
    result.memory_used_bytes = meta.memory_bytes;
    result.signal = meta.signal;

    // resource classification takes precedence over timeout
    if (resource_exhausted(meta)) {
        result.outcome = outcome::RESOURCE_EXCEEDED;
    } else if (meta.wall_limit_exceeded || meta.cpu_limit_exceeded) {
        result.outcome = outcome::TIMED_OUT;
    } else if (meta.signal || meta.exitcode != 0) {
        result.outcome = outcome::RUNTIME_FAILURE;
        result.exit_code = meta.exitcode;
    } else {
        result.outcome = outcome::COMPLETED;
        result.exit_code = 0;
    }
    return result;
}

execution_result sandbox_executor::execute(const execution_request &request, const cancellation_token *cancel) const {
    execution_limits limits = request.limits;
    limits.verify();
    if (limits.clamp(cfg.limit_ceilings))
        LOG(WARNING) << "Requested limits exceed the configured ceilings, clamped";

    if (cancel && cancel->is_cancelled()) throw execution_cancelled();

    try {
        scratch_directory scratch(cfg.scratch_root);
        write_file_content(scratch.path() / "main.py", request.source);

        runguard::runguard_options opt;
        opt.command = {python.string(), "-I", "-u", "main.py"};
        opt.work_dir = scratch.path().string();
        opt.env = {"PATH=/usr/bin:/bin",
                   "HOME=" + scratch.path().string(),
                   "TMPDIR=" + scratch.path().string(),
                   "PYTHONDONTWRITEBYTECODE=1",
                   "PYTHONHASHSEED=0",
                   "PYTHONIOENCODING=utf-8",
                   "LANG=C.UTF-8"};
        for (auto &name : cfg.env_allowlist)
            if (auto value = get_env(name)) opt.env.push_back(name + "=" + *value);
        opt.stdin_data = request.stdin_data;

        opt.use_wall_limit = true;
        opt.wall_limit = {limits.wall_clock_seconds, limits.wall_clock_seconds};
        opt.use_cpu_limit = true;
        opt.cpu_limit = {limits.cpu_time_seconds, limits.cpu_time_seconds};
        opt.memory_limit = limits.max_memory_bytes;
        opt.file_limit = limits.max_file_bytes;
        opt.nofile = limits.max_open_files;
        opt.nproc = limits.max_processes;
        opt.stream_size = limits.max_output_bytes;
        opt.no_core_dumps = true;
        opt.use_seccomp = cfg.use_seccomp;
        opt.new_network_namespace = cfg.use_network_namespace;

        LOG(INFO) << fmt::format("Executing submission in {} (cpu {}s, wall {}s, memory {} bytes, output {} bytes)",
                                 scratch.path().string(), limits.cpu_time_seconds, limits.wall_clock_seconds,
                                 limits.max_memory_bytes, limits.max_output_bytes);

        auto meta = runguard::runit(opt, cancel);
        if (!scratch.release())
            LOG(WARNING) << "Scratch directory " << scratch.path() << " could not be removed";

        if (meta.cancelled) throw execution_cancelled();

        execution_result result = classify(meta);
        LOG(INFO) << "Execution finished: " << get_display_message(result.outcome) << " in " << result.duration_ms << "ms";
        return result;
    } catch (sandbox_error &e) {
        LOG(ERROR) << "Sandbox error: " << e;
        execution_result result;
        result.outcome = outcome::SANDBOX_ERROR;
        result.internal_error = e.what();
        return result;
    } catch (system_error &e) {
        LOG(ERROR) << "Sandbox error: " << e.what();
        execution_result result;
        result.outcome = outcome::SANDBOX_ERROR;
        result.internal_error = e.what();
        return result;
    }
}

}  // namespace pysandbox
