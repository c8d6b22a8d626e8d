#include "config.hpp"
#include <glog/logging.h>
#include <unistd.h>
#include <algorithm>
#include <thread>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace pysandbox {
using namespace std;

template <typename T>
static void assign_env(const string &key, T &value) {
    if (auto parsed = get_env_as<T>(key)) value = *parsed;
}

template <typename T>
static void raise_to(T &ceiling, T value) {
    if (ceiling < value) ceiling = value;
}

static bool get_env_flag(const string &key, bool def_value) {
    auto text = get_env(key);
    if (!text) return def_value;
    if (*text == "1" || *text == "true" || *text == "yes" || *text == "on") return true;
    if (*text == "0" || *text == "false" || *text == "no" || *text == "off") return false;
    throw config_error(fmt::format("environment variable {} has invalid value '{}'", key, *text));
}

static filesystem::path default_python() {
    // /usr/bin/python3 first: shims found earlier on PATH usually fork
    if (access("/usr/bin/python3", X_OK) == 0) return "/usr/bin/python3";
    return find_executable("python3");
}

sandbox_config load_config_from_env() {
    sandbox_config config;

    assign_env("SANDBOX_CPU_TIME_SECONDS", config.default_limits.cpu_time_seconds);
    assign_env("SANDBOX_WALL_CLOCK_SECONDS", config.default_limits.wall_clock_seconds);
    assign_env("SANDBOX_MAX_MEMORY_BYTES", config.default_limits.max_memory_bytes);
    assign_env("SANDBOX_MAX_OUTPUT_BYTES", config.default_limits.max_output_bytes);
    assign_env("SANDBOX_MAX_OPEN_FILES", config.default_limits.max_open_files);
    assign_env("SANDBOX_MAX_PROCESSES", config.default_limits.max_processes);
    assign_env("SANDBOX_MAX_FILE_BYTES", config.default_limits.max_file_bytes);

    config.fit_ceilings();

    config.python_executable = get_env("SANDBOX_PYTHON").value_or(default_python().string());
    config.scratch_root = get_env("SANDBOX_SCRATCH_DIR").value_or(filesystem::temp_directory_path().string());

    if (auto allowlist = get_env("SANDBOX_ENV_ALLOWLIST"))
        config.env_allowlist = split_list(*allowlist);

    config.use_seccomp = get_env_flag("SANDBOX_SECCOMP", true);
    config.use_network_namespace = get_env_flag("SANDBOX_NETWORK_NAMESPACE", false);

    if (auto policy = get_env("SANDBOX_POLICY_FILE"))
        config.policy_file = filesystem::path(*policy);

    if (auto backoff = get_env_as<long>("SANDBOX_RETRY_BACKOFF_MS"))
        config.retry_backoff = chrono::milliseconds(*backoff);

    config.workers = max(1u, thread::hardware_concurrency());
    assign_env("SANDBOX_WORKERS", config.workers);

    config.verify();
    return config;
}

void sandbox_config::fit_ceilings() {
    raise_to(limit_ceilings.cpu_time_seconds, default_limits.cpu_time_seconds);
    raise_to(limit_ceilings.wall_clock_seconds, default_limits.wall_clock_seconds);
    raise_to(limit_ceilings.max_memory_bytes, default_limits.max_memory_bytes);
    raise_to(limit_ceilings.max_output_bytes, default_limits.max_output_bytes);
    raise_to(limit_ceilings.max_open_files, default_limits.max_open_files);
    raise_to(limit_ceilings.max_processes, default_limits.max_processes);
    raise_to(limit_ceilings.max_file_bytes, default_limits.max_file_bytes);
}

void sandbox_config::verify() const {
    try {
        default_limits.verify();
        limit_ceilings.verify();
    } catch (invalid_argument &e) {
        throw config_error(e.what());
    }

    if (python_executable.empty())
        throw config_error("no Python interpreter found, set SANDBOX_PYTHON");
    if (!filesystem::is_directory(scratch_root))
        throw config_error("scratch directory " + scratch_root.string() + " does not exist");
    if (retry_backoff.count() < 0)
        throw config_error("retry backoff must not be negative");
    if (workers == 0)
        throw config_error("at least one worker is required");
}

}  // namespace pysandbox
