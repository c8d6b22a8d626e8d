#include "judge/execution.hpp"
#include <fmt/core.h>
#include <cmath>
#include <stdexcept>
#include <tuple>

namespace pysandbox {
using namespace std;

template <typename T>
static void ensure_positive(const char *name, T value) {
    if (!(value > 0) || !isfinite(static_cast<double>(value)))
        throw invalid_argument(fmt::format("limit {} must be positive and finite, got {}", name, value));
}

void execution_limits::verify() const {
    ensure_positive("cpu_time_seconds", cpu_time_seconds);
    ensure_positive("wall_clock_seconds", wall_clock_seconds);
    ensure_positive("max_memory_bytes", max_memory_bytes);
    ensure_positive("max_output_bytes", max_output_bytes);
    ensure_positive("max_open_files", max_open_files);
    ensure_positive("max_processes", max_processes);
    ensure_positive("max_file_bytes", max_file_bytes);
}

template <typename T>
static bool lower_to(T &value, T ceiling) {
    if (value <= ceiling) return false;
    value = ceiling;
    return true;
}

bool execution_limits::clamp(const execution_limits &ceiling) {
    bool lowered = false;
    lowered |= lower_to(cpu_time_seconds, ceiling.cpu_time_seconds);
    lowered |= lower_to(wall_clock_seconds, ceiling.wall_clock_seconds);
    lowered |= lower_to(max_memory_bytes, ceiling.max_memory_bytes);
    lowered |= lower_to(max_output_bytes, ceiling.max_output_bytes);
    lowered |= lower_to(max_open_files, ceiling.max_open_files);
    lowered |= lower_to(max_processes, ceiling.max_processes);
    lowered |= lower_to(max_file_bytes, ceiling.max_file_bytes);
    return lowered;
}

bool operator==(const execution_limits &a, const execution_limits &b) {
    return tie(a.cpu_time_seconds, a.wall_clock_seconds, a.max_memory_bytes, a.max_output_bytes,
               a.max_open_files, a.max_processes, a.max_file_bytes) ==
           tie(b.cpu_time_seconds, b.wall_clock_seconds, b.max_memory_bytes, b.max_output_bytes,
               b.max_open_files, b.max_processes, b.max_file_bytes);
}

execution_limits limits_override::apply(const execution_limits &defaults) const {
    execution_limits result = defaults;
    if (cpu_time_seconds) result.cpu_time_seconds = *cpu_time_seconds;
    if (wall_clock_seconds) result.wall_clock_seconds = *wall_clock_seconds;
    if (max_memory_bytes) result.max_memory_bytes = *max_memory_bytes;
    if (max_output_bytes) result.max_output_bytes = *max_output_bytes;
    if (max_open_files) result.max_open_files = *max_open_files;
    if (max_processes) result.max_processes = *max_processes;
    if (max_file_bytes) result.max_file_bytes = *max_file_bytes;
    return result;
}

bool operator==(const violation &a, const violation &b) {
    return a.kind == b.kind && a.detail == b.detail && a.line == b.line;
}

bool operator<(const violation &a, const violation &b) {
    return tie(a.line, a.kind, a.detail) < tie(b.line, b.kind, b.detail);
}

}  // namespace pysandbox
