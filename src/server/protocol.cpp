#include "server/protocol.hpp"
#include <fmt/core.h>
#include <cstdint>
#include <limits>
#include <type_traits>
#include "common/json_utils.hpp"

namespace pysandbox {
using namespace std;
using namespace nlohmann;

void to_json(json &j, const violation &v) {
    j = {{"kind", v.kind}, {"detail", v.detail}, {"line", v.line}};
}

void to_json(json &j, const execution_limits &limits) {
    j = {{"cpu_time_seconds", limits.cpu_time_seconds},
         {"wall_clock_seconds", limits.wall_clock_seconds},
         {"max_memory_bytes", limits.max_memory_bytes},
         {"max_output_bytes", limits.max_output_bytes},
         {"max_open_files", limits.max_open_files},
         {"max_processes", limits.max_processes},
         {"max_file_bytes", limits.max_file_bytes}};
}

void to_json(json &j, const execution_result &result) {
    j = {{"outcome", result.outcome},
         {"stdout", result.stdout_data},
         {"stderr", result.stderr_data},
         {"truncated_stdout", result.truncated_stdout},
         {"truncated_stderr", result.truncated_stderr},
         {"duration_ms", result.duration_ms},
         {"cpu_time_ms", result.cpu_time_ms},
         {"memory_used_bytes", result.memory_used_bytes}};
    if (result.exit_code) j["exit_code"] = *result.exit_code;
    if (result.signal) j["signal"] = *result.signal;
    if (result.outcome == outcome::REJECTED) j["violations"] = result.violations;
    if (result.outcome == outcome::SANDBOX_ERROR) j["internal_error"] = result.internal_error;
}

namespace protocol {

static void require_object(const json &j, const char *what) {
    if (!j.is_object()) throw invalid_argument(fmt::format("{} must be a JSON object", what));
}

template <typename T>
static optional<T> get_number(const json &j, const char *key) {
    if (!exists(j, key)) return nullopt;
    const json &value = j.at(key);
    if (!value.is_number())
        throw build_invalid_argument("unexpected value type of field", "limits", key);
    if constexpr (is_integral_v<T>) {
        if (!value.is_number_integer())
            throw build_invalid_argument("expected an integer in field", "limits", key);
        bool in_range;
        if (value.is_number_unsigned())
            in_range = value.get<uint64_t>() <= (uint64_t)numeric_limits<T>::max();
        else
            in_range = value.get<int64_t>() >= (int64_t)numeric_limits<T>::min() &&
                       value.get<int64_t>() <= (int64_t)numeric_limits<T>::max();
        if (!in_range) throw build_invalid_argument("value out of range in field", "limits", key);
    }
    return value.get<T>();
}

limits_override parse_limits(const json &j) {
    limits_override limits;
    if (j.is_null()) return limits;
    require_object(j, "limits");
    limits.cpu_time_seconds = get_number<double>(j, "cpu_time_seconds");
    limits.wall_clock_seconds = get_number<double>(j, "wall_clock_seconds");
    limits.max_memory_bytes = get_number<int64_t>(j, "max_memory_bytes");
    limits.max_output_bytes = get_number<int64_t>(j, "max_output_bytes");
    limits.max_open_files = get_number<int>(j, "max_open_files");
    limits.max_processes = get_number<int>(j, "max_processes");
    limits.max_file_bytes = get_number<int64_t>(j, "max_file_bytes");
    return limits;
}

static json member_or_null(const json &j, const char *key) {
    const json *ref = find_path(j, key);
    return ref ? *ref : json();
}

execute_request parse_execute_request(const json &j) {
    require_object(j, "execute request");
    execute_request request;
    request.source = get_value<string>(j, "source");
    request.stdin_data = get_optional<string>(j, "stdin");
    request.limits = parse_limits(member_or_null(j, "limits"));
    return request;
}

static test_case parse_test_case(const json &j, size_t index) {
    if (!j.is_object()) throw invalid_argument(fmt::format("test case {} must be a JSON object", index));
    test_case testcase;
    try {
        testcase.name = get_optional<string>(j, "name");
        testcase.input = get_optional<string>(j, "input");
        testcase.expected_output = get_value<string>(j, "expected_output");
        testcase.hidden = get_optional<bool>(j, "hidden").value_or(false);
        testcase.weight = get_optional<double>(j, "weight").value_or(1.0);
    } catch (invalid_argument &e) {
        throw invalid_argument(fmt::format("test case {}: {}", index, e.what()));
    }
    return testcase;
}

grade_request parse_grade_request(const json &j) {
    require_object(j, "grade request");
    grade_request request;
    if (exists(j, "id")) {
        const json &id = j.at("id");
        request.id = id.is_string() ? id.get<string>() : id.dump();
    }
    request.source = get_value<string>(j, "source");

    const json &cases = access(j, "test_cases");
    if (!cases.is_array()) throw invalid_argument("test_cases must be an array");
    for (size_t i = 0; i < cases.size(); ++i)
        request.test_cases.push_back(parse_test_case(cases[i], i));

    request.limits = parse_limits(member_or_null(j, "limits"));
    return request;
}

json execution_response(const execution_result &result) {
    return result;
}

json submission_response(const submission &submit, const grade_request &request, bool reveal_hidden) {
    json results = json::array();
    for (auto &item : submit.test_results) {
        json entry = {{"passed", item.passed}, {"hidden", false}};
        json result = item.result;

        if (item.index && *item.index < request.test_cases.size()) {
            auto &testcase = request.test_cases[*item.index];
            entry["index"] = *item.index;
            entry["hidden"] = testcase.hidden;
            if (testcase.name) entry["name"] = *testcase.name;

            if (testcase.hidden && !reveal_hidden) {
                result.erase("stdout");
                result.erase("stderr");
            } else {
                entry["input"] = testcase.input ? json(*testcase.input) : json();
                entry["expected_output"] = testcase.expected_output;
            }
        }
        entry["result"] = move(result);
        results.push_back(move(entry));
    }

    json j = {{"status", submit.status},
              {"score", submit.score},
              {"passed_count", submit.passed_count},
              {"total_count", submit.total_count},
              {"duration_ms", submit.duration_ms},
              {"test_results", move(results)}};
    if (request.id) j["id"] = *request.id;
    return j;
}

json validation_response(const validation_report &report) {
    return {{"safe", report.safe()},
            {"violations", report.violations},
            {"blocked_imports", report.blocked_imports},
            {"blocked_operations", report.blocked_operations}};
}

json limits_response(const sandbox_config &config) {
    return {{"defaults", config.default_limits}, {"ceilings", config.limit_ceilings}};
}

json policy_response(const validation_policy &policy) {
    return {{"forbidden_modules", policy.forbidden_modules},
            {"forbidden_builtins", policy.forbidden_builtins},
            {"forbidden_attributes", policy.forbidden_attributes}};
}

string dump(const json &j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

}  // namespace protocol
}  // namespace pysandbox
