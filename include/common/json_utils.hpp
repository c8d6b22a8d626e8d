#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace pysandbox {

/**
 * @brief follow a path of object keys
 * @return the addressed value, or nullptr when some key is missing
 */
template <typename... Keys>
const nlohmann::json *find_path(const nlohmann::json &j, const Keys &... keys) {
    const nlohmann::json *ref = j.is_null() ? nullptr : &j;
    auto step = [&ref](const auto &key) {
        if (ref && ref->is_object() && ref->count(key))
            ref = &ref->at(key);
        else
            ref = nullptr;
    };
    (step(keys), ...);
    return ref;
}

template <typename... Keys>
bool exists(const nlohmann::json &j, const Keys &... keys) {
    const nlohmann::json *ref = find_path(j, keys...);
    return ref && !ref->is_null();
}

template <typename... Keys>
std::invalid_argument build_invalid_argument(const char *problem, const Keys &... keys) {
    std::string path;
    ((path += (path.empty() ? "" : "."), path += keys), ...);
    return std::invalid_argument(std::string(problem) + ": " + path);
}

template <typename... Keys>
const nlohmann::json &access(const nlohmann::json &j, const Keys &... keys) {
    const nlohmann::json *ref = find_path(j, keys...);
    if (!ref || ref->is_null())
        throw build_invalid_argument("missing field", keys...);
    return *ref;
}

template <typename T, typename... Keys>
T get_value(const nlohmann::json &j, const Keys &... keys) {
    const nlohmann::json &res = access(j, keys...);
    try {
        return res.get<T>();
    } catch (nlohmann::json::exception &) {
        throw build_invalid_argument("unexpected value type of field", keys...);
    }
}

/**
 * @brief like get_value, but a missing or null field gives nullopt
 */
template <typename T, typename... Keys>
std::optional<T> get_optional(const nlohmann::json &j, const Keys &... keys) {
    if (!exists(j, keys...)) return std::nullopt;
    return get_value<T>(j, keys...);
}

}  // namespace pysandbox
