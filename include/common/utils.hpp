#pragma once

#include <fmt/core.h>
#include <boost/lexical_cast.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "common/exceptions.hpp"

namespace pysandbox {

/**
 * @brief look up an environment variable
 * @param key name of the variable
 * @param def_value returned when the variable is not set
 * @return value of the variable, or def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief look up an environment variable
 * @return value of the variable, or nullopt when unset or empty
 */
std::optional<std::string> get_env(const std::string &key);

/**
 * @brief parse an environment variable as T
 * @throw config_error when the variable is set but cannot be parsed
 */
template <typename T>
std::optional<T> get_env_as(const std::string &key) {
    auto text = get_env(key);
    if (!text) return std::nullopt;
    try {
        return boost::lexical_cast<T>(*text);
    } catch (boost::bad_lexical_cast &) {
        throw config_error(fmt::format("environment variable {} has invalid value '{}'", key, *text));
    }
}

/**
 * @brief split a comma separated list, trimming blanks and dropping empty items
 */
std::vector<std::string> split_list(const std::string &text);

/**
 * @brief find an executable by name in the directories of PATH
 * @return absolute path, or an empty path if not found. Names containing
 * a slash are returned unchanged.
 */
std::filesystem::path find_executable(const std::string &name);

}  // namespace pysandbox
