#pragma once

#include <filesystem>
#include <set>
#include <string>

namespace pysandbox {

/**
 * @brief deny-lists consulted by the validator
 * Loaded once at start-up and injected, never mutated afterwards. The
 * attribute list is expected to grow as new reflection vectors show up.
 */
struct validation_policy {
    /**
     * @brief top-level packages that may not be imported
     */
    std::set<std::string> forbidden_modules;

    /**
     * @brief builtin functions that may not be called by bare name
     */
    std::set<std::string> forbidden_builtins;

    /**
     * @brief attribute names that may not be accessed
     */
    std::set<std::string> forbidden_attributes;
};

/**
 * @brief the built-in policy
 */
const validation_policy &default_policy();

/**
 * @brief read a policy from a JSON file
 * The file is an object with optional "forbidden_modules",
 * "forbidden_builtins" and "forbidden_attributes" string arrays. Missing
 * keys keep the built-in list.
 * @throw config_error when the file is unreadable or malformed
 */
validation_policy load_policy(const std::filesystem::path &path);

}  // namespace pysandbox
