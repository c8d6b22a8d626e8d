#pragma once

#include <filesystem>
#include <string>

namespace pysandbox {

/**
 * @brief read the whole content of a file
 * @param path file to read
 * @return file content (no encoding assumed)
 * @throw std::system_error when the file cannot be opened
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief write content to a file, replacing it
 * @throw std::system_error when the file cannot be written
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief execution-scoped working directory of the child process
 * Created with a unique name and mode 0700 under the scratch root, removed
 * recursively in the destructor whatever happened to the execution.
 * Two instances never share a directory.
 */
struct scratch_directory {
    /**
     * @param root parent directory, must exist
     * @throw sandbox_error when the directory cannot be created
     */
    explicit scratch_directory(const std::filesystem::path &root);
    scratch_directory(scratch_directory &&other);
    ~scratch_directory();

    scratch_directory(const scratch_directory &) = delete;
    scratch_directory &operator=(const scratch_directory &) = delete;

    const std::filesystem::path &path() const;

    /**
     * @brief remove the directory now
     * @return false if removal failed, the failure is logged
     */
    bool release();

private:
    std::filesystem::path dir;
};

}  // namespace pysandbox
