#pragma once

#include <filesystem>
#include "config.hpp"

namespace pysandbox::test {

/**
 * @brief configuration for tests, with a scratch root owned by this test process
 * The scratch root is created on first use and emptied by every
 * execution, count_scratch_dirs() checks that.
 */
sandbox_config make_test_config();

/**
 * @brief number of entries left in the scratch root of make_test_config()
 */
size_t count_scratch_dirs();

/**
 * @brief remove every SANDBOX_* variable a test may have set
 */
void clear_sandbox_env();

}  // namespace pysandbox::test
