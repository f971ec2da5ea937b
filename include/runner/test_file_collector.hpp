#pragma once

#include "core/error.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace logictest {

inline constexpr std::string_view kTestFileExtension = ".test";

/**
 * @brief Resolve command-line paths to the list of test files to run
 *
 * A file is taken as given (made absolute). A directory is walked
 * recursively and every regular file ending in ".test" is collected, in
 * lexicographic order within that directory tree. Paths keep the order in
 * which they were given.
 *
 * @return IO_ERROR naming the first path that does not exist
 */
[[nodiscard]] Result<std::vector<std::string>> collect_test_files(
    const std::vector<std::string>& paths);

} // namespace logictest
