#include "runner/test_file_collector.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <system_error>

namespace logictest {

namespace fs = std::filesystem;

Result<std::vector<std::string>> collect_test_files(const std::vector<std::string>& paths) {
    using R = Result<std::vector<std::string>>;
    std::vector<std::string> test_files;

    for (const auto& arg : paths) {
        std::error_code ec;
        const fs::path abs = fs::absolute(arg, ec);
        if (ec) {
            return R::error(ErrorCategory::IO_ERROR, std::format("{}: {}", arg, ec.message()));
        }

        const auto status = fs::status(abs, ec);
        if (ec || !fs::exists(status)) {
            return R::error(ErrorCategory::IO_ERROR, std::format("{}: no such file or directory", arg));
        }

        if (!fs::is_directory(status)) {
            test_files.push_back(abs.string());
            continue;
        }

        std::vector<std::string> found;
        fs::recursive_directory_iterator it(abs, fs::directory_options::skip_permission_denied, ec);
        const fs::recursive_directory_iterator end;
        while (!ec && it != end) {
            const auto& entry = *it;
            if (entry.is_regular_file(ec) && entry.path().extension().string() == kTestFileExtension) {
                found.push_back(entry.path().string());
            }
            it.increment(ec);
        }
        if (ec) {
            return R::error(ErrorCategory::IO_ERROR, std::format("{}: {}", arg, ec.message()));
        }

        std::sort(found.begin(), found.end());
        test_files.insert(test_files.end(), found.begin(), found.end());
    }

    return R::ok(std::move(test_files));
}

} // namespace logictest
