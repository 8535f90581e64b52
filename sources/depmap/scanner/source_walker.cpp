//
// Created by gregorian-rayne on 1/19/26.
//

#include "depmap/scanner/source_walker.hpp"

#include <algorithm>
#include <unordered_set>

namespace depmap::scanner {

    const std::vector<std::string>& default_excludes() {
        static const std::vector<std::string> excludes = {
            "__pycache__", ".git", ".venv", "venv", "env",
            "node_modules", ".tox", ".eggs", "build", "dist",
            ".pytest_cache", ".mypy_cache"
        };
        return excludes;
    }

    Result<std::vector<fs::path>, Error> collect_source_files(
        const fs::path& root,
        const std::vector<std::string>& extensions,
        const std::vector<std::string>& excludes
    ) {
        std::error_code ec;

        if (!fs::is_directory(root, ec)) {
            return Result<std::vector<fs::path>, Error>::failure(
                Error::invalid_argument("Not a directory", root.string())
            );
        }

        const std::unordered_set<std::string> excluded(excludes.begin(), excludes.end());
        std::vector<fs::path> files;

        fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            return Result<std::vector<fs::path>, Error>::failure(
                Error::io_error("Failed to list directory", root.string())
            );
        }

        for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (ec) {
                return Result<std::vector<fs::path>, Error>::failure(
                    Error::io_error("Failed to list directory", root.string())
                );
            }

            const auto& entry = *it;
            std::error_code entry_ec;

            if (entry.is_directory(entry_ec)) {
                const auto name = entry.path().filename().string();
                const auto relative = entry.path().lexically_relative(root).generic_string();
                if (excluded.contains(name) || excluded.contains(relative)) {
                    it.disable_recursion_pending();
                }
                continue;
            }

            if (!entry.is_regular_file(entry_ec)) {
                continue;
            }

            const auto ext = entry.path().extension().string();
            if (std::ranges::find(extensions, ext) != extensions.end()) {
                files.push_back(entry.path());
            }
        }

        std::ranges::sort(files);
        return Result<std::vector<fs::path>, Error>::success(std::move(files));
    }

}  // namespace depmap::scanner
