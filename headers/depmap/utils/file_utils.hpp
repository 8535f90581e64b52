//
// Created by gregorian-rayne on 1/14/26.
//

#ifndef DEPMAP_FILE_UTILS_HPP
#define DEPMAP_FILE_UTILS_HPP

/**
 * @file file_utils.hpp
 * @brief File system helpers returning Result<T, Error>.
 */

#include "depmap/result.hpp"
#include "depmap/error.hpp"

#include <string>
#include <string_view>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace depmap::file_utils {

    namespace fs = std::filesystem;

    /**
     * Whole file contents, read in binary mode.
     */
    inline Result<std::string, Error> read_file(const fs::path& path) {
        using ReadResult = Result<std::string, Error>;

        if (std::error_code ec; !fs::is_regular_file(path, ec)) {
            return ReadResult::failure(Error::not_found("File not found", path.string()));
        }

        std::ifstream in(path, std::ios::binary);
        std::ostringstream buffer;
        if (in) {
            buffer << in.rdbuf();
        }
        if (!in || in.bad()) {
            return ReadResult::failure(Error::io_error("Failed to read file", path.string()));
        }
        return ReadResult::success(std::move(buffer).str());
    }

    /**
     * Replaces the file's contents; missing parent directories are created.
     */
    inline Result<void, Error> write_file(const fs::path& path, const std::string_view content) {
        if (const auto dir = path.parent_path(); !dir.empty()) {
            std::error_code ec;
            fs::create_directories(dir, ec);
            if (ec) {
                return Result<void, Error>::failure(Error::io_error("Failed to create directory", dir.string()));
            }
        }

        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            return Result<void, Error>::failure(Error::io_error("Failed to write file", path.string()));
        }
        return Result<void, Error>::success();
    }

    /**
     * Line count with "\n", "\r\n" and a lone "\r" all ending a line.
     * A final terminator does not open an extra empty line.
     */
    inline std::size_t count_lines(const std::string_view content) noexcept {
        std::size_t lines = 0;
        bool open_line = false;
        for (std::size_t i = 0; i < content.size(); ++i) {
            const char c = content[i];
            if (c != '\n' && c != '\r') {
                open_line = true;
                continue;
            }
            if (c == '\r' && i + 1 < content.size() && content[i + 1] == '\n') {
                ++i;
            }
            ++lines;
            open_line = false;
        }
        return open_line ? lines + 1 : lines;
    }

}  // namespace depmap::file_utils

#endif //DEPMAP_FILE_UTILS_HPP
