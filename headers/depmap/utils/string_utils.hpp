//
// Created by gregorian-rayne on 1/14/26.
//

#ifndef DEPMAP_STRING_UTILS_HPP
#define DEPMAP_STRING_UTILS_HPP

/**
 * @file string_utils.hpp
 * @brief String helpers for dotted module ids and option values.
 */

#include <string>
#include <string_view>
#include <vector>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace depmap::string_utils {

    inline std::string_view trim(std::string_view s) noexcept {
        const auto first = std::ranges::find_if(s, [](const unsigned char c) {
            return !std::isspace(c);
        });
        s.remove_prefix(static_cast<std::size_t>(first - s.begin()));
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
            s.remove_suffix(1);
        }
        return s;
    }

    /**
     * Splits on a delimiter character, keeping empty parts.
     */
    inline std::vector<std::string_view> split(std::string_view s, const char delimiter) {
        std::vector<std::string_view> parts;
        std::size_t start = 0;
        std::size_t end = s.find(delimiter);

        while (end != std::string_view::npos) {
            parts.push_back(s.substr(start, end - start));
            start = end + 1;
            end = s.find(delimiter, start);
        }

        parts.push_back(s.substr(start));
        return parts;
    }

    /**
     * Splits a comma separated option value ("build,dist, .venv"),
     * trimming each entry and dropping empty ones.
     */
    inline std::vector<std::string> split_list(std::string_view s) {
        std::vector<std::string> items;
        for (const auto part : split(s, ',')) {
            if (const auto item = trim(part); !item.empty()) {
                items.emplace_back(item);
            }
        }
        return items;
    }

    template<typename Container>
    std::string join(const Container& parts, const std::string_view delimiter) {
        std::ostringstream oss;
        bool first = true;
        for (const auto& part : parts) {
            if (!first) {
                oss << delimiter;
            }
            oss << part;
            first = false;
        }
        return oss.str();
    }

    inline std::string replace_all(std::string_view s, const std::string_view from, const std::string_view to) {
        if (from.empty()) {
            return std::string(s);
        }

        std::string out;
        out.reserve(s.size());

        std::size_t pos = 0;
        std::size_t found;
        while ((found = s.find(from, pos)) != std::string_view::npos) {
            out.append(s, pos, found - pos);
            out.append(to);
            pos = found + from.size();
        }

        out.append(s, pos, s.size() - pos);
        return out;
    }

    inline std::string to_lower(const std::string_view s) {
        std::string out(s);
        std::ranges::transform(out, out.begin(), [](const unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        return out;
    }

    // ============================================================================
    // Dotted names
    // ============================================================================

    /**
     * First component of a dotted name ("a" for "a.b.c").
     */
    inline std::string_view first_component(const std::string_view dotted) noexcept {
        return dotted.substr(0, dotted.find('.'));
    }

    /**
     * Drops the last component ("a.b" for "a.b.c", "" for "a").
     */
    inline std::string_view parent_name(const std::string_view dotted) noexcept {
        const auto pos = dotted.rfind('.');
        return pos == std::string_view::npos ? std::string_view{} : dotted.substr(0, pos);
    }

    inline std::size_t component_count(const std::string_view dotted) noexcept {
        if (dotted.empty()) {
            return 0;
        }
        return static_cast<std::size_t>(std::ranges::count(dotted, '.')) + 1;
    }

    /**
     * Joins two dotted names, skipping an empty side.
     */
    inline std::string join_dotted(const std::string_view head, const std::string_view tail) {
        if (head.empty()) {
            return std::string(tail);
        }
        if (tail.empty()) {
            return std::string(head);
        }
        std::string out(head);
        out += '.';
        out += tail;
        return out;
    }

}  // namespace depmap::string_utils

#endif //DEPMAP_STRING_UTILS_HPP
