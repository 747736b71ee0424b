#pragma once

#include <range/v3/algorithm/all_of.hpp>

#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace patchgrader {

/// Replace every non-overlapping occurrence of ``from`` in ``str`` with ``to``, scanning left to right
inline std::string replace_all(std::string str, std::string_view from, std::string_view to) {
    if (from.empty()) {
        return str;
    }

    std::size_t pos = 0;
    while ((pos = str.find(from, pos)) != std::string::npos) {
        str.replace(pos, from.size(), to);
        pos += to.size();
    }

    return str;
}

/// Split ``text`` into lines, each keeping its terminating ``\n`` (the last line may lack one)
inline std::vector<std::string_view> split_lines_keep_ends(std::string_view text) {
    std::vector<std::string_view> lines;

    std::size_t start = 0;
    while (start < text.size()) {
        std::size_t end = text.find('\n', start);
        if (end == std::string_view::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, end - start + 1));
        start = end + 1;
    }

    return lines;
}

/// Split on runs of whitespace, dropping empty tokens
inline std::vector<std::string> split_whitespace(std::string_view text) {
    std::vector<std::string> tokens;
    std::string current;

    for (char chr : text) {
        if (std::isspace(static_cast<unsigned char>(chr)) != 0) {
            if (!current.empty()) {
                tokens.push_back(std::move(current));
                current.clear();
            }
        } else {
            current += chr;
        }
    }

    if (!current.empty()) {
        tokens.push_back(std::move(current));
    }

    return tokens;
}

inline std::string_view trim(std::string_view text) {
    constexpr std::string_view WHITESPACE = " \t\r\n\f\v";

    auto first = text.find_first_not_of(WHITESPACE);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = text.find_last_not_of(WHITESPACE);

    return text.substr(first, last - first + 1);
}

inline bool is_blank(std::string_view text) {
    return ranges::all_of(text, [](char chr) { return std::isspace(static_cast<unsigned char>(chr)) != 0; });
}

} // namespace patchgrader
