#pragma once

#include <fmt/format.h>
#include <range/v3/algorithm/find_if.hpp>

#include <array>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>

/// Declare the canonical string names of an enum's enumerators. Must be used in the
/// namespace of the enum so that it is found through ADL.
///
/// Example:
///   PATCHGRADER_ENUM_NAMES(Color, {Color::Red, "red"}, {Color::Blue, "blue"});
///
/// Enums declared this way become formattable with fmt and convertible from/to strings
/// through ``enum_to_string`` and ``enum_from_string``.
#define PATCHGRADER_ENUM_NAMES(enum_name, ... /*{enumerator, "name"} pairs*/)                                         \
    constexpr auto enum_names(enum_name /*tag*/) {                                                                     \
        return std::to_array<std::pair<enum_name, std::string_view>>({__VA_ARGS__});                                   \
    }                                                                                                                  \
    static_assert(true, "require a trailing semicolon")

namespace patchgrader {

template <typename E>
concept NamedEnum = std::is_enum_v<E> && requires(E tag) {
    { enum_names(tag) };
};

template <NamedEnum E>
constexpr std::string_view enum_to_string(E value) {
    constexpr auto names = enum_names(E{});

    auto iter = ranges::find_if(names, [value](const auto& entry) { return entry.first == value; });

    if (iter == names.end()) {
        return "<unknown>";
    }

    return iter->second;
}

template <NamedEnum E>
constexpr std::optional<E> enum_from_string(std::string_view name) {
    constexpr auto names = enum_names(E{});

    auto iter = ranges::find_if(names, [name](const auto& entry) { return entry.second == name; });

    if (iter == names.end()) {
        return std::nullopt;
    }

    return iter->first;
}

/// Every canonical name of ``E``, in declaration order
template <NamedEnum E>
constexpr auto enum_name_list() {
    constexpr auto names = enum_names(E{});

    std::array<std::string_view, names.size()> result{};
    for (std::size_t i = 0; i < names.size(); ++i) {
        result[i] = names[i].second;
    }

    return result;
}

} // namespace patchgrader

template <patchgrader::NamedEnum E>
struct fmt::formatter<E> : fmt::formatter<std::string_view>
{
    auto format(E value, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(patchgrader::enum_to_string(value), ctx);
    }
};
