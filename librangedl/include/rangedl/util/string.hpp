// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef RANGEDL_UTIL_STRING_HPP
#define RANGEDL_UTIL_STRING_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace rangedl::util
{
    [[nodiscard]] auto is_space(char c) -> bool;
    [[nodiscard]] auto is_digit(char c) -> bool;

    [[nodiscard]] auto to_lower(char c) -> char;
    [[nodiscard]] auto to_lower(std::string_view str) -> std::string;

    [[nodiscard]] auto starts_with(std::string_view str, std::string_view prefix) -> bool;
    [[nodiscard]] auto ends_with(std::string_view str, std::string_view suffix) -> bool;

    [[nodiscard]] auto lstrip(std::string_view input) -> std::string_view;
    [[nodiscard]] auto rstrip(std::string_view input) -> std::string_view;
    [[nodiscard]] auto strip(std::string_view input) -> std::string_view;

    /**
     * Parse a non-negative decimal integer.
     *
     * Surrounding whitespaces are ignored, any other character, a sign, or an overflow
     * makes the parsing fail.
     */
    [[nodiscard]] auto parse_non_negative_int(std::string_view str) -> std::optional<std::int64_t>;
}
#endif
