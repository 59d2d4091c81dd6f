// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <cctype>
#include <charconv>
#include <iterator>

#include "rangedl/util/string.hpp"

namespace rangedl::util
{
    /****************************************
     *  Implementation of cctype functions  *
     ****************************************/

    auto is_space(char c) -> bool
    {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    auto is_digit(char c) -> bool
    {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    }

    auto to_lower(char c) -> char
    {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    auto to_lower(std::string_view str) -> std::string
    {
        auto out = std::string();
        std::transform(
            str.cbegin(),
            str.cend(),
            std::back_inserter(out),
            [](char c) { return to_lower(c); }
        );
        return out;
    }

    /*******************************************
     *  Implementation of start/end functions  *
     *******************************************/

    auto starts_with(std::string_view str, std::string_view prefix) -> bool
    {
        return str.size() >= prefix.size() && 0 == str.compare(0, prefix.size(), prefix);
    }

    auto ends_with(std::string_view str, std::string_view suffix) -> bool
    {
        return str.size() >= suffix.size()
               && 0 == str.compare(str.size() - suffix.size(), suffix.size(), suffix);
    }

    /***************************************
     *  Implementation of strip functions  *
     ***************************************/

    auto lstrip(std::string_view input) -> std::string_view
    {
        const auto start = std::find_if_not(input.cbegin(), input.cend(), &is_space);
        return input.substr(static_cast<std::size_t>(start - input.cbegin()));
    }

    auto rstrip(std::string_view input) -> std::string_view
    {
        const auto rstart = std::find_if_not(input.crbegin(), input.crend(), &is_space);
        return input.substr(0, static_cast<std::size_t>(input.crend() - rstart));
    }

    auto strip(std::string_view input) -> std::string_view
    {
        return rstrip(lstrip(input));
    }

    /**************************************
     *  Implementation of integer parsing  *
     **************************************/

    auto parse_non_negative_int(std::string_view str) -> std::optional<std::int64_t>
    {
        const auto stripped = strip(str);
        if (stripped.empty() || !is_digit(stripped.front()))
        {
            return std::nullopt;
        }

        std::int64_t value = 0;
        const auto* const last = stripped.data() + stripped.size();
        const auto [ptr, ec] = std::from_chars(stripped.data(), last, value);
        if (ec != std::errc() || ptr != last)
        {
            return std::nullopt;
        }
        return value;
    }
}
