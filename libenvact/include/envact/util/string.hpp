// Copyright (c) 2025, envact Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ENVACT_UTIL_STRING_HPP
#define ENVACT_UTIL_STRING_HPP

#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace envact::util
{
    [[nodiscard]] auto to_lower(std::string_view str) -> std::string;
    [[nodiscard]] auto to_upper(std::string_view str) -> std::string;

    [[nodiscard]] auto starts_with(std::string_view str, std::string_view prefix) -> bool;
    [[nodiscard]] auto ends_with(std::string_view str, std::string_view suffix) -> bool;
    [[nodiscard]] auto contains(std::string_view str, std::string_view needle) -> bool;

    /** Space, tab, carriage return and newline. */
    inline constexpr std::string_view blanks = " \t\r\n";

    [[nodiscard]] auto strip(std::string_view input, std::string_view chars = blanks)
        -> std::string_view;
    [[nodiscard]] auto rstrip(std::string_view input, std::string_view chars = blanks)
        -> std::string_view;

    /**
     * Split @p input on each occurrence of @p sep.
     *
     * Empty fields are kept: splitting "a::b" on ':' gives three fields.
     */
    [[nodiscard]] auto split(std::string_view input, char sep) -> std::vector<std::string>;

    void replace_all(std::string& data, std::string_view search, std::string_view replace);

    /**
     * Concatenate the elements of @p items with @p sep in between.
     *
     * Elements are either string-like or path-like (anything with a ``string()`` member).
     */
    template <class Range, class Sep>
    [[nodiscard]] auto join(const Sep& sep, const Range& items) -> std::string
    {
        std::string out;
        bool first = true;
        for (const auto& item : items)
        {
            if (!first)
            {
                out += sep;
            }
            first = false;
            using item_type = std::decay_t<decltype(item)>;
            if constexpr (std::is_convertible_v<const item_type&, std::string_view>)
            {
                out += std::string_view(item);
            }
            else
            {
                out += item.string();
            }
        }
        return out;
    }
}
#endif
