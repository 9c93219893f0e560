// Copyright (c) 2025, envact Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <cctype>

#include "envact/util/string.hpp"

namespace envact::util
{
    namespace
    {
        template <class CharFunc>
        auto map_chars(std::string_view str, CharFunc func) -> std::string
        {
            std::string out(str.size(), '\0');
            std::transform(
                str.begin(),
                str.end(),
                out.begin(),
                [&func](char c) { return static_cast<char>(func(static_cast<unsigned char>(c))); }
            );
            return out;
        }
    }

    auto to_lower(std::string_view str) -> std::string
    {
        return map_chars(str, [](int c) { return std::tolower(c); });
    }

    auto to_upper(std::string_view str) -> std::string
    {
        return map_chars(str, [](int c) { return std::toupper(c); });
    }

    auto starts_with(std::string_view str, std::string_view prefix) -> bool
    {
        return str.substr(0, prefix.size()) == prefix;
    }

    auto ends_with(std::string_view str, std::string_view suffix) -> bool
    {
        return (str.size() >= suffix.size()) && (str.substr(str.size() - suffix.size()) == suffix);
    }

    auto contains(std::string_view str, std::string_view needle) -> bool
    {
        return str.find(needle) != std::string_view::npos;
    }

    auto rstrip(std::string_view input, std::string_view chars) -> std::string_view
    {
        const auto last = input.find_last_not_of(chars);
        if (last == std::string_view::npos)
        {
            return input.substr(0, 0);
        }
        return input.substr(0, last + 1);
    }

    auto strip(std::string_view input, std::string_view chars) -> std::string_view
    {
        const auto first = input.find_first_not_of(chars);
        if (first == std::string_view::npos)
        {
            return input.substr(0, 0);
        }
        return rstrip(input.substr(first), chars);
    }

    auto split(std::string_view input, char sep) -> std::vector<std::string>
    {
        std::vector<std::string> fields;
        std::size_t start = 0;
        for (auto pos = input.find(sep); pos != std::string_view::npos; pos = input.find(sep, start))
        {
            fields.emplace_back(input.substr(start, pos - start));
            start = pos + 1;
        }
        fields.emplace_back(input.substr(start));
        return fields;
    }

    void replace_all(std::string& data, std::string_view search, std::string_view replace)
    {
        if (search.empty())
        {
            return;
        }
        std::string out;
        out.reserve(data.size());
        std::size_t start = 0;
        for (auto pos = data.find(search); pos != std::string::npos; pos = data.find(search, start))
        {
            out.append(data, start, pos - start);
            out += replace;
            start = pos + search.size();
        }
        out.append(data, start, std::string::npos);
        data = std::move(out);
    }
}
