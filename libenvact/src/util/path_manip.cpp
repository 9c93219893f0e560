// Copyright (c) 2025, envact Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <cctype>

#include "envact/util/build.hpp"
#include "envact/util/environment.hpp"
#include "envact/util/path_manip.hpp"
#include "envact/util/string.hpp"

namespace envact::util
{
    namespace
    {
        // Both separators are accepted in user input on Windows
        constexpr std::string_view separators = on_win ? "/\\" : "/";

        auto is_sep(char c) -> bool
        {
            return separators.find(c) != std::string_view::npos;
        }

        auto has_drive_letter(std::string_view path) -> bool
        {
            return (path.size() >= 3) && std::isalpha(static_cast<unsigned char>(path[0]))
                   && (path[1] == ':') && ((path[2] == '/') || (path[2] == '\\'));
        }

        // "~", "~/..." but not "~user"
        auto starts_with_home(std::string_view path) -> bool
        {
            return !path.empty() && (path[0] == '~') && ((path.size() == 1) || is_sep(path[1]));
        }
    }

    auto is_explicit_path(std::string_view input) -> bool
    {
        if ((input == ".") || (input == ".."))
        {
            return false;
        }
        if (starts_with(input, "~") || has_drive_letter(input))
        {
            return true;
        }
        return std::any_of(input.begin(), input.end(), is_sep);
    }

    auto expand_home(std::string_view path, std::string_view home) -> std::string
    {
        if (!starts_with_home(path))
        {
            return std::string(path);
        }
        if (path.size() == 1)
        {
            return std::string(home);
        }
        auto out = std::string(rstrip(home, separators));
        out += path.substr(1);
        return out;
    }

    auto expand_home(std::string_view path) -> std::string
    {
        if (!starts_with_home(path))
        {
            return std::string(path);
        }
        return expand_home(path, user_home_dir());
    }

    auto shrink_home(std::string_view path, std::string_view home) -> std::string
    {
        home = rstrip(home, separators);
        if (home.empty() || !starts_with(path, home))
        {
            return std::string(path);
        }
        const auto rest = path.substr(home.size());
        if (!rest.empty() && !is_sep(rest.front()))
        {
            return std::string(path);
        }
        return "~" + std::string(rest);
    }

    auto shrink_home(std::string_view path) -> std::string
    {
        return shrink_home(path, user_home_dir());
    }

    auto path_entry_equal(std::string_view lhs, std::string_view rhs) -> bool
    {
        auto normalize = [](std::string_view entry) -> std::string
        {
            // The root directory keeps its separator
            const auto trimmed = rstrip(entry, separators);
            auto out = std::string(trimmed.empty() ? entry.substr(0, 1) : trimmed);
            if (on_win)
            {
                std::replace(out.begin(), out.end(), '/', '\\');
                if ((out.size() == 2) && (out[1] == ':'))
                {
                    out += '\\';
                }
                out = to_lower(out);
            }
            return out;
        };
        return normalize(lhs) == normalize(rhs);
    }
}
