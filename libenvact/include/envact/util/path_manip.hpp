// Copyright (c) 2025, envact Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ENVACT_UTIL_PATH_MANIP_HPP
#define ENVACT_UTIL_PATH_MANIP_HPP

#include <string>
#include <string_view>

namespace envact::util
{
    /*
     * String helpers for paths typed by the user or read from PATH entries.
     * None of them touch the filesystem.
     */

    /**
     * Return true if @p input designates a directory rather than an environment name.
     *
     * That is the case of absolute paths, of paths starting with "~", "./" or "../" and of
     * anything holding a separator. The bare "." and ".." are not paths by this definition.
     */
    [[nodiscard]] auto is_explicit_path(std::string_view input) -> bool;

    /**
     * Replace a leading "~" component of @p path with @p home.
     */
    [[nodiscard]] auto expand_home(std::string_view path, std::string_view home) -> std::string;

    /**
     * Same with the home directory of the current user, only looked up when needed.
     */
    [[nodiscard]] auto expand_home(std::string_view path) -> std::string;

    /**
     * Replace a leading @p home component of @p path with "~".
     */
    [[nodiscard]] auto shrink_home(std::string_view path, std::string_view home) -> std::string;
    [[nodiscard]] auto shrink_home(std::string_view path) -> std::string;

    /**
     * Compare two entries of a PATH-like variable.
     *
     * Trailing separators are ignored. On Windows, the comparison is case insensitive and
     * '/' matches '\'.
     */
    [[nodiscard]] auto path_entry_equal(std::string_view lhs, std::string_view rhs) -> bool;
}
#endif
