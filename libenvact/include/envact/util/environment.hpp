// Copyright (c) 2025, envact Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ENVACT_UTIL_ENVIRONMENT_HPP
#define ENVACT_UTIL_ENVIRONMENT_HPP

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "envact/fs/filesystem.hpp"
#include "envact/util/build.hpp"

namespace envact::util
{
    using environment_map = std::unordered_map<std::string, std::string>;

    /** Value of the process environment variable @p key, if it is defined. */
    [[nodiscard]] auto get_env(const std::string& key) -> std::optional<std::string>;

    /** @throw std::runtime_error if the variable cannot be set. */
    void set_env(const std::string& key, const std::string& value);
    void unset_env(const std::string& key);

    [[nodiscard]] auto get_env_map() -> environment_map;

    /**
     * Replace the whole process environment with @p env.
     */
    void set_env_map(const environment_map& env);

    [[nodiscard]] auto user_home_dir() -> std::string;

    /**
     * Per user configuration directory, $XDG_CONFIG_HOME when it is set.
     */
    [[nodiscard]] auto user_config_dir() -> std::string;

    /**
     * Per user data directory, $XDG_DATA_HOME when it is set.
     */
    [[nodiscard]] auto user_data_dir() -> std::string;

    /** Separator of PATH entries. */
    [[nodiscard]] constexpr auto pathsep() -> char
    {
        return on_win ? ';' : ':';
    }

    /**
     * Directories an environment at @p prefix contributes to PATH, in PATH order.
     */
    [[nodiscard]] auto get_path_dirs(const fs::u8path& prefix) -> std::vector<fs::u8path>;
}
#endif
