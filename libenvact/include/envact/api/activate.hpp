// Copyright (c) 2025, envact Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ENVACT_API_ACTIVATE_HPP
#define ENVACT_API_ACTIVATE_HPP

#include <optional>
#include <string>
#include <string_view>

#include "envact/core/activation.hpp"
#include "envact/util/environment.hpp"

namespace envact
{
    class Configuration;

    /*
     * Single line commands.
     *
     * Each one reads the session state from the process environment and prints one value
     * on the standard output, or nothing when it fails.
     */

    /// The name of the variable holding the prompt in the native shell of the platform.
    [[nodiscard]] auto native_prompt_var() -> std::string_view;

    /// Print the prefix of a valid environment, throw otherwise.
    void checkenv(Configuration& config, std::string_view ref);

    /// Print the PATH with the given environment activated.
    void activate_path(Configuration& config, std::string_view ref);

    /// Print the PATH with the active environment deactivated.
    void deactivate_path(Configuration& config);

    /// Print the prompt with the given environment activated, leaving PATH aside.
    void setps1(
        Configuration& config,
        std::string_view ref,
        const std::optional<std::string>& current_prompt = std::nullopt
    );

    namespace detail
    {
        [[nodiscard]] auto
        session_state(const util::environment_map& env, const std::optional<std::string>& prompt)
            -> ActivationState;
    }
}

#endif
