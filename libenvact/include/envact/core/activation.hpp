// Copyright (c) 2025, envact Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ENVACT_CORE_ACTIVATION_HPP
#define ENVACT_CORE_ACTIVATION_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "envact/core/error_handling.hpp"
#include "envact/fs/filesystem.hpp"

namespace envact
{
    class Context;

    /**
     * An environment reference after validation.
     */
    struct ResolvedEnvironment
    {
        /// Name displayed in the prompt.
        std::string name;
        fs::u8path prefix;

        auto operator==(const ResolvedEnvironment& other) const -> bool = default;
    };

    /**
     * The activation related state of a shell session.
     *
     * The engine never modifies the session, it only computes new states.
     */
    struct ActivationState
    {
        /// The environment currently on PATH, if any.
        std::optional<ResolvedEnvironment> active_env;
        /// Value of the PATH variable.
        std::string path;
        /// Current prompt string.
        std::string prompt;
        /// The prompt before the last activation, if the session recorded it.
        std::optional<std::string> saved_prompt;

        auto operator==(const ActivationState& other) const -> bool = default;
    };

    /**
     * Split the value of a PATH-like variable.
     *
     * Empty entries are kept, an empty value gives no entries.
     */
    [[nodiscard]] auto split_path_var(std::string_view path) -> std::vector<std::string>;

    [[nodiscard]] auto join_path_var(const std::vector<std::string>& entries) -> std::string;

    /**
     * Resolve an environment name or path to an existing environment.
     *
     * An empty reference designates the root environment.
     * Fails with envact_error_code::invalid_environment, without side effects.
     */
    [[nodiscard]] auto validate_environment(const Context& context, std::string_view ref)
        -> expected_t<ResolvedEnvironment>;

    /**
     * Remove the active environment from the state.
     *
     * The prompt goes back to the saved one. Without a saved prompt, the marker of the
     * active environment is removed from the current prompt instead.
     * Fails with envact_error_code::corrupt_state if one of the directories of the active
     * environment cannot be found in PATH.
     */
    [[nodiscard]] auto deactivate(const Context& context, const ActivationState& state)
        -> expected_t<ActivationState>;

    /**
     * Deactivate the current environment and activate the given one.
     */
    [[nodiscard]] auto
    activate(const Context& context, std::string_view ref, const ActivationState& state)
        -> expected_t<ActivationState>;

    /**
     * Activate again the active environment, moving its directories back in front of PATH.
     */
    [[nodiscard]] auto reactivate(const Context& context, const ActivationState& state)
        -> expected_t<ActivationState>;

    /**
     * The marker prepended to the prompt, rendered from Context::env_prompt.
     */
    [[nodiscard]] auto prompt_modifier(const Context& context, const ResolvedEnvironment& env)
        -> std::string;

    /**
     * The prompt a session would show with @p ref active.
     *
     * Starts from the current prompt of @p state, without the marker of the environment
     * recorded as active, and prepends the marker of @p ref. PATH is not looked at, so
     * this works after the session PATH has already been switched to @p ref.
     * Fails with envact_error_code::invalid_environment if @p ref does not resolve.
     */
    [[nodiscard]] auto
    activated_prompt(const Context& context, std::string_view ref, const ActivationState& state)
        -> expected_t<std::string>;
}

#endif
