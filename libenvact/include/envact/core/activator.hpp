// Copyright (c) 2025, envact Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ENVACT_CORE_ACTIVATOR_HPP
#define ENVACT_CORE_ACTIVATOR_HPP

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "envact/core/activation.hpp"
#include "envact/core/error_handling.hpp"
#include "envact/fs/filesystem.hpp"
#include "envact/util/environment.hpp"

namespace envact
{
    class Context;

    inline constexpr std::string_view ENVACT_PREFIX_VAR = "ENVACT_PREFIX";
    inline constexpr std::string_view ENVACT_DEFAULT_ENV_VAR = "ENVACT_DEFAULT_ENV";
    inline constexpr std::string_view ENVACT_SAVED_PROMPT_VAR = "ENVACT_SAVED_PROMPT";

    /**
     * Mutations a shell must apply to its session to go from one state to another.
     */
    struct EnvironmentTransform
    {
        using variables = std::vector<std::pair<std::string, std::string>>;

        /// New PATH, when it changes. May be empty.
        std::optional<std::string> path;
        std::vector<fs::u8path> deactivate_scripts;
        std::vector<std::string> unset_vars;
        /// Shell variables, such as the prompt, that are not exported.
        variables set_vars;
        variables export_vars;
        std::vector<fs::u8path> activate_scripts;
    };

    /**
     * Compute the session mutations between two states.
     *
     * The prompt is set through @p prompt_var. Scripts are left empty, they depend on the
     * shell and are added by the @ref Activator.
     */
    [[nodiscard]] auto make_transform(
        const ActivationState& before,
        const ActivationState& after,
        std::string_view prompt_var
    ) -> EnvironmentTransform;

    /**
     * Rebuild the activation state from the variables of a session.
     *
     * A session with an empty or unset ENVACT_PREFIX has nothing active.
     */
    [[nodiscard]] auto
    read_session_state(const util::environment_map& env, std::string_view prompt_var)
        -> ActivationState;

    /**
     * Render state changes as a script for a given shell.
     *
     * Statements come in a fixed order: PATH, deactivation scripts of the old environment,
     * removed variables, shell variables, exported variables, then activation scripts of
     * the new environment. Shells only provide the syntax of each statement.
     */
    class Activator
    {
    public:

        virtual ~Activator() = default;

        Activator(const Activator&) = delete;
        Activator& operator=(const Activator&) = delete;

        [[nodiscard]] std::string script(const EnvironmentTransform& transform) const;

        virtual std::string shell_extension() const = 0;
        virtual std::string shell() const = 0;
        virtual std::string prompt_var() const = 0;

        std::vector<fs::u8path> get_activate_scripts(const fs::u8path& prefix) const;
        std::vector<fs::u8path> get_deactivate_scripts(const fs::u8path& prefix) const;

        /// The transform with the activation scripts of the shell.
        EnvironmentTransform
        build_transform(const ActivationState& before, const ActivationState& after) const;

        ActivationState session_state(const util::environment_map& env) const;

        expected_t<std::string> activate(std::string_view ref, const util::environment_map& env) const;
        expected_t<std::string> reactivate(const util::environment_map& env) const;
        expected_t<std::string> deactivate(const util::environment_map& env) const;

    protected:

        explicit Activator(const Context& context);

        virtual std::string export_var(std::string_view name, std::string_view value) const = 0;
        virtual std::string set_var(std::string_view name, std::string_view value) const = 0;
        virtual std::string unset_var(std::string_view name) const = 0;
        virtual std::string source(const fs::u8path& script) const = 0;

    private:

        auto render(const ActivationState& before, expected_t<ActivationState> after) const
            -> expected_t<std::string>;

        const Context& m_context;
    };

    class PosixActivator : public Activator
    {
    public:

        explicit PosixActivator(const Context& context)
            : Activator(context)
        {
        }

        std::string shell_extension() const override;
        std::string shell() const override;
        std::string prompt_var() const override;

    protected:

        std::string export_var(std::string_view name, std::string_view value) const override;
        std::string set_var(std::string_view name, std::string_view value) const override;
        std::string unset_var(std::string_view name) const override;
        std::string source(const fs::u8path& script) const override;
    };

    class CmdExeActivator : public Activator
    {
    public:

        explicit CmdExeActivator(const Context& context)
            : Activator(context)
        {
        }

        std::string shell_extension() const override;
        std::string shell() const override;
        std::string prompt_var() const override;

    protected:

        std::string export_var(std::string_view name, std::string_view value) const override;
        std::string set_var(std::string_view name, std::string_view value) const override;
        std::string unset_var(std::string_view name) const override;
        std::string source(const fs::u8path& script) const override;
    };

    class PowerShellActivator : public Activator
    {
    public:

        explicit PowerShellActivator(const Context& context)
            : Activator(context)
        {
        }

        std::string shell_extension() const override;
        std::string shell() const override;
        std::string prompt_var() const override;

    protected:

        std::string export_var(std::string_view name, std::string_view value) const override;
        std::string set_var(std::string_view name, std::string_view value) const override;
        std::string unset_var(std::string_view name) const override;
        std::string source(const fs::u8path& script) const override;
    };
}
#endif
