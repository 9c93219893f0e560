// Copyright (c) 2025, envact Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <functional>
#include <system_error>

#include <fmt/format.h>

#include "envact/core/activator.hpp"
#include "envact/core/context.hpp"
#include "envact/core/output.hpp"
#include "envact/util/build.hpp"
#include "envact/util/string.hpp"

namespace envact
{
    namespace
    {
        auto hook_dir(const fs::u8path& prefix, std::string_view kind) -> fs::u8path
        {
            return prefix / "etc" / "envact" / fs::u8path(kind);
        }

        // Scripts of @p dir for the shell extension, sorted by file name
        auto list_scripts(const fs::u8path& dir, const std::string& extension)
            -> std::vector<fs::u8path>
        {
            std::vector<fs::u8path> scripts;
            std::error_code ec;
            if (!fs::is_directory(dir, ec))
            {
                return scripts;
            }
            for (const auto& entry : fs::directory_iterator(dir, ec))
            {
                std::error_code file_ec;
                if ((entry.path().extension() == extension) && entry.is_regular_file(file_ec))
                {
                    scripts.push_back(entry.path());
                }
            }
            if (ec)
            {
                LOG_WARNING << "Could not list scripts in " << dir.string() << ": " << ec.message();
            }
            std::sort(scripts.begin(), scripts.end());
            return scripts;
        }

        auto lookup_var(const util::environment_map& env, std::string_view key)
            -> std::optional<std::string>
        {
            if (auto it = env.find(std::string(key)); it != env.end())
            {
                return it->second;
            }
            if constexpr (util::on_win)
            {
                // "Path" and "PATH" are the same variable on Windows
                const auto wanted = util::to_upper(key);
                const auto it = std::find_if(
                    env.begin(),
                    env.end(),
                    [&wanted](const auto& entry) { return util::to_upper(entry.first) == wanted; }
                );
                if (it != env.end())
                {
                    return it->second;
                }
            }
            return std::nullopt;
        }
    }

    /*************************
     * State transformations *
     *************************/

    auto make_transform(
        const ActivationState& before,
        const ActivationState& after,
        std::string_view prompt_var
    ) -> EnvironmentTransform
    {
        EnvironmentTransform transform;
        if (after.path != before.path)
        {
            transform.path = after.path;
        }
        if (after.prompt != before.prompt)
        {
            transform.set_vars.emplace_back(prompt_var, after.prompt);
        }

        if (after.active_env.has_value())
        {
            transform.export_vars = {
                { std::string(ENVACT_PREFIX_VAR), after.active_env->prefix.string() },
                { std::string(ENVACT_DEFAULT_ENV_VAR), after.active_env->name },
                { std::string(ENVACT_SAVED_PROMPT_VAR), after.saved_prompt.value_or("") },
            };
        }
        else if (before.active_env.has_value())
        {
            for (const auto var : { ENVACT_PREFIX_VAR, ENVACT_DEFAULT_ENV_VAR, ENVACT_SAVED_PROMPT_VAR })
            {
                transform.unset_vars.emplace_back(var);
            }
        }
        return transform;
    }

    auto read_session_state(const util::environment_map& env, std::string_view prompt_var)
        -> ActivationState
    {
        ActivationState state;
        state.path = lookup_var(env, "PATH").value_or("");
        state.prompt = lookup_var(env, prompt_var).value_or("");

        const auto prefix = lookup_var(env, ENVACT_PREFIX_VAR).value_or("");
        if (prefix.empty())
        {
            return state;
        }
        auto name = lookup_var(env, ENVACT_DEFAULT_ENV_VAR).value_or("");
        state.active_env = ResolvedEnvironment{ name.empty() ? prefix : std::move(name), prefix };
        state.saved_prompt = lookup_var(env, ENVACT_SAVED_PROMPT_VAR);
        return state;
    }

    /*************
     * Activator *
     *************/

    Activator::Activator(const Context& context)
        : m_context(context)
    {
    }

    std::string Activator::script(const EnvironmentTransform& transform) const
    {
        std::string out;
        if (transform.path.has_value())
        {
            out += export_var("PATH", transform.path.value());
        }
        for (const auto& file : transform.deactivate_scripts)
        {
            out += source(file);
        }
        for (const auto& name : transform.unset_vars)
        {
            out += unset_var(name);
        }
        for (const auto& [name, value] : transform.set_vars)
        {
            out += set_var(name, value);
        }
        for (const auto& [name, value] : transform.export_vars)
        {
            out += export_var(name, value);
        }
        for (const auto& file : transform.activate_scripts)
        {
            out += source(file);
        }
        return out;
    }

    std::vector<fs::u8path> Activator::get_activate_scripts(const fs::u8path& prefix) const
    {
        return list_scripts(hook_dir(prefix, "activate.d"), shell_extension());
    }

    std::vector<fs::u8path> Activator::get_deactivate_scripts(const fs::u8path& prefix) const
    {
        // Undone in the reverse order of activation
        auto scripts = list_scripts(hook_dir(prefix, "deactivate.d"), shell_extension());
        std::reverse(scripts.begin(), scripts.end());
        return scripts;
    }

    EnvironmentTransform
    Activator::build_transform(const ActivationState& before, const ActivationState& after) const
    {
        auto transform = make_transform(before, after, prompt_var());
        if (before.active_env.has_value())
        {
            transform.deactivate_scripts = get_deactivate_scripts(before.active_env->prefix);
        }
        if (after.active_env.has_value())
        {
            transform.activate_scripts = get_activate_scripts(after.active_env->prefix);
        }
        return transform;
    }

    ActivationState Activator::session_state(const util::environment_map& env) const
    {
        return read_session_state(env, prompt_var());
    }

    auto Activator::render(const ActivationState& before, expected_t<ActivationState> after) const
        -> expected_t<std::string>
    {
        if (!after)
        {
            return forward_error(after);
        }
        return script(build_transform(before, after.value()));
    }

    expected_t<std::string>
    Activator::activate(std::string_view ref, const util::environment_map& env) const
    {
        const auto before = session_state(env);
        return render(before, envact::activate(m_context, ref, before));
    }

    expected_t<std::string> Activator::reactivate(const util::environment_map& env) const
    {
        const auto before = session_state(env);
        return render(before, envact::reactivate(m_context, before));
    }

    expected_t<std::string> Activator::deactivate(const util::environment_map& env) const
    {
        const auto before = session_state(env);
        return render(before, envact::deactivate(m_context, before));
    }

    /*************************
     * Shell specific syntax *
     *************************/

    namespace
    {
        // Inside single quotes nothing is special but the quote itself
        auto posix_quote(std::string_view value) -> std::string
        {
            auto quoted = std::string(value);
            util::replace_all(quoted, "'", "'\"'\"'");
            return "'" + quoted + "'";
        }

        // Backtick is the escape character of PowerShell double quoted strings
        auto powershell_quote(std::string_view value) -> std::string
        {
            auto quoted = std::string(value);
            util::replace_all(quoted, "`", "``");
            util::replace_all(quoted, "\"", "`\"");
            util::replace_all(quoted, "$", "`$");
            return "\"" + quoted + "\"";
        }
    }

    std::string PosixActivator::shell_extension() const
    {
        return ".sh";
    }

    std::string PosixActivator::shell() const
    {
        return "posix";
    }

    std::string PosixActivator::prompt_var() const
    {
        return "PS1";
    }

    std::string PosixActivator::export_var(std::string_view name, std::string_view value) const
    {
        return fmt::format("export {}={}\n", name, posix_quote(value));
    }

    std::string PosixActivator::set_var(std::string_view name, std::string_view value) const
    {
        return fmt::format("{}={}\n", name, posix_quote(value));
    }

    std::string PosixActivator::unset_var(std::string_view name) const
    {
        return fmt::format("unset {}\n", name);
    }

    std::string PosixActivator::source(const fs::u8path& script) const
    {
        return fmt::format(". {}\n", posix_quote(script.string()));
    }

    std::string CmdExeActivator::shell_extension() const
    {
        return ".bat";
    }

    std::string CmdExeActivator::shell() const
    {
        return "cmd.exe";
    }

    std::string CmdExeActivator::prompt_var() const
    {
        return "PROMPT";
    }

    std::string CmdExeActivator::export_var(std::string_view name, std::string_view value) const
    {
        return fmt::format("@SET \"{}={}\"\n", name, value);
    }

    std::string CmdExeActivator::set_var(std::string_view name, std::string_view value) const
    {
        // cmd.exe has no unexported variables
        return export_var(name, value);
    }

    std::string CmdExeActivator::unset_var(std::string_view name) const
    {
        return fmt::format("@SET {}=\n", name);
    }

    std::string CmdExeActivator::source(const fs::u8path& script) const
    {
        return fmt::format("@CALL \"{}\"\n", script.string());
    }

    std::string PowerShellActivator::shell_extension() const
    {
        return ".ps1";
    }

    std::string PowerShellActivator::shell() const
    {
        return "powershell";
    }

    std::string PowerShellActivator::prompt_var() const
    {
        return "PROMPT";
    }

    std::string PowerShellActivator::export_var(std::string_view name, std::string_view value) const
    {
        return fmt::format("$Env:{} = {}\n", name, powershell_quote(value));
    }

    std::string PowerShellActivator::set_var(std::string_view name, std::string_view value) const
    {
        return export_var(name, value);
    }

    std::string PowerShellActivator::unset_var(std::string_view name) const
    {
        return fmt::format("Remove-Item -ErrorAction SilentlyContinue Env:{}\n", name);
    }

    std::string PowerShellActivator::source(const fs::u8path& script) const
    {
        return fmt::format(". {}\n", powershell_quote(script.string()));
    }
}
