// Copyright (c) 2025, envact Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <exception>

#include <fmt/format.h>

#include "envact/core/activation.hpp"
#include "envact/core/context.hpp"
#include "envact/core/environments_manager.hpp"
#include "envact/core/output.hpp"
#include "envact/util/environment.hpp"
#include "envact/util/path_manip.hpp"
#include "envact/util/string.hpp"

namespace envact
{
    auto split_path_var(std::string_view path) -> std::vector<std::string>
    {
        if (path.empty())
        {
            return {};
        }
        return util::split(path, util::pathsep());
    }

    auto join_path_var(const std::vector<std::string>& entries) -> std::string
    {
        return util::join(util::pathsep(), entries);
    }

    /*************
     * Validator *
     *************/

    namespace
    {
        auto normalize_prefix(const fs::u8path& path) -> fs::u8path
        {
            auto out = fs::absolute(path).lexically_normal();
            if (!out.has_filename() && out.has_relative_path())
            {
                out = out.parent_path();
            }
            return out;
        }

        auto find_by_name(const Context& context, std::string_view name)
            -> std::optional<fs::u8path>
        {
            for (const auto& dir : context.envs_dirs)
            {
                const auto candidate = dir / name;
                LOG_TRACE << "Looking for environment '" << name << "' in " << candidate.string();
                if (is_environment(candidate))
                {
                    return { normalize_prefix(candidate) };
                }
            }
            for (const auto& prefix : EnvironmentsManager(context).registered_prefixes())
            {
                if (prefix.filename() == name)
                {
                    return { normalize_prefix(prefix) };
                }
            }
            return std::nullopt;
        }

        auto validate_environment_impl(const Context& context, std::string_view ref)
            -> expected_t<ResolvedEnvironment>
        {
            if (ref.empty() || (ref == root_env_name))
            {
                const auto& root = context.prefix_params.root_prefix;
                if (root.empty())
                {
                    return make_unexpected(
                        "No root prefix configured, cannot resolve the base environment",
                        envact_error_code::invalid_environment
                    );
                }
                if (!is_environment(root))
                {
                    return make_unexpected(
                        fmt::format(
                            "The base environment at '{}' is not a valid environment ('{}' is missing)",
                            root.string(),
                            PREFIX_MAGIC_FILE
                        ),
                        envact_error_code::invalid_environment
                    );
                }
                return ResolvedEnvironment{ std::string(root_env_name), normalize_prefix(root) };
            }

            if ((ref == ".") || (ref == ".."))
            {
                return make_unexpected(
                    fmt::format("'{}' is not a valid environment name", ref),
                    envact_error_code::invalid_environment
                );
            }

            if (util::is_explicit_path(ref))
            {
                const auto prefix = normalize_prefix(util::expand_home(ref));
                if (!is_environment(prefix))
                {
                    return make_unexpected(
                        fmt::format(
                            "'{}' is not a valid environment: '{}' not found",
                            ref,
                            (prefix / fs::u8path(PREFIX_MAGIC_FILE)).string()
                        ),
                        envact_error_code::invalid_environment
                    );
                }
                return ResolvedEnvironment{ env_name(context, prefix), prefix };
            }

            if (auto prefix = find_by_name(context, ref))
            {
                return ResolvedEnvironment{ std::string(ref), std::move(prefix).value() };
            }

            std::vector<std::string> searched;
            for (const auto& dir : context.envs_dirs)
            {
                searched.push_back(dir.string());
            }
            return make_unexpected(
                fmt::format(
                    "Could not find environment '{}' (searched: {} and the registered environments)",
                    ref,
                    searched.empty() ? std::string("no environment directory")
                                     : util::join(", ", searched)
                ),
                envact_error_code::invalid_environment
            );
        }
    }

    auto validate_environment(const Context& context, std::string_view ref)
        -> expected_t<ResolvedEnvironment>
    {
        try
        {
            return validate_environment_impl(context, ref);
        }
        catch (const std::exception& e)
        {
            // Unreadable directories, unset home and the like.
            return make_unexpected(
                fmt::format("Could not resolve environment '{}': {}", ref, e.what()),
                envact_error_code::invalid_environment
            );
        }
    }

    /***************
     * Deactivator *
     ***************/

    namespace
    {
        auto strip_marker(std::string_view prompt, std::string_view marker) -> std::string
        {
            if (!marker.empty() && util::starts_with(prompt, marker))
            {
                return std::string(prompt.substr(marker.size()));
            }
            return std::string(prompt);
        }
    }

    auto deactivate(const Context& context, const ActivationState& state)
        -> expected_t<ActivationState>
    {
        if (!state.active_env.has_value())
        {
            return state;
        }

        const auto& env = state.active_env.value();
        auto entries = split_path_var(state.path);
        for (const auto& dir : util::get_path_dirs(env.prefix))
        {
            const auto dir_str = dir.string();
            auto it = std::find_if(
                entries.begin(),
                entries.end(),
                [&](const std::string& entry) { return util::path_entry_equal(entry, dir_str); }
            );
            if (it == entries.end())
            {
                return make_unexpected(
                    fmt::format(
                        "Environment '{}' is recorded as active but its directory is not on PATH\n"
                        "expected: {}\n"
                        "found PATH: {}",
                        env.name,
                        dir_str,
                        state.path
                    ),
                    envact_error_code::corrupt_state
                );
            }
            entries.erase(it);
        }

        LOG_DEBUG << "Deactivating environment " << env.prefix.string();

        ActivationState out;
        out.path = join_path_var(entries);
        if (state.saved_prompt.has_value())
        {
            out.prompt = state.saved_prompt.value();
        }
        else
        {
            LOG_DEBUG << "No saved prompt, removing the marker of " << env.name << " instead";
            out.prompt = strip_marker(state.prompt, prompt_modifier(context, env));
        }
        return out;
    }

    /*************
     * Activator *
     *************/

    auto prompt_modifier(const Context& context, const ResolvedEnvironment& env) -> std::string
    {
        auto out = context.env_prompt;
        util::replace_all(out, "{default_env}", env.name);
        util::replace_all(out, "{name}", env.prefix.filename().string());
        util::replace_all(out, "{prefix}", env.prefix.string());
        return out;
    }

    namespace
    {
        // A marker left in the prompt while nothing is active, by a shell that lost its
        // session variables, is only removed once
        auto strip_stale_marker(const std::string& prompt, const std::string& marker) -> std::string
        {
            auto out = strip_marker(prompt, marker);
            if (out.size() != prompt.size())
            {
                LOG_WARNING << "Prompt already starts with '" << marker
                            << "' while no environment is active, removing the stale marker";
            }
            return out;
        }

        auto activate_resolved(
            const Context& context,
            const ResolvedEnvironment& resolved,
            const ActivationState& state
        ) -> expected_t<ActivationState>
        {
            auto deactivated = deactivate(context, state);
            if (!deactivated)
            {
                return forward_error(deactivated);
            }
            ActivationState out = std::move(deactivated).value();

            const auto modifier = prompt_modifier(context, resolved);
            if (!state.active_env.has_value() && context.change_ps1)
            {
                out.prompt = strip_stale_marker(out.prompt, modifier);
            }

            auto entries = split_path_var(out.path);
            const auto dirs = util::get_path_dirs(resolved.prefix);
            std::vector<std::string> new_entries;
            new_entries.reserve(dirs.size() + entries.size());
            for (const auto& dir : dirs)
            {
                new_entries.push_back(dir.string());
            }
            new_entries.insert(new_entries.end(), entries.begin(), entries.end());
            out.path = join_path_var(new_entries);

            out.saved_prompt = out.prompt;
            if (context.change_ps1)
            {
                out.prompt = modifier + out.prompt;
            }
            out.active_env = resolved;

            LOG_DEBUG << "Activating environment " << resolved.prefix.string();
            return out;
        }
    }

    auto activate(const Context& context, std::string_view ref, const ActivationState& state)
        -> expected_t<ActivationState>
    {
        auto resolved = validate_environment(context, ref);
        if (!resolved)
        {
            return forward_error(resolved);
        }
        return activate_resolved(context, resolved.value(), state);
    }

    auto
    activated_prompt(const Context& context, std::string_view ref, const ActivationState& state)
        -> expected_t<std::string>
    {
        auto resolved = validate_environment(context, ref);
        if (!resolved)
        {
            return forward_error(resolved);
        }
        if (!context.change_ps1)
        {
            return state.prompt;
        }

        const auto modifier = prompt_modifier(context, resolved.value());
        if (state.active_env.has_value())
        {
            const auto base = strip_marker(state.prompt, prompt_modifier(context, *state.active_env));
            return modifier + base;
        }
        return modifier + strip_stale_marker(state.prompt, modifier);
    }

    auto reactivate(const Context& context, const ActivationState& state)
        -> expected_t<ActivationState>
    {
        if (!state.active_env.has_value())
        {
            return state;
        }
        const auto& env = state.active_env.value();
        if (!is_environment(env.prefix))
        {
            return make_unexpected(
                fmt::format(
                    "Cannot reactivate '{}': '{}' is no longer a valid environment",
                    env.name,
                    env.prefix.string()
                ),
                envact_error_code::invalid_environment
            );
        }
        return activate_resolved(context, env, state);
    }
}
