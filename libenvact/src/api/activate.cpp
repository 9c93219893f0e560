// Copyright (c) 2025, envact Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <iostream>

#include "envact/api/activate.hpp"
#include "envact/api/configuration.hpp"
#include "envact/core/activator.hpp"
#include "envact/core/error_handling.hpp"
#include "envact/core/output.hpp"
#include "envact/util/build.hpp"

namespace envact
{
    auto native_prompt_var() -> std::string_view
    {
        if constexpr (util::on_win)
        {
            return "PROMPT";
        }
        else
        {
            return "PS1";
        }
    }

    namespace detail
    {
        auto
        session_state(const util::environment_map& env, const std::optional<std::string>& prompt)
            -> ActivationState
        {
            auto state = read_session_state(env, native_prompt_var());
            if (prompt.has_value())
            {
                state.prompt = prompt.value();
            }
            return state;
        }
    }

    void checkenv(Configuration& config, std::string_view ref)
    {
        config.load();

        const auto env = extract(validate_environment(config.context(), ref));
        LOG_INFO << "Environment '" << env.name << "' found at '" << env.prefix.string() << "'";
        std::cout << env.prefix.string() << std::endl;

        config.operation_teardown();
    }

    void activate_path(Configuration& config, std::string_view ref)
    {
        config.load();

        const auto before = detail::session_state(util::get_env_map(), std::nullopt);
        const auto after = extract(activate(config.context(), ref, before));
        std::cout << after.path << std::endl;

        config.operation_teardown();
    }

    void deactivate_path(Configuration& config)
    {
        config.load();

        const auto before = detail::session_state(util::get_env_map(), std::nullopt);
        const auto after = extract(deactivate(config.context(), before));
        std::cout << after.path << std::endl;

        config.operation_teardown();
    }

    void setps1(
        Configuration& config,
        std::string_view ref,
        const std::optional<std::string>& current_prompt
    )
    {
        config.load();

        // PATH may already hold the new environment, only the prompt is computed
        const auto state = detail::session_state(util::get_env_map(), current_prompt);
        std::cout << extract(activated_prompt(config.context(), ref, state)) << std::endl;

        config.operation_teardown();
    }
}
