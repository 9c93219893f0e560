// Copyright (c) 2025, envact Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <optional>
#include <string>

#include "envact/api/activate.hpp"
#include "envact/api/configuration.hpp"

#include "common_options.hpp"
#include "envact.hpp"

using namespace envact;  // NOLINT(build/namespaces)

void
set_checkenv_command(CLI::App* subcom, Configuration& config)
{
    init_general_options(subcom, config);
    init_prefix_options(subcom, config);
    auto ref = init_env_ref_option(subcom);

    subcom->callback([&config, ref] { checkenv(config, *ref); });
}

void
set_activate_command(CLI::App* subcom, Configuration& config)
{
    init_general_options(subcom, config);
    init_prefix_options(subcom, config);
    auto ref = init_env_ref_option(subcom);

    subcom->callback([&config, ref] { activate_path(config, *ref); });
}

void
set_deactivate_command(CLI::App* subcom, Configuration& config)
{
    init_general_options(subcom, config);
    init_prefix_options(subcom, config);

    subcom->callback([&config] { deactivate_path(config); });
}

void
set_setps1_command(CLI::App* subcom, Configuration& config)
{
    init_general_options(subcom, config);
    init_prefix_options(subcom, config);
    auto ref = init_env_ref_option(subcom);

    auto prompt = std::make_shared<std::string>();
    auto* prompt_opt = subcom->add_option(
        "prompt",
        *prompt,
        "The current prompt (default: read from the prompt variable)"
    );

    subcom->callback(
        [&config, ref, prompt, prompt_opt]
        {
            const auto current_prompt = (prompt_opt->count() > 0) ? std::optional(*prompt)
                                                                  : std::nullopt;
            setps1(config, *ref, current_prompt);
        }
    );
}
