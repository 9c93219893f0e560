// Copyright (c) 2025, envact Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "envact/api/configuration.hpp"
#include "envact/api/env.hpp"

#include "common_options.hpp"
#include "envact.hpp"

void
set_env_command(CLI::App* com, envact::Configuration& config)
{
    auto* list_subcom = com->add_subcommand("list", "List known environments");
    init_general_options(list_subcom, config);
    init_prefix_options(list_subcom, config);

    list_subcom->callback([&config] { envact::print_envs(config); });

    com->require_subcommand(/* min */ 1, /* max */ 1);
}
