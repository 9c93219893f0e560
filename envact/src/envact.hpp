// Copyright (c) 2025, envact Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ENVACT_CLI_ENVACT_HPP
#define ENVACT_CLI_ENVACT_HPP

#include <CLI/CLI.hpp>

#include "envact/core/error_handling.hpp"

namespace envact
{
    class Configuration;
}

void
set_checkenv_command(CLI::App* subcom, envact::Configuration& config);

void
set_activate_command(CLI::App* subcom, envact::Configuration& config);

void
set_deactivate_command(CLI::App* subcom, envact::Configuration& config);

void
set_setps1_command(CLI::App* subcom, envact::Configuration& config);

void
set_shell_command(CLI::App* subcom, envact::Configuration& config);

void
set_env_command(CLI::App* subcom, envact::Configuration& config);

void
set_config_command(CLI::App* subcom, envact::Configuration& config);

void
set_envact_command(CLI::App* com, envact::Configuration& config);

/// Process exit code reported for an error: 2 for usage, 3 for environment, 4 for state errors.
int
exit_code(envact::envact_error_code ec);

/**
 * Parse the command line and run the selected command.
 *
 * Errors are logged, never thrown, and the command line values are cleared on return.
 */
int
run_envact(envact::Configuration& config, int argc, char** argv);

#endif
