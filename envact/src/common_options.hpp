// Copyright (c) 2025, envact Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ENVACT_CLI_COMMON_OPTIONS_HPP
#define ENVACT_CLI_COMMON_OPTIONS_HPP

#include <memory>
#include <string>

#include <CLI/CLI.hpp>

#include "envact/api/configuration.hpp"

void
init_rc_options(CLI::App* subcom, envact::Configuration& config);

void
init_general_options(CLI::App* subcom, envact::Configuration& config);

void
init_prefix_options(CLI::App* subcom, envact::Configuration& config);

/**
 * Add the optional positional argument naming the environment.
 *
 * The returned string is filled on parse, it stays empty for the root environment.
 */
std::shared_ptr<std::string>
init_env_ref_option(CLI::App* subcom);

#endif
