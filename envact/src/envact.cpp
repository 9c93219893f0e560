// Copyright (c) 2025, envact Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <optional>
#include <string>

#include <fmt/format.h>

#include "envact/api/configuration.hpp"
#include "envact/core/output.hpp"
#include "envact/version.hpp"

#include "common_options.hpp"
#include "envact.hpp"

using namespace envact;  // NOLINT(build/namespaces)

void
set_envact_command(CLI::App* com, Configuration& config)
{
    init_general_options(com, config);
    init_prefix_options(com, config);

    com->set_version_flag("--version", envact::version(), "Print the version and exit");

    CLI::App* checkenv_subcom = com->add_subcommand(
        "checkenv",
        "Check that an environment exists, print its prefix"
    );
    set_checkenv_command(checkenv_subcom, config);

    CLI::App* activate_subcom = com->add_subcommand(
        "activate",
        "Print the PATH with an environment activated"
    );
    set_activate_command(activate_subcom, config);

    CLI::App* deactivate_subcom = com->add_subcommand(
        "deactivate",
        "Print the PATH with the active environment deactivated"
    );
    set_deactivate_command(deactivate_subcom, config);

    CLI::App* setps1_subcom = com->add_subcommand(
        "setps1",
        "Print the prompt with an environment activated"
    );
    set_setps1_command(setps1_subcom, config);

    CLI::App* shell_subcom = com->add_subcommand("shell", "Generate activation scripts");
    set_shell_command(shell_subcom, config);

    CLI::App* env_subcom = com->add_subcommand("env", "List environments");
    set_env_command(env_subcom, config);

    CLI::App* config_subcom = com->add_subcommand("config", "Configuration of envact");
    set_config_command(config_subcom, config);

    com->require_subcommand(/* min */ 0, /* max */ 1);
}

int
exit_code(envact_error_code ec)
{
    switch (ec)
    {
        case envact_error_code::too_many_arguments:
        case envact_error_code::incorrect_usage:
            return 2;
        case envact_error_code::invalid_environment:
            return 3;
        case envact_error_code::corrupt_state:
            return 4;
        default:
            return 1;
    }
}

int
run_envact(Configuration& config, int argc, char** argv)
{
    CLI::App app{ "Version: " + version() + "\n" };
    set_envact_command(&app, config);

    std::optional<envact_error> error_to_report;
    try
    {
        app.parse(argc, argv);
        if (app.get_subcommands().empty())
        {
            config.load();
            Console::instance().print(app.help());
        }
    }
    catch (const CLI::ExtrasError& e)
    {
        error_to_report = envact_error(
            fmt::format("{}: {}", name_of(envact_error_code::too_many_arguments), e.what()),
            envact_error_code::too_many_arguments
        );
    }
    catch (const CLI::ParseError& e)
    {
        config.operation_teardown();
        // Also raised for --help and --version, with a zero exit code
        const int code = app.exit(e);
        return (code == 0) ? 0 : exit_code(envact_error_code::incorrect_usage);
    }
    catch (const envact_error& e)
    {
        error_to_report = e;
    }
    catch (const std::exception& e)
    {
        error_to_report = envact_error(e.what(), envact_error_code::unknown);
    }

    config.operation_teardown();
    if (error_to_report)
    {
        LOG_CRITICAL << error_to_report->what();
        return exit_code(error_to_report->error_code());
    }
    return 0;
}
