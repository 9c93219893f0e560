// Copyright (c) 2025, envact Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <memory>
#include <set>
#include <string>

#include "envact/api/configuration.hpp"
#include "envact/api/shell.hpp"
#include "envact/core/output.hpp"
#include "envact/util/build.hpp"

#include "common_options.hpp"
#include "envact.hpp"

using namespace envact;  // NOLINT(build/namespaces)

namespace
{
    auto init_shell_option(CLI::App* subcmd) -> std::shared_ptr<std::string>
    {
        auto shell_type = std::make_shared<std::string>();
        subcmd->add_option("-s,--shell", *shell_type, "A shell type")
            ->check(CLI::IsMember(
                std::set<std::string>({ "bash", "zsh", "dash", "posix", "cmd.exe", "powershell" })
            ));
        return shell_type;
    }

    auto consolidate_shell(const std::string& shell_type) -> std::string
    {
        if (!shell_type.empty())
        {
            return shell_type;
        }

        LOG_DEBUG << "No shell type provided, using the platform default";
        return util::on_win ? "cmd.exe" : "posix";
    }

    void set_shell_activate_command(CLI::App* subsubcmd, Configuration& config)
    {
        init_general_options(subsubcmd, config);
        init_prefix_options(subsubcmd, config);
        auto shell_type = init_shell_option(subsubcmd);
        auto ref = init_env_ref_option(subsubcmd);

        subsubcmd->callback(
            [&config, shell_type, ref]
            { shell_activate(config, *ref, consolidate_shell(*shell_type)); }
        );
    }

    void set_shell_reactivate_command(CLI::App* subsubcmd, Configuration& config)
    {
        init_general_options(subsubcmd, config);
        init_prefix_options(subsubcmd, config);
        auto shell_type = init_shell_option(subsubcmd);

        subsubcmd->callback([&config, shell_type]
                            { shell_reactivate(config, consolidate_shell(*shell_type)); });
    }

    void set_shell_deactivate_command(CLI::App* subsubcmd, Configuration& config)
    {
        init_general_options(subsubcmd, config);
        init_prefix_options(subsubcmd, config);
        auto shell_type = init_shell_option(subsubcmd);

        subsubcmd->callback([&config, shell_type]
                            { shell_deactivate(config, consolidate_shell(*shell_type)); });
    }
}

void
set_shell_command(CLI::App* shell_subcmd, Configuration& config)
{
    auto* acti_subsubcmd = shell_subcmd->add_subcommand(
        "activate",
        "Output activation code for the given shell"
    );
    set_shell_activate_command(acti_subsubcmd, config);

    auto* reacti_subsubcmd = shell_subcmd->add_subcommand(
        "reactivate",
        "Output reactivation code for the given shell"
    );
    set_shell_reactivate_command(reacti_subsubcmd, config);

    auto* deacti_subsubcmd = shell_subcmd->add_subcommand(
        "deactivate",
        "Output deactivation code for the given shell"
    );
    set_shell_deactivate_command(deacti_subsubcmd, config);

    shell_subcmd->require_subcommand(/* min */ 1, /* max */ 1);
}
