// Copyright (c) 2025, envact Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <cstdint>
#include <vector>

#include "envact/core/common_types.hpp"

#include "common_options.hpp"

using namespace envact;  // NOLINT(build/namespaces)

namespace
{
    void add_setting_flag(
        CLI::App* subcom,
        const std::string& flags,
        Setting& setting,
        const std::string& group
    )
    {
        subcom
            ->add_flag_function(
                flags,
                [&setting](std::int64_t) { setting.set_cli_value(true); },
                setting.description()
            )
            ->group(group);
    }
}

void
init_rc_options(CLI::App* subcom, Configuration& config)
{
    std::string cli_group = "Configuration options";

    auto& rc_files = config.at("rc_files");
    subcom
        ->add_option_function<std::vector<std::string>>(
            "--rc-file",
            [&rc_files](const std::vector<std::string>& files)
            { rc_files.set_cli_value(std::vector<fs::u8path>(files.begin(), files.end())); },
            rc_files.description()
        )
        ->option_text("FILE1 FILE2...")
        ->group(cli_group);

    add_setting_flag(subcom, "--no-rc", config.at("no_rc"), cli_group);
    add_setting_flag(subcom, "--no-env", config.at("no_env"), cli_group);
}

void
init_general_options(CLI::App* subcom, Configuration& config)
{
    init_rc_options(subcom, config);

    std::string cli_group = "Global options";

    auto& verbose = config.at("verbose");
    subcom
        ->add_flag_function(
            "-v,--verbose",
            [&verbose](std::int64_t count) { verbose.set_cli_value(static_cast<int>(count)); },
            "Set verbosity (higher verbosity with multiple -v, e.g. -vvv)"
        )
        ->group(cli_group);

    auto& level = config.at("log_level");
    const std::vector<std::string> level_names(
        envact::detail::log_level_names.begin(),
        envact::detail::log_level_names.end()
    );
    subcom
        ->add_option_function<std::string>(
            "--log-level",
            [&level](const std::string& name)
            {
                if (auto parsed = log_level_from_name(name))
                {
                    level.set_cli_value(parsed.value());
                }
            },
            level.description()
        )
        ->group(cli_group)
        ->transform(CLI::IsMember(level_names, CLI::ignore_case));

    add_setting_flag(subcom, "-q,--quiet", config.at("quiet"), cli_group);
    add_setting_flag(subcom, "--json", config.at("json"), cli_group);
}

void
init_prefix_options(CLI::App* subcom, Configuration& config)
{
    std::string cli_group = "Prefix options";

    auto& root = config.at("root_prefix");
    subcom
        ->add_option_function<std::string>(
            "-r,--root-prefix",
            [&root](const std::string& prefix) { root.set_cli_value(fs::u8path(prefix)); },
            root.description()
        )
        ->option_text("PATH")
        ->group(cli_group);
}

std::shared_ptr<std::string>
init_env_ref_option(CLI::App* subcom)
{
    auto ref = std::make_shared<std::string>();
    subcom->add_option("env", *ref, "The environment, either by name or by path (default: base)");
    return ref;
}
