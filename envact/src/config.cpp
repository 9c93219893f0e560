// Copyright (c) 2025, envact Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <cstdint>
#include <string>
#include <vector>

#include "envact/api/config.hpp"
#include "envact/api/configuration.hpp"

#include "common_options.hpp"
#include "envact.hpp"

using namespace envact;  // NOLINT(build/namespaces)

namespace
{
    void init_config_options(CLI::App* subcom, Configuration& config)
    {
        init_general_options(subcom, config);
        init_prefix_options(subcom, config);
    }

    void add_config_names_option(CLI::App* subcom, Configuration& config)
    {
        auto& names = config.at("config_names");
        subcom->add_option_function<std::vector<std::string>>(
            "configs",
            [&names](const std::vector<std::string>& value) { names.set_cli_value(value); },
            names.description()
        );
    }

    void add_show_flag(CLI::App* subcom, const std::string& flags, Setting& setting)
    {
        subcom->add_flag_function(
            flags,
            [&setting](std::int64_t) { setting.set_cli_value(true); },
            setting.description()
        );
    }

    void init_config_list_options(CLI::App* subcom, Configuration& config)
    {
        add_show_flag(subcom, "-s,--sources", config.at("show_config_sources"));
        add_show_flag(subcom, "-a,--all", config.at("show_all_configs"));
        add_show_flag(subcom, "-d,--descriptions", config.at("show_config_descriptions"));
        add_config_names_option(subcom, config);
    }

    void set_config_list_command(CLI::App* subcom, Configuration& config)
    {
        init_config_options(subcom, config);
        init_config_list_options(subcom, config);

        subcom->callback([&config] { config_list(config); });
    }

    void set_config_sources_command(CLI::App* subcom, Configuration& config)
    {
        init_config_options(subcom, config);

        subcom->callback([&config] { config_sources(config); });
    }

    void set_config_describe_command(CLI::App* subcom, Configuration& config)
    {
        init_config_options(subcom, config);

        add_config_names_option(subcom, config);

        subcom->callback([&config] { config_describe(config); });
    }
}

void
set_config_command(CLI::App* subcom, Configuration& config)
{
    init_config_options(subcom, config);

    auto* list_subcom = subcom->add_subcommand("list", "List configuration values");
    set_config_list_command(list_subcom, config);

    auto* sources_subcom = subcom->add_subcommand("sources", "Show configuration sources");
    set_config_sources_command(sources_subcom, config);

    auto* describe_subcom = subcom->add_subcommand("describe", "Describe given configuration parameters");
    set_config_describe_command(describe_subcom, config);
}
