// Copyright (c) 2025, envact Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <iostream>

#include "envact/api/config.hpp"
#include "envact/api/configuration.hpp"
#include "envact/util/path_manip.hpp"

namespace envact
{
    namespace
    {
        auto names_to_show(const Configuration& config) -> const std::vector<std::string>&
        {
            return config.at("config_names").value<std::vector<std::string>>();
        }
    }

    void config_describe(Configuration& config)
    {
        config.load();

        DumpOptions options;
        options.values = false;
        options.descriptions = true;
        options.all = true;
        std::cout << config.dump(options, names_to_show(config)) << std::endl;

        config.operation_teardown();
    }

    void config_list(Configuration& config)
    {
        config.load();

        DumpOptions options;
        options.sources = config.at("show_config_sources").value<bool>();
        options.descriptions = config.at("show_config_descriptions").value<bool>();
        options.all = config.at("show_all_configs").value<bool>();
        std::cout << config.dump(options, names_to_show(config)) << std::endl;

        config.operation_teardown();
    }

    void config_sources(Configuration& config)
    {
        config.load();

        if (config.context().src_params.no_rc)
        {
            std::cout << "Configuration files disabled by --no-rc flag" << std::endl;
        }
        else
        {
            std::cout << "Configuration files (by precedence order):" << std::endl;

            const auto srcs = config.sources();
            const auto valid_srcs = config.valid_sources();

            for (const auto& s : srcs)
            {
                const bool valid = std::find(valid_srcs.begin(), valid_srcs.end(), s)
                                   != valid_srcs.end();
                std::cout << util::shrink_home(s.string()) << (valid ? "" : " (invalid)")
                          << std::endl;
            }
        }

        config.operation_teardown();
    }
}
