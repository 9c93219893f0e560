// Copyright (c) 2025, envact Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "envact/api/configuration.hpp"
#include "envact/api/env.hpp"
#include "envact/core/activator.hpp"
#include "envact/core/environments_manager.hpp"
#include "envact/core/output.hpp"
#include "envact/util/environment.hpp"
#include "envact/util/string.hpp"

namespace envact
{
    void print_envs(Configuration& config)
    {
        config.load();
        detail::print_envs_impl(config);
        config.operation_teardown();
    }

    namespace detail
    {
        std::optional<fs::u8path> active_prefix()
        {
            const auto prefix = util::get_env(std::string(ENVACT_PREFIX_VAR)).value_or("");
            if (prefix.empty())
            {
                return std::nullopt;
            }
            return fs::u8path(prefix);
        }

        void print_envs_impl(const Configuration& config)
        {
            const auto& ctx = config.context();
            const auto prefixes = EnvironmentsManager(ctx).list_all_known_prefixes();
            const auto active = active_prefix();
            auto is_active = [&active](const fs::u8path& prefix)
            { return active.has_value() && paths_equal(active.value(), prefix); };

            if (ctx.output_params.json)
            {
                auto listing = nlohmann::json::object();
                listing["active"] = nullptr;
                listing["envs"] = nlohmann::json::array();
                for (const auto& prefix : prefixes)
                {
                    listing["envs"].push_back(prefix.string());
                    if (is_active(prefix))
                    {
                        listing["active"] = prefix.string();
                    }
                }
                Console::instance().print_json(listing);
                return;
            }

            printers::Table table({ "Name", "Active", "Path" });
            table.set_padding({ 2, 2, 2 });
            for (const auto& prefix : prefixes)
            {
                table.add_row({ env_name(ctx, prefix), is_active(prefix) ? "*" : "", prefix.string() });
            }
            Console::instance().print(util::rstrip(table.str(), "\n"));
        }
    }
}
