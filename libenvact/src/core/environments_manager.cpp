// Copyright (c) 2025, envact Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include "envact/core/context.hpp"
#include "envact/core/environments_manager.hpp"
#include "envact/core/output.hpp"
#include "envact/util/environment.hpp"
#include "envact/util/path_manip.hpp"
#include "envact/util/string.hpp"

namespace envact
{
    namespace
    {
        // Strip trailing separators so that "/a/b/" and "/a/b" name the same directory
        auto without_trailing_sep(const fs::u8path& path) -> fs::u8path
        {
            auto normal = path.lexically_normal();
            if (!normal.has_filename() && normal.has_relative_path())
            {
                normal = normal.parent_path();
            }
            return normal;
        }

        void insert_environments_of(const fs::u8path& envs_dir, std::set<fs::u8path>& out)
        {
            std::error_code ec;
            if (!fs::is_directory(envs_dir, ec))
            {
                return;
            }
            for (const auto& entry : fs::directory_iterator(envs_dir, ec))
            {
                if (is_environment(entry.path()))
                {
                    out.insert(entry.path().lexically_normal());
                }
            }
            if (ec)
            {
                LOG_WARNING << "Could not list " << envs_dir.string() << ": " << ec.message();
            }
        }
    }

    bool is_environment(const fs::u8path& prefix)
    {
        std::error_code ec;
        const bool found = fs::is_regular_file(prefix / fs::u8path(PREFIX_MAGIC_FILE), ec);
        if (ec)
        {
            LOG_DEBUG << "Could not inspect " << prefix.string() << ": " << ec.message();
            return false;
        }
        return found;
    }

    bool paths_equal(const fs::u8path& lhs, const fs::u8path& rhs)
    {
        return util::path_entry_equal(
            lhs.lexically_normal().string(),
            rhs.lexically_normal().string()
        );
    }

    std::string env_name(const Context& context, const fs::u8path& prefix)
    {
        if (prefix.empty())
        {
            throw std::invalid_argument("Cannot name an environment with an empty prefix");
        }
        if (paths_equal(prefix, context.prefix_params.root_prefix))
        {
            return std::string(root_env_name);
        }

        const auto dir = without_trailing_sep(prefix);
        const auto parent = dir.parent_path();
        const bool in_envs_dir = (parent.filename() == "envs")
                                 || std::any_of(
                                     context.envs_dirs.begin(),
                                     context.envs_dirs.end(),
                                     [&parent](const fs::u8path& d) { return paths_equal(d, parent); }
                                 );
        return in_envs_dir ? dir.filename().string() : dir.string();
    }

    EnvironmentsManager::EnvironmentsManager(const Context& context)
        : m_context(context)
    {
    }

    std::set<fs::u8path> EnvironmentsManager::list_all_known_prefixes() const
    {
        const auto registered = registered_prefixes();
        std::set<fs::u8path> prefixes(registered.begin(), registered.end());

        for (const auto& envs_dir : m_context.envs_dirs)
        {
            insert_environments_of(envs_dir, prefixes);
        }

        const auto& root = m_context.prefix_params.root_prefix;
        if (!root.empty() && is_environment(root))
        {
            prefixes.insert(root.lexically_normal());
        }
        return prefixes;
    }

    std::vector<fs::u8path> EnvironmentsManager::registered_prefixes() const
    {
        const auto registry = get_environments_txt_file();
        std::ifstream in(registry);
        if (!in)
        {
            LOG_TRACE << "No environment registry at " << registry.string();
            return {};
        }

        std::vector<fs::u8path> prefixes;
        std::string line;
        while (std::getline(in, line))
        {
            const auto entry = util::strip(line);
            if (entry.empty())
            {
                continue;
            }
            const auto prefix = without_trailing_sep(fs::u8path(std::string(entry)));
            if (is_environment(prefix))
            {
                prefixes.push_back(prefix);
            }
            else
            {
                LOG_DEBUG << "Skipping registered prefix " << entry << " (not an environment)";
            }
        }
        return prefixes;
    }

    fs::u8path EnvironmentsManager::get_environments_txt_file() const
    {
        return fs::u8path(util::user_home_dir()) / ".envact" / "environments.txt";
    }
}
