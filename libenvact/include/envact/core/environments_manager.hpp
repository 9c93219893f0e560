// Copyright (c) 2025, envact Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ENVACT_CORE_ENVIRONMENTS_MANAGER_HPP
#define ENVACT_CORE_ENVIRONMENTS_MANAGER_HPP

#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "envact/fs/filesystem.hpp"

namespace envact
{
    class Context;

    /// File whose presence marks a directory as an environment.
    inline constexpr std::string_view PREFIX_MAGIC_FILE = "conda-meta/history";

    /**
     * Return true if the directory holds a well-formed environment.
     *
     * Filesystem errors are reported as a missing environment.
     */
    bool is_environment(const fs::u8path& prefix);

    /**
     * Compare two prefixes after lexical normalization, ignoring trailing separators.
     */
    bool paths_equal(const fs::u8path& lhs, const fs::u8path& rhs);

    /**
     * Display name of an environment.
     *
     * The root prefix is named after root_env_name, prefixes directly inside one of the
     * configured environment directories (or any directory called "envs") use their
     * directory name, other prefixes use their full path.
     */
    std::string env_name(const Context& context, const fs::u8path& prefix);

    /**
     * Read-only view on the environments known to the user.
     */
    class EnvironmentsManager
    {
    public:

        explicit EnvironmentsManager(const Context& context);

        /// Root prefix, environments of the envs directories, and registered prefixes.
        std::set<fs::u8path> list_all_known_prefixes() const;

        /// Prefixes listed in the registry file that still hold an environment.
        std::vector<fs::u8path> registered_prefixes() const;

        fs::u8path get_environments_txt_file() const;

    private:

        const Context& m_context;
    };
}
#endif
