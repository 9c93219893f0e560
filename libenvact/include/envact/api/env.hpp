// Copyright (c) 2025, envact Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ENVACT_API_ENV_HPP
#define ENVACT_API_ENV_HPP

#include <optional>
#include <string>

#include "envact/fs/filesystem.hpp"

namespace envact
{
    class Configuration;
    class Context;

    void print_envs(Configuration& config);

    namespace detail
    {
        /// The prefix recorded as active in the session, if any.
        std::optional<fs::u8path> active_prefix();

        void print_envs_impl(const Configuration& config);
    }
}

#endif
