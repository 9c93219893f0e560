// Copyright (c) 2025, envact Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ENVACT_API_CONFIG_HPP
#define ENVACT_API_CONFIG_HPP

namespace envact
{
    class Configuration;

    void config_describe(Configuration& config);
    void config_list(Configuration& config);
    void config_sources(Configuration& config);
}

#endif
