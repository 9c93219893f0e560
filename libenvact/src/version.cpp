// Copyright (c) 2025, envact Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "envact/version.hpp"

namespace envact
{
    std::string version()
    {
        return LIBENVACT_VERSION_STRING;
    }

    std::array<int, 3> version_arr()
    {
        return { LIBENVACT_VERSION_MAJOR, LIBENVACT_VERSION_MINOR, LIBENVACT_VERSION_PATCH };
    }
}
