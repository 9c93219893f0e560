// Copyright (c) 2025, envact Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef LIBENVACT_VERSION_HPP
#define LIBENVACT_VERSION_HPP

#include <array>
#include <string>

#define LIBENVACT_VERSION_MAJOR 0
#define LIBENVACT_VERSION_MINOR 3
#define LIBENVACT_VERSION_PATCH 0

#define LIBENVACT_VERSION_STRING "0.3.0"
#define LIBENVACT_VERSION                                                                          \
    (LIBENVACT_VERSION_MAJOR * 10000 + LIBENVACT_VERSION_MINOR * 100 + LIBENVACT_VERSION_PATCH)

namespace envact
{
    std::string version();
    std::array<int, 3> version_arr();
}

#endif
