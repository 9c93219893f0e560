// Copyright (c) 2025, envact Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ENVACT_UTIL_BUILD_HPP
#define ENVACT_UTIL_BUILD_HPP

namespace envact::util
{
    // Windows shells and PATH layout differ enough that the whole activation is switched on it
#if defined(_WIN32)
    inline constexpr bool on_win = true;
#else
    inline constexpr bool on_win = false;
#endif
}
#endif
