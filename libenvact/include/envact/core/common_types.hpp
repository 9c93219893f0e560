// Copyright (c) 2025, envact Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ENVACT_CORE_COMMON_TYPES_HPP
#define ENVACT_CORE_COMMON_TYPES_HPP

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace envact
{
    /**
     * Threshold of the messages that get logged.
     *
     * Same order and values as ``spdlog::level::level_enum``.
     */
    enum class log_level
    {
        trace,
        debug,
        info,
        warn,
        err,
        critical,
        off
    };

    namespace detail
    {
        // Indexed by log_level, spelled as in rc files and on the command line
        inline constexpr std::array<std::string_view, 7> log_level_names = {
            "trace", "debug", "info", "warning", "error", "critical", "off",
        };
    }

    constexpr auto name_of(log_level level) noexcept -> std::string_view
    {
        return detail::log_level_names[static_cast<std::size_t>(level)];
    }

    constexpr auto log_level_from_name(std::string_view name) noexcept -> std::optional<log_level>
    {
        for (std::size_t i = 0; i < detail::log_level_names.size(); ++i)
        {
            if (detail::log_level_names[i] == name)
            {
                return static_cast<log_level>(i);
            }
        }
        return std::nullopt;
    }

    /**
     * Level for a verbosity count, as given by repeated ``-v`` flags.
     *
     * Zero keeps warnings, each increment shows one more level down to trace.
     */
    constexpr auto log_level_for_verbosity(int verbosity) noexcept -> log_level
    {
        if (verbosity <= 0)
        {
            return log_level::warn;
        }
        if (verbosity >= 3)
        {
            return log_level::trace;
        }
        return (verbosity == 1) ? log_level::info : log_level::debug;
    }
}
#endif
