// Copyright (c) 2025, envact Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "envact/core/error_handling.hpp"

namespace envact
{
    auto name_of(envact_error_code ec) noexcept -> std::string_view
    {
        switch (ec)
        {
            case envact_error_code::invalid_environment:
                return "InvalidEnvironment";
            case envact_error_code::corrupt_state:
                return "CorruptState";
            case envact_error_code::too_many_arguments:
                return "TooManyArguments";
            case envact_error_code::incorrect_usage:
                return "IncorrectUsage";
            case envact_error_code::configuration_failure:
                return "ConfigurationFailure";
            case envact_error_code::internal_failure:
                return "InternalFailure";
            case envact_error_code::unknown:
                break;
        }
        return "Unknown";
    }

    envact_error::envact_error(const std::string& msg, envact_error_code ec)
        : std::runtime_error(msg)
        , m_error_code(ec)
    {
    }

    auto envact_error::error_code() const noexcept -> envact_error_code
    {
        return m_error_code;
    }

    auto make_unexpected(const std::string& msg, envact_error_code ec)
        -> tl::unexpected<envact_error>
    {
        return tl::make_unexpected(envact_error(msg, ec));
    }
}
