// Copyright (c) 2025, envact Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ENVACT_CORE_ERROR_HANDLING_HPP
#define ENVACT_CORE_ERROR_HANDLING_HPP

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <tl/expected.hpp>

namespace envact
{
    enum class envact_error_code
    {
        unknown,
        invalid_environment,
        corrupt_state,
        too_many_arguments,
        incorrect_usage,
        configuration_failure,
        internal_failure,
    };

    /// Name of the error kind, as shown to users in front of the message.
    [[nodiscard]] auto name_of(envact_error_code ec) noexcept -> std::string_view;

    /**
     * Error of an envact operation.
     *
     * Thrown across the configuration layer and carried by ``expected_t`` through the
     * activation engine.
     */
    class envact_error : public std::runtime_error
    {
    public:

        envact_error(const std::string& msg, envact_error_code ec);

        [[nodiscard]] auto error_code() const noexcept -> envact_error_code;

    private:

        envact_error_code m_error_code;
    };

    template <class T>
    using expected_t = tl::expected<T, envact_error>;

    [[nodiscard]] auto make_unexpected(const std::string& msg, envact_error_code ec)
        -> tl::unexpected<envact_error>;

    /// Propagate the error of @p result into an expected of another type.
    template <class T>
    [[nodiscard]] auto forward_error(const expected_t<T>& result) -> tl::unexpected<envact_error>
    {
        return tl::make_unexpected(result.error());
    }

    /**
     * Unwrap @p result, throwing its error if there is one.
     */
    template <class T>
    auto extract(expected_t<T>&& result) -> T
    {
        if (!result)
        {
            throw std::move(result).error();
        }
        return std::move(result).value();
    }

    template <class T>
    auto extract(const expected_t<T>& result) -> const T&
    {
        if (!result)
        {
            throw result.error();
        }
        return result.value();
    }
}
#endif
