// Copyright (c) 2025, envact Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <catch2/catch_all.hpp>

#include "envact/core/common_types.hpp"
#include "envact/core/error_handling.hpp"

namespace envact
{
    namespace
    {
        auto half(int value) -> expected_t<int>
        {
            if (value % 2 != 0)
            {
                return make_unexpected("odd value", envact_error_code::incorrect_usage);
            }
            return value / 2;
        }

        auto quarter(int value) -> expected_t<int>
        {
            auto h = half(value);
            if (!h)
            {
                return forward_error(h);
            }
            return half(h.value());
        }

        TEST_CASE("envact_error")
        {
            const auto error = envact_error("Environment not found", envact_error_code::invalid_environment);
            CHECK(error.error_code() == envact_error_code::invalid_environment);
            CHECK(std::string(error.what()) == "Environment not found");
        }

        TEST_CASE("error_code_names")
        {
            CHECK(name_of(envact_error_code::invalid_environment) == "InvalidEnvironment");
            CHECK(name_of(envact_error_code::corrupt_state) == "CorruptState");
            CHECK(name_of(envact_error_code::too_many_arguments) == "TooManyArguments");
            CHECK(name_of(envact_error_code::unknown) == "Unknown");
        }

        TEST_CASE("forward_error")
        {
            CHECK(quarter(8) == 2);

            const auto res = quarter(6);
            REQUIRE_FALSE(res.has_value());
            CHECK(res.error().error_code() == envact_error_code::incorrect_usage);
            CHECK(std::string(res.error().what()) == "odd value");
        }

        TEST_CASE("extract")
        {
            CHECK(extract(half(4)) == 2);

            auto res = half(3);
            REQUIRE_THROWS_AS(extract(res), envact_error);
            try
            {
                [[maybe_unused]] auto value = extract(half(5));
                FAIL("extract should have thrown");
            }
            catch (const envact_error& e)
            {
                CHECK(e.error_code() == envact_error_code::incorrect_usage);
            }
        }

        TEST_CASE("log_level_names")
        {
            CHECK(name_of(log_level::warn) == "warning");
            CHECK(name_of(log_level::err) == "error");
            CHECK(log_level_from_name("debug") == log_level::debug);
            CHECK(log_level_from_name("off") == log_level::off);
            CHECK(log_level_from_name("verbose") == std::nullopt);
        }
    }
}
