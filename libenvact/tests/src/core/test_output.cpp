// Copyright (c) 2025, envact Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <stdexcept>

#include <catch2/catch_all.hpp>

#include "envact/core/context.hpp"
#include "envact/core/output.hpp"

#include "envacttests.hpp"

namespace envact
{
    namespace
    {
        TEST_CASE("console_print")
        {
            auto& ctx = envacttests::context();
            REQUIRE(Console::is_available());

            SECTION("Regular output")
            {
                const auto capture = envacttests::CoutCapture();
                Console::instance().print("/opt/envs/envA/bin:/usr/bin");
                CHECK(capture.str() == "/opt/envs/envA/bin:/usr/bin\n");
            }

            SECTION("Quiet")
            {
                ctx.output_params.quiet = true;
                {
                    const auto capture = envacttests::CoutCapture();
                    Console::instance().print("hidden");
                    Console::instance().print("forced", true);
                    CHECK(capture.str() == "forced\n");
                }
                ctx.output_params.quiet = false;
            }
        }

        TEST_CASE("console_print_json")
        {
            auto& ctx = envacttests::context();
            ctx.output_params.quiet = true;
            {
                const auto capture = envacttests::CoutCapture();
                Console::instance().print_json({ { "active", nullptr } });
                CHECK(capture.str() == "{\n    \"active\": null\n}\n");
            }
            ctx.output_params.quiet = false;
        }

        TEST_CASE("table")
        {
            printers::Table table({ "Name", "Active", "Path" });

            SECTION("Columns fit the widest cell")
            {
                table.set_padding({ 2, 2, 2 });
                table.add_row({ "base", "", "/opt/root" });
                table.add_row({ "envA", "*", "/opt/root/envs/envA" });
                table.add_row({ "longer_name", "", "/tmp/longer_name" });

                CHECK(
                    table.str()
                    == "  Name         Active  Path\n"
                       "  ----------------------------------------\n"
                       "  base                 /opt/root\n"
                       "  envA         *       /opt/root/envs/envA\n"
                       "  longer_name          /tmp/longer_name\n"
                );
            }

            SECTION("Right alignment")
            {
                table.set_alignment({ printers::alignment::right });
                table.add_row({ "a", "*", "/p" });
                CHECK(
                    table.str()
                    == " Name Active Path\n"
                       " ----------------\n"
                       "    a *      /p\n"
                );
            }

            SECTION("Header only")
            {
                CHECK(table.str() == " Name Active Path\n ----------------\n");
            }

            SECTION("Wrong number of cells")
            {
                CHECK_THROWS_AS(table.add_row({ "envA", "*" }), std::invalid_argument);
            }
        }

        TEST_CASE("context_log_level")
        {
            auto& ctx = envacttests::context();
            const auto saved = ctx.output_params.logging_level;

            ctx.set_verbosity(0);
            CHECK(ctx.output_params.logging_level == log_level::warn);
            ctx.set_verbosity(1);
            CHECK(ctx.output_params.logging_level == log_level::info);
            ctx.set_verbosity(2);
            CHECK(ctx.output_params.logging_level == log_level::debug);
            ctx.set_verbosity(3);
            CHECK(ctx.output_params.logging_level == log_level::trace);
            CHECK(ctx.output_params.verbosity == 3);

            ctx.set_verbosity(0);
            ctx.set_log_level(saved);
        }
    }
}
