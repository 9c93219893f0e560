// Copyright (c) 2025, envact Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <string>
#include <vector>

#include <catch2/catch_all.hpp>

#include "envact/fs/filesystem.hpp"
#include "envact/util/string.hpp"

using namespace envact::util;

namespace
{
    TEST_CASE("to_lower")
    {
        CHECK(to_lower("EnVs/Foo1") == "envs/foo1");
        CHECK(to_lower("") == "");
    }

    TEST_CASE("to_upper")
    {
        CHECK(to_upper("envact_prefix") == "ENVACT_PREFIX");
    }

    TEST_CASE("starts_with")
    {
        CHECK(starts_with("(envA) $ ", "(envA) "));
        CHECK(starts_with("", ""));
        CHECK_FALSE(starts_with("", "~"));
        CHECK_FALSE(starts_with("$ ", "(envA) "));
    }

    TEST_CASE("ends_with")
    {
        CHECK(ends_with("/opt/envs/", "/"));
        CHECK(ends_with("envactrc.yaml", ".yaml"));
        CHECK_FALSE(ends_with("", "/"));
        CHECK_FALSE(ends_with("yaml", ".yaml"));
    }

    TEST_CASE("contains")
    {
        CHECK(contains("envs/foo", "/"));
        CHECK(contains("envs/foo", "s/f"));
        CHECK_FALSE(contains("foo", "/"));
    }

    TEST_CASE("strip")
    {
        CHECK(rstrip("\t  name \n") == "\t  name");
        CHECK(strip("  name\r\n") == "name");
        CHECK(strip("    ") == "");
        CHECK(strip("") == "");

        CHECK(rstrip("/opt/envs//", "/") == "/opt/envs");
        CHECK(strip("/opt/", "/") == "opt");
        CHECK(rstrip("/opt/envs\\/", "/\\") == "/opt/envs");
    }

    TEST_CASE("split")
    {
        using Strings = std::vector<std::string>;

        CHECK(split("/a/bin:/usr/bin", ':') == Strings{ "/a/bin", "/usr/bin" });
        CHECK(split("/a/bin::/usr/bin", ':') == Strings{ "/a/bin", "", "/usr/bin" });
        CHECK(split(":/usr/bin:", ':') == Strings{ "", "/usr/bin", "" });
        CHECK(split("/usr/bin", ':') == Strings{ "/usr/bin" });
        CHECK(split("", ':') == Strings{ "" });
    }

    TEST_CASE("replace_all")
    {
        std::string prompt = "({default_env}) {default_env} $ ";
        replace_all(prompt, "{default_env}", "envA");
        CHECK(prompt == "(envA) envA $ ");

        std::string quoted = "it's";
        replace_all(quoted, "'", "'\"'\"'");
        CHECK(quoted == "it'\"'\"'s");

        // The replacement is not searched again
        std::string doubled = "aa";
        replace_all(doubled, "a", "aa");
        CHECK(doubled == "aaaa");

        std::string unchanged = "nothing";
        replace_all(unchanged, "", "x");
        CHECK(unchanged == "nothing");
    }

    TEST_CASE("join")
    {
        CHECK(join(':', std::vector<std::string>{ "/a/bin", "/usr/bin" }) == "/a/bin:/usr/bin");
        CHECK(join(", ", std::vector<std::string>{ "a" }) == "a");
        CHECK(join(':', std::vector<std::string>{}) == "");
        CHECK(join(':', std::vector<std::string>{ "", "" }) == ":");

        const auto dirs = std::vector<envact::fs::u8path>{ "/a/bin", "/b/bin" };
        CHECK(join(':', dirs) == "/a/bin:/b/bin");
    }
}
