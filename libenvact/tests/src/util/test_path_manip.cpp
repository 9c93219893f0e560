// Copyright (c) 2025, envact Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <catch2/catch_all.hpp>

#include "envact/util/build.hpp"
#include "envact/util/path_manip.hpp"

using namespace envact::util;

namespace
{
    TEST_CASE("is_explicit_path")
    {
        CHECK(is_explicit_path("./"));
        CHECK(is_explicit_path("./envs/envA"));
        CHECK(is_explicit_path("../envA"));
        CHECK(is_explicit_path("~"));
        CHECK(is_explicit_path("~/envs/envA"));
        CHECK(is_explicit_path("/"));
        CHECK(is_explicit_path("/opt/envs/envA"));
        CHECK(is_explicit_path("envs/envA"));
        CHECK(is_explicit_path(R"(C:\envs\envA)"));
        CHECK(is_explicit_path("C:/envs/envA"));

        CHECK_FALSE(is_explicit_path(""));
        CHECK_FALSE(is_explicit_path("envA"));
        CHECK_FALSE(is_explicit_path("base"));
        CHECK_FALSE(is_explicit_path(".hidden"));

        SECTION("Current and parent directory are names")
        {
            CHECK_FALSE(is_explicit_path("."));
            CHECK_FALSE(is_explicit_path(".."));
        }

        if (on_win)
        {
            CHECK(is_explicit_path(R"(envs\envA)"));
        }
        else
        {
            CHECK_FALSE(is_explicit_path(R"(envs\envA)"));
        }
    }

    TEST_CASE("expand_home")
    {
        CHECK(expand_home("", "") == "");
        CHECK(expand_home("~", "") == "");
        CHECK(expand_home("", "/user/envact") == "");
        CHECK(expand_home("~", "/user/envact") == "/user/envact");
        CHECK(expand_home("~/", "/user/envact") == "/user/envact/");
        CHECK(expand_home("~/envs/envA", "/user/envact") == "/user/envact/envs/envA");
        CHECK(expand_home("~/envs/envA", "/user/envact/") == "/user/envact/envs/envA");
        CHECK(expand_home("file~name", "/user/envact") == "file~name");
        CHECK(expand_home("~file", "/user/envact") == "~file");
        CHECK(expand_home("/opt/~/envs", "/user/envact") == "/opt/~/envs");

        // No home lookup for paths without a leading ~
        CHECK(expand_home("/opt/envs") == "/opt/envs");
    }

    TEST_CASE("shrink_home")
    {
        CHECK(shrink_home("", "") == "");
        CHECK(shrink_home("~", "") == "~");
        CHECK(shrink_home("", "/user/envact") == "");
        CHECK(shrink_home("/user/envact", "/user/envact") == "~");
        CHECK(shrink_home("/user/envact/", "/user/envact") == "~/");
        CHECK(shrink_home("/user/envact/.envactrc", "/user/envact") == "~/.envactrc");
        CHECK(shrink_home("/user/envact/.envactrc", "/user/envact/") == "~/.envactrc");
        CHECK(shrink_home("/user/envact2/.envactrc", "/user/envact") == "/user/envact2/.envactrc");
        CHECK(shrink_home("/etc/envact/.envactrc", "/user/envact") == "/etc/envact/.envactrc");
    }

    TEST_CASE("path_entry_equal")
    {
        CHECK(path_entry_equal("/opt/envs/envA/bin", "/opt/envs/envA/bin"));
        CHECK(path_entry_equal("/opt/envs/envA/bin/", "/opt/envs/envA/bin"));
        CHECK(path_entry_equal("/", "/"));
        CHECK(path_entry_equal("", ""));
        CHECK_FALSE(path_entry_equal("/opt/envs/envA/bin", "/opt/envs/envB/bin"));
        CHECK_FALSE(path_entry_equal("", "/usr/bin"));
        CHECK_FALSE(path_entry_equal("/", ""));

        if (on_win)
        {
            CHECK(path_entry_equal(R"(C:\Envs\envA\Scripts)", "c:/envs/enva/scripts/"));
            CHECK(path_entry_equal(R"(C:\)", "c:"));
        }
        else
        {
            CHECK_FALSE(path_entry_equal("/opt/Envs/envA/bin", "/opt/envs/envA/bin"));
        }
    }
}
