// Copyright (c) 2025, envact Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <catch2/catch_all.hpp>

#include "envact/util/build.hpp"
#include "envact/util/environment.hpp"

#include "envacttests.hpp"

using namespace envact::util;

namespace
{
    TEST_CASE("get_env", "[envact::util]")
    {
        const auto restore = envacttests::EnvironmentCleaner();

        REQUIRE_FALSE(get_env("VAR_THAT_DOES_NOT_EXIST_XYZ").has_value());
        REQUIRE(get_env("PATH").has_value());
    }

    TEST_CASE("set_env", "[envact::util]")
    {
        const auto restore = envacttests::EnvironmentCleaner();

        const auto key = std::string("VAR_THAT_DOES_NOT_EXIST_XYZ");
        set_env(key, "VALUE");
        REQUIRE(get_env(key) == "VALUE");
        set_env(key, "(envA) $ ");
        REQUIRE(get_env(key) == "(envA) $ ");
    }

    TEST_CASE("unset_env", "[envact::util]")
    {
        const auto restore = envacttests::EnvironmentCleaner();

        const auto key = std::string("VAR_THAT_DOES_NOT_EXIST_ABC");
        REQUIRE_FALSE(get_env(key).has_value());
        unset_env(key);
        REQUIRE_FALSE(get_env(key).has_value());
        set_env(key, "VALUE");
        REQUIRE(get_env(key).has_value());
        unset_env(key);
        REQUIRE_FALSE(get_env(key).has_value());
    }

    TEST_CASE("get_env_map", "[envact::util]")
    {
        const auto restore = envacttests::EnvironmentCleaner();

        auto env = get_env_map();
        REQUIRE(env.size() > 0);
        REQUIRE(env.count("VAR_THAT_MUST_NOT_EXIST_XYZ") == 0);
        REQUIRE(env.count("PATH") == 1);

        set_env("VAR_THAT_MUST_NOT_EXIST_XYZ", "value");
        env = get_env_map();
        REQUIRE(env.at("VAR_THAT_MUST_NOT_EXIST_XYZ") == "value");
    }

    TEST_CASE("set_env_map", "[envact::util]")
    {
        const auto restore = envacttests::EnvironmentCleaner();

        const auto key_inexistent = std::string("VAR_THAT_DOES_NOT_EXIST_XYZ");
        const auto key_unchanged = std::string("VAR_UNCHANGED_XYZ");
        const auto key_changed = std::string("VAR_CHANGED_XYZ");

        set_env(key_unchanged, "unchanged_value");
        set_env(key_changed, "old_value");
        set_env_map({ { key_changed, "new_value" }, { key_inexistent, "new_value" } });
        CHECK(get_env(key_unchanged) == std::nullopt);
        CHECK(get_env(key_changed) == "new_value");
        CHECK(get_env(key_inexistent) == "new_value");
    }

    TEST_CASE("user_home_dir", "[envact::util]")
    {
        const auto restore = envacttests::EnvironmentCleaner();

        if (on_win)
        {
            set_env("USERPROFILE", R"(D:\user\envact)");
            CHECK(user_home_dir() == R"(D:\user\envact)");
        }
        else
        {
            set_env("HOME", "/user/envact");
            CHECK(user_home_dir() == "/user/envact");
        }
    }

    TEST_CASE("user_xdg", "[envact::util]")
    {
        const auto restore = envacttests::EnvironmentCleaner();

        SECTION("XDG environment variables")
        {
            set_env("XDG_CONFIG_HOME", "xconfig");
            set_env("XDG_DATA_HOME", "xdata");
            CHECK(user_config_dir() == "xconfig");
            CHECK(user_data_dir() == "xdata");
        }

        if (!on_win)
        {
            SECTION("Fallback on home")
            {
                unset_env("XDG_CONFIG_HOME");
                unset_env("XDG_DATA_HOME");
                set_env("HOME", "/user/envact");
                CHECK(user_config_dir() == "/user/envact/.config");
                CHECK(user_data_dir() == "/user/envact/.local/share");
            }
        }
    }

    TEST_CASE("get_path_dirs", "[envact::util]")
    {
        const auto prefix = envact::fs::u8path("/opt/envs/envA");
        const auto dirs = get_path_dirs(prefix);
        if (on_win)
        {
            REQUIRE(dirs.size() == 6);
            CHECK(dirs.front() == prefix);
            CHECK(dirs.back() == prefix / "bin");
        }
        else
        {
            REQUIRE(dirs.size() == 1);
            CHECK(dirs.front() == prefix / "bin");
        }
    }

    TEST_CASE("pathsep", "[envact::util]")
    {
        if (on_win)
        {
            CHECK(pathsep() == ';');
        }
        else
        {
            CHECK(pathsep() == ':');
        }
    }
}
