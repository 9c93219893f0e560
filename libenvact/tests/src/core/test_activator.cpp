// Copyright (c) 2025, envact Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <string>

#include <catch2/catch_all.hpp>

#include "envact/core/activation.hpp"
#include "envact/core/activator.hpp"
#include "envact/util/build.hpp"
#include "envact/util/string.hpp"

#include "envacttests.hpp"

namespace envact
{
    namespace
    {
        auto active_session(const ResolvedEnvironment& env, std::string path) -> util::environment_map
        {
            return {
                { "PATH", std::move(path) },
                { "PS1", "(" + env.name + ") $ " },
                { std::string(ENVACT_PREFIX_VAR), env.prefix.string() },
                { std::string(ENVACT_DEFAULT_ENV_VAR), env.name },
                { std::string(ENVACT_SAVED_PROMPT_VAR), "$ " },
            };
        }

        TEST_CASE("make_transform")
        {
            const auto env = ResolvedEnvironment{ "envA", fs::u8path("/opt/envs/envA") };

            ActivationState before;
            before.path = "/usr/bin";
            before.prompt = "$ ";

            ActivationState after;
            after.path = "/opt/envs/envA/bin:/usr/bin";
            after.prompt = "(envA) $ ";
            after.saved_prompt = "$ ";
            after.active_env = env;

            SECTION("Activation")
            {
                const auto envt = make_transform(before, after, "PS1");
                CHECK(envt.path == after.path);
                CHECK(envt.unset_vars.empty());
                REQUIRE(envt.set_vars.size() == 1);
                CHECK(envt.set_vars.front().first == "PS1");
                CHECK(envt.set_vars.front().second == "(envA) $ ");
                REQUIRE(envt.export_vars.size() == 3);
                CHECK(envt.export_vars[0].first == ENVACT_PREFIX_VAR);
                CHECK(envt.export_vars[0].second == env.prefix.string());
                CHECK(envt.export_vars[1].first == ENVACT_DEFAULT_ENV_VAR);
                CHECK(envt.export_vars[1].second == "envA");
                CHECK(envt.export_vars[2].first == ENVACT_SAVED_PROMPT_VAR);
                CHECK(envt.export_vars[2].second == "$ ");
                CHECK(envt.activate_scripts.empty());
                CHECK(envt.deactivate_scripts.empty());
            }

            SECTION("Deactivation")
            {
                const auto envt = make_transform(after, before, "PROMPT");
                CHECK(envt.path == "/usr/bin");
                REQUIRE(envt.set_vars.size() == 1);
                CHECK(envt.set_vars.front().first == "PROMPT");
                CHECK(envt.set_vars.front().second == "$ ");
                CHECK(envt.export_vars.empty());
                CHECK(
                    envt.unset_vars
                    == std::vector<std::string>{ "ENVACT_PREFIX", "ENVACT_DEFAULT_ENV", "ENVACT_SAVED_PROMPT" }
                );
            }

            SECTION("Nothing to do")
            {
                const auto envt = make_transform(before, before, "PS1");
                CHECK_FALSE(envt.path.has_value());
                CHECK(envt.set_vars.empty());
                CHECK(envt.export_vars.empty());
                CHECK(envt.unset_vars.empty());
            }

            SECTION("PATH becomes empty")
            {
                ActivationState empty = before;
                empty.path = "";
                const auto envt = make_transform(before, empty, "PS1");
                CHECK(envt.path == "");
                CHECK(envt.export_vars.empty());

                const auto script = PosixActivator(envacttests::context()).script(envt);
                CHECK(script == "export PATH=''\n");
            }
        }

        TEST_CASE("read_session_state")
        {
            SECTION("Nothing active")
            {
                const auto state = read_session_state({ { "PATH", "/usr/bin" }, { "PS1", "$ " } }, "PS1");
                CHECK(state.path == "/usr/bin");
                CHECK(state.prompt == "$ ");
                CHECK_FALSE(state.saved_prompt.has_value());
                CHECK_FALSE(state.active_env.has_value());
            }

            SECTION("Environment active")
            {
                const auto env = ResolvedEnvironment{ "envA", fs::u8path("/opt/envs/envA") };
                const auto state = read_session_state(active_session(env, "/opt/envs/envA/bin"), "PS1");
                CHECK(state.path == "/opt/envs/envA/bin");
                CHECK(state.prompt == "(envA) $ ");
                CHECK(state.saved_prompt == "$ ");
                REQUIRE(state.active_env.has_value());
                CHECK(state.active_env.value() == env);
            }

            SECTION("Missing environment name")
            {
                const auto state = read_session_state(
                    { { "PATH", "/opt/envs/envA/bin" }, { "ENVACT_PREFIX", "/opt/envs/envA" } },
                    "PS1"
                );
                REQUIRE(state.active_env.has_value());
                CHECK(state.active_env->name == "/opt/envs/envA");
                CHECK_FALSE(state.saved_prompt.has_value());
            }

            SECTION("Empty prefix means nothing active")
            {
                const auto state = read_session_state(
                    { { "PATH", "/usr/bin" }, { "ENVACT_PREFIX", "" }, { "ENVACT_SAVED_PROMPT", "> " } },
                    "PS1"
                );
                CHECK_FALSE(state.active_env.has_value());
                CHECK_FALSE(state.saved_prompt.has_value());
            }

            if (util::on_win)
            {
                SECTION("Case insensitive names")
                {
                    const auto state = read_session_state({ { "Path", R"(C:\Windows)" } }, "PROMPT");
                    CHECK(state.path == R"(C:\Windows)");
                }
            }
        }

        TEST_CASE_METHOD(envacttests::EnvironmentsFixture, "PosixActivator")
        {
            auto activator = PosixActivator(ctx);

            SECTION("Activate")
            {
                const auto script = activator.activate(
                    "envA",
                    { { "PATH", "/usr/bin" }, { "PS1", "it's $ " } }
                );
                REQUIRE(script.has_value());
                CHECK(util::contains(script.value(), "export PATH='" + path_with(envA, "/usr/bin") + "'\n"));
                CHECK(util::contains(script.value(), "PS1='(envA) it'\"'\"'s $ '\n"));
                CHECK(util::contains(script.value(), "export ENVACT_PREFIX='" + envA.string() + "'\n"));
                CHECK(util::contains(script.value(), "export ENVACT_DEFAULT_ENV='envA'\n"));
                CHECK(util::contains(script.value(), "export ENVACT_SAVED_PROMPT='it'\"'\"'s $ '\n"));
                CHECK_FALSE(util::contains(script.value(), "unset"));
            }

            SECTION("Deactivate")
            {
                const auto env = ResolvedEnvironment{ "envA", envA };
                const auto script = activator.deactivate(active_session(env, path_with(envA, "/usr/bin")));
                REQUIRE(script.has_value());
                CHECK(util::contains(script.value(), "export PATH='/usr/bin'\n"));
                CHECK(util::contains(script.value(), "PS1='$ '\n"));
                CHECK(util::contains(script.value(), "unset ENVACT_PREFIX\n"));
                CHECK(util::contains(script.value(), "unset ENVACT_DEFAULT_ENV\n"));
                CHECK(util::contains(script.value(), "unset ENVACT_SAVED_PROMPT\n"));
                CHECK_FALSE(util::contains(script.value(), "export ENVACT"));
            }

            SECTION("Deactivate without saved prompt")
            {
                const auto env = ResolvedEnvironment{ "envA", envA };
                auto session = active_session(env, path_with(envA, "/usr/bin"));
                session.erase(std::string(ENVACT_SAVED_PROMPT_VAR));
                session["PS1"] = "(envA) custom> ";
                const auto script = activator.deactivate(session);
                REQUIRE(script.has_value());
                CHECK(util::contains(script.value(), "PS1='custom> '\n"));
            }

            SECTION("Deactivate with nothing active")
            {
                const auto script = activator.deactivate({ { "PATH", "/usr/bin" }, { "PS1", "$ " } });
                REQUIRE(script.has_value());
                CHECK(script.value() == "");
            }

            SECTION("Deactivate corrupt session")
            {
                const auto env = ResolvedEnvironment{ "envA", envA };
                const auto script = activator.deactivate(active_session(env, "/usr/bin"));
                REQUIRE_FALSE(script.has_value());
                CHECK(script.error().error_code() == envact_error_code::corrupt_state);
            }

            SECTION("Activate invalid environment")
            {
                const auto script = activator.activate("does-not-exist", { { "PATH", "/usr/bin" } });
                REQUIRE_FALSE(script.has_value());
                CHECK(script.error().error_code() == envact_error_code::invalid_environment);
            }

            SECTION("Reactivate")
            {
                const auto env = ResolvedEnvironment{ "envA", envA };
                const auto script = activator.reactivate(active_session(env, path_with(envA, "/usr/bin")));
                REQUIRE(script.has_value());
                // Nothing changed but the variables are exported again
                CHECK_FALSE(util::contains(script.value(), "export PATH"));
                CHECK(util::contains(script.value(), "export ENVACT_PREFIX='" + envA.string() + "'\n"));
            }
        }

        TEST_CASE_METHOD(envacttests::EnvironmentsFixture, "activate_scripts")
        {
            const auto activate_d = envA / "etc" / "envact" / "activate.d";
            const auto deactivate_d = envA / "etc" / "envact" / "deactivate.d";
            envacttests::write_file(activate_d / "b.sh", "");
            envacttests::write_file(activate_d / "a.sh", "");
            envacttests::write_file(activate_d / "c.bat", "");
            envacttests::write_file(deactivate_d / "a.sh", "");
            envacttests::write_file(deactivate_d / "b.sh", "");

            auto activator = PosixActivator(ctx);

            SECTION("Listing")
            {
                CHECK(
                    activator.get_activate_scripts(envA)
                    == std::vector<fs::u8path>{ activate_d / "a.sh", activate_d / "b.sh" }
                );
                CHECK(
                    activator.get_deactivate_scripts(envA)
                    == std::vector<fs::u8path>{ deactivate_d / "b.sh", deactivate_d / "a.sh" }
                );
                CHECK(activator.get_activate_scripts(envB).empty());
            }

            SECTION("Sourced after the variables are set")
            {
                const auto script = extract(activator.activate("envA", { { "PATH", "/usr/bin" } }));
                const auto a_pos = script.find(". '" + (activate_d / "a.sh").string() + "'");
                const auto b_pos = script.find(". '" + (activate_d / "b.sh").string() + "'");
                const auto export_pos = script.find("export ENVACT_PREFIX");
                REQUIRE(a_pos != std::string::npos);
                REQUIRE(b_pos != std::string::npos);
                CHECK(export_pos < a_pos);
                CHECK(a_pos < b_pos);
                CHECK_FALSE(util::contains(script, "c.bat"));
            }

            SECTION("Deactivation scripts run before the variables are unset")
            {
                const auto env = ResolvedEnvironment{ "envA", envA };
                const auto script = extract(activator.deactivate(active_session(env, path_with(envA, ""))));
                const auto b_pos = script.find(". '" + (deactivate_d / "b.sh").string() + "'");
                const auto a_pos = script.find(". '" + (deactivate_d / "a.sh").string() + "'");
                const auto unset_pos = script.find("unset ENVACT_PREFIX");
                REQUIRE(b_pos != std::string::npos);
                REQUIRE(a_pos != std::string::npos);
                CHECK(b_pos < a_pos);
                CHECK(a_pos < unset_pos);
            }
        }

        TEST_CASE_METHOD(envacttests::EnvironmentsFixture, "CmdExeActivator")
        {
            auto activator = CmdExeActivator(ctx);
            CHECK(activator.shell() == "cmd.exe");
            CHECK(activator.shell_extension() == ".bat");
            CHECK(activator.prompt_var() == "PROMPT");

            const auto script = activator.activate("envB", { { "PATH", "/usr/bin" }, { "PROMPT", "$P$G" } });
            REQUIRE(script.has_value());
            CHECK(util::contains(script.value(), "@SET \"PATH=" + path_with(envB, "/usr/bin") + "\"\n"));
            CHECK(util::contains(script.value(), "@SET \"PROMPT=(envB) $P$G\"\n"));
            CHECK(util::contains(script.value(), "@SET \"ENVACT_PREFIX=" + envB.string() + "\"\n"));

            const auto env = ResolvedEnvironment{ "envB", envB };
            auto session = active_session(env, path_with(envB, "/usr/bin"));
            session.erase("PS1");
            const auto back = activator.deactivate(session);
            REQUIRE(back.has_value());
            CHECK(util::contains(back.value(), "@SET ENVACT_PREFIX=\n"));
        }

        TEST_CASE_METHOD(envacttests::EnvironmentsFixture, "PowerShellActivator")
        {
            auto activator = PowerShellActivator(ctx);
            CHECK(activator.shell() == "powershell");
            CHECK(activator.shell_extension() == ".ps1");

            const auto script = activator.activate("envA", { { "PATH", "/usr/bin" }, { "PROMPT", "$ " } });
            REQUIRE(script.has_value());
            CHECK(util::contains(script.value(), "$Env:PATH = \"" + path_with(envA, "/usr/bin") + "\"\n"));
            CHECK(util::contains(script.value(), "$Env:PROMPT = \"(envA) `$ \"\n"));
            CHECK(util::contains(script.value(), "$Env:ENVACT_DEFAULT_ENV = \"envA\"\n"));

            const auto env = ResolvedEnvironment{ "envA", envA };
            const auto back = activator.deactivate(active_session(env, path_with(envA, "/usr/bin")));
            REQUIRE(back.has_value());
            CHECK(util::contains(back.value(), "Remove-Item -ErrorAction SilentlyContinue Env:ENVACT_PREFIX\n"));
        }
    }
}
