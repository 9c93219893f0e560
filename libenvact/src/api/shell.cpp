// Copyright (c) 2025, envact Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <fstream>
#include <iostream>
#include <random>

#include <fmt/format.h>

#include "envact/api/configuration.hpp"
#include "envact/api/shell.hpp"
#include "envact/core/context.hpp"
#include "envact/core/error_handling.hpp"
#include "envact/core/output.hpp"
#include "envact/util/environment.hpp"

namespace envact
{
    auto make_activator(const Context& context, std::string_view shell_type)
        -> std::unique_ptr<Activator>
    {
        if (shell_type == "bash" || shell_type == "zsh" || shell_type == "dash"
            || shell_type == "posix")
        {
            return std::make_unique<PosixActivator>(context);
        }
        if (shell_type == "cmd.exe")
        {
            return std::make_unique<CmdExeActivator>(context);
        }
        if (shell_type == "powershell")
        {
            return std::make_unique<PowerShellActivator>(context);
        }
        throw envact_error(
            fmt::format("Shell type not handled: '{}'", shell_type),
            envact_error_code::incorrect_usage
        );
    }

    namespace
    {
        std::string random_alphanumeric_string(std::size_t len)
        {
            static constexpr std::string_view chars = "0123456789"
                                                      "abcdefghijklmnopqrstuvwxyz"
                                                      "ABCDEFGHIJKLMNOPQRSTUVWXYZ";
            std::random_device device;
            std::mt19937 generator(device());
            std::uniform_int_distribution<std::size_t> distribution(0, chars.size() - 1);

            std::string result(len, '\0');
            for (auto& c : result)
            {
                c = chars[distribution(generator)];
            }
            return result;
        }

        void print_script(Activator& activator, expected_t<std::string> script)
        {
            // Nothing is printed when the transition fails
            const auto& content = extract(script);
            if (activator.shell() == "cmd.exe")
            {
                std::cout << write_script_file(content, activator.shell_extension()).string()
                          << std::endl;
            }
            else
            {
                std::cout << content;
            }
        }
    }

    auto write_script_file(const std::string& content, std::string_view extension) -> fs::u8path
    {
        const auto temp_dir = fs::temp_directory_path();
        fs::u8path path;
        do
        {
            path = temp_dir / fmt::format("envact_act{}{}", random_alphanumeric_string(10), extension);
        } while (fs::exists(path));

        std::ofstream out(path, std::ios::out | std::ios::binary);
        out << content;
        out.close();
        if (!out)
        {
            throw envact_error(
                fmt::format("Could not write activation script at '{}'", path.string()),
                envact_error_code::internal_failure
            );
        }
        LOG_DEBUG << "Activation script written at '" << path.string() << "'";
        return path;
    }

    void shell_activate(Configuration& config, std::string_view ref, const std::string& shell_type)
    {
        config.load();

        auto activator = make_activator(config.context(), shell_type);
        print_script(*activator, activator->activate(ref, util::get_env_map()));

        config.operation_teardown();
    }

    void shell_reactivate(Configuration& config, const std::string& shell_type)
    {
        config.load();

        auto activator = make_activator(config.context(), shell_type);
        print_script(*activator, activator->reactivate(util::get_env_map()));

        config.operation_teardown();
    }

    void shell_deactivate(Configuration& config, const std::string& shell_type)
    {
        config.load();

        auto activator = make_activator(config.context(), shell_type);
        print_script(*activator, activator->deactivate(util::get_env_map()));

        config.operation_teardown();
    }
}
