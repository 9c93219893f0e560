// Copyright (c) 2025, envact Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ENVACT_API_SHELL_HPP
#define ENVACT_API_SHELL_HPP

#include <memory>
#include <string>
#include <string_view>

#include "envact/core/activator.hpp"
#include "envact/fs/filesystem.hpp"

namespace envact
{
    class Configuration;
    class Context;

    /**
     * Create the script renderer of a shell.
     *
     * Throws an envact_error with envact_error_code::incorrect_usage for unknown shells.
     */
    auto make_activator(const Context& context, std::string_view shell_type)
        -> std::unique_ptr<Activator>;

    void shell_activate(Configuration& config, std::string_view ref, const std::string& shell_type);
    void shell_reactivate(Configuration& config, const std::string& shell_type);
    void shell_deactivate(Configuration& config, const std::string& shell_type);

    /**
     * Write an activation script in a temporary file and return its path.
     *
     * cmd.exe cannot evaluate a multi-line output, it calls the file instead and removes it.
     */
    auto write_script_file(const std::string& content, std::string_view extension) -> fs::u8path;
}

#endif
