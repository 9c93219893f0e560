// Copyright (c) 2025, envact Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ENVACT_CORE_CONTEXT_HPP
#define ENVACT_CORE_CONTEXT_HPP

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "envact/core/common_types.hpp"
#include "envact/fs/filesystem.hpp"

namespace spdlog
{
    class logger;
}

namespace envact
{
    /// Name under which the root prefix is activated and listed.
    inline constexpr std::string_view root_env_name = "base";

    struct ContextOptions
    {
        /// Install a stderr logger as spdlog default logger for the lifetime of the Context.
        bool enable_logging = false;
    };

    /**
     * Settings shared by all the operations of a run.
     *
     * A Context is filled by the @ref Configuration and then only read by the
     * activation engine.
     */
    class Context
    {
    public:

        struct OutputParams
        {
            int verbosity = 0;
            log_level logging_level = log_level::warn;
            bool json = false;
            bool quiet = false;
            std::string log_pattern = "%^%-9!l%-8n%$ %v";
        };

        struct SrcParams
        {
            bool no_rc = false;
            bool no_env = false;
        };

        struct PrefixParams
        {
            fs::u8path root_prefix;
        };

        std::vector<fs::u8path> envs_dirs;
        bool change_ps1 = true;
        std::string env_prompt = "({default_env}) ";

        OutputParams output_params;
        SrcParams src_params;
        PrefixParams prefix_params;

        explicit Context(const ContextOptions& options = {});
        ~Context();

        Context(const Context&) = delete;
        Context& operator=(const Context&) = delete;

        /** Record the number of -v flags and derive the log level from it. */
        void set_verbosity(int verbosity);
        void set_log_level(log_level level);

    private:

        std::shared_ptr<spdlog::logger> m_logger;
    };
}
#endif
