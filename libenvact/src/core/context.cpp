// Copyright (c) 2025, envact Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "envact/core/context.hpp"

namespace envact
{
    namespace
    {
        auto to_spdlog(log_level level) -> spdlog::level::level_enum
        {
            return static_cast<spdlog::level::level_enum>(level);
        }
    }

    Context::Context(const ContextOptions& options)
    {
        if (!options.enable_logging)
        {
            return;
        }
        // Logs go to stderr, stdout is reserved to what the shell evaluates
        auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        m_logger = std::make_shared<spdlog::logger>("libenvact", std::move(sink));
        m_logger->set_pattern(output_params.log_pattern);
        spdlog::set_default_logger(m_logger);
        set_log_level(output_params.logging_level);
    }

    Context::~Context()
    {
        if (!m_logger)
        {
            return;
        }
        m_logger->flush();
        if (spdlog::default_logger_raw() == m_logger.get())
        {
            spdlog::set_default_logger(nullptr);
        }
    }

    void Context::set_verbosity(int verbosity)
    {
        output_params.verbosity = verbosity;
        set_log_level(log_level_for_verbosity(verbosity));
    }

    void Context::set_log_level(log_level level)
    {
        output_params.logging_level = level;
        if (m_logger)
        {
            m_logger->set_level(to_spdlog(level));
        }
    }
}
