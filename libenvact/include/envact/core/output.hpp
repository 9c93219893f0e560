// Copyright (c) 2025, envact Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ENVACT_CORE_OUTPUT_HPP
#define ENVACT_CORE_OUTPUT_HPP

#include <cstddef>
#include <iosfwd>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "envact/core/common_types.hpp"

namespace envact
{
    class Context;

    /**
     * Owner of the standard output.
     *
     * Standard output is reserved for the values handed back to the calling shell, so
     * listings go through here, while diagnostics go to the loggers.
     * A single instance may exist at a time.
     */
    class Console
    {
    public:

        explicit Console(const Context& context);
        ~Console();

        Console(const Console&) = delete;
        Console& operator=(const Console&) = delete;

        static Console& instance();
        static bool is_available();

        /** Print @p str and a newline, unless the output is quiet and @p force is false. */
        void print(std::string_view str, bool force = false);

        /** Print @p j as indented JSON, regardless of quiet. */
        void print_json(const nlohmann::json& j);

        const Context& context() const;

    private:

        const Context& m_context;
    };

    namespace printers
    {
        enum class alignment
        {
            left,
            right,
        };

        /**
         * Text table with a header, a dashed rule under it, and one line per row.
         *
         * Columns are as wide as their widest cell. Each cell is preceded by the padding
         * of its column.
         */
        class Table
        {
        public:

            explicit Table(std::vector<std::string> header);

            void set_alignment(std::vector<alignment> align);
            void set_padding(std::vector<std::size_t> padding);

            /** @throw std::invalid_argument if the row does not have one cell per column. */
            void add_row(std::vector<std::string> row);

            std::ostream& print(std::ostream& out) const;
            [[nodiscard]] std::string str() const;

        private:

            std::vector<std::string> m_header;
            std::vector<std::vector<std::string>> m_rows;
            std::vector<alignment> m_align;
            std::vector<std::size_t> m_padding;
        };
    }

    /**
     * Collect one log message and hand it to the spdlog default logger on destruction.
     *
     * Continuation lines of a multi-line message are indented under the first one.
     */
    class MessageLogger
    {
    public:

        explicit MessageLogger(log_level level);
        ~MessageLogger();

        MessageLogger(const MessageLogger&) = delete;
        MessageLogger& operator=(const MessageLogger&) = delete;

        std::ostringstream& stream();

    private:

        log_level m_level;
        std::ostringstream m_stream;
    };
}

#undef LOG
#undef LOG_TRACE
#undef LOG_DEBUG
#undef LOG_INFO
#undef LOG_WARNING
#undef LOG_ERROR
#undef LOG_CRITICAL

#define LOG(severity) envact::MessageLogger(severity).stream()
#define LOG_TRACE LOG(envact::log_level::trace)
#define LOG_DEBUG LOG(envact::log_level::debug)
#define LOG_INFO LOG(envact::log_level::info)
#define LOG_WARNING LOG(envact::log_level::warn)
#define LOG_ERROR LOG(envact::log_level::err)
#define LOG_CRITICAL LOG(envact::log_level::critical)

#endif
