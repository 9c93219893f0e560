// Copyright (c) 2025, envact Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <iostream>
#include <stdexcept>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "envact/core/context.hpp"
#include "envact/core/output.hpp"
#include "envact/util/string.hpp"

namespace envact
{
    /***********
     * Console *
     ***********/

    namespace
    {
        Console* current_console = nullptr;
    }

    Console::Console(const Context& context)
        : m_context(context)
    {
        if (current_console != nullptr)
        {
            throw std::logic_error("envact::Console singleton already set");
        }
        current_console = this;
    }

    Console::~Console()
    {
        std::cout.flush();
        current_console = nullptr;
    }

    Console& Console::instance()
    {
        if (current_console == nullptr)
        {
            throw std::logic_error("envact::Console not initialized");
        }
        return *current_console;
    }

    bool Console::is_available()
    {
        return current_console != nullptr;
    }

    void Console::print(std::string_view str, bool force)
    {
        if (m_context.output_params.quiet && !force)
        {
            return;
        }
        std::cout << str << '\n';
        std::cout.flush();
    }

    void Console::print_json(const nlohmann::json& j)
    {
        print(j.dump(4), true);
    }

    const Context& Console::context() const
    {
        return m_context;
    }

    /*******************
     * printers::Table *
     *******************/

    namespace printers
    {
        Table::Table(std::vector<std::string> header)
            : m_header(std::move(header))
            , m_align(m_header.size(), alignment::left)
            , m_padding(m_header.size(), 1)
        {
        }

        void Table::set_alignment(std::vector<alignment> align)
        {
            align.resize(m_header.size(), alignment::left);
            m_align = std::move(align);
        }

        void Table::set_padding(std::vector<std::size_t> padding)
        {
            padding.resize(m_header.size(), 1);
            m_padding = std::move(padding);
        }

        void Table::add_row(std::vector<std::string> row)
        {
            if (row.size() != m_header.size())
            {
                throw std::invalid_argument(fmt::format(
                    "Table row has {} cells, expected {}",
                    row.size(),
                    m_header.size()
                ));
            }
            m_rows.push_back(std::move(row));
        }

        std::ostream& Table::print(std::ostream& out) const
        {
            std::vector<std::size_t> widths(m_header.size());
            for (std::size_t col = 0; col < m_header.size(); ++col)
            {
                widths[col] = m_header[col].size();
                for (const auto& row : m_rows)
                {
                    widths[col] = std::max(widths[col], row[col].size());
                }
            }

            auto print_line = [&](const std::vector<std::string>& cells)
            {
                std::string line;
                for (std::size_t col = 0; col < cells.size(); ++col)
                {
                    line.append(m_padding[col], ' ');
                    if (m_align[col] == alignment::right)
                    {
                        line += fmt::format("{:>{}}", cells[col], widths[col]);
                    }
                    else
                    {
                        line += fmt::format("{:<{}}", cells[col], widths[col]);
                    }
                }
                // No trailing blanks after a short last cell
                out << util::rstrip(line, " ") << '\n';
            };

            print_line(m_header);
            std::size_t rule = 0;
            for (std::size_t col = 0; col < widths.size(); ++col)
            {
                rule += m_padding[col] + widths[col];
            }
            const std::size_t indent = m_padding.empty() ? 0 : m_padding.front();
            out << std::string(indent, ' ') << std::string(rule - indent, '-') << '\n';

            for (const auto& row : m_rows)
            {
                print_line(row);
            }
            return out;
        }

        std::string Table::str() const
        {
            std::ostringstream out;
            print(out);
            return out.str();
        }
    }

    /*****************
     * MessageLogger *
     *****************/

    MessageLogger::MessageLogger(log_level level)
        : m_level(level)
    {
    }

    MessageLogger::~MessageLogger()
    {
        auto* logger = spdlog::default_logger_raw();
        if ((logger == nullptr) || (m_level == log_level::off))
        {
            return;
        }
        const auto level = static_cast<spdlog::level::level_enum>(m_level);
        if (!logger->should_log(level))
        {
            return;
        }

        std::string text = m_stream.str();
        // Continuation lines line up after the "level    logger   " columns of the pattern
        util::replace_all(text, "\n", "\n" + std::string(18, ' '));
        logger->log(level, "{}", text);
    }

    std::ostringstream& MessageLogger::stream()
    {
        return m_stream;
    }
}
