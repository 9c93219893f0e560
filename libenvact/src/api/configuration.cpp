// Copyright (c) 2025, envact Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <string_view>

#include <fmt/format.h>

#include "envact/api/configuration.hpp"
#include "envact/core/output.hpp"
#include "envact/util/build.hpp"
#include "envact/util/environment.hpp"
#include "envact/util/path_manip.hpp"
#include "envact/util/string.hpp"

namespace envact
{
    /*******************************
     *  Implementation of Setting  *
     *******************************/

    const std::string& Setting::name() const
    {
        return m_name;
    }

    const std::string& Setting::group() const
    {
        return m_group;
    }

    const std::string& Setting::description() const
    {
        return m_description;
    }

    const std::vector<std::string>& Setting::env_var_names() const
    {
        return m_env_var_names;
    }

    const std::set<std::string>& Setting::needed() const
    {
        return m_needed;
    }

    bool Setting::is_rc_configurable() const
    {
        return m_rc_configurable;
    }

    const std::vector<std::string>& Setting::source() const
    {
        return m_source;
    }

    bool Setting::configured() const
    {
        return p_storage->has_api_value() || p_storage->has_cli_value() || m_env_configured
               || p_storage->has_rc_values();
    }

    Setting&& Setting::group(std::string name)
    {
        m_group = std::move(name);
        return std::move(*this);
    }

    Setting&& Setting::description(std::string text)
    {
        m_description = std::move(text);
        return std::move(*this);
    }

    Setting&& Setting::env_vars(std::vector<std::string> names)
    {
        if (names.empty())
        {
            names.push_back("ENVACT_" + util::to_upper(m_name));
        }
        m_env_var_names = std::move(names);
        return std::move(*this);
    }

    Setting&& Setting::rc_configurable()
    {
        m_rc_configurable = true;
        m_needed.insert("root_prefix");
        return std::move(*this);
    }

    Setting&& Setting::needs(std::set<std::string> names)
    {
        m_needed.insert(names.begin(), names.end());
        return std::move(*this);
    }

    Setting&& Setting::after_compute(std::function<void()> hook)
    {
        p_after_compute = std::move(hook);
        return std::move(*this);
    }

    Setting& Setting::clear_cli_value()
    {
        p_storage->clear_cli_value();
        return *this;
    }

    Setting& Setting::clear_rc_values()
    {
        p_storage->clear_rc_values();
        return *this;
    }

    Setting& Setting::clear_values()
    {
        p_storage->clear_api_value();
        p_storage->clear_cli_value();
        p_storage->clear_rc_values();
        m_env_configured = false;
        return *this;
    }

    void Setting::add_rc_value(const YAML::Node& node, const std::string& source)
    {
        p_storage->add_rc_value(node, source);
    }

    void Setting::compute(const Context& context)
    {
        std::vector<std::pair<std::string, std::string>> env_values;
        // no_env can always be set from the environment
        if (!context.src_params.no_env || (m_name == "no_env"))
        {
            for (const auto& var : m_env_var_names)
            {
                if (auto raw = util::get_env(var))
                {
                    env_values.emplace_back(var, std::move(raw).value());
                }
            }
        }

        m_env_configured = !env_values.empty();
        m_source = p_storage->merge(env_values);

        if (p_after_compute)
        {
            p_after_compute();
        }
    }

    YAML::Node Setting::yaml_value() const
    {
        return p_storage->yaml_value();
    }

    nlohmann::json Setting::json_value() const
    {
        return p_storage->json_value();
    }

    /*********
     * hooks *
     *********/

    namespace
    {
        bool is_var_char(char c)
        {
            return std::isalnum(static_cast<unsigned char>(c)) || (c == '_');
        }

        // Replace $VAR and ${VAR} by the value of the environment variable, when it is set.
        std::string expand_vars(std::string_view text)
        {
            std::string out;
            out.reserve(text.size());
            std::size_t pos = 0;
            while (pos < text.size())
            {
                if (text[pos] != '$')
                {
                    out.push_back(text[pos++]);
                    continue;
                }

                const bool braced = (pos + 1 < text.size()) && (text[pos + 1] == '{');
                const std::size_t begin = pos + (braced ? 2 : 1);
                std::size_t end = begin;
                while ((end < text.size()) && is_var_char(text[end]))
                {
                    ++end;
                }
                const bool closed = !braced || ((end < text.size()) && (text[end] == '}'));
                if ((end == begin) || !closed)
                {
                    out.push_back(text[pos++]);
                    continue;
                }

                const std::size_t next = braced ? end + 1 : end;
                if (auto value = util::get_env(std::string(text.substr(begin, end - begin))))
                {
                    out += value.value();
                }
                else
                {
                    out += text.substr(pos, next - pos);
                }
                pos = next;
            }
            return out;
        }
    }

    namespace detail
    {
        fs::u8path default_root_prefix()
        {
            return fs::u8path(util::user_data_dir()) / "envact";
        }

        void root_prefix_hook(fs::u8path& prefix)
        {
            if (prefix.empty())
            {
                prefix = default_root_prefix();
            }
            prefix = fs::weakly_canonical(fs::u8path(util::expand_home(prefix.string())));
            LOG_DEBUG << "Using root prefix '" << prefix.string() << "'";
        }

        void rc_files_hook(const Context& ctx, std::vector<fs::u8path>& files)
        {
            if (!files.empty() && ctx.src_params.no_rc)
            {
                throw envact_error(
                    "Configuration files given while disabled by 'no_rc'",
                    envact_error_code::configuration_failure
                );
            }

            for (auto& file : files)
            {
                file = util::expand_home(file.string());
                if (!fs::exists(file))
                {
                    throw envact_error(
                        fmt::format("Configuration file '{}' does not exist", file.string()),
                        envact_error_code::configuration_failure
                    );
                }
            }
        }

        void envs_dirs_hook(std::vector<fs::u8path>& dirs)
        {
            for (auto& dir : dirs)
            {
                dir = fs::weakly_canonical(fs::u8path(util::expand_home(dir.string())));
                std::error_code ec;
                if (fs::exists(dir, ec) && !fs::is_directory(dir, ec))
                {
                    throw envact_error(
                        fmt::format("Environments directory '{}' is not a directory", dir.string()),
                        envact_error_code::configuration_failure
                    );
                }
            }
        }

        log_level log_level_fallback(const Configuration& config)
        {
            const auto& params = config.context().output_params;
            if (params.json || params.quiet)
            {
                return log_level::critical;
            }
            if (config.at("verbose").configured())
            {
                return log_level_for_verbosity(params.verbosity);
            }
            return log_level::warn;
        }

        bool has_config_name(const std::string& file)
        {
            const auto filename = fs::u8path(file).filename().string();
            return (filename == ".envactrc") || (filename == "envactrc")
                   || util::ends_with(filename, ".yml") || util::ends_with(filename, ".yaml");
        }
    }

    namespace
    {
        bool is_config_file(const fs::u8path& path)
        {
            std::error_code ec;
            return fs::is_regular_file(path, ec) && detail::has_config_name(path.string());
        }

        // Files of a rc directory come in reverse name order, the last name takes precedence.
        std::vector<fs::u8path> existing_rc_sources(const std::vector<fs::u8path>& locations)
        {
            std::vector<fs::u8path> found;
            for (const auto& location : locations)
            {
                std::error_code ec;
                if (is_config_file(location))
                {
                    found.push_back(location);
                }
                else if (fs::is_directory(location, ec))
                {
                    std::vector<fs::u8path> files;
                    for (const auto& entry : fs::directory_iterator(location, ec))
                    {
                        if (is_config_file(entry.path()))
                        {
                            files.push_back(entry.path());
                        }
                    }
                    std::sort(files.rbegin(), files.rend());
                    found.insert(found.end(), files.begin(), files.end());
                }
                else
                {
                    LOG_TRACE << "No configuration at '" << location.string() << "'";
                }
            }
            return found;
        }

        // A null node when the file cannot be used.
        YAML::Node read_rc_file(const fs::u8path& file)
        {
            std::ifstream in(file, std::ios::binary);
            std::stringstream content;
            content << in.rdbuf();

            YAML::Node node;
            try
            {
                node = YAML::Load(expand_vars(content.str()));
            }
            catch (const YAML::Exception& e)
            {
                LOG_WARNING << fmt::format(
                    "Skipping configuration file '{}': {}",
                    file.string(),
                    e.what()
                );
                return YAML::Node();
            }

            if (!node.IsNull() && !node.IsMap())
            {
                LOG_WARNING << fmt::format(
                    "Skipping configuration file '{}', it is misformatted",
                    file.string()
                );
                return YAML::Node();
            }
            return node;
        }

        std::string source_comment(const std::vector<std::string>& source)
        {
            return "'" + util::join("' > '", source) + "'";
        }

        void emit_value(
            YAML::Emitter& out,
            const YAML::Node& value,
            const std::vector<std::string>& source,
            bool with_source
        )
        {
            if (!value.IsSequence())
            {
                out << value;
                if (with_source)
                {
                    out << YAML::Comment(source_comment(source));
                }
                return;
            }

            if (value.size() == 0)
            {
                out << YAML::_Null();
                if (with_source)
                {
                    out << YAML::Comment(source_comment({ "default" }));
                }
                return;
            }

            // Merged sequences have one source per item
            const bool per_item = (source.size() == value.size());
            out << YAML::BeginSeq;
            for (std::size_t i = 0; i < value.size(); ++i)
            {
                out << value[i];
                if (with_source)
                {
                    const auto item_source = per_item ? std::vector{ source[i] } : source;
                    out << YAML::Comment(source_comment(item_source));
                }
            }
            out << YAML::EndSeq;
        }

        bool
        is_shown(const DumpOptions& options, const std::vector<std::string>& names, const Setting& s)
        {
            if (!names.empty())
            {
                return std::find(names.begin(), names.end(), s.name()) != names.end();
            }
            return options.all || (s.is_rc_configurable() && s.configured());
        }

        std::string dump_json(
            const DumpOptions& options,
            const std::vector<std::string>& names,
            const std::vector<const Setting*>& settings
        )
        {
            auto root = nlohmann::json::object();
            for (const auto* s : settings)
            {
                if (!is_shown(options, names, *s))
                {
                    continue;
                }
                if (!options.sources && !options.descriptions)
                {
                    root[s->name()] = s->json_value();
                    continue;
                }

                auto& entry = root[s->name()];
                entry["value"] = s->json_value();
                if (options.sources)
                {
                    entry["source"] = s->source();
                }
                if (options.descriptions)
                {
                    entry["description"] = s->description();
                }
            }
            return root.dump(4);
        }

        std::string dump_yaml(
            const DumpOptions& options,
            const std::vector<std::string>& names,
            const std::vector<const Setting*>& settings
        )
        {
            YAML::Emitter out;
            bool empty = true;
            for (const auto* s : settings)
            {
                if (!is_shown(options, names, *s))
                {
                    continue;
                }

                if (options.descriptions)
                {
                    if (!empty)
                    {
                        out << YAML::Newline << YAML::Newline;
                    }
                    out << YAML::Comment(s->name()) << YAML::Newline;
                    out << YAML::Comment("  " + s->description());
                }
                if (options.values)
                {
                    if (empty)
                    {
                        out << YAML::BeginMap;
                    }
                    out << YAML::Key << s->name() << YAML::Value;
                    emit_value(out, s->yaml_value(), s->source(), options.sources);
                }
                empty = false;
            }
            if (options.values && !empty)
            {
                out << YAML::EndMap;
            }
            return out.c_str();
        }
    }

    /*************************************
     *  Implementation of Configuration  *
     *************************************/

    Configuration::Configuration(Context& ctx)
        : m_context(ctx)
    {
        register_settings();
    }

    Configuration::~Configuration() = default;

    void Configuration::register_settings()
    {
        // Basic
        insert(Setting("root_prefix", &m_context.prefix_params.root_prefix)
                   .group("Basic")
                   .env_vars()
                   .needs({ "rc_files" })
                   .description("Path to the root prefix, holding the 'base' environment")
                   .fallback<fs::u8path>(detail::default_root_prefix)
                   .post_merge<fs::u8path>(detail::root_prefix_hook)
                   .after_compute(
                       [this]
                       {
                           if (!m_context.src_params.no_rc)
                           {
                               load_rc_files(at("rc_files").value<std::vector<fs::u8path>>());
                           }
                       }
                   ));

        insert(Setting("envs_dirs", &m_context.envs_dirs)
                   .group("Basic")
                   .rc_configurable()
                   .env_vars()
                   .description("Directories in which environments are looked up by name")
                   .fallback<std::vector<fs::u8path>>(
                       [this]
                       {
                           const auto& root = m_context.prefix_params.root_prefix;
                           return std::vector<fs::u8path>{ root / "envs" };
                       }
                   )
                   .post_merge<std::vector<fs::u8path>>(detail::envs_dirs_hook));

        // Prompt
        insert(Setting("env_prompt", &m_context.env_prompt)
                   .group("Prompt")
                   .rc_configurable()
                   .env_vars()
                   .description(
                       "Template prepended to the prompt of an activated shell, with "
                       "'{default_env}', '{name}' and '{prefix}' placeholders"
                   ));

        insert(Setting("change_ps1", &m_context.change_ps1)
                   .group("Prompt")
                   .rc_configurable()
                   .env_vars()
                   .description("Whether activation modifies the prompt"));

        // Output
        insert(Setting("json", &m_context.output_params.json)
                   .group("Output")
                   .description("Report in JSON format"));

        insert(Setting("quiet", &m_context.output_params.quiet)
                   .group("Output")
                   .description("Set quiet mode (print less output)"));

        insert(Setting("verbose", 0)
                   .group("Output")
                   .description("Set the verbosity, repeat to increase it")
                   .post_merge<int>([this](int& value) { m_context.set_verbosity(value); }));

        insert(Setting("log_level", &m_context.output_params.logging_level)
                   .group("Output")
                   .rc_configurable()
                   .env_vars()
                   .needs({ "json", "quiet", "verbose" })
                   .description("Set the log level, written on the error stream")
                   .fallback<log_level>([this] { return detail::log_level_fallback(*this); }));

        insert(Setting("show_config_sources", false)
                   .group("Output")
                   .description("Display the source of each configuration value"));

        insert(Setting("show_config_descriptions", false)
                   .group("Output")
                   .description("Display the description of each configuration value"));

        insert(Setting("show_all_configs", false)
                   .group("Output")
                   .description("Display all configuration values, including unset ones"));

        insert(Setting("config_names", std::vector<std::string>())
                   .group("Output")
                   .description("Restrict the displayed configuration to these keys"));

        // Config sources
        insert(Setting("rc_files", std::vector<fs::u8path>())
                   .group("Config sources")
                   .env_vars({ "ENVACTRC" })
                   .needs({ "no_rc" })
                   .description("Paths to the configuration files to use")
                   .post_merge<std::vector<fs::u8path>>(
                       [this](std::vector<fs::u8path>& files)
                       { detail::rc_files_hook(m_context, files); }
                   ));

        insert(Setting("no_rc", &m_context.src_params.no_rc)
                   .group("Config sources")
                   .env_vars()
                   .needs({ "no_env" })
                   .description("Disable the use of configuration files"));

        insert(Setting("no_env", &m_context.src_params.no_env)
                   .group("Config sources")
                   .env_vars()
                   .description("Disable the use of environment variables"));
    }

    Setting& Configuration::insert(Setting setting)
    {
        const std::string name = setting.name();
        auto [it, inserted] = m_settings.emplace(name, std::move(setting));
        if (!inserted)
        {
            throw envact_error(
                fmt::format("Setting '{}' already exists", name),
                envact_error_code::internal_failure
            );
        }
        m_order.push_back(name);
        return it->second;
    }

    Setting& Configuration::at(const std::string& name)
    {
        return const_cast<Setting&>(std::as_const(*this).at(name));
    }

    const Setting& Configuration::at(const std::string& name) const
    {
        const auto it = m_settings.find(name);
        if (it == m_settings.end())
        {
            throw envact_error(
                fmt::format("Setting '{}' does not exist", name),
                envact_error_code::internal_failure
            );
        }
        return it->second;
    }

    // Highest precedence first. A location listed twice keeps its lowest precedence.
    std::vector<fs::u8path> Configuration::compute_default_rc_sources(const Context& context)
    {
        const auto home = fs::u8path(util::user_home_dir());
        const auto config_dir = fs::u8path(util::user_config_dir()) / "envact";
        const auto& root = context.prefix_params.root_prefix;
        const auto system = fs::u8path(util::on_win ? "C:\\ProgramData\\envact" : "/etc/envact");

        std::vector<fs::u8path> locations;
        if (auto envactrc = util::get_env("ENVACTRC"))
        {
            locations.emplace_back(envactrc.value());
        }
        locations.push_back(home / ".envactrc");
        locations.push_back(config_dir / "envactrc.d");
        locations.push_back(config_dir / "envactrc");
        if (!root.empty())
        {
            locations.push_back(root / "envactrc.d");
            locations.push_back(root / ".envactrc");
        }
        locations.push_back(system / "envactrc.d");
        locations.push_back(system / ".envactrc");

        std::vector<fs::u8path> sources;
        for (auto it = locations.rbegin(); it != locations.rend(); ++it)
        {
            if (std::find(sources.begin(), sources.end(), *it) == sources.end())
            {
                sources.push_back(*it);
            }
        }
        std::reverse(sources.begin(), sources.end());
        return sources;
    }

    void Configuration::load_rc_files(std::vector<fs::u8path> paths)
    {
        if (paths.empty())
        {
            paths = compute_default_rc_sources(m_context);
        }

        m_sources = existing_rc_sources(paths);
        std::vector<std::pair<fs::u8path, YAML::Node>> parsed;
        for (const auto& file : m_sources)
        {
            auto node = read_rc_file(file);
            if (node.IsNull())
            {
                continue;
            }
            LOG_TRACE << "Configuration read from '" << file.string() << "'";
            m_valid_sources.push_back(file);
            parsed.emplace_back(file, std::move(node));
        }

        for (auto& [name, setting] : m_settings)
        {
            if (!setting.is_rc_configurable())
            {
                continue;
            }
            for (const auto& [file, node] : parsed)
            {
                const auto value = node[name];
                if (!value || value.IsNull())
                {
                    continue;
                }
                try
                {
                    setting.add_rc_value(value, util::shrink_home(file.string()));
                }
                catch (const YAML::Exception& e)
                {
                    LOG_WARNING << fmt::format(
                        "Skipping invalid '{}' in '{}': {}",
                        name,
                        file.string(),
                        e.what()
                    );
                }
            }
        }
    }

    auto Configuration::loading_sequence() const -> std::vector<std::string>
    {
        std::vector<std::string> sequence;
        std::vector<std::string> path;

        std::function<void(const std::string&)> visit = [&](const std::string& name)
        {
            if (std::find(sequence.begin(), sequence.end(), name) != sequence.end())
            {
                return;
            }
            if (std::find(path.begin(), path.end(), name) != path.end())
            {
                throw envact_error(
                    fmt::format(
                        "Circular dependency in settings: {}->{}",
                        util::join("->", path),
                        name
                    ),
                    envact_error_code::internal_failure
                );
            }
            path.push_back(name);
            for (const auto& needed : at(name).needed())
            {
                visit(needed);
            }
            path.pop_back();
            sequence.push_back(name);
        };

        for (const auto& name : m_order)
        {
            visit(name);
        }
        return sequence;
    }

    void Configuration::load()
    {
        LOG_DEBUG << "Loading configuration";

        m_sources.clear();
        m_valid_sources.clear();
        for (auto& [name, setting] : m_settings)
        {
            setting.clear_rc_values();
        }

        try
        {
            for (const auto& name : loading_sequence())
            {
                at(name).compute(m_context);
            }
        }
        catch (const YAML::Exception& e)
        {
            throw envact_error(
                fmt::format("Invalid configuration value: {}", e.what()),
                envact_error_code::configuration_failure
            );
        }

        m_context.set_log_level(m_context.output_params.logging_level);
    }

    void Configuration::operation_teardown()
    {
        for (auto& [name, setting] : m_settings)
        {
            setting.clear_cli_value();
        }
    }

    void Configuration::clear_values()
    {
        for (auto& [name, setting] : m_settings)
        {
            setting.clear_values();
        }
    }

    std::vector<fs::u8path> Configuration::sources() const
    {
        return m_sources;
    }

    std::vector<fs::u8path> Configuration::valid_sources() const
    {
        return m_valid_sources;
    }

    std::string
    Configuration::dump(const DumpOptions& options, const std::vector<std::string>& names) const
    {
        std::vector<const Setting*> settings;
        for (const auto& name : m_order)
        {
            settings.push_back(&at(name));
        }

        if (m_context.output_params.json)
        {
            return dump_json(options, names, settings);
        }
        return dump_yaml(options, names, settings);
    }
}
