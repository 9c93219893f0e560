// Copyright (c) 2025, envact Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ENVACT_API_CONFIGURATION_HPP
#define ENVACT_API_CONFIGURATION_HPP

#include <algorithm>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include "envact/core/common_types.hpp"
#include "envact/core/context.hpp"
#include "envact/core/error_handling.hpp"
#include "envact/fs/filesystem.hpp"

namespace YAML
{
    template <>
    struct convert<envact::fs::u8path>
    {
        static Node encode(const envact::fs::u8path& path)
        {
            return Node(path.string());
        }

        static bool decode(const Node& node, envact::fs::u8path& path)
        {
            if (node.IsScalar())
            {
                path = node.Scalar();
                return true;
            }
            return false;
        }
    };

    template <>
    struct convert<envact::log_level>
    {
        static Node encode(const envact::log_level& level)
        {
            return Node(std::string(envact::name_of(level)));
        }

        static bool decode(const Node& node, envact::log_level& level)
        {
            const auto parsed = node.IsScalar() ? envact::log_level_from_name(node.Scalar())
                                                : std::nullopt;
            if (parsed)
            {
                level = *parsed;
            }
            return parsed.has_value();
        }
    };
}

namespace envact
{
    /// What ``Configuration::dump`` shows.
    struct DumpOptions
    {
        bool values = true;
        bool sources = false;
        bool descriptions = false;
        /// Also show the settings that were not configured.
        bool all = false;
    };

    namespace detail
    {
        template <class T>
        struct is_vector : std::false_type
        {
        };

        template <class T>
        struct is_vector<std::vector<T>> : std::true_type
        {
        };

        template <class T>
        auto to_json_value(const T& value) -> nlohmann::json
        {
            return nlohmann::json(value);
        }

        inline auto to_json_value(const fs::u8path& path) -> nlohmann::json
        {
            return path.string();
        }

        inline auto to_json_value(log_level level) -> nlohmann::json
        {
            return std::string(name_of(level));
        }

        template <class T>
        auto to_json_value(const std::vector<T>& values) -> nlohmann::json
        {
            auto array = nlohmann::json::array();
            for (const auto& v : values)
            {
                array.push_back(to_json_value(v));
            }
            return array;
        }

        /// A value read from the environment or from a rc file, with where it comes from.
        template <class T>
        struct SourcedValue
        {
            std::string source;
            T value;
        };

        /// Type-erased storage and merging of the values of a setting.
        class SettingStorage
        {
        public:

            virtual ~SettingStorage() = default;

            virtual bool has_api_value() const = 0;
            virtual bool has_cli_value() const = 0;
            virtual bool has_rc_values() const = 0;

            virtual void clear_api_value() = 0;
            virtual void clear_cli_value() = 0;
            virtual void clear_rc_values() = 0;

            /// Throws ``YAML::Exception`` when @p node does not hold the setting type.
            virtual void add_rc_value(const YAML::Node& node, const std::string& source) = 0;

            /**
             * Merge the values by precedence into the target, returning the sources used.
             *
             * @p env_values are the raw environment variable values with their names.
             */
            virtual auto merge(const std::vector<std::pair<std::string, std::string>>& env_values)
                -> std::vector<std::string> = 0;

            virtual auto yaml_value() const -> YAML::Node = 0;
            virtual auto json_value() const -> nlohmann::json = 0;
        };

        template <class T>
        class TypedStorage : public SettingStorage
        {
        public:

            explicit TypedStorage(T* target)
                : p_target(target)
                , m_default(*target)
            {
            }

            explicit TypedStorage(T init)
                : m_owned(std::move(init))
                , p_target(&*m_owned)
                , m_default(*p_target)
            {
            }

            bool has_api_value() const override
            {
                return m_api.has_value();
            }

            bool has_cli_value() const override
            {
                return m_cli.has_value();
            }

            bool has_rc_values() const override
            {
                return !m_rc.empty();
            }

            void clear_api_value() override
            {
                m_api.reset();
            }

            void clear_cli_value() override
            {
                m_cli.reset();
            }

            void clear_rc_values() override
            {
                m_rc.clear();
            }

            void add_rc_value(const YAML::Node& node, const std::string& source) override
            {
                m_rc.push_back({ source, node.as<T>() });
            }

            auto merge(const std::vector<std::pair<std::string, std::string>>& env_values)
                -> std::vector<std::string> override;

            auto yaml_value() const -> YAML::Node override
            {
                return YAML::Node(*p_target);
            }

            auto json_value() const -> nlohmann::json override
            {
                return to_json_value(*p_target);
            }

            auto value() const -> const T&
            {
                return *p_target;
            }

            void set_api_value(T value)
            {
                m_api = std::move(value);
            }

            void set_cli_value(T value)
            {
                m_cli = std::move(value);
            }

            std::function<T()> fallback;
            std::function<void(T&)> post_merge;

        private:

            static auto parse_env(const std::string& raw) -> T
            {
                if constexpr (is_vector<T>::value)
                {
                    return YAML::Load("[" + raw + "]").as<T>();
                }
                else
                {
                    return YAML::Load(raw).as<T>();
                }
            }

            std::optional<T> m_owned;
            T* p_target;
            T m_default;
            std::optional<T> m_api;
            std::optional<T> m_cli;
            std::vector<SourcedValue<T>> m_rc;
        };
    }

    /**
     * A named configuration value, merged from the API, the command line, the environment
     * variables and the rc files, in this order of precedence.
     *
     * The merged value is written to a field of the ``Context`` or, for settings only
     * meaningful to the command line, kept in the setting itself.
     */
    class Setting
    {
    public:

        template <class T>
        Setting(std::string name, T* target);

        template <class T>
        Setting(std::string name, T init);

        Setting(Setting&&) = default;
        Setting& operator=(Setting&&) = default;

        const std::string& name() const;
        const std::string& group() const;
        const std::string& description() const;
        const std::vector<std::string>& env_var_names() const;
        const std::set<std::string>& needed() const;
        bool is_rc_configurable() const;

        /// The sources of the last computed value, ``default`` when none was configured.
        const std::vector<std::string>& source() const;

        /// Whether a value other than the default was given.
        bool configured() const;

        Setting&& group(std::string name);
        Setting&& description(std::string text);

        /// Read from the given variables, ``ENVACT_<NAME>`` by default.
        Setting&& env_vars(std::vector<std::string> names = {});

        /// Read from rc files, computed after the root prefix.
        Setting&& rc_configurable();

        /// Compute the given settings before this one.
        Setting&& needs(std::set<std::string> names);

        /// Value used instead of the default when nothing configured the setting.
        template <class T>
        Setting&& fallback(std::function<T()> hook);

        /// Called with the merged value before it is stored.
        template <class T>
        Setting&& post_merge(std::function<void(T&)> hook);

        /// Called once the value is stored.
        Setting&& after_compute(std::function<void()> hook);

        template <class T>
        Setting& set_value(T value);

        template <class T>
        Setting& set_cli_value(T value);

        Setting& clear_cli_value();
        Setting& clear_rc_values();
        Setting& clear_values();

        /// Throws ``YAML::Exception`` when @p node does not hold the setting type.
        void add_rc_value(const YAML::Node& node, const std::string& source);

        void compute(const Context& context);

        template <class T>
        const T& value() const;

        YAML::Node yaml_value() const;
        nlohmann::json json_value() const;

    private:

        template <class T>
        auto typed() const -> detail::TypedStorage<T>&;

        std::string m_name;
        std::string m_group = "Default";
        std::string m_description = "No description provided";
        std::vector<std::string> m_env_var_names;
        std::set<std::string> m_needed;
        std::vector<std::string> m_source = { "default" };
        bool m_rc_configurable = false;
        bool m_env_configured = false;
        std::function<void()> p_after_compute;
        std::unique_ptr<detail::SettingStorage> p_storage;
    };

    /**
     * The settings of envact, loaded in dependency order.
     */
    class Configuration
    {
    public:

        explicit Configuration(Context& ctx);
        ~Configuration();

        Configuration(const Configuration&) = delete;
        Configuration& operator=(const Configuration&) = delete;

        /// Throws ``envact_error`` with ``internal_failure`` for unknown names.
        Setting& at(const std::string& name);
        const Setting& at(const std::string& name) const;

        Setting& insert(Setting setting);

        /**
         * Compute every setting and apply the resulting log level.
         *
         * Throws ``envact_error`` with ``configuration_failure`` on invalid values.
         */
        void load();

        /// Forget the command line values, once an operation is done.
        void operation_teardown();
        void clear_values();

        /// The rc files found, by precedence.
        std::vector<fs::u8path> sources() const;
        /// The rc files found and parsed, by precedence.
        std::vector<fs::u8path> valid_sources() const;

        std::string
        dump(const DumpOptions& options = {}, const std::vector<std::string>& names = {}) const;

        Context& context()
        {
            return m_context;
        }

        const Context& context() const
        {
            return m_context;
        }

        /// Default rc file locations, by precedence.
        static std::vector<fs::u8path> compute_default_rc_sources(const Context& context);

    private:

        void register_settings();
        auto loading_sequence() const -> std::vector<std::string>;
        void load_rc_files(std::vector<fs::u8path> paths);

        Context& m_context;
        std::map<std::string, Setting> m_settings;
        std::vector<std::string> m_order;
        std::vector<fs::u8path> m_sources;
        std::vector<fs::u8path> m_valid_sources;
    };

    /*************************************
     *  Implementation of TypedStorage   *
     *************************************/

    namespace detail
    {
        template <class T>
        auto
        TypedStorage<T>::merge(const std::vector<std::pair<std::string, std::string>>& env_values)
            -> std::vector<std::string>
        {
            std::vector<SourcedValue<T>> candidates;
            if (m_api)
            {
                candidates.push_back({ "API", *m_api });
            }
            if (m_cli)
            {
                candidates.push_back({ "CLI", *m_cli });
            }
            for (const auto& [var, raw] : env_values)
            {
                candidates.push_back({ var, parse_env(raw) });
            }
            candidates.insert(candidates.end(), m_rc.begin(), m_rc.end());

            std::vector<std::string> sources;
            T merged = m_default;
            if (candidates.empty())
            {
                sources.push_back("default");
                if (fallback)
                {
                    merged = fallback();
                }
            }
            else if constexpr (is_vector<T>::value)
            {
                merged.clear();
                for (const auto& candidate : candidates)
                {
                    for (const auto& item : candidate.value)
                    {
                        if (std::find(merged.begin(), merged.end(), item) == merged.end())
                        {
                            merged.push_back(item);
                            sources.push_back(candidate.source);
                        }
                    }
                }
            }
            else
            {
                merged = candidates.front().value;
                for (const auto& candidate : candidates)
                {
                    sources.push_back(candidate.source);
                }
            }

            if (post_merge)
            {
                post_merge(merged);
            }
            *p_target = std::move(merged);
            return sources;
        }
    }

    /*******************************
     *  Implementation of Setting  *
     *******************************/

    template <class T>
    Setting::Setting(std::string name, T* target)
        : m_name(std::move(name))
        , p_storage(std::make_unique<detail::TypedStorage<T>>(target))
    {
    }

    template <class T>
    Setting::Setting(std::string name, T init)
        : m_name(std::move(name))
        , p_storage(std::make_unique<detail::TypedStorage<T>>(std::move(init)))
    {
    }

    template <class T>
    auto Setting::typed() const -> detail::TypedStorage<T>&
    {
        auto* storage = dynamic_cast<detail::TypedStorage<T>*>(p_storage.get());
        if (storage == nullptr)
        {
            throw envact_error(
                "Setting '" + m_name + "' accessed with the wrong type",
                envact_error_code::internal_failure
            );
        }
        return *storage;
    }

    template <class T>
    Setting&& Setting::fallback(std::function<T()> hook)
    {
        typed<T>().fallback = std::move(hook);
        return std::move(*this);
    }

    template <class T>
    Setting&& Setting::post_merge(std::function<void(T&)> hook)
    {
        typed<T>().post_merge = std::move(hook);
        return std::move(*this);
    }

    template <class T>
    Setting& Setting::set_value(T value)
    {
        typed<T>().set_api_value(std::move(value));
        return *this;
    }

    template <class T>
    Setting& Setting::set_cli_value(T value)
    {
        typed<T>().set_cli_value(std::move(value));
        return *this;
    }

    template <class T>
    const T& Setting::value() const
    {
        return typed<T>().value();
    }
}

#endif
