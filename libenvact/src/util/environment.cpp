// Copyright (c) 2025, envact Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <cstdlib>
#include <stdexcept>

#include <fmt/format.h>

#ifdef _WIN32
#include <mutex>
#else
#include <pwd.h>
#include <unistd.h>

extern "C"
{
    extern char** environ;
}
#endif

#include "envact/util/environment.hpp"

namespace envact::util
{
    namespace
    {
#ifdef _WIN32
        // The CRT environment functions are not thread-safe
        std::mutex env_mutex;
#endif

        auto non_empty_env(const std::string& key) -> std::optional<std::string>
        {
            auto value = get_env(key);
            if (value && value->empty())
            {
                return std::nullopt;
            }
            return value;
        }

        void put_env(const std::string& key, const char* value)
        {
#ifdef _WIN32
            const std::scoped_lock lock{ env_mutex };
            // An empty value removes the variable
            const bool failed = ::_putenv_s(key.c_str(), value ? value : "") != 0;
#else
            const bool failed = value ? (::setenv(key.c_str(), value, 1) != 0)
                                      : (::unsetenv(key.c_str()) != 0);
#endif
            if (failed)
            {
                throw std::runtime_error(
                    fmt::format(R"(Failed to update the environment variable "{}")", key)
                );
            }
        }
    }

    auto get_env(const std::string& key) -> std::optional<std::string>
    {
#ifdef _WIN32
        const std::scoped_lock lock{ env_mutex };
        char* buffer = nullptr;
        std::size_t size = 0;
        if ((::_dupenv_s(&buffer, &size, key.c_str()) != 0) || (buffer == nullptr))
        {
            return std::nullopt;
        }
        std::string value = buffer;
        std::free(buffer);
        return value;
#else
        if (const char* value = std::getenv(key.c_str()))
        {
            return std::string(value);
        }
        return std::nullopt;
#endif
    }

    void set_env(const std::string& key, const std::string& value)
    {
        put_env(key, value.c_str());
    }

    void unset_env(const std::string& key)
    {
        put_env(key, nullptr);
    }

    auto get_env_map() -> environment_map
    {
        environment_map env;
#ifdef _WIN32
        const std::scoped_lock lock{ env_mutex };
        char** entries = _environ;
#else
        char** entries = environ;
#endif
        for (; (entries != nullptr) && (*entries != nullptr); ++entries)
        {
            const std::string_view entry = *entries;
            const auto eq = entry.find('=');
            // Windows keeps hidden "=C:" entries for the per drive directories
            if ((eq == 0) || (eq == std::string_view::npos))
            {
                continue;
            }
            env.emplace(entry.substr(0, eq), entry.substr(eq + 1));
        }
        return env;
    }

    void set_env_map(const environment_map& env)
    {
        for (const auto& entry : get_env_map())
        {
            if (env.count(entry.first) == 0)
            {
                unset_env(entry.first);
            }
        }
        for (const auto& [key, value] : env)
        {
            set_env(key, value);
        }
    }

    auto user_home_dir() -> std::string
    {
#ifdef _WIN32
        if (auto home = non_empty_env("USERPROFILE"))
        {
            return *home;
        }
        const auto home = get_env("HOMEDRIVE").value_or("") + get_env("HOMEPATH").value_or("");
#else
        if (auto home = non_empty_env("HOME"))
        {
            return *home;
        }
        const auto* entry = ::getpwuid(::getuid());
        const std::string home = (entry && entry->pw_dir) ? entry->pw_dir : "";
#endif
        if (home.empty())
        {
            throw std::runtime_error("Cannot determine the home directory of the current user");
        }
        return home;
    }

    auto user_config_dir() -> std::string
    {
        if (auto dir = non_empty_env("XDG_CONFIG_HOME"))
        {
            return *dir;
        }
        if (on_win)
        {
            if (auto dir = non_empty_env("APPDATA"))
            {
                return *dir;
            }
            return (fs::u8path(user_home_dir()) / "AppData" / "Roaming").string();
        }
        return (fs::u8path(user_home_dir()) / ".config").string();
    }

    auto user_data_dir() -> std::string
    {
        if (auto dir = non_empty_env("XDG_DATA_HOME"))
        {
            return *dir;
        }
        if (on_win)
        {
            return user_config_dir();
        }
        return (fs::u8path(user_home_dir()) / ".local" / "share").string();
    }

    auto get_path_dirs(const fs::u8path& prefix) -> std::vector<fs::u8path>
    {
        if (!on_win)
        {
            return { prefix / "bin" };
        }
        const auto library = prefix / "Library";
        return {
            prefix,
            library / "mingw-w64" / "bin",
            library / "usr" / "bin",
            library / "bin",
            prefix / "Scripts",
            prefix / "bin",
        };
    }
}
