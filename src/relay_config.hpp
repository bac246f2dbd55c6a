/*
 * File: src/relay_config.hpp
 * Project: Battle Relay
 * Purpose: Environment configuration and .env loading
 * Notes:
 *  - PORT is mandatory; everything else has a default
 *  - WS_AUTH_TOKEN falls back to "test_token" for local use (logged)
 * Last updated: 2026-10-18
 */

#pragma once
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

#include "common/log.hpp"

inline constexpr const char *kDefaultMapUrl = "https://api.chatwars.me/webview/map";
inline constexpr const char *kDefaultAuthToken = "test_token";

struct ConfigError : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct RelayConfig
{
    std::string host{"127.0.0.1"};
    unsigned short port{0};
    std::string auth_token{kDefaultAuthToken};
    std::chrono::seconds poll_interval{60};
    std::string map_url{kDefaultMapUrl};
    unsigned worker_threads{1};
    LogLevel log_level{LogLevel::info};
};

using EnvLookup = std::function<std::optional<std::string>(const std::string &)>;

inline std::optional<std::string> process_env(const std::string &key)
{
    if (const char *v = std::getenv(key.c_str()))
        return std::string(v);
    return std::nullopt;
}

namespace config_detail
{

inline std::string trim(const std::string &s)
{
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos)
        return {};
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

// Whole string must be a decimal number in [lo, hi].
inline std::optional<unsigned long> parse_uint(const std::string &s, unsigned long lo, unsigned long hi)
{
    if (s.empty() || s.size() > 10)
        return std::nullopt;
    unsigned long v = 0;
    for (char c : s)
    {
        if (c < '0' || c > '9')
            return std::nullopt;
        v = v * 10 + static_cast<unsigned long>(c - '0');
    }
    if (v < lo || v > hi)
        return std::nullopt;
    return v;
}

} // namespace config_detail

// Reads KEY=VALUE lines into the process environment without overriding
// variables that are already set. Returns the number of variables applied;
// a missing file is not an error.
inline std::size_t load_dotenv(const std::string &path = ".env")
{
    std::ifstream f(path);
    if (!f)
        return 0;
    std::size_t applied = 0;
    std::string line;
    while (std::getline(f, line))
    {
        line = config_detail::trim(line);
        if (line.empty() || line[0] == '#')
            continue;
        if (line.rfind("export ", 0) == 0)
            line = config_detail::trim(line.substr(7));
        auto eq = line.find('=');
        if (eq == std::string::npos)
            continue;
        auto key = config_detail::trim(line.substr(0, eq));
        auto value = config_detail::trim(line.substr(eq + 1));
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front())
            value = value.substr(1, value.size() - 2);
        if (key.empty() || std::getenv(key.c_str()))
            continue;
        if (::setenv(key.c_str(), value.c_str(), 1) == 0)
            ++applied;
    }
    return applied;
}

inline RelayConfig load_config(const EnvLookup &env = process_env)
{
    using config_detail::parse_uint;
    RelayConfig cfg;

    if (auto v = env("LOG_LEVEL"))
        cfg.log_level = parse_log_level(*v);

    if (auto v = env("HOST"); v && !v->empty())
        cfg.host = *v;
    else
        log_warn("config", "HOST not set, defaulting to ", cfg.host);

    auto port = env("PORT");
    if (!port)
        throw ConfigError("PORT must be set");
    auto p = parse_uint(config_detail::trim(*port), 1, 65535);
    if (!p)
        throw ConfigError("PORT must be a valid number between 1 and 65535, got '" + *port + "'");
    cfg.port = static_cast<unsigned short>(*p);

    if (auto v = env("WS_AUTH_TOKEN"); v && !v->empty())
        cfg.auth_token = *v;
    else
        log_warn("config", "WS_AUTH_TOKEN not set, defaulting to ", kDefaultAuthToken);

    if (auto v = env("POLL_INTERVAL_SECS"))
    {
        auto secs = parse_uint(config_detail::trim(*v), 1, 86400);
        if (!secs)
            throw ConfigError("POLL_INTERVAL_SECS must be a positive number of seconds, got '" + *v + "'");
        cfg.poll_interval = std::chrono::seconds(*secs);
    }

    if (auto v = env("MAP_URL"); v && !v->empty())
        cfg.map_url = *v;

    if (auto v = env("WORKER_THREADS"))
    {
        auto n = parse_uint(config_detail::trim(*v), 1, 256);
        if (!n)
            throw ConfigError("WORKER_THREADS must be between 1 and 256, got '" + *v + "'");
        cfg.worker_threads = static_cast<unsigned>(*n);
    }
    return cfg;
}
