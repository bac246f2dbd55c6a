/*
 * File: src/relay_auth.hpp
 * Project: Battle Relay
 * Purpose: Shared-secret check for WebSocket clients
 * Notes:
 *  - Credential travels in Sec-WebSocket-Protocol as "token-<value>"
 *  - Secret is fixed at start-up (relay_config.hpp)
 * Last updated: 2026-10-18
 */

#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "common/log.hpp"

inline constexpr std::string_view kTokenProtocolPrefix = "token-";

struct Credential
{
    std::string value;    // secret presented by the client
    std::string protocol; // full subprotocol entry to echo back, e.g. "token-abc"
};

// Picks the first "token-" entry out of a comma separated subprotocol list.
inline std::optional<Credential> extract_credential(std::string_view header)
{
    while (!header.empty())
    {
        auto comma = header.find(',');
        auto item = header.substr(0, comma);
        header = (comma == std::string_view::npos) ? std::string_view{} : header.substr(comma + 1);

        while (!item.empty() && (item.front() == ' ' || item.front() == '\t'))
            item.remove_prefix(1);
        while (!item.empty() && (item.back() == ' ' || item.back() == '\t'))
            item.remove_suffix(1);

        if (item.size() > kTokenProtocolPrefix.size() && item.substr(0, kTokenProtocolPrefix.size()) == kTokenProtocolPrefix)
            return Credential{std::string(item.substr(kTokenProtocolPrefix.size())), std::string(item)};
    }
    return std::nullopt;
}

class Authenticator
{
    std::string secret_;

    // Runtime independent of where the first mismatch is.
    static bool equal_ct(std::string_view a, std::string_view b)
    {
        unsigned char diff = static_cast<unsigned char>(a.size() != b.size());
        for (std::size_t i = 0; i < b.size(); ++i)
        {
            unsigned char ca = i < a.size() ? static_cast<unsigned char>(a[i]) : 0;
            diff |= static_cast<unsigned char>(ca ^ static_cast<unsigned char>(b[i]));
        }
        return diff == 0;
    }

public:
    explicit Authenticator(std::string secret) : secret_(std::move(secret)) {}

    bool validate(const std::optional<std::string> &credential) const
    {
        if (credential && equal_ct(*credential, secret_))
        {
            log_debug("auth", "token validated");
            return true;
        }
        log_warn("auth", credential ? "invalid token presented" : "no token presented");
        return false;
    }
};
