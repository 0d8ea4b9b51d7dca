/*

account.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Sending account: identity, protocol, credential reference and an optional
endpoint override.

*/

#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace mailcast
{

/// Protocol used to submit messages for an account
enum class protocol_kind : std::uint8_t
{
    smtp,          ///< SMTP with password authentication (AUTH PLAIN/LOGIN)
    smtp_oauth2    ///< SMTP with an OAuth2 bearer token (AUTH XOAUTH2)
};

[[nodiscard]] constexpr std::string_view to_string(protocol_kind kind) noexcept
{
    switch (kind)
    {
        case protocol_kind::smtp: return "smtp";
        case protocol_kind::smtp_oauth2: return "oauth2";
    }
    return "unknown";
}

inline std::ostream& operator<<(std::ostream& os, protocol_kind kind)
{
    return os << to_string(kind);
}

/// How the SMTP connection is secured
enum class tls_mode : std::uint8_t
{
    none,       ///< plain text, only for tests and local relays
    starttls,   ///< upgrade after EHLO (port 587)
    implicit    ///< TLS from the first byte (port 465)
};

/// Submission endpoint for an account
struct endpoint
{
    std::string host;
    std::uint16_t port{587};
    tls_mode tls{tls_mode::starttls};

    bool operator==(const endpoint&) const = default;
};

/// Stable identity of an account for the whole run: address and protocol.
struct account_id
{
    std::string address;
    protocol_kind protocol{protocol_kind::smtp};

    auto operator<=>(const account_id&) const = default;
    bool operator==(const account_id&) const = default;

    [[nodiscard]] std::string to_string() const
    {
        std::string out = address;
        out += '/';
        out += mailcast::to_string(protocol);
        return out;
    }
};

inline std::ostream& operator<<(std::ostream& os, const account_id& id)
{
    return os << id.to_string();
}

struct account
{
    account_id id;

    /// Key under which the credential store resolves this account's secret
    std::string credential_ref;

    /// Set to bypass the provider directory
    std::optional<endpoint> endpoint_override;

    [[nodiscard]] const std::string& address() const noexcept
    {
        return id.address;
    }

    [[nodiscard]] protocol_kind protocol() const noexcept
    {
        return id.protocol;
    }

    /// Domain part of the address, empty when there is no '@'
    [[nodiscard]] std::string_view domain() const noexcept
    {
        const std::string_view addr = id.address;
        const auto at = addr.rfind('@');
        if (at == std::string_view::npos)
            return {};
        return addr.substr(at + 1);
    }
};

} // namespace mailcast
