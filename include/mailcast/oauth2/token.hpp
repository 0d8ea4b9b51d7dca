/*

token.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

OAuth2 access token as handed to SMTP XOAUTH2.

*/

#pragma once

#include <chrono>
#include <string>

#include <mailcast/codec/base64.hpp>

namespace mailcast::oauth2
{

struct token
{
    std::string access_token;
    std::string refresh_token;
    std::chrono::system_clock::time_point expires_at{};

    [[nodiscard]] bool expired(std::chrono::system_clock::time_point now,
        std::chrono::seconds skew = std::chrono::seconds{30}) const noexcept
    {
        return expires_at <= now + skew;
    }
};

/// Initial client response for SASL XOAUTH2, already base64 encoded.
[[nodiscard]] inline std::string xoauth2_initial_response(const std::string& user, const std::string& access_token)
{
    std::string raw = "user=" + user + "\x01" + "auth=Bearer " + access_token + "\x01\x01";
    return codec::base64_encode(raw);
}

} // namespace mailcast::oauth2
