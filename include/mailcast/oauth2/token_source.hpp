/*

token_source.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Token source with a refresh callback. No HTTP client is bundled; the caller
decides how a refresh is obtained.

*/

#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <utility>

#include <mailcast/detail/result.hpp>
#include <mailcast/oauth2/token.hpp>

namespace mailcast::oauth2
{

class token_source
{
public:
    using refresh_fn = std::function<mailcast::result<token>(const token& current)>;

    token_source(token initial, refresh_fn fn)
        : current_(std::move(initial)),
          refresh_(std::move(fn))
    {
    }

    token_source(const token_source&) = delete;
    token_source& operator=(const token_source&) = delete;

    mailcast::result<std::string> get_access_token()
    {
        return get_access_token(false);
    }

    mailcast::result<std::string> refresh_access_token()
    {
        return get_access_token(true);
    }

    [[nodiscard]] unsigned int refresh_count() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return refreshes_;
    }

private:
    mailcast::result<std::string> get_access_token(bool force_refresh)
    {
        token snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto now = std::chrono::system_clock::now();
            if (!force_refresh && !current_.access_token.empty() && !current_.expired(now, skew_))
                return mailcast::ok(current_.access_token);
            snapshot = current_;
        }

        if (!refresh_)
            return mailcast::fail<std::string>(errc::credential_unavailable,
                force_refresh ? "oauth2 token rejected and no refresh function configured"
                              : "oauth2 token expired and no refresh function configured");

        auto refreshed = refresh_(snapshot);
        if (!refreshed)
        {
            error_info err = std::move(refreshed).error();
            err.code = errc::credential_unavailable;
            if (err.where.empty())
                err.where = "oauth2.refresh";
            return mailcast::fail<std::string>(std::move(err));
        }

        std::lock_guard<std::mutex> lock(mutex_);
        current_ = std::move(refreshed).value();
        ++refreshes_;
        return mailcast::ok(current_.access_token);
    }

    mutable std::mutex mutex_;
    token current_;
    refresh_fn refresh_;
    std::chrono::seconds skew_{30};
    unsigned int refreshes_{0};
};

} // namespace mailcast::oauth2
