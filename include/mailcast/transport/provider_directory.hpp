/*

provider_directory.hpp
----------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Domain to SMTP submission endpoint lookup.

*/

#pragma once

#include <map>
#include <string>
#include <string_view>
#include <utility>

#include <mailcast/core/account.hpp>
#include <mailcast/detail/redact.hpp>
#include <mailcast/detail/result.hpp>

namespace mailcast
{

class provider_directory
{
public:
    /// Directory with the well-known consumer mail providers.
    static provider_directory with_defaults()
    {
        provider_directory dir;
        dir.add("gmail.com", endpoint{"smtp.gmail.com", 587, tls_mode::starttls});
        dir.add("googlemail.com", endpoint{"smtp.gmail.com", 587, tls_mode::starttls});
        dir.add("yahoo.com", endpoint{"smtp.mail.yahoo.com", 587, tls_mode::starttls});
        dir.add("hotmail.com", endpoint{"smtp-mail.outlook.com", 587, tls_mode::starttls});
        dir.add("outlook.com", endpoint{"smtp-mail.outlook.com", 587, tls_mode::starttls});
        dir.add("live.com", endpoint{"smtp-mail.outlook.com", 587, tls_mode::starttls});
        dir.add("aol.com", endpoint{"smtp.aol.com", 587, tls_mode::starttls});
        return dir;
    }

    void add(std::string domain, endpoint ep)
    {
        entries_[detail::to_lower_ascii(domain)] = std::move(ep);
    }

    /// Endpoint for an account: its override if any, otherwise by domain.
    [[nodiscard]] result<endpoint> resolve(const account& acc) const
    {
        if (acc.endpoint_override)
            return *acc.endpoint_override;

        const std::string domain = detail::to_lower_ascii(acc.domain());
        const auto it = entries_.find(domain);
        if (it == entries_.end())
        {
            error_info err = make_error(errc::provider_unsupported,
                "no SMTP endpoint known for domain '" + domain + "'");
            err.where = "provider_directory";
            return fail<endpoint>(std::move(err));
        }
        return it->second;
    }

    [[nodiscard]] std::size_t size() const noexcept
    {
        return entries_.size();
    }

private:
    std::map<std::string, endpoint> entries_;
};

} // namespace mailcast
