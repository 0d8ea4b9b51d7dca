/*

io/input_files.hpp
------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Accounts file: one "address,secret[,protocol]" per line, protocol being "smtp" (password,
the default) or "oauth2" (access token). The secret may contain commas; a last field is
only taken as the protocol when it names one.
Recipients file: one address per line.
Blank lines are skipped in both.

*/

#pragma once

#include <filesystem>
#include <fstream>
#include <istream>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <mailcast/core/account.hpp>
#include <mailcast/credentials/credential_store.hpp>
#include <mailcast/detail/log.hpp>
#include <mailcast/detail/redact.hpp>
#include <mailcast/detail/result.hpp>

namespace mailcast::io
{

struct account_list
{
    std::vector<account> accounts;

    /// Credential per account, keyed like account::credential_ref
    std::vector<std::pair<std::string, credential>> credentials;

    /// Copy every credential into the store.
    void install(static_credential_store& store) const
    {
        for (const auto& [ref, cred] : credentials)
            store.add(ref, cred);
    }
};

namespace detail
{

[[nodiscard]] inline error_info line_error(std::size_t line_no, std::string_view what)
{
    std::string msg = "line " + std::to_string(line_no) + ": ";
    msg += what;
    return make_error(errc::input_invalid, std::move(msg));
}

[[nodiscard]] inline bool plausible_address(std::string_view addr) noexcept
{
    const auto at = addr.find('@');
    return at != std::string_view::npos && at > 0 && at + 1 < addr.size()
        && addr.find_first_of(" \t<>,") == std::string_view::npos;
}

} // namespace detail

[[nodiscard]] inline result<account_list> parse_accounts(std::istream& in)
{
    account_list out;
    std::set<account_id> seen;

    std::string raw;
    std::size_t line_no = 0;
    while (std::getline(in, raw))
    {
        ++line_no;
        const std::string_view line = mailcast::detail::trim_ascii(raw);
        if (line.empty())
            continue;

        const auto comma = line.find(',');
        if (comma == std::string_view::npos)
            return fail<account_list>(detail::line_error(line_no, "missing comma"));

        const std::string_view address = mailcast::detail::trim_ascii(line.substr(0, comma));
        std::string_view secret = mailcast::detail::trim_ascii(line.substr(comma + 1));
        protocol_kind protocol = protocol_kind::smtp;

        const auto last = secret.rfind(',');
        if (last != std::string_view::npos)
        {
            const std::string_view tail = mailcast::detail::trim_ascii(secret.substr(last + 1));
            if (mailcast::detail::iequals_ascii(tail, "smtp") || mailcast::detail::iequals_ascii(tail, "oauth2"))
            {
                protocol = mailcast::detail::iequals_ascii(tail, "oauth2") ? protocol_kind::smtp_oauth2 : protocol_kind::smtp;
                secret = mailcast::detail::trim_ascii(secret.substr(0, last));
            }
        }

        if (address.empty() || secret.empty())
            return fail<account_list>(detail::line_error(line_no, "empty address or secret"));
        if (!detail::plausible_address(address))
            return fail<account_list>(detail::line_error(line_no, "invalid address '" + std::string(address) + "'"));

        account acc;
        acc.id = account_id{std::string(address), protocol};
        if (!seen.insert(acc.id).second)
        {
            MAILCAST_LOG_WARN("INPUT", "line " << line_no << ": duplicate account " << acc.id << " dropped");
            continue;
        }
        acc.credential_ref = acc.id.to_string();

        credential cred;
        cred.username = acc.address();
        cred.secret = std::string(secret);
        cred.kind = protocol == protocol_kind::smtp_oauth2 ? credential::kind_t::oauth2_token : credential::kind_t::password;

        out.credentials.emplace_back(acc.credential_ref, std::move(cred));
        out.accounts.push_back(std::move(acc));
    }

    MAILCAST_LOG_DEBUG("INPUT", "parsed " << out.accounts.size() << " account(s)");
    return out;
}

[[nodiscard]] inline result<std::vector<std::string>> parse_recipients(std::istream& in)
{
    std::vector<std::string> out;

    std::string raw;
    std::size_t line_no = 0;
    while (std::getline(in, raw))
    {
        ++line_no;
        const std::string_view line = mailcast::detail::trim_ascii(raw);
        if (line.empty())
            continue;
        if (!detail::plausible_address(line))
            return fail<std::vector<std::string>>(detail::line_error(line_no, "invalid address '" + std::string(line) + "'"));
        out.emplace_back(line);
    }

    MAILCAST_LOG_DEBUG("INPUT", "parsed " << out.size() << " recipient(s)");
    return out;
}

[[nodiscard]] inline result<account_list> load_accounts(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in)
        return fail<account_list>(errc::input_invalid, "cannot open accounts file " + path.string());
    return parse_accounts(in);
}

[[nodiscard]] inline result<std::vector<std::string>> load_recipients(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in)
        return fail<std::vector<std::string>>(errc::input_invalid, "cannot open recipients file " + path.string());
    return parse_recipients(in);
}

} // namespace mailcast::io
