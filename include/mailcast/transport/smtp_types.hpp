/*

smtp_types.hpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

SMTP reply and EHLO capability values.

*/

#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <mailcast/detail/redact.hpp>

namespace mailcast::smtp
{

struct reply
{
    int status = 0;
    std::vector<std::string> lines;

    [[nodiscard]] bool is_positive_completion() const noexcept { return status / 100 == 2; }
    [[nodiscard]] bool is_positive_intermediate() const noexcept { return status / 100 == 3; }
    [[nodiscard]] bool is_transient_negative() const noexcept { return status / 100 == 4; }
    [[nodiscard]] bool is_permanent_negative() const noexcept { return status / 100 == 5; }

    [[nodiscard]] std::string message() const
    {
        if (lines.empty())
            return std::string();

        std::string out = lines.front();
        for (std::size_t i = 1; i < lines.size(); ++i)
        {
            out += "\n";
            out += lines[i];
        }
        return out;
    }
};

/// One parsed reply line: "250-SIZE 35882577" gives {250, true, "SIZE 35882577"}.
struct reply_line
{
    int status = 0;
    bool more = false;
    std::string text;
};

[[nodiscard]] inline std::optional<reply_line> parse_reply_line(std::string_view line)
{
    if (line.size() < 3)
        return std::nullopt;
    int status = 0;
    for (std::size_t i = 0; i < 3; ++i)
    {
        const char ch = line[i];
        if (ch < '0' || ch > '9')
            return std::nullopt;
        status = status * 10 + (ch - '0');
    }
    if (status < 200 || status > 599)
        return std::nullopt;

    reply_line out;
    out.status = status;
    if (line.size() == 3)
        return out;
    if (line[3] != '-' && line[3] != ' ')
        return std::nullopt;
    out.more = line[3] == '-';
    out.text = std::string(line.substr(4));
    return out;
}

struct capabilities
{
    std::map<std::string, std::vector<std::string>> entries;

    [[nodiscard]] bool empty() const noexcept { return entries.empty(); }

    [[nodiscard]] bool supports(std::string_view capability) const
    {
        return entries.find(normalize_key(capability)) != entries.end();
    }

    [[nodiscard]] const std::vector<std::string>* parameters(std::string_view capability) const
    {
        const auto it = entries.find(normalize_key(capability));
        return it == entries.end() ? nullptr : &it->second;
    }

    [[nodiscard]] bool supports_auth(std::string_view mechanism) const
    {
        const auto* params = parameters("AUTH");
        if (params == nullptr)
            return false;
        for (const auto& p : *params)
        {
            if (detail::iequals_ascii(p, mechanism))
                return true;
        }
        return false;
    }

    /// Fill from an EHLO reply; the first line is the server greeting.
    static capabilities parse(const reply& rep)
    {
        capabilities caps;
        std::vector<std::string_view> tokens;
        for (std::size_t i = 1; i < rep.lines.size(); ++i)
        {
            detail::split_tokens(rep.lines[i], tokens);
            if (tokens.empty())
                continue;
            auto& params = caps.entries[normalize_key(tokens.front())];
            for (std::size_t t = 1; t < tokens.size(); ++t)
                params.emplace_back(tokens[t]);
        }
        return caps;
    }

private:
    static std::string normalize_key(std::string_view key)
    {
        std::string out(key);
        for (char& ch : out)
        {
            if (ch >= 'a' && ch <= 'z')
                ch = static_cast<char>(ch - ('a' - 'A'));
        }
        return out;
    }
};

} // namespace mailcast::smtp
