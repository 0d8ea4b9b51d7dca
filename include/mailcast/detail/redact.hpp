/*

redact.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Credential scrubbing for SMTP protocol lines before they reach logs, traces
or error details.

*/

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace mailcast::detail
{

[[nodiscard]] inline char to_lower_ascii(char ch) noexcept
{
    if (ch >= 'A' && ch <= 'Z')
        return static_cast<char>(ch + ('a' - 'A'));
    return ch;
}

[[nodiscard]] inline std::string to_lower_ascii(std::string_view text)
{
    std::string out(text);
    for (char& ch : out)
        ch = to_lower_ascii(ch);
    return out;
}

[[nodiscard]] inline bool iequals_ascii(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i)
    {
        if (to_lower_ascii(a[i]) != to_lower_ascii(b[i]))
            return false;
    }
    return true;
}

[[nodiscard]] inline bool starts_with_ci(std::string_view text, std::string_view prefix) noexcept
{
    if (text.size() < prefix.size())
        return false;
    return iequals_ascii(text.substr(0, prefix.size()), prefix);
}

[[nodiscard]] inline std::string_view trim_ascii(std::string_view text) noexcept
{
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t' || text.front() == '\r' || text.front() == '\n'))
        text.remove_prefix(1);
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\r' || text.back() == '\n'))
        text.remove_suffix(1);
    return text;
}

inline void split_tokens(std::string_view text, std::vector<std::string_view>& out)
{
    out.clear();
    while (!text.empty())
    {
        while (!text.empty() && text.front() == ' ')
            text.remove_prefix(1);
        if (text.empty())
            break;
        const auto pos = text.find(' ');
        if (pos == std::string_view::npos)
        {
            out.push_back(text);
            break;
        }
        out.push_back(text.substr(0, pos));
        text.remove_prefix(pos + 1);
    }
}

[[nodiscard]] inline bool looks_like_base64(std::string_view text) noexcept
{
    if (text.empty())
        return false;
    for (unsigned char ch : text)
    {
        const bool valid = (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z')
            || (ch >= '0' && ch <= '9') || ch == '+' || ch == '/' || ch == '=';
        if (!valid)
            return false;
    }
    return true;
}

[[nodiscard]] inline bool has_base64_markers(std::string_view text) noexcept
{
    for (unsigned char ch : text)
    {
        if (ch == '=' || ch == '+' || ch == '/' || (ch >= '0' && ch <= '9'))
            return true;
    }
    return false;
}

/// Redact the secret part of a client line.
/// "AUTH PLAIN <b64>" and "AUTH XOAUTH2 <b64>" keep the mechanism; a bare
/// base64 continuation line (AUTH LOGIN username/password) is replaced entirely.
[[nodiscard]] inline std::string redact_line(std::string_view line)
{
    std::string_view trimmed = line;
    while (!trimmed.empty() && (trimmed.back() == '\r' || trimmed.back() == '\n'))
        trimmed.remove_suffix(1);
    const std::string_view suffix = line.substr(trimmed.size());

    std::vector<std::string_view> tokens;
    split_tokens(trimmed, tokens);
    if (tokens.empty())
        return std::string(line);

    bool redacted = false;
    if (iequals_ascii(tokens.front(), "AUTH"))
    {
        if (tokens.size() >= 3)
        {
            tokens.resize(3);
            tokens[2] = "<redacted>";
            redacted = true;
        }
    }
    else if (tokens.size() == 1 && looks_like_base64(tokens.front())
        && (tokens.front().size() >= 12 || has_base64_markers(tokens.front())))
    {
        tokens[0] = "<redacted>";
        redacted = true;
    }

    if (!redacted)
        return std::string(line);

    std::string result;
    for (std::size_t i = 0; i < tokens.size(); ++i)
    {
        if (i > 0)
            result.push_back(' ');
        result.append(tokens[i].data(), tokens[i].size());
    }
    result.append(suffix.data(), suffix.size());
    return result;
}

/// Hide a secret for display: keeps the first two characters only.
[[nodiscard]] inline std::string mask_secret(std::string_view secret)
{
    if (secret.size() <= 2)
        return std::string(secret.size(), '*');
    std::string out(secret.substr(0, 2));
    out.append(secret.size() - 2, '*');
    return out;
}

} // namespace mailcast::detail
