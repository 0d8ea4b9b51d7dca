/*

mime.hpp
--------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Rendering of an outgoing message into RFC 5322 / MIME text and SMTP DATA
transparency (RFC 5321 section 4.5.2).

*/

#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <locale>
#include <random>
#include <sstream>
#include <string>
#include <string_view>

#include <mailcast/codec/base64.hpp>
#include <mailcast/core/message.hpp>

namespace mailcast::mime
{

[[nodiscard]] inline bool is_ascii_printable(std::string_view text) noexcept
{
    for (unsigned char ch : text)
    {
        if (ch < 0x20 || ch > 0x7E)
            return false;
    }
    return true;
}

/// RFC 2047 "B" encoded word when the text is not plain ASCII.
[[nodiscard]] inline std::string encode_header_word(std::string_view text)
{
    if (is_ascii_printable(text))
        return std::string(text);
    return "=?UTF-8?B?" + codec::base64_encode(text) + "?=";
}

/// "Name <address>" with the name quoted or encoded as needed.
[[nodiscard]] inline std::string format_mailbox(std::string_view name, std::string_view address)
{
    if (name.empty())
        return "<" + std::string(address) + ">";
    std::string out;
    if (is_ascii_printable(name))
    {
        out += '"';
        for (char ch : name)
        {
            if (ch == '"' || ch == '\\')
                out += '\\';
            out += ch;
        }
        out += '"';
    }
    else
    {
        out = encode_header_word(name);
    }
    out += " <";
    out += address;
    out += '>';
    return out;
}

/// Date header value, always in UTC.
[[nodiscard]] inline std::string format_date(std::chrono::system_clock::time_point when)
{
    const std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm tm_buf{};
    gmtime_r(&t, &tm_buf);
    std::ostringstream out;
    out.imbue(std::locale::classic());
    out << std::put_time(&tm_buf, "%a, %d %b %Y %H:%M:%S +0000");
    return out.str();
}

[[nodiscard]] inline std::string random_token(std::size_t length)
{
    static constexpr std::string_view alphabet = "0123456789abcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937_64 rng(std::random_device{}());
    std::uniform_int_distribution<std::size_t> dist(0, alphabet.size() - 1);
    std::string out;
    out.reserve(length);
    for (std::size_t i = 0; i < length; ++i)
        out += alphabet[dist(rng)];
    return out;
}

[[nodiscard]] inline std::string make_message_id(std::string_view from_address)
{
    const auto at = from_address.rfind('@');
    const std::string_view domain = at == std::string_view::npos ? std::string_view{"localhost"} : from_address.substr(at + 1);
    const auto stamp = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "<" + std::to_string(stamp) + "." + random_token(16) + "@" + std::string(domain) + ">";
}

/// Fixed header values, injectable for reproducible output.
struct render_options
{
    std::string boundary;
    std::string message_id;
    std::chrono::system_clock::time_point date{std::chrono::system_clock::now()};
};

/// Normalize any line ending to CRLF.
[[nodiscard]] inline std::string to_crlf(std::string_view text)
{
    std::string out;
    out.reserve(text.size() + text.size() / 32);
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        const char ch = text[i];
        if (ch == '\r')
        {
            out += "\r\n";
            if (i + 1 < text.size() && text[i + 1] == '\n')
                ++i;
        }
        else if (ch == '\n')
        {
            out += "\r\n";
        }
        else
        {
            out += ch;
        }
    }
    return out;
}

/**
Render the message as multipart/mixed with a UTF-8 text part and an optional
base64 attachment.
**/
[[nodiscard]] inline std::string render(const message& msg, render_options opts = {})
{
    if (opts.boundary.empty())
        opts.boundary = "=_mailcast_" + random_token(24);
    if (opts.message_id.empty())
        opts.message_id = make_message_id(msg.from);

    std::string out;
    out += "From: " + format_mailbox(msg.from_name, msg.from) + "\r\n";
    out += "To: <" + msg.to + ">\r\n";
    out += "Subject: " + encode_header_word(msg.subject) + "\r\n";
    out += "Date: " + format_date(opts.date) + "\r\n";
    out += "Message-ID: " + opts.message_id + "\r\n";
    out += "MIME-Version: 1.0\r\n";
    out += "Content-Type: multipart/mixed; boundary=\"" + opts.boundary + "\"\r\n";
    out += "\r\n";

    out += "--" + opts.boundary + "\r\n";
    out += "Content-Type: text/plain; charset=utf-8\r\n";
    out += "Content-Transfer-Encoding: base64\r\n";
    out += "\r\n";
    out += codec::base64_encode(to_crlf(msg.body), codec::base64_mime_line);
    out += "\r\n";

    if (msg.file)
    {
        const std::string name = encode_header_word(msg.file->filename);
        out += "--" + opts.boundary + "\r\n";
        out += "Content-Type: " + msg.file->content_type + "; name=\"" + name + "\"\r\n";
        out += "Content-Transfer-Encoding: base64\r\n";
        out += "Content-Disposition: attachment; filename=\"" + name + "\"\r\n";
        out += "\r\n";
        out += codec::base64_encode(msg.file->bytes, codec::base64_mime_line);
        out += "\r\n";
    }

    out += "--" + opts.boundary + "--\r\n";
    return out;
}

/**
Prepare rendered text for the DATA phase: CRLF line endings, a dot doubled
at the start of every line, and the terminating "CRLF.CRLF".
**/
[[nodiscard]] inline std::string dot_stuff(std::string_view text)
{
    const std::string crlf = to_crlf(text);
    std::string out;
    out.reserve(crlf.size() + 8);
    bool line_start = true;
    for (char ch : crlf)
    {
        if (line_start && ch == '.')
            out += '.';
        out += ch;
        line_start = ch == '\n';
    }
    if (!out.empty() && !line_start)
        out += "\r\n";
    out += ".\r\n";
    return out;
}

} // namespace mailcast::mime
