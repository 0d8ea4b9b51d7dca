/*

base64.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>


namespace mailcast::codec
{


/**
Base64 alphabet (RFC 4648).
**/
inline constexpr std::string_view base64_charset{"ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};


/**
Maximum encoded line length for MIME bodies (RFC 2045).
**/
inline constexpr std::size_t base64_mime_line{76};


/**
Encoding bytes into Base64.

@param data       Bytes to encode.
@param line_width Insert CRLF after this many output characters, zero for a single line. Rounded down to a multiple of four.
@return           Encoded text.
**/
[[nodiscard]] inline std::string base64_encode(std::string_view data, std::size_t line_width = 0)
{
    if (line_width > 0)
        line_width -= line_width % 4;

    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4 + (line_width > 0 ? (data.size() / line_width + 1) * 2 : 0));

    std::size_t column = 0;
    auto put = [&](char ch)
    {
        if (line_width > 0 && column == line_width)
        {
            out += "\r\n";
            column = 0;
        }
        out.push_back(ch);
        ++column;
    };

    std::size_t i = 0;
    for (; i + 2 < data.size(); i += 3)
    {
        const std::uint32_t n = (static_cast<std::uint8_t>(data[i]) << 16)
            | (static_cast<std::uint8_t>(data[i + 1]) << 8)
            | static_cast<std::uint8_t>(data[i + 2]);
        put(base64_charset[(n >> 18) & 0x3F]);
        put(base64_charset[(n >> 12) & 0x3F]);
        put(base64_charset[(n >> 6) & 0x3F]);
        put(base64_charset[n & 0x3F]);
    }

    const std::size_t rest = data.size() - i;
    if (rest == 1)
    {
        const std::uint32_t n = static_cast<std::uint8_t>(data[i]) << 16;
        put(base64_charset[(n >> 18) & 0x3F]);
        put(base64_charset[(n >> 12) & 0x3F]);
        put('=');
        put('=');
    }
    else if (rest == 2)
    {
        const std::uint32_t n = (static_cast<std::uint8_t>(data[i]) << 16)
            | (static_cast<std::uint8_t>(data[i + 1]) << 8);
        put(base64_charset[(n >> 18) & 0x3F]);
        put(base64_charset[(n >> 12) & 0x3F]);
        put(base64_charset[(n >> 6) & 0x3F]);
        put('=');
    }
    return out;
}


/**
Decoding Base64 text, ignoring line breaks.

@param text Encoded text.
@return     Decoded bytes, or nothing if the text holds a character outside the alphabet.
**/
[[nodiscard]] inline std::optional<std::string> base64_decode(std::string_view text)
{
    std::string out;
    out.reserve(text.size() / 4 * 3);

    std::uint32_t acc = 0;
    int bits = 0;
    for (char ch : text)
    {
        if (ch == '\r' || ch == '\n')
            continue;
        if (ch == '=')
            break;
        const auto pos = base64_charset.find(ch);
        if (pos == std::string_view::npos)
            return std::nullopt;
        acc = (acc << 6) | static_cast<std::uint32_t>(pos);
        bits += 6;
        if (bits >= 8)
        {
            bits -= 8;
            out.push_back(static_cast<char>((acc >> bits) & 0xFF));
        }
    }
    return out;
}


} // namespace mailcast::codec
