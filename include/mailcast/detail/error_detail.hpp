/*

error_detail.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Builder for the error_info::detail field. Each entry is written as key=value\n
so reports can show it verbatim and redaction can work line by line.

*/

#pragma once

#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>

#include <boost/system/error_code.hpp>

#include <mailcast/detail/redact.hpp>

namespace mailcast::detail
{

class error_detail
{
public:
    error_detail() = default;

    error_detail& add(std::string_view key, std::string_view value)
    {
        append_key(key);
        out_.append(value.data(), value.size());
        out_.push_back('\n');
        return *this;
    }

    /// Add a protocol line; credentials in AUTH exchanges are replaced first.
    error_detail& add_line(std::string_view key, std::string_view line)
    {
        append_key(key);
        std::string clean = redact_line(line);
        while (!clean.empty() && (clean.back() == '\r' || clean.back() == '\n'))
            clean.pop_back();
        out_.append(clean);
        out_.push_back('\n');
        return *this;
    }

    error_detail& add_int(std::string_view key, std::uint64_t v)
    {
        append_key(key);
        append_int(v);
        out_.push_back('\n');
        return *this;
    }

    error_detail& add_ec(std::string_view key, const boost::system::error_code& ec)
    {
        append_key(key);
        out_.append(ec.category().name());
        out_.push_back(':');
        append_int(static_cast<std::uint64_t>(ec.value() < 0 ? -ec.value() : ec.value()));
        const std::string msg = ec.message();
        if (!msg.empty())
        {
            out_.push_back(' ');
            out_.append(msg);
        }
        out_.push_back('\n');
        return *this;
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return out_.empty();
    }

    [[nodiscard]] std::string str() const
    {
        return out_;
    }

private:
    std::string out_;

    void append_key(std::string_view key)
    {
        out_.append(key.data(), key.size());
        out_.push_back('=');
    }

    void append_int(std::uint64_t v)
    {
        char buffer[32]{};
        const auto res = std::to_chars(std::begin(buffer), std::end(buffer), v);
        if (res.ec == std::errc{})
            out_.append(buffer, static_cast<std::size_t>(res.ptr - buffer));
        else
            out_.append("0");
    }
};

} // namespace mailcast::detail
