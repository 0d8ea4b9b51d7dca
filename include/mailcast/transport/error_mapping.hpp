/*

error_mapping.hpp
-----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Mapping from Asio error codes and SMTP replies to mailcast::errc.

*/

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <mailcast/detail/asio_decl.hpp>
#include <mailcast/detail/error_detail.hpp>
#include <mailcast/detail/result.hpp>
#include <mailcast/transport/smtp_types.hpp>

namespace mailcast::net
{

enum class io_stage
{
    resolve,
    connect,
    read,
    write,
    handshake
};

[[nodiscard]] constexpr std::string_view stage_name(io_stage stage) noexcept
{
    switch (stage)
    {
        case io_stage::resolve: return "resolve";
        case io_stage::connect: return "connect";
        case io_stage::read: return "read";
        case io_stage::write: return "write";
        case io_stage::handshake: return "handshake";
    }
    return "unknown";
}

[[nodiscard]] inline bool is_certificate_error(const mailcast::asio::error_code& ec) noexcept
{
    if (ec.category() != mailcast::asio::error::get_ssl_category())
        return false;
    const std::string msg = ec.message();
    return msg.find("certificate") != std::string::npos;
}

[[nodiscard]] inline errc map_net_error(io_stage stage, const mailcast::asio::error_code& ec, bool timeout_triggered) noexcept
{
    if (timeout_triggered || ec == mailcast::asio::error::timed_out)
        return errc::net_timeout;
    if (ec == mailcast::asio::error::operation_aborted)
        return errc::net_cancelled;
    if (ec == mailcast::asio::error::eof || ec == mailcast::asio::ssl::error::stream_truncated)
        return errc::net_eof;
    if (ec == mailcast::asio::error::connection_refused)
        return errc::net_connection_refused;
    if (ec == mailcast::asio::error::connection_reset ||
        ec == mailcast::asio::error::broken_pipe)
        return errc::net_connection_reset;
    if (ec == mailcast::asio::error::host_not_found ||
        ec == mailcast::asio::error::host_not_found_try_again)
        return errc::net_resolve_failed;

    switch (stage)
    {
        case io_stage::resolve: return errc::net_resolve_failed;
        case io_stage::connect: return errc::net_connect_failed;
        case io_stage::read: return errc::net_io_failed;
        case io_stage::write: return errc::net_io_failed;
        case io_stage::handshake:
            return is_certificate_error(ec) ? errc::tls_verify_failed : errc::tls_handshake_failed;
    }
    return errc::net_io_failed;
}

[[nodiscard]] inline error_info make_net_error(io_stage stage, const mailcast::asio::error_code& ec,
    bool timeout_triggered, std::string_view host, std::uint16_t port)
{
    detail::error_detail detail;
    detail.add("proto", "smtp");
    detail.add("host", host);
    detail.add_int("port", port);
    detail.add("stage", stage_name(stage));
    detail.add_ec("ec", ec);

    const errc code = map_net_error(stage, ec, timeout_triggered);
    std::string message(stage_name(stage));
    message += timeout_triggered ? ": timed out" : ": " + ec.message();
    std::string where = "net.";
    where += stage_name(stage);
    return make_error(code, std::move(message), detail.str(), ec, std::move(where));
}

} // namespace mailcast::net

namespace mailcast::smtp
{

enum class command_kind
{
    greeting,
    ehlo,
    helo,
    starttls,
    auth,
    mail_from,
    rcpt_to,
    data_cmd,
    data_body,
    rset,
    noop,
    quit,
    other
};

[[nodiscard]] constexpr std::string_view command_name(command_kind k) noexcept
{
    switch (k)
    {
        case command_kind::greeting: return "greeting";
        case command_kind::ehlo: return "ehlo";
        case command_kind::helo: return "helo";
        case command_kind::starttls: return "starttls";
        case command_kind::auth: return "auth";
        case command_kind::mail_from: return "mail_from";
        case command_kind::rcpt_to: return "rcpt_to";
        case command_kind::data_cmd: return "data_cmd";
        case command_kind::data_body: return "data_body";
        case command_kind::rset: return "rset";
        case command_kind::noop: return "noop";
        case command_kind::quit: return "quit";
        case command_kind::other: return "other";
    }
    return "other";
}

[[nodiscard]] constexpr bool is_temporary(int code) noexcept
{
    return code >= 400 && code < 500;
}

[[nodiscard]] constexpr bool is_permanent(int code) noexcept
{
    return code >= 500 && code < 600;
}

/// Failure code for a non-successful reply to command k.
[[nodiscard]] inline errc map_smtp_reply(command_kind k, int code) noexcept
{
    if (code == 421)
        return errc::smtp_service_not_available;

    switch (k)
    {
        case command_kind::auth:
            if (code == 454)
                return errc::smtp_temporary_failure;
            if (is_temporary(code) || is_permanent(code))
                return errc::smtp_auth_failed;
            break;
        case command_kind::mail_from:
            if (code == 552)
                return errc::smtp_message_too_large;
            if (is_permanent(code))
                return errc::smtp_mail_from_rejected;
            break;
        case command_kind::rcpt_to:
            if (is_permanent(code))
                return errc::smtp_rejected_recipient;
            break;
        case command_kind::data_cmd:
            if (is_permanent(code))
                return errc::smtp_data_rejected;
            break;
        case command_kind::data_body:
            if (code == 552)
                return errc::smtp_message_too_large;
            if (is_permanent(code))
                return errc::smtp_data_rejected;
            break;
        default:
            break;
    }

    if (is_temporary(code))
        return errc::smtp_temporary_failure;
    if (is_permanent(code))
        return errc::smtp_permanent_failure;

    return errc::smtp_bad_reply;
}

[[nodiscard]] inline std::string find_enhanced_status(const std::vector<std::string>& lines)
{
    for (const auto& line : lines)
    {
        for (std::size_t i = 0; i + 4 < line.size(); ++i)
        {
            const char a = line[i];
            const char b = line[i + 1];
            const char c = line[i + 2];
            const char d = line[i + 3];
            const char e = line[i + 4];
            if (a >= '2' && a <= '5' &&
                b == '.' &&
                c >= '0' && c <= '9' &&
                d == '.' &&
                e >= '0' && e <= '9')
            {
                std::size_t end = i + 5;
                while (end < line.size() && line[end] >= '0' && line[end] <= '9')
                    ++end;
                return line.substr(i, end - i);
            }
        }
    }
    return {};
}

/// error_info for a rejected command; message carries the server text.
[[nodiscard]] inline error_info make_smtp_error(std::string_view host, command_kind k,
    std::string_view command_line, const reply& r)
{
    detail::error_detail detail;
    detail.add("proto", "smtp");
    detail.add("host", host);
    detail.add("command", command_name(k));
    if (!command_line.empty())
        detail.add_line("command.line", command_line);
    detail.add_int("reply.code", static_cast<std::uint64_t>(r.status));
    for (std::size_t i = 0; i < r.lines.size(); ++i)
        detail.add("reply.line" + std::to_string(i), r.lines[i]);

    error_info err;
    err.code = map_smtp_reply(k, r.status);
    err.message = r.message();
    err.reply_code = r.status;
    err.enhanced_status = find_enhanced_status(r.lines);
    if (!err.enhanced_status.empty())
        detail.add("enhanced", err.enhanced_status);
    err.detail = detail.str();
    err.where = "smtp.";
    err.where += command_name(k);
    return err;
}

} // namespace mailcast::smtp
