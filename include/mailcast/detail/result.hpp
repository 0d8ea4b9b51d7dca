/*

result.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Error handling types using std::expected (C++23).
Operations on the dispatch path do not throw; every failure is returned as an
error_info inside result<T>.

*/

#pragma once

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include <boost/system/error_code.hpp>

namespace mailcast
{

/// Error categories for mailcast operations
enum class errc : std::uint16_t
{
    // Network (100-199)
    net_resolve_failed = 100,
    net_connect_failed = 101,
    net_connection_refused = 102,
    net_connection_reset = 103,
    net_timeout = 104,
    net_eof = 105,
    net_io_failed = 106,
    net_cancelled = 107,
    tls_handshake_failed = 120,
    tls_verify_failed = 121,

    // SMTP (200-299)
    smtp_bad_reply = 200,
    smtp_service_not_available = 201,
    smtp_auth_failed = 202,
    smtp_mail_from_rejected = 203,
    smtp_rejected_recipient = 204,
    smtp_data_rejected = 205,
    smtp_message_too_large = 206,
    smtp_temporary_failure = 207,
    smtp_permanent_failure = 208,
    smtp_invalid_state = 209,

    // Campaign resources (300-399)
    credential_unavailable = 300,
    attachment_unavailable = 301,
    attachment_too_large = 302,
    provider_unsupported = 303,

    // Input validation (700-799)
    invalid_argument = 700,
    config_invalid = 701,
    input_invalid = 702,
    no_accounts = 703,

    // Internal (900-999)
    internal_error = 900,
    cancelled = 901,
};

/// Stable snake_case name of an error code, used in logs and reports
[[nodiscard]] constexpr std::string_view to_string(errc code) noexcept
{
    switch (code)
    {
        case errc::net_resolve_failed: return "net_resolve_failed";
        case errc::net_connect_failed: return "net_connect_failed";
        case errc::net_connection_refused: return "net_connection_refused";
        case errc::net_connection_reset: return "net_connection_reset";
        case errc::net_timeout: return "net_timeout";
        case errc::net_eof: return "net_eof";
        case errc::net_io_failed: return "net_io_failed";
        case errc::net_cancelled: return "net_cancelled";
        case errc::tls_handshake_failed: return "tls_handshake_failed";
        case errc::tls_verify_failed: return "tls_verify_failed";
        case errc::smtp_bad_reply: return "smtp_bad_reply";
        case errc::smtp_service_not_available: return "smtp_service_not_available";
        case errc::smtp_auth_failed: return "smtp_auth_failed";
        case errc::smtp_mail_from_rejected: return "smtp_mail_from_rejected";
        case errc::smtp_rejected_recipient: return "smtp_rejected_recipient";
        case errc::smtp_data_rejected: return "smtp_data_rejected";
        case errc::smtp_message_too_large: return "smtp_message_too_large";
        case errc::smtp_temporary_failure: return "smtp_temporary_failure";
        case errc::smtp_permanent_failure: return "smtp_permanent_failure";
        case errc::smtp_invalid_state: return "smtp_invalid_state";
        case errc::credential_unavailable: return "credential_unavailable";
        case errc::attachment_unavailable: return "attachment_unavailable";
        case errc::attachment_too_large: return "attachment_too_large";
        case errc::provider_unsupported: return "provider_unsupported";
        case errc::invalid_argument: return "invalid_argument";
        case errc::config_invalid: return "config_invalid";
        case errc::input_invalid: return "input_invalid";
        case errc::no_accounts: return "no_accounts";
        case errc::internal_error: return "internal_error";
        case errc::cancelled: return "cancelled";
    }
    return "unknown";
}

inline std::ostream& operator<<(std::ostream& os, errc code)
{
    return os << to_string(code);
}

/// Rich error value carried by result<T>.
struct error_info
{
    errc code{errc::internal_error};
    std::string message;
    /// key=value lines built with detail::error_detail
    std::string detail;
    boost::system::error_code sys{};
    /// Where the failure was produced ("smtp.rcpt_to", "worker", ...)
    std::string where;
    /// SMTP reply code when the failure came from a server reply
    std::optional<int> reply_code;
    /// Enhanced status code (RFC 3463) when the server supplied one, e.g. "5.7.8"
    std::string enhanced_status;

    /// One-line description for logs and reports
    [[nodiscard]] std::string to_string() const
    {
        std::string out = "[";
        out += mailcast::to_string(code);
        out += "]";
        if (reply_code)
        {
            out += ' ';
            out += std::to_string(*reply_code);
            if (!enhanced_status.empty())
            {
                out += ' ';
                out += enhanced_status;
            }
        }
        if (!message.empty())
        {
            out += ' ';
            out += message;
        }
        return out;
    }
};

template<typename T>
using result = std::expected<T, error_info>;

using result_void = std::expected<void, error_info>;

[[nodiscard]] inline result_void ok()
{
    return result_void{};
}

template<typename T>
[[nodiscard]] result<std::decay_t<T>> ok(T&& value)
{
    return result<std::decay_t<T>>(std::forward<T>(value));
}

[[nodiscard]] inline error_info make_error(errc code, std::string message, std::string detail = {},
    boost::system::error_code sys = {}, std::string where = {})
{
    error_info err;
    err.code = code;
    err.message = std::move(message);
    err.detail = std::move(detail);
    err.sys = sys;
    err.where = std::move(where);
    return err;
}

template<typename T>
[[nodiscard]] result<T> fail(error_info err)
{
    return std::unexpected(std::move(err));
}

template<typename T>
[[nodiscard]] result<T> fail(errc code, std::string message, std::string detail = {},
    boost::system::error_code sys = {})
{
    return std::unexpected(make_error(code, std::move(message), std::move(detail), sys));
}

[[nodiscard]] inline result_void fail_void(error_info err)
{
    return std::unexpected(std::move(err));
}

[[nodiscard]] inline result_void fail_void(errc code, std::string message, std::string detail = {},
    boost::system::error_code sys = {})
{
    return std::unexpected(make_error(code, std::move(message), std::move(detail), sys));
}

/// Convert an escaped exception into an internal_error without rethrowing past the caller.
[[nodiscard]] inline error_info error_from_exception(std::exception_ptr ep, std::string where)
{
    std::string what = "unknown exception";
    try
    {
        if (ep)
            std::rethrow_exception(ep);
    }
    catch (const std::exception& exc)
    {
        what = exc.what();
    }
    catch (...)
    {
        // non-std exception type; keep the generic description
    }
    return make_error(errc::internal_error, std::move(what), {}, {}, std::move(where));
}

} // namespace mailcast
