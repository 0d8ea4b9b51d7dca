/*

error_kind.hpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Closed failure taxonomy and the pure classification function that maps a raw
error_info onto it. No I/O happens here.

*/

#pragma once

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <mailcast/detail/redact.hpp>
#include <mailcast/detail/result.hpp>

namespace mailcast
{

enum class error_kind : std::uint8_t
{
    authentication_failed,
    rate_limited,
    quota_exceeded,
    account_suspended,
    connection_timeout,
    invalid_recipient,
    protocol_rejected,
    attachment_too_large,
    credential_unavailable,
    unknown_transient,
    unknown_fatal,
    worker_internal_error,
    unsupported_provider
};

inline constexpr std::size_t error_kind_count = 13;

/// What the engine does after a failure of a given kind
enum class recovery_policy : std::uint8_t
{
    retry_same_session,
    reopen_and_retry,
    skip_recipient_continue,
    abort_account
};

[[nodiscard]] constexpr std::string_view to_string(error_kind kind) noexcept
{
    switch (kind)
    {
        case error_kind::authentication_failed: return "authentication-failed";
        case error_kind::rate_limited: return "rate-limited";
        case error_kind::quota_exceeded: return "quota-exceeded";
        case error_kind::account_suspended: return "account-suspended";
        case error_kind::connection_timeout: return "connection-timeout";
        case error_kind::invalid_recipient: return "invalid-recipient";
        case error_kind::protocol_rejected: return "protocol-rejected";
        case error_kind::attachment_too_large: return "attachment-too-large";
        case error_kind::credential_unavailable: return "credential-unavailable";
        case error_kind::unknown_transient: return "unknown-transient";
        case error_kind::unknown_fatal: return "unknown-fatal";
        case error_kind::worker_internal_error: return "worker-internal-error";
        case error_kind::unsupported_provider: return "unsupported-provider";
    }
    return "unknown-fatal";
}

[[nodiscard]] constexpr std::string_view to_string(recovery_policy policy) noexcept
{
    switch (policy)
    {
        case recovery_policy::retry_same_session: return "retry-same-session";
        case recovery_policy::reopen_and_retry: return "reopen-and-retry";
        case recovery_policy::skip_recipient_continue: return "skip-recipient-continue";
        case recovery_policy::abort_account: return "abort-account";
    }
    return "abort-account";
}

inline std::ostream& operator<<(std::ostream& os, error_kind kind)
{
    return os << to_string(kind);
}

inline std::ostream& operator<<(std::ostream& os, recovery_policy policy)
{
    return os << to_string(policy);
}

/// Every kind maps to exactly one policy.
[[nodiscard]] constexpr recovery_policy policy_for(error_kind kind) noexcept
{
    switch (kind)
    {
        case error_kind::rate_limited:
            return recovery_policy::retry_same_session;
        case error_kind::connection_timeout:
        case error_kind::unknown_transient:
            return recovery_policy::reopen_and_retry;
        case error_kind::invalid_recipient:
        case error_kind::protocol_rejected:
        case error_kind::attachment_too_large:
            return recovery_policy::skip_recipient_continue;
        case error_kind::authentication_failed:
        case error_kind::quota_exceeded:
        case error_kind::account_suspended:
        case error_kind::credential_unavailable:
        case error_kind::unknown_fatal:
        case error_kind::worker_internal_error:
        case error_kind::unsupported_provider:
            return recovery_policy::abort_account;
    }
    return recovery_policy::abort_account;
}

/// Static, user-facing advice per kind.
[[nodiscard]] constexpr std::string_view recovery_hint(error_kind kind) noexcept
{
    switch (kind)
    {
        case error_kind::authentication_failed:
            return "Check the account password or app password; for OAuth2 accounts re-authorize the token.";
        case error_kind::rate_limited:
            return "The provider is throttling this account; raise the send delay or use fewer recipients per account.";
        case error_kind::quota_exceeded:
            return "The daily sending quota is used up; wait for the quota window to reset before reusing this account.";
        case error_kind::account_suspended:
            return "The provider has disabled sending for this account; review the account in the provider's web console.";
        case error_kind::connection_timeout:
            return "The server did not answer in time; check network connectivity and firewall rules for port 587.";
        case error_kind::invalid_recipient:
            return "The recipient address was rejected; clean the recipient list.";
        case error_kind::protocol_rejected:
            return "The server refused the message; review sender address, content and attachment type.";
        case error_kind::attachment_too_large:
            return "The attachment exceeds the size limit; use smaller files.";
        case error_kind::credential_unavailable:
            return "No usable credential was found for this account; check the accounts file or token refresh setup.";
        case error_kind::unknown_transient:
            return "A temporary failure persisted after retries; rerun the campaign for the affected recipients.";
        case error_kind::unknown_fatal:
            return "The server rejected the account permanently; inspect the error detail in the log.";
        case error_kind::worker_internal_error:
            return "An internal error stopped this account; run with --verbose and report the log.";
        case error_kind::unsupported_provider:
            return "The address domain has no known SMTP endpoint; supply host and port for this account.";
    }
    return "";
}

struct classification
{
    error_kind kind{error_kind::unknown_fatal};
    recovery_policy policy{recovery_policy::abort_account};

    bool operator==(const classification&) const = default;
};

namespace detail
{

[[nodiscard]] inline bool contains_any(std::string_view text, std::initializer_list<std::string_view> needles) noexcept
{
    for (const auto needle : needles)
    {
        if (text.find(needle) != std::string_view::npos)
            return true;
    }
    return false;
}

[[nodiscard]] inline bool is_smtp_code(errc code) noexcept
{
    const auto value = static_cast<std::uint16_t>(code);
    return value >= 200 && value < 300;
}

// Kinds recognisable from the server text regardless of the command that failed.
[[nodiscard]] inline std::optional<error_kind> kind_from_text(const error_info& err)
{
    const std::string text = to_lower_ascii(err.message);

    if (contains_any(text, {"quota", "daily limit", "daily user sending", "sending limit exceeded", "limit exceeded"}))
        return error_kind::quota_exceeded;
    if (contains_any(text, {"suspended", "account disabled", "has been disabled", "account blocked", "blocked", "locked"}))
        return error_kind::account_suspended;
    if (contains_any(text, {"rate limit", "too many", "try again later", "throttl", "slow down"}))
        return error_kind::rate_limited;
    if (err.enhanced_status == "4.7.0" || err.enhanced_status == "4.7.28")
        return error_kind::rate_limited;
    return std::nullopt;
}

[[nodiscard]] inline bool temporary_reply(const error_info& err) noexcept
{
    return err.reply_code && *err.reply_code >= 400 && *err.reply_code < 500;
}

} // namespace detail

/**
 * Map a raw failure to its kind and policy.
 * Depends only on the fields of err, so repeated calls agree.
 */
[[nodiscard]] inline classification classify(const error_info& err)
{
    auto make = [](error_kind kind)
    {
        return classification{kind, policy_for(kind)};
    };

    switch (err.code)
    {
        case errc::internal_error:
        case errc::invalid_argument:
        case errc::smtp_invalid_state:
            return make(error_kind::worker_internal_error);
        case errc::config_invalid:
        case errc::input_invalid:
        case errc::no_accounts:
            return make(error_kind::unknown_fatal);
        case errc::credential_unavailable:
            return make(error_kind::credential_unavailable);
        case errc::provider_unsupported:
            return make(error_kind::unsupported_provider);
        case errc::attachment_too_large:
        case errc::smtp_message_too_large:
            return make(error_kind::attachment_too_large);
        case errc::attachment_unavailable:
            return make(error_kind::unknown_transient);
        case errc::net_timeout:
            return make(error_kind::connection_timeout);
        case errc::tls_verify_failed:
            return make(error_kind::unknown_fatal);
        case errc::net_resolve_failed:
        case errc::net_connect_failed:
        case errc::net_connection_refused:
        case errc::net_connection_reset:
        case errc::net_eof:
        case errc::net_io_failed:
        case errc::net_cancelled:
        case errc::tls_handshake_failed:
        case errc::cancelled:
            return make(error_kind::unknown_transient);
        default:
            break;
    }

    if (!detail::is_smtp_code(err.code))
        return make(error_kind::unknown_fatal);

    if (auto kind = detail::kind_from_text(err))
        return make(*kind);

    switch (err.code)
    {
        case errc::smtp_auth_failed:
            return make(error_kind::authentication_failed);
        case errc::smtp_rejected_recipient:
            return make(detail::temporary_reply(err) ? error_kind::unknown_transient : error_kind::invalid_recipient);
        case errc::smtp_mail_from_rejected:
        case errc::smtp_data_rejected:
            return make(detail::temporary_reply(err) ? error_kind::unknown_transient : error_kind::protocol_rejected);
        case errc::smtp_temporary_failure:
        case errc::smtp_service_not_available:
        case errc::smtp_bad_reply:
            return make(error_kind::unknown_transient);
        case errc::smtp_permanent_failure:
            return make(error_kind::unknown_fatal);
        default:
            break;
    }
    return make(error_kind::unknown_fatal);
}

} // namespace mailcast
