/*

campaign_config.hpp
-------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Campaign configuration: content pools, pacing, distribution, retry schedule
and transport options. Read once at the start of a run.

File format: one "key = value" per line, '#' starts a comment line,
"subject" and "body" may repeat. A body value may contain "\n" escapes.

*/

#pragma once

#include <charconv>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <mailcast/content/sender_names.hpp>
#include <mailcast/detail/backoff.hpp>
#include <mailcast/detail/redact.hpp>
#include <mailcast/detail/result.hpp>
#include <mailcast/dispatch/campaign_planner.hpp>
#include <mailcast/transport/smtp_options.hpp>

namespace mailcast
{

/// Where attachments come from when the CLI builds a directory provider.
struct attachment_settings
{
    std::vector<std::filesystem::path> directories;
    std::set<std::string> extensions;
    std::uintmax_t max_bytes{25u * 1024u * 1024u};
};

struct campaign_config
{
    std::vector<std::string> subjects;
    std::vector<std::string> bodies;

    /// Minimum gap between the starts of two sends on one account
    std::chrono::milliseconds send_delay{4500};

    distribution_mode mode{distribution_mode::distribute};

    /// Per-account maximum in distribute mode
    std::optional<std::size_t> per_account_cap;

    detail::retry_policy retry;

    /// Cancel the run once this much time has passed
    std::optional<std::chrono::milliseconds> run_timeout;

    content::sender_name_style sender_names{content::sender_name_style::business};

    /// Fixed seed for subject/body/name selection; random when unset
    std::optional<std::uint64_t> seed;

    smtp::smtp_options transport;
    attachment_settings attachments;

    /// Ceiling for send_delay, retry delays and transport timeouts
    static constexpr std::chrono::milliseconds max_delay_limit{std::chrono::hours{24}};

    /// Ceiling for run_timeout
    static constexpr std::chrono::seconds max_run_timeout{std::chrono::hours{24 * 30}};

    /// Production defaults.
    static campaign_config defaults()
    {
        campaign_config cfg;
        cfg.subjects = default_subjects();
        cfg.bodies = default_bodies();
        return cfg;
    }

    /// No pacing, near-zero backoff, fixed seed. For tests and dry runs.
    static campaign_config fast_test()
    {
        campaign_config cfg = defaults();
        cfg.send_delay = std::chrono::milliseconds{0};
        cfg.retry = detail::retry_policy::immediate();
        cfg.sender_names = content::sender_name_style::none;
        cfg.seed = 42;
        return cfg;
    }

    static std::vector<std::string> default_subjects()
    {
        return {
            "Notice", "Confirmation", "Alert Release", "New Update Confirmation",
            "Thanks for your interest", "Purchase Notification", "Purchase Confirmation",
            "Purchase Invoice", "Update", "Notification", "Renewal", "Subscription",
            "Purchase Receipt", "New Receipt", "Thanks for your order", "Transaction Notification"};
    }

    static std::vector<std::string> default_bodies()
    {
        return {
            "Hello, Please find the attached documents for your review. We appreciate your prompt attention to this matter. Thank you.",
            "Greetings, The files you requested are attached. Please let us know if you have any questions. Best regards.",
            "Dear User, Attached is the information pertaining to your account. Please review it at your earliest convenience. Sincerely."};
    }

    /// Configuration errors that would make a run meaningless.
    [[nodiscard]] result_void validate() const
    {
        if (subjects.empty())
            return fail_void(errc::config_invalid, "at least one subject is required");
        if (bodies.empty())
            return fail_void(errc::config_invalid, "at least one body is required");
        if (send_delay.count() < 0)
            return fail_void(errc::config_invalid, "send_delay_ms must not be negative");
        if (send_delay > max_delay_limit)
            return fail_void(errc::config_invalid, "send_delay_ms exceeds 24 hours");
        if (retry.initial_delay > max_delay_limit || retry.max_delay > max_delay_limit)
            return fail_void(errc::config_invalid, "retry delays must not exceed 24 hours");
        if (run_timeout && *run_timeout > max_run_timeout)
            return fail_void(errc::config_invalid, "run_timeout_s exceeds 30 days");
        if (retry.max_attempts == 0)
            return fail_void(errc::config_invalid, "retry_max_attempts must be at least 1");
        if (retry.backoff_multiplier < 1.0)
            return fail_void(errc::config_invalid, "retry_multiplier must be at least 1.0");
        return ok();
    }
};

namespace detail
{

template<typename T>
[[nodiscard]] std::optional<T> parse_number(std::string_view text) noexcept
{
    T value{};
    const auto res = std::from_chars(text.data(), text.data() + text.size(), value);
    if (res.ec != std::errc{} || res.ptr != text.data() + text.size())
        return std::nullopt;
    return value;
}

[[nodiscard]] inline std::optional<double> parse_double(std::string_view text)
{
    try
    {
        std::size_t used = 0;
        const std::string copy(text);
        const double value = std::stod(copy, &used);
        if (used != copy.size())
            return std::nullopt;
        return value;
    }
    catch (const std::logic_error&)
    {
        return std::nullopt;
    }
}

[[nodiscard]] inline std::optional<bool> parse_bool(std::string_view text) noexcept
{
    if (iequals_ascii(text, "true") || iequals_ascii(text, "yes") || iequals_ascii(text, "on") || text == "1")
        return true;
    if (iequals_ascii(text, "false") || iequals_ascii(text, "no") || iequals_ascii(text, "off") || text == "0")
        return false;
    return std::nullopt;
}

[[nodiscard]] inline std::string unescape_newlines(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        if (text[i] == '\\' && i + 1 < text.size() && text[i + 1] == 'n')
        {
            out += '\n';
            ++i;
        }
        else
        {
            out += text[i];
        }
    }
    return out;
}

class config_reader
{
public:
    explicit config_reader(campaign_config& cfg)
        : cfg_(cfg)
    {
    }

    result_void apply(std::size_t line_no, std::string_view key, std::string_view value)
    {
        auto bad = [&](std::string_view what)
        {
            std::string msg = "line " + std::to_string(line_no) + ": ";
            msg += what;
            msg += " '";
            msg += value;
            msg += "' for key '";
            msg += key;
            msg += "'";
            return fail_void(errc::config_invalid, std::move(msg));
        };

        if (key == "subject")
        {
            if (!subjects_seen_)
                cfg_.subjects.clear();
            subjects_seen_ = true;
            cfg_.subjects.emplace_back(value);
            return ok();
        }
        if (key == "body")
        {
            if (!bodies_seen_)
                cfg_.bodies.clear();
            bodies_seen_ = true;
            cfg_.bodies.push_back(unescape_newlines(value));
            return ok();
        }
        if (key == "send_delay_ms")
        {
            const auto v = parse_number<std::int64_t>(value);
            if (!v || *v < 0)
                return bad("invalid delay");
            if (*v > campaign_config::max_delay_limit.count())
                return bad("delay above 24 hours");
            cfg_.send_delay = std::chrono::milliseconds{*v};
            return ok();
        }
        if (key == "mode")
        {
            const auto m = distribution_mode_from_string(value);
            if (!m)
                return bad("unknown mode");
            cfg_.mode = *m;
            return ok();
        }
        if (key == "per_account_cap")
        {
            if (value == "none" || value.empty())
            {
                cfg_.per_account_cap.reset();
                return ok();
            }
            const auto v = parse_number<std::size_t>(value);
            if (!v)
                return bad("invalid cap");
            cfg_.per_account_cap = *v;
            return ok();
        }
        if (key == "retry_max_attempts")
        {
            const auto v = parse_number<unsigned int>(value);
            if (!v || *v == 0)
                return bad("invalid attempt count");
            cfg_.retry.max_attempts = *v;
            return ok();
        }
        if (key == "retry_initial_delay_ms" || key == "retry_max_delay_ms")
        {
            const auto v = parse_number<std::int64_t>(value);
            if (!v || *v < 0)
                return bad("invalid delay");
            if (*v > campaign_config::max_delay_limit.count())
                return bad("delay above 24 hours");
            if (key == "retry_initial_delay_ms")
                cfg_.retry.initial_delay = std::chrono::milliseconds{*v};
            else
                cfg_.retry.max_delay = std::chrono::milliseconds{*v};
            return ok();
        }
        if (key == "retry_multiplier")
        {
            const auto v = parse_double(value);
            if (!v || *v < 1.0)
                return bad("invalid multiplier");
            cfg_.retry.backoff_multiplier = *v;
            return ok();
        }
        if (key == "retry_jitter")
        {
            const auto v = parse_double(value);
            if (!v || *v < 0.0 || *v >= 1.0)
                return bad("invalid jitter");
            cfg_.retry.jitter_factor = *v;
            return ok();
        }
        if (key == "run_timeout_s")
        {
            const auto v = parse_number<std::int64_t>(value);
            if (!v || *v < 0)
                return bad("invalid timeout");
            if (*v > campaign_config::max_run_timeout.count())
                return bad("timeout above 30 days");
            if (*v == 0)
                cfg_.run_timeout.reset();
            else
                cfg_.run_timeout = std::chrono::seconds{*v};
            return ok();
        }
        if (key == "sender_names")
        {
            const auto s = content::sender_name_style_from_string(value);
            if (!s)
                return bad("unknown sender name style");
            cfg_.sender_names = *s;
            return ok();
        }
        if (key == "seed")
        {
            const auto v = parse_number<std::uint64_t>(value);
            if (!v)
                return bad("invalid seed");
            cfg_.seed = *v;
            return ok();
        }
        if (key == "helo_domain")
        {
            cfg_.transport.helo_domain = std::string(value);
            return ok();
        }
        if (key == "verify_tls")
        {
            const auto v = parse_bool(value);
            if (!v)
                return bad("invalid boolean");
            cfg_.transport.verify_peer = *v;
            return ok();
        }
        if (key == "connect_timeout_ms" || key == "command_timeout_ms" || key == "data_timeout_ms")
        {
            const auto v = parse_number<std::int64_t>(value);
            if (!v || *v <= 0)
                return bad("invalid timeout");
            if (*v > campaign_config::max_delay_limit.count())
                return bad("timeout above 24 hours");
            const std::chrono::milliseconds ms{*v};
            if (key == "connect_timeout_ms")
                cfg_.transport.connect_timeout = ms;
            else if (key == "command_timeout_ms")
                cfg_.transport.command_timeout = ms;
            else
                cfg_.transport.data_timeout = ms;
            return ok();
        }
        if (key == "attachment_dir")
        {
            cfg_.attachments.directories.emplace_back(std::string(value));
            return ok();
        }
        if (key == "attachment_extensions")
        {
            cfg_.attachments.extensions.clear();
            std::string_view rest = value;
            while (!rest.empty())
            {
                const auto comma = rest.find(',');
                std::string ext = to_lower_ascii(trim_ascii(rest.substr(0, comma)));
                if (!ext.empty())
                {
                    if (ext.front() != '.')
                        ext.insert(ext.begin(), '.');
                    cfg_.attachments.extensions.insert(std::move(ext));
                }
                if (comma == std::string_view::npos)
                    break;
                rest.remove_prefix(comma + 1);
            }
            return ok();
        }
        if (key == "attachment_max_bytes")
        {
            const auto v = parse_number<std::uintmax_t>(value);
            if (!v)
                return bad("invalid size");
            cfg_.attachments.max_bytes = *v;
            return ok();
        }

        return fail_void(errc::config_invalid,
            "line " + std::to_string(line_no) + ": unknown key '" + std::string(key) + "'");
    }

private:
    campaign_config& cfg_;
    bool subjects_seen_ = false;
    bool bodies_seen_ = false;
};

} // namespace detail

/**
Parse a configuration stream on top of campaign_config::defaults().

@param in Stream in key = value format.
@return   Validated configuration or errc::config_invalid naming the line.
**/
[[nodiscard]] inline result<campaign_config> parse_campaign_config(std::istream& in)
{
    campaign_config cfg = campaign_config::defaults();
    detail::config_reader reader(cfg);

    std::string line;
    std::size_t line_no = 0;
    while (std::getline(in, line))
    {
        ++line_no;
        const std::string_view trimmed = detail::trim_ascii(line);
        if (trimmed.empty() || trimmed.front() == '#')
            continue;

        const auto eq = trimmed.find('=');
        if (eq == std::string_view::npos)
            return fail<campaign_config>(errc::config_invalid,
                "line " + std::to_string(line_no) + ": expected key = value");

        const std::string_view key = detail::trim_ascii(trimmed.substr(0, eq));
        const std::string_view value = detail::trim_ascii(trimmed.substr(eq + 1));
        if (key.empty())
            return fail<campaign_config>(errc::config_invalid,
                "line " + std::to_string(line_no) + ": missing key");

        auto applied = reader.apply(line_no, key, value);
        if (!applied)
            return fail<campaign_config>(std::move(applied).error());
    }

    auto valid = cfg.validate();
    if (!valid)
        return fail<campaign_config>(std::move(valid).error());
    return cfg;
}

[[nodiscard]] inline result<campaign_config> load_campaign_config(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in)
        return fail<campaign_config>(errc::config_invalid, "cannot open config file " + path.string());
    return parse_campaign_config(in);
}

} // namespace mailcast
