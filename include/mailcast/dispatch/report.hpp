/*

dispatch/report.hpp
-------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <chrono>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

#include <mailcast/core/account.hpp>
#include <mailcast/dispatch/campaign_planner.hpp>
#include <mailcast/dispatch/progress.hpp>
#include <mailcast/errors/error_classifier.hpp>
#include <mailcast/errors/error_kind.hpp>

namespace mailcast
{

struct account_report
{
    account_progress progress;
    error_histogram errors;
    std::vector<error_record> history;

    [[nodiscard]] const account_id& account() const noexcept
    {
        return progress.account;
    }
};

/// Final outcome of one run, built from frozen state.
struct campaign_report
{
    distribution_mode mode{distribution_mode::distribute};
    std::vector<account_report> accounts;
    progress_totals totals;
    std::vector<std::string> unassigned;
    std::chrono::milliseconds duration{0};
    bool cancelled = false;
    bool timed_out = false;
    std::size_t sessions_opened = 0;
    std::size_t sessions_closed = 0;

    [[nodiscard]] const account_report* find(const account_id& id) const noexcept
    {
        for (const auto& a : accounts)
        {
            if (a.account() == id)
                return &a;
        }
        return nullptr;
    }

    /// Campaign-wide count per error kind
    [[nodiscard]] error_histogram errors() const
    {
        error_histogram out;
        for (const auto& a : accounts)
        {
            for (const auto& [kind, count] : a.errors)
                out[kind] += count;
        }
        return out;
    }
};

/**
Plain text report: per account status, counters, every error kind with its count and
recovery hint; then totals, unassigned recipients and duration.
**/
[[nodiscard]] inline std::string render_text(const campaign_report& report)
{
    std::ostringstream out;
    out << "Campaign report (" << to_string(report.mode) << ")\n";

    for (const auto& a : report.accounts)
    {
        const auto& p = a.progress;
        out << "  " << p.account << ": " << p.status
            << "  sent=" << p.sent << " failed=" << p.failed << " skipped=" << p.skipped
            << " cancelled=" << p.cancelled << " of " << p.assigned << '\n';
        for (const auto& [kind, count] : a.errors)
            out << "      " << kind << " x" << count << ": " << recovery_hint(kind) << '\n';
    }

    const auto& t = report.totals;
    out << "Totals: sent=" << t.sent << " failed=" << t.failed << " skipped=" << t.skipped
        << " cancelled=" << t.cancelled << " attempted=" << t.attempted << " assigned=" << t.assigned << '\n';
    if (!report.unassigned.empty())
        out << "Unassigned recipients: " << report.unassigned.size() << '\n';
    out << "Sessions: opened=" << report.sessions_opened << " closed=" << report.sessions_closed << '\n';
    out << "Duration: " << std::fixed << std::setprecision(1)
        << static_cast<double>(report.duration.count()) / 1000.0 << "s";
    if (report.timed_out)
        out << " (run timeout reached)";
    else if (report.cancelled)
        out << " (cancelled)";
    out << '\n';
    return out.str();
}

/// One progress line per account, used for live display.
[[nodiscard]] inline std::string render_progress(const progress_snapshot& snap)
{
    std::ostringstream out;
    for (const auto& p : snap.accounts)
    {
        out << p.account << " [" << p.status << "] "
            << (p.sent + p.failed + p.skipped + p.cancelled) << '/' << p.assigned
            << " sent=" << p.sent << " failed=" << p.failed << '\n';
    }
    return out.str();
}

} // namespace mailcast
