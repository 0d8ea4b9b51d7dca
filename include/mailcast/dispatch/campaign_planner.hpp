/*

campaign_planner.hpp
--------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Recipient to account assignment.

*/

#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include <mailcast/core/account.hpp>

namespace mailcast
{

enum class distribution_mode : std::uint8_t
{
    distribute,   ///< each recipient goes to exactly one account
    broadcast     ///< every account gets the full list
};

[[nodiscard]] constexpr std::string_view to_string(distribution_mode mode) noexcept
{
    switch (mode)
    {
        case distribution_mode::distribute: return "distribute";
        case distribution_mode::broadcast: return "broadcast";
    }
    return "distribute";
}

inline std::ostream& operator<<(std::ostream& os, distribution_mode mode)
{
    return os << to_string(mode);
}

[[nodiscard]] inline std::optional<distribution_mode> distribution_mode_from_string(std::string_view name) noexcept
{
    if (name == "distribute")
        return distribution_mode::distribute;
    if (name == "broadcast")
        return distribution_mode::broadcast;
    return std::nullopt;
}

struct assignment_entry
{
    account_id account;
    std::vector<std::string> recipients;
};

/// Immutable result of planning, in account input order.
struct assignment
{
    std::vector<assignment_entry> entries;

    /// Recipients dropped by the per-account cap
    std::vector<std::string> unassigned;

    [[nodiscard]] const assignment_entry* find(const account_id& id) const noexcept
    {
        const auto it = std::find_if(entries.begin(), entries.end(),
            [&id](const assignment_entry& e) { return e.account == id; });
        return it == entries.end() ? nullptr : &*it;
    }

    [[nodiscard]] std::size_t assigned_count() const noexcept
    {
        std::size_t total = 0;
        for (const auto& e : entries)
            total += e.recipients.size();
        return total;
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return entries.empty();
    }
};

class campaign_planner
{
public:
    /**
     * Compute the assignment.
     *
     * Distribute: account i takes floor(R/A) recipients plus one when i < R mod A,
     * truncated to the cap, as a contiguous slice after the previous account's slice.
     * Recipients after the last slice are unassigned.
     * Broadcast: every account gets the whole list; the cap does not apply.
     *
     * @param accounts   Accounts in input order.
     * @param recipients Recipients in input order.
     * @param mode       Distribution mode.
     * @param cap        Optional per-account maximum.
     * @return           The assignment; empty when there are no accounts.
     */
    [[nodiscard]] static assignment distribute(const std::vector<account>& accounts,
        const std::vector<std::string>& recipients, distribution_mode mode,
        std::optional<std::size_t> cap = std::nullopt)
    {
        assignment out;
        if (accounts.empty())
        {
            out.unassigned = recipients;
            return out;
        }

        out.entries.reserve(accounts.size());
        if (mode == distribution_mode::broadcast)
        {
            for (const auto& acc : accounts)
                out.entries.push_back(assignment_entry{acc.id, recipients});
            return out;
        }

        const std::size_t base = recipients.size() / accounts.size();
        const std::size_t remainder = recipients.size() % accounts.size();
        std::size_t offset = 0;
        for (std::size_t i = 0; i < accounts.size(); ++i)
        {
            std::size_t share = base + (i < remainder ? 1 : 0);
            if (cap)
                share = std::min(share, *cap);

            assignment_entry entry{accounts[i].id, {}};
            entry.recipients.assign(recipients.begin() + static_cast<std::ptrdiff_t>(offset),
                recipients.begin() + static_cast<std::ptrdiff_t>(offset + share));
            offset += share;
            out.entries.push_back(std::move(entry));
        }
        out.unassigned.assign(recipients.begin() + static_cast<std::ptrdiff_t>(offset), recipients.end());
        return out;
    }
};

} // namespace mailcast
