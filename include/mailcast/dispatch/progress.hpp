/*

progress.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Live per-account counters and status, safe to update from every worker and
to snapshot from any thread.

*/

#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <shared_mutex>
#include <string_view>
#include <vector>

#include <mailcast/core/account.hpp>

namespace mailcast
{

enum class account_status : std::uint8_t
{
    pending,
    sending,
    completed,
    failed,
    cancelled
};

[[nodiscard]] constexpr std::string_view to_string(account_status status) noexcept
{
    switch (status)
    {
        case account_status::pending: return "pending";
        case account_status::sending: return "sending";
        case account_status::completed: return "completed";
        case account_status::failed: return "failed";
        case account_status::cancelled: return "cancelled";
    }
    return "pending";
}

inline std::ostream& operator<<(std::ostream& os, account_status status)
{
    return os << to_string(status);
}

[[nodiscard]] constexpr bool is_terminal(account_status status) noexcept
{
    return status == account_status::completed
        || status == account_status::failed
        || status == account_status::cancelled;
}

enum class send_outcome : std::uint8_t
{
    sent,
    failed,
    skipped,
    cancelled
};

struct account_progress
{
    account_id account;
    std::size_t assigned = 0;
    std::size_t attempted = 0;
    std::size_t sent = 0;
    std::size_t failed = 0;
    std::size_t skipped = 0;
    std::size_t cancelled = 0;
    account_status status = account_status::pending;

    /// Recipients not yet accounted for
    [[nodiscard]] std::size_t remaining() const noexcept
    {
        const std::size_t done = sent + failed + skipped + cancelled;
        return done >= assigned ? 0 : assigned - done;
    }
};

struct progress_totals
{
    std::size_t assigned = 0;
    std::size_t attempted = 0;
    std::size_t sent = 0;
    std::size_t failed = 0;
    std::size_t skipped = 0;
    std::size_t cancelled = 0;
};

/// Immutable copy of the aggregator state.
struct progress_snapshot
{
    std::vector<account_progress> accounts;
    progress_totals totals;
    bool frozen = false;

    [[nodiscard]] const account_progress* find(const account_id& id) const noexcept
    {
        for (const auto& a : accounts)
        {
            if (a.account == id)
                return &a;
        }
        return nullptr;
    }

    [[nodiscard]] bool all_terminal() const noexcept
    {
        for (const auto& a : accounts)
        {
            if (!is_terminal(a.status))
                return false;
        }
        return true;
    }
};

class progress_aggregator
{
public:
    progress_aggregator() = default;

    progress_aggregator(const progress_aggregator&) = delete;
    progress_aggregator& operator=(const progress_aggregator&) = delete;

    /// Add an account before the run starts. Re-registering keeps the existing entry.
    void register_account(const account_id& id, std::size_t assigned)
    {
        std::unique_lock lock(map_mutex_);
        if (index_.count(id) != 0)
            return;
        auto e = std::make_unique<entry>();
        e->data.account = id;
        e->data.assigned = assigned;
        index_.emplace(id, entries_.size());
        entries_.push_back(std::move(e));
    }

    /**
     * Count `count` recipients with the given outcome.
     * sent and failed also count as attempted. Ignored once frozen or for unknown accounts.
     */
    bool record(const account_id& id, send_outcome outcome, std::size_t count = 1)
    {
        if (frozen_.load(std::memory_order_acquire))
            return false;
        entry* e = find(id);
        if (e == nullptr)
            return false;

        std::lock_guard<std::mutex> lock(e->mutex);
        switch (outcome)
        {
            case send_outcome::sent:
                e->data.attempted += count;
                e->data.sent += count;
                break;
            case send_outcome::failed:
                e->data.attempted += count;
                e->data.failed += count;
                break;
            case send_outcome::skipped:
                e->data.skipped += count;
                break;
            case send_outcome::cancelled:
                e->data.cancelled += count;
                break;
        }
        return true;
    }

    /**
     * Advance an account's status. Transitions only move forward
     * (pending, sending, terminal); a terminal status is final.
     *
     * @return true when the status changed.
     */
    bool set_status(const account_id& id, account_status next)
    {
        if (frozen_.load(std::memory_order_acquire))
            return false;
        entry* e = find(id);
        if (e == nullptr)
            return false;

        std::lock_guard<std::mutex> lock(e->mutex);
        if (rank(next) <= rank(e->data.status))
            return false;
        e->data.status = next;
        return true;
    }

    [[nodiscard]] std::optional<account_progress> get(const account_id& id) const
    {
        const entry* e = find(id);
        if (e == nullptr)
            return std::nullopt;
        std::lock_guard<std::mutex> lock(e->mutex);
        return e->data;
    }

    /// Stop accepting updates. Called once the run is terminal.
    void freeze() noexcept
    {
        frozen_.store(true, std::memory_order_release);
    }

    [[nodiscard]] bool frozen() const noexcept
    {
        return frozen_.load(std::memory_order_acquire);
    }

    /// Copy of every account, one account lock at a time.
    [[nodiscard]] progress_snapshot snapshot() const
    {
        progress_snapshot snap;
        snap.frozen = frozen();
        std::shared_lock lock(map_mutex_);
        snap.accounts.reserve(entries_.size());
        for (const auto& e : entries_)
        {
            account_progress copy;
            {
                std::lock_guard<std::mutex> guard(e->mutex);
                copy = e->data;
            }
            snap.totals.assigned += copy.assigned;
            snap.totals.attempted += copy.attempted;
            snap.totals.sent += copy.sent;
            snap.totals.failed += copy.failed;
            snap.totals.skipped += copy.skipped;
            snap.totals.cancelled += copy.cancelled;
            snap.accounts.push_back(std::move(copy));
        }
        return snap;
    }

private:
    struct entry
    {
        mutable std::mutex mutex;
        account_progress data;
    };

    static constexpr int rank(account_status status) noexcept
    {
        switch (status)
        {
            case account_status::pending: return 0;
            case account_status::sending: return 1;
            default: return 2;
        }
    }

    // Entries are never removed, so the pointer outlives the map lock.
    entry* find(const account_id& id) const
    {
        std::shared_lock lock(map_mutex_);
        const auto it = index_.find(id);
        return it == index_.end() ? nullptr : entries_[it->second].get();
    }

    mutable std::shared_mutex map_mutex_;
    std::map<account_id, std::size_t> index_;
    std::vector<std::unique_ptr<entry>> entries_;
    std::atomic<bool> frozen_{false};
};

} // namespace mailcast
