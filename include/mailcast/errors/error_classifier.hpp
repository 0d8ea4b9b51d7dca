/*

error_classifier.hpp
--------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Classification plus per-account, append-only error history.

*/

#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

#include <mailcast/core/account.hpp>
#include <mailcast/detail/log.hpp>
#include <mailcast/errors/error_kind.hpp>

namespace mailcast
{

/// One surfaced failure. Never modified after it is appended.
struct error_record
{
    account_id account;
    error_kind kind{error_kind::unknown_fatal};
    recovery_policy policy{recovery_policy::abort_account};
    errc code{errc::internal_error};
    std::string message;
    std::string recipient;
    std::chrono::system_clock::time_point timestamp;
};

using error_histogram = std::map<error_kind, std::size_t>;

class error_classifier
{
public:
    error_classifier() = default;

    error_classifier(const error_classifier&) = delete;
    error_classifier& operator=(const error_classifier&) = delete;

    /// Create the history slot for an account. Idempotent.
    void register_account(const account_id& id)
    {
        std::unique_lock lock(map_mutex_);
        auto& slot = histories_[id];
        if (!slot)
            slot = std::make_unique<history_t>();
    }

    /// Pure classification, no history side effect.
    [[nodiscard]] static classification classify(const error_info& err)
    {
        return mailcast::classify(err);
    }

    /**
     * Classify a failure and append it to the account's history.
     *
     * @param id        Owning account.
     * @param err       Raw failure.
     * @param recipient Recipient the failure belongs to, empty for account-level failures.
     * @return          The classification that was recorded.
     */
    classification record(const account_id& id, const error_info& err, const std::string& recipient = {})
    {
        const classification cls = mailcast::classify(err);

        error_record rec;
        rec.account = id;
        rec.kind = cls.kind;
        rec.policy = cls.policy;
        rec.code = err.code;
        rec.message = err.to_string();
        rec.recipient = recipient;
        rec.timestamp = std::chrono::system_clock::now();

        history_t* history = find_or_register(id);
        {
            std::lock_guard<std::mutex> lock(history->mutex);
            history->records.push_back(std::move(rec));
        }

        MAILCAST_LOG_DEBUG("CLASSIFIER", id << ": " << cls.kind << " -> " << cls.policy
            << " (" << err.to_string() << ")");
        return cls;
    }

    /// Copy of one account's history in append order.
    [[nodiscard]] std::vector<error_record> history(const account_id& id) const
    {
        const history_t* h = find(id);
        if (h == nullptr)
            return {};
        std::lock_guard<std::mutex> lock(h->mutex);
        return h->records;
    }

    /// Count of recorded failures per kind for one account.
    [[nodiscard]] error_histogram histogram(const account_id& id) const
    {
        error_histogram out;
        const history_t* h = find(id);
        if (h == nullptr)
            return out;
        std::lock_guard<std::mutex> lock(h->mutex);
        for (const auto& rec : h->records)
            ++out[rec.kind];
        return out;
    }

    /// Campaign-wide counts; visits one account at a time.
    [[nodiscard]] error_histogram histogram() const
    {
        error_histogram out;
        std::shared_lock lock(map_mutex_);
        for (const auto& [id, h] : histories_)
        {
            std::lock_guard<std::mutex> guard(h->mutex);
            for (const auto& rec : h->records)
                ++out[rec.kind];
        }
        return out;
    }

    [[nodiscard]] std::size_t size(const account_id& id) const
    {
        const history_t* h = find(id);
        if (h == nullptr)
            return 0;
        std::lock_guard<std::mutex> lock(h->mutex);
        return h->records.size();
    }

private:
    struct history_t
    {
        mutable std::mutex mutex;
        std::vector<error_record> records;
    };

    // Slots are never erased, so the returned pointer stays valid.
    const history_t* find(const account_id& id) const
    {
        std::shared_lock lock(map_mutex_);
        const auto it = histories_.find(id);
        return it == histories_.end() ? nullptr : it->second.get();
    }

    history_t* find_or_register(const account_id& id)
    {
        {
            std::shared_lock lock(map_mutex_);
            const auto it = histories_.find(id);
            if (it != histories_.end())
                return it->second.get();
        }
        std::unique_lock lock(map_mutex_);
        auto& slot = histories_[id];
        if (!slot)
            slot = std::make_unique<history_t>();
        return slot.get();
    }

    mutable std::shared_mutex map_mutex_;
    std::map<account_id, std::unique_ptr<history_t>> histories_;
};

} // namespace mailcast
