/*

dispatch/connection_manager.hpp
-------------------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <mailcast/core/account.hpp>
#include <mailcast/core/message.hpp>
#include <mailcast/credentials/credential_store.hpp>
#include <mailcast/detail/async_mutex.hpp>
#include <mailcast/detail/asio_decl.hpp>
#include <mailcast/detail/backoff.hpp>
#include <mailcast/detail/log.hpp>
#include <mailcast/detail/result.hpp>
#include <mailcast/errors/error_kind.hpp>
#include <mailcast/transport/transport.hpp>

namespace mailcast
{

/**
 * Bookkeeping for the session currently bound to an account.
 */
struct session_stats
{
    std::chrono::steady_clock::time_point opened_at;
    std::chrono::steady_clock::time_point last_used_at;
    std::size_t times_used = 0;
    unsigned int consecutive_failures = 0;
    bool open = false;

    void mark_used() noexcept
    {
        last_used_at = std::chrono::steady_clock::now();
        ++times_used;
    }
};


/**
 * Owns at most one live transport session per account.
 *
 * Every account has a slot guarded by its own async mutex; work for two accounts never
 * contends, work for one account is serialized. Sessions are opened lazily, reused while
 * the liveness probe passes, reopened after transient failures and closed exactly once.
 *
 * Accounts must be registered before the first acquire().
 */
class connection_manager
{
    struct slot;

public:
    /**
     * Exclusive access to one account's session.
     * Holds the account lock until destroyed; move-only.
     */
    class session_lease
    {
    public:
        session_lease() = default;

        session_lease(session_lease&&) noexcept = default;
        session_lease& operator=(session_lease&&) noexcept = default;

        session_lease(const session_lease&) = delete;
        session_lease& operator=(const session_lease&) = delete;

        explicit operator bool() const noexcept
        {
            return slot_ != nullptr && lock_.owns_lock();
        }

        [[nodiscard]] const account_id& account() const noexcept;

        /// Give up the account lock early
        void release() noexcept
        {
            lock_.unlock();
            slot_ = nullptr;
        }

    private:
        friend class connection_manager;

        session_lease(slot* s, detail::async_mutex::scoped_lock lock) noexcept
            : slot_(s)
            , lock_(std::move(lock))
        {
        }

        slot* slot_ = nullptr;
        detail::async_mutex::scoped_lock lock_;
    };

    /**
     * @param executor    Executor for account locks.
     * @param transports  Session factories per protocol.
     * @param credentials Source of account secrets, consulted once per session open.
     * @param retry       Attempt budget and backoff schedule for one send.
     */
    connection_manager(asio::any_io_executor executor, transport_registry transports,
        std::shared_ptr<credential_store> credentials, detail::retry_policy retry = {})
        : executor_(std::move(executor))
        , transports_(std::move(transports))
        , credentials_(std::move(credentials))
        , retry_(retry)
    {
    }

    connection_manager(const connection_manager&) = delete;
    connection_manager& operator=(const connection_manager&) = delete;

    ~connection_manager()
    {
        // release_all() normally ran; anything left is dropped without a goodbye
        std::unique_lock lock(map_mutex_);
        for (auto& [id, s] : slots_)
        {
            if (s->session)
            {
                MAILCAST_LOG_WARN("CONN", "dropping session of " << id << " without QUIT");
                s->session.reset();
                sessions_closed_.fetch_add(1, std::memory_order_relaxed);
            }
        }
    }

    void register_account(const account& acc)
    {
        std::unique_lock lock(map_mutex_);
        auto& s = slots_[acc.id];
        if (!s)
            s = std::make_unique<slot>(executor_, acc);
    }

    /**
     * Lock the account and make sure it has a live session.
     *
     * An existing session is kept when its probe succeeds; otherwise it is closed and a new
     * one is opened, retried according to the retry policy.
     *
     * @param id Registered account.
     * @return   Lease holding the account lock, or the classified open failure.
     */
    asio::awaitable<result<session_lease>> acquire(const account_id& id)
    {
        slot* s = find(id);
        if (s == nullptr)
            co_return fail<session_lease>(errc::invalid_argument, "account not registered: " + id.to_string());

        auto lock = co_await s->mutex.lock();
        if (!lock)
            co_return fail<session_lease>(std::move(lock).error());

        session_lease lease(s, std::move(*lock));

        if (s->session)
        {
            if (s->session->is_open() && co_await s->session->probe())
            {
                MAILCAST_LOG_TRACE("CONN", "reusing session of " << id);
                co_return std::move(lease);
            }
            MAILCAST_LOG_DEBUG("CONN", "session of " << id << " failed its probe");
            co_await close_session(*s, "stale");
        }

        auto opened = co_await run_attempts(*s, nullptr);
        if (!opened)
            co_return fail<session_lease>(std::move(opened).error());
        co_return std::move(lease);
    }

    /**
     * Send one message on the leased account.
     *
     * Failures are classified after each attempt:
     * retry-same-session keeps the session, reopen-and-retry closes it and opens a new one,
     * both wait out the backoff delay; skip-recipient-continue returns at once;
     * abort-account closes the session and returns. The attempt budget includes the first try.
     * A stop request ends the loop at the next attempt boundary with errc::cancelled;
     * the failure it interrupted is kept for take_interrupted_failure().
     */
    asio::awaitable<result_void> send(session_lease& lease, const message& msg)
    {
        if (!lease)
            co_return fail_void(errc::invalid_argument, "send without a session lease");
        co_return co_await run_attempts(*lease.slot_, &msg);
    }

    /// Close the account's session, waiting for the account lock.
    asio::awaitable<void> release(const account_id& id)
    {
        slot* s = find(id);
        if (s == nullptr)
            co_return;

        auto lock = co_await s->mutex.lock();
        if (!lock)
        {
            MAILCAST_LOG_WARN("CONN", "release of " << id << " interrupted: " << lock.error().message);
            co_return;
        }
        co_await close_session(*s, "release");
    }

    /// Close every remaining session, one account at a time.
    asio::awaitable<void> release_all()
    {
        std::vector<account_id> ids;
        {
            std::shared_lock lock(map_mutex_);
            ids.reserve(slots_.size());
            for (const auto& [id, s] : slots_)
                ids.push_back(id);
        }
        for (const auto& id : ids)
            co_await release(id);
        MAILCAST_LOG_DEBUG("CONN", "all sessions released (opened " << sessions_opened() << ", closed " << sessions_closed() << ")");
    }

    /// Stop retrying: pending backoff waits end now, no new attempt starts. Thread-safe.
    void request_stop()
    {
        stop_.store(true, std::memory_order_release);

        std::shared_lock lock(map_mutex_);
        for (const auto& [id, s] : slots_)
        {
            std::lock_guard<std::mutex> guard(s->state_mutex);
            if (auto timer = s->backoff_timer.lock())
                asio::post(timer->get_executor(), [timer]() { timer->cancel(); });
        }
    }

    [[nodiscard]] bool stop_requested() const noexcept
    {
        return stop_.load(std::memory_order_acquire);
    }

    [[nodiscard]] std::size_t sessions_opened() const noexcept
    {
        return sessions_opened_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] std::size_t sessions_closed() const noexcept
    {
        return sessions_closed_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] std::size_t open_sessions() const noexcept
    {
        return sessions_opened() - sessions_closed();
    }

    /// The failure a stop request cut short on this account, if any. Clears it.
    [[nodiscard]] std::optional<error_info> take_interrupted_failure(const account_id& id)
    {
        slot* s = find(id);
        if (s == nullptr)
            return std::nullopt;
        std::lock_guard<std::mutex> lock(s->state_mutex);
        return std::exchange(s->interrupted, std::nullopt);
    }

    [[nodiscard]] std::optional<session_stats> stats(const account_id& id) const
    {
        const slot* s = find(id);
        if (s == nullptr)
            return std::nullopt;
        std::lock_guard<std::mutex> lock(s->state_mutex);
        return s->stats;
    }

    [[nodiscard]] const detail::retry_policy& retry() const noexcept
    {
        return retry_;
    }

private:
    struct slot
    {
        slot(asio::any_io_executor executor, account acc)
            : mutex(std::move(executor))
            , owner(std::move(acc))
        {
        }

        detail::async_mutex mutex;
        const account owner;

        // guarded by mutex
        std::unique_ptr<transport_session> session;

        // readable from other threads
        mutable std::mutex state_mutex;
        session_stats stats;
        std::weak_ptr<asio::steady_timer> backoff_timer;
        std::optional<error_info> interrupted;
    };

    slot* find(const account_id& id) const
    {
        std::shared_lock lock(map_mutex_);
        const auto it = slots_.find(id);
        return it == slots_.end() ? nullptr : it->second.get();
    }

    asio::awaitable<result_void> run_attempts(slot& s, const message* msg)
    {
        result_void outcome = ok();
        unsigned int attempt = 0;
        while (true)
        {
            if (stop_requested())
            {
                if (!outcome)
                {
                    std::lock_guard<std::mutex> lock(s.state_mutex);
                    s.interrupted = outcome.error();
                }
                co_return stopped(outcome, attempt);
            }

            ++attempt;
            outcome = co_await attempt_once(s, msg);
            if (outcome)
            {
                std::lock_guard<std::mutex> lock(s.state_mutex);
                s.stats.consecutive_failures = 0;
                if (msg != nullptr)
                    s.stats.mark_used();
                co_return ok();
            }

            const classification cls = classify(outcome.error());
            {
                std::lock_guard<std::mutex> lock(s.state_mutex);
                ++s.stats.consecutive_failures;
            }
            MAILCAST_LOG_DEBUG("CONN", s.owner.id << " attempt " << attempt << " failed: "
                << outcome.error().to_string() << " -> " << cls.kind << "/" << cls.policy);

            switch (cls.policy)
            {
                case recovery_policy::abort_account:
                    co_await close_session(s, "abort");
                    co_return outcome;
                case recovery_policy::skip_recipient_continue:
                    co_return outcome;
                case recovery_policy::reopen_and_retry:
                    co_await close_session(s, "reopen");
                    break;
                case recovery_policy::retry_same_session:
                    break;
            }

            if (!retry_.should_retry(attempt))
            {
                MAILCAST_LOG_WARN("CONN", s.owner.id << " gave up after " << attempt << " attempts: " << outcome.error().to_string());
                co_return outcome;
            }

            co_await backoff(s, retry_.delay(attempt));
        }
    }

    asio::awaitable<result_void> attempt_once(slot& s, const message* msg)
    {
        if (s.session && !s.session->is_open())
            co_await close_session(s, "lost");

        if (!s.session)
        {
            auto opened = co_await open_session(s);
            if (!opened)
                co_return opened;
        }

        if (msg == nullptr)
            co_return ok();
        co_return co_await s.session->send(*msg);
    }

    asio::awaitable<result_void> open_session(slot& s)
    {
        auto factory = transports_.find(s.owner.protocol());
        if (!factory)
            co_return fail_void(errc::provider_unsupported,
                "no transport for protocol " + std::string(to_string(s.owner.protocol())));

        auto cred = credentials_->resolve(s.owner);
        if (!cred)
            co_return fail_void(std::move(cred).error());

        auto session = co_await factory->open(s.owner, *cred);
        if (!session && cred->kind == credential::kind_t::oauth2_token
            && classify(session.error()).kind == error_kind::authentication_failed)
        {
            MAILCAST_LOG_INFO("CONN", "token of " << s.owner.id << " rejected, refreshing");
            auto refreshed = credentials_->refresh(s.owner);
            if (!refreshed)
                co_return fail_void(std::move(refreshed).error());
            session = co_await factory->open(s.owner, *refreshed);
        }
        if (!session)
            co_return fail_void(std::move(session).error());

        s.session = std::move(*session);
        sessions_opened_.fetch_add(1, std::memory_order_relaxed);
        {
            std::lock_guard<std::mutex> lock(s.state_mutex);
            s.stats.opened_at = std::chrono::steady_clock::now();
            s.stats.last_used_at = s.stats.opened_at;
            s.stats.times_used = 0;
            s.stats.open = true;
        }
        MAILCAST_LOG_DEBUG("CONN", "session opened for " << s.owner.id);
        co_return ok();
    }

    // The pointer is taken before awaiting so a session is closed exactly once.
    asio::awaitable<void> close_session(slot& s, std::string_view reason)
    {
        std::unique_ptr<transport_session> session = std::move(s.session);
        if (!session)
            co_return;

        co_await session->close();
        session.reset();
        sessions_closed_.fetch_add(1, std::memory_order_relaxed);
        {
            std::lock_guard<std::mutex> lock(s.state_mutex);
            s.stats.open = false;
        }
        MAILCAST_LOG_DEBUG("CONN", "session closed for " << s.owner.id << " (" << reason << ")");
    }

    asio::awaitable<void> backoff(slot& s, std::chrono::milliseconds delay)
    {
        auto executor = co_await asio::this_coro::executor;
        auto timer = std::make_shared<asio::steady_timer>(executor);
        timer->expires_after(delay);
        {
            std::lock_guard<std::mutex> lock(s.state_mutex);
            s.backoff_timer = timer;
        }
        // request_stop() may have run before the timer was visible
        if (!stop_requested())
        {
            asio::error_code ec;
            co_await timer->async_wait(asio::use_nothrow_awaitable(ec));
        }
        std::lock_guard<std::mutex> lock(s.state_mutex);
        s.backoff_timer.reset();
    }

    static result_void stopped(const result_void& last, unsigned int attempts)
    {
        std::string msg = "stopped";
        if (attempts > 0)
        {
            msg += " after " + std::to_string(attempts) + " attempt(s)";
            if (!last)
                msg += ": " + last.error().message;
        }
        return fail_void(errc::cancelled, std::move(msg));
    }

    asio::any_io_executor executor_;
    transport_registry transports_;
    std::shared_ptr<credential_store> credentials_;
    detail::retry_policy retry_;

    mutable std::shared_mutex map_mutex_;
    std::map<account_id, std::unique_ptr<slot>> slots_;

    std::atomic<bool> stop_{false};
    std::atomic<std::size_t> sessions_opened_{0};
    std::atomic<std::size_t> sessions_closed_{0};
};

inline const account_id& connection_manager::session_lease::account() const noexcept
{
    return slot_->owner.id;
}

} // namespace mailcast
