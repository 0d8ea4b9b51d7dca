/*

dispatch/worker_pool.hpp
------------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include <mailcast/content/attachment_provider.hpp>
#include <mailcast/content/sender_names.hpp>
#include <mailcast/core/message.hpp>
#include <mailcast/detail/asio_decl.hpp>
#include <mailcast/detail/log.hpp>
#include <mailcast/detail/result.hpp>
#include <mailcast/dispatch/campaign_config.hpp>
#include <mailcast/dispatch/campaign_planner.hpp>
#include <mailcast/dispatch/connection_manager.hpp>
#include <mailcast/dispatch/progress.hpp>
#include <mailcast/errors/error_classifier.hpp>

namespace mailcast
{

/// Collaborators shared by all workers of one run. Must outlive the pool.
struct worker_environment
{
    connection_manager& connections;
    error_classifier& errors;
    progress_aggregator& progress;
    content::attachment_provider& attachments;
    const campaign_config& config;
};


/**
 * One coroutine per account with work, each on its own strand of a thread pool sized to
 * the number of those accounts.
 *
 * A worker drains its recipients in order. Consecutive send starts are at least
 * config.send_delay apart. A failure only stops the worker when its policy is
 * abort-account; the remaining recipients are then skipped. Cancellation is checked
 * before every send and interrupts the pacing wait; untouched recipients become cancelled.
 */
class worker_pool
{
public:
    explicit worker_pool(std::size_t workers)
        : pool_(std::max<std::size_t>(1, workers))
    {
    }

    worker_pool(const worker_pool&) = delete;
    worker_pool& operator=(const worker_pool&) = delete;

    ~worker_pool()
    {
        if (active() > 0)
        {
            cancel();
            wait();
        }
        pool_.join();
    }

    [[nodiscard]] asio::any_io_executor executor() noexcept
    {
        return pool_.get_executor();
    }

    /**
     * Spawn a worker for every entry with recipients. Entries without recipients are left
     * to the caller.
     *
     * @param plan Assignment; copied per worker.
     * @param env  Shared collaborators.
     */
    void start(const assignment& plan, worker_environment env)
    {
        std::vector<std::shared_ptr<worker_state>> spawned;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            env_ = std::make_unique<worker_environment>(env);

            std::size_t index = 0;
            for (const auto& entry : plan.entries)
            {
                if (entry.recipients.empty())
                    continue;

                const std::uint64_t seed = env.config.seed
                    ? *env.config.seed + index * 7919u
                    : static_cast<std::uint64_t>(std::random_device{}());
                auto state = std::make_shared<worker_state>(asio::make_strand(pool_), entry, seed,
                    env.config.sender_names);
                states_.push_back(state);
                spawned.push_back(std::move(state));
                ++index;
            }
        }

        {
            std::lock_guard<std::mutex> lock(done_mutex_);
            active_ += spawned.size();
        }

        for (auto& state : spawned)
        {
            auto strand = state->strand;
            asio::co_spawn(strand, run_worker(std::move(state)), asio::detached);
        }
        MAILCAST_LOG_INFO("WORKER", "started " << spawned.size() << " worker(s)");
    }

    /// Request cooperative cancellation. Safe from any thread, any number of times.
    void cancel()
    {
        if (cancelled_.exchange(true, std::memory_order_acq_rel))
            return;

        std::vector<std::shared_ptr<worker_state>> states;
        connection_manager* connections = nullptr;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            states = states_;
            if (env_)
                connections = &env_->connections;
        }

        MAILCAST_LOG_INFO("WORKER", "cancellation requested");
        for (auto& state : states)
            asio::post(state->strand, [state]() { state->pacing.cancel(); });
        if (connections != nullptr)
            connections->request_stop();
    }

    [[nodiscard]] bool cancelled() const noexcept
    {
        return cancelled_.load(std::memory_order_acquire);
    }

    /// Block until every worker has exited.
    void wait()
    {
        std::unique_lock<std::mutex> lock(done_mutex_);
        done_cv_.wait(lock, [this]() { return active_ == 0; });
    }

    /// Block until every worker has exited or the timeout elapsed. True when all exited.
    template<typename Rep, typename Period>
    bool wait_for(std::chrono::duration<Rep, Period> timeout)
    {
        std::unique_lock<std::mutex> lock(done_mutex_);
        return done_cv_.wait_for(lock, timeout, [this]() { return active_ == 0; });
    }

    [[nodiscard]] std::size_t active() const
    {
        std::lock_guard<std::mutex> lock(done_mutex_);
        return active_;
    }

    /// Wait for all outstanding handlers, then stop the threads.
    void join()
    {
        pool_.join();
    }

private:
    enum class step
    {
        proceed,
        abort_account,
        stop
    };

    struct worker_state
    {
        worker_state(asio::any_io_executor ex, assignment_entry e, std::uint64_t seed,
            content::sender_name_style style)
            : strand(ex)
            , pacing(std::move(ex))
            , entry(std::move(e))
            , rng(seed)
            , names(style, seed ^ 0x9e3779b97f4a7c15ull)
        {
        }

        asio::any_io_executor strand;
        asio::steady_timer pacing;
        assignment_entry entry;
        std::mt19937_64 rng;
        content::sender_name_generator names;

        std::size_t next = 0;
        bool started = false;
        bool current_recorded = true;
        std::chrono::steady_clock::time_point last_start;
    };

    // Decrements the active count however the worker coroutine ends.
    class active_guard
    {
    public:
        explicit active_guard(worker_pool& pool) noexcept
            : pool_(pool)
        {
        }

        active_guard(const active_guard&) = delete;
        active_guard& operator=(const active_guard&) = delete;

        ~active_guard()
        {
            std::lock_guard<std::mutex> lock(pool_.done_mutex_);
            --pool_.active_;
            pool_.done_cv_.notify_all();
        }

    private:
        worker_pool& pool_;
    };

    asio::awaitable<void> run_worker(std::shared_ptr<worker_state> state)
    {
        active_guard guard(*this);
        const worker_environment& env = *env_;
        const account_id& id = state->entry.account;

        env.progress.set_status(id, account_status::sending);
        MAILCAST_LOG_INFO("WORKER", id << " starting with " << state->entry.recipients.size() << " recipient(s)");

        account_status final_status = account_status::failed;
        std::exception_ptr escaped;
        try
        {
            final_status = co_await drain(*state);
        }
        catch (...)
        {
            escaped = std::current_exception();
        }

        if (escaped)
        {
            const error_info err = error_from_exception(escaped, "worker");
            MAILCAST_LOG_ERROR("WORKER", id << " stopped by an exception: " << err.message);
            const auto& recipients = state->entry.recipients;
            if (!state->current_recorded && state->next < recipients.size())
            {
                env.errors.record(id, err, recipients[state->next]);
                env.progress.record(id, send_outcome::failed);
                ++state->next;
            }
            else
            {
                env.errors.record(id, err);
            }
            mark_remaining(*state, send_outcome::skipped);
            final_status = account_status::failed;
        }

        co_await env.connections.release(id);
        env.progress.set_status(id, final_status);
        MAILCAST_LOG_INFO("WORKER", id << " finished: " << final_status);
    }

    asio::awaitable<account_status> drain(worker_state& state)
    {
        const worker_environment& env = *env_;
        const auto& recipients = state.entry.recipients;

        while (state.next < recipients.size())
        {
            if (cancelled())
                co_return finish_cancelled(state);

            if (state.started && env.config.send_delay.count() > 0)
            {
                state.pacing.expires_at(state.last_start + env.config.send_delay);
                asio::error_code ec;
                co_await state.pacing.async_wait(asio::use_nothrow_awaitable(ec));
                if (cancelled())
                    co_return finish_cancelled(state);
            }

            state.started = true;
            state.last_start = std::chrono::steady_clock::now();
            state.current_recorded = false;
            const step outcome = co_await send_one(state, recipients[state.next]);
            state.current_recorded = true;
            ++state.next;

            if (outcome == step::abort_account)
            {
                const std::size_t skipped = mark_remaining(state, send_outcome::skipped);
                MAILCAST_LOG_WARN("WORKER", state.entry.account << " aborted, " << skipped << " recipient(s) skipped");
                co_return account_status::failed;
            }
            if (outcome == step::stop)
                co_return finish_cancelled(state);
        }
        co_return account_status::completed;
    }

    asio::awaitable<step> send_one(worker_state& state, const std::string& recipient)
    {
        const worker_environment& env = *env_;
        const account_id& id = state.entry.account;

        auto msg = build_message(state, recipient);
        if (!msg)
            co_return on_failure(state, recipient, msg.error());

        auto lease = co_await env.connections.acquire(id);
        if (!lease)
            co_return on_failure(state, recipient, lease.error());

        auto sent = co_await env.connections.send(*lease, *msg);
        if (!sent)
            co_return on_failure(state, recipient, sent.error());

        env.progress.record(id, send_outcome::sent);
        MAILCAST_LOG_DEBUG("WORKER", id << " sent to " << recipient);
        co_return step::proceed;
    }

    step on_failure(worker_state& state, const std::string& recipient, const error_info& err)
    {
        const worker_environment& env = *env_;
        const account_id& id = state.entry.account;

        if (err.code == errc::cancelled)
        {
            if (auto cause = env.connections.take_interrupted_failure(id))
            {
                const classification cls = env.errors.record(id, *cause, recipient);
                MAILCAST_LOG_INFO("WORKER", id << " stopped while retrying " << recipient << ": " << cls.kind);
            }
            env.progress.record(id, send_outcome::cancelled);
            return step::stop;
        }

        const classification cls = env.errors.record(id, err, recipient);
        env.progress.record(id, send_outcome::failed);
        MAILCAST_LOG_WARN("WORKER", id << " failed for " << recipient << ": " << cls.kind << " (" << err.to_string() << ")");
        return cls.policy == recovery_policy::abort_account ? step::abort_account : step::proceed;
    }

    result<message> build_message(worker_state& state, const std::string& recipient)
    {
        const worker_environment& env = *env_;

        message msg;
        msg.from = state.entry.account.address;
        msg.from_name = state.names.next();
        msg.to = recipient;
        msg.subject = pick(state.rng, env.config.subjects);
        msg.body = pick(state.rng, env.config.bodies);

        auto file = env.attachments.build(recipient);
        if (!file)
            return fail<message>(std::move(file).error());
        msg.file = std::move(*file);
        return msg;
    }

    static std::string pick(std::mt19937_64& rng, const std::vector<std::string>& pool)
    {
        if (pool.empty())
            return {};
        std::uniform_int_distribution<std::size_t> dist(0, pool.size() - 1);
        return pool[dist(rng)];
    }

    account_status finish_cancelled(worker_state& state)
    {
        const std::size_t count = mark_remaining(state, send_outcome::cancelled);
        MAILCAST_LOG_INFO("WORKER", state.entry.account << " cancelled, " << count << " recipient(s) untouched");
        return account_status::cancelled;
    }

    std::size_t mark_remaining(worker_state& state, send_outcome outcome)
    {
        const std::size_t total = state.entry.recipients.size();
        const std::size_t count = state.next < total ? total - state.next : 0;
        if (count > 0)
            env_->progress.record(state.entry.account, outcome, count);
        state.next = total;
        return count;
    }

    asio::thread_pool pool_;

    mutable std::mutex mutex_;
    std::unique_ptr<worker_environment> env_;
    std::vector<std::shared_ptr<worker_state>> states_;
    std::atomic<bool> cancelled_{false};

    mutable std::mutex done_mutex_;
    std::condition_variable done_cv_;
    std::size_t active_ = 0;
};

} // namespace mailcast
