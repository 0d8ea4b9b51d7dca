/*

dispatch/campaign_controller.hpp
--------------------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <chrono>
#include <exception>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <mailcast/content/attachment_provider.hpp>
#include <mailcast/core/account.hpp>
#include <mailcast/credentials/credential_store.hpp>
#include <mailcast/detail/asio_decl.hpp>
#include <mailcast/detail/log.hpp>
#include <mailcast/detail/result.hpp>
#include <mailcast/dispatch/campaign_config.hpp>
#include <mailcast/dispatch/campaign_planner.hpp>
#include <mailcast/dispatch/connection_manager.hpp>
#include <mailcast/dispatch/progress.hpp>
#include <mailcast/dispatch/report.hpp>
#include <mailcast/dispatch/worker_pool.hpp>
#include <mailcast/errors/error_classifier.hpp>
#include <mailcast/transport/transport.hpp>

namespace mailcast
{

/**
 * Runs campaigns: plans the assignment, runs one worker per account with work, releases
 * every session and returns the report.
 *
 * run() blocks the calling thread. cancel() and snapshot() may be called from any thread.
 */
class campaign_controller
{
public:
    campaign_controller(transport_registry transports, std::shared_ptr<credential_store> credentials,
        std::shared_ptr<content::attachment_provider> attachments = std::make_shared<content::no_attachments>())
        : transports_(std::move(transports))
        , credentials_(std::move(credentials))
        , attachments_(std::move(attachments))
    {
    }

    campaign_controller(const campaign_controller&) = delete;
    campaign_controller& operator=(const campaign_controller&) = delete;

    /**
     * Run one campaign to completion, cancellation or timeout.
     *
     * @param accounts   Sending accounts in input order; identities must be unique.
     * @param recipients Recipients in input order.
     * @param config     Campaign configuration.
     * @return           Report, or errc::no_accounts / errc::input_invalid /
     *                   errc::config_invalid before anything is sent.
     */
    result<campaign_report> run(const std::vector<account>& accounts, const std::vector<std::string>& recipients,
        const campaign_config& config)
    {
        if (accounts.empty())
            return fail<campaign_report>(errc::no_accounts, "no usable accounts");

        auto valid = config.validate();
        if (!valid)
            return fail<campaign_report>(std::move(valid).error());

        std::set<account_id> seen;
        for (const auto& acc : accounts)
        {
            if (!seen.insert(acc.id).second)
                return fail<campaign_report>(errc::input_invalid, "duplicate account " + acc.id.to_string());
        }

        const assignment plan = campaign_planner::distribute(accounts, recipients, config.mode, config.per_account_cap);
        if (plan.empty())
            return fail<campaign_report>(errc::no_accounts, "no assignment could be built");

        auto progress = std::make_shared<progress_aggregator>();
        auto errors = std::make_shared<error_classifier>();
        std::size_t active = 0;
        for (const auto& entry : plan.entries)
        {
            progress->register_account(entry.account, entry.recipients.size());
            errors->register_account(entry.account);
            if (entry.recipients.empty())
                progress->set_status(entry.account, account_status::completed);
            else
                ++active;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (running_)
                return fail<campaign_report>(errc::invalid_argument, "a campaign is already running");
            running_ = true;
            cancel_requested_ = false;
            progress_ = progress;
        }

        MAILCAST_LOG_INFO("CAMPAIGN", "starting: " << accounts.size() << " account(s), " << recipients.size()
            << " recipient(s), mode " << to_string(config.mode) << ", " << plan.unassigned.size() << " unassigned");

        const auto started = std::chrono::steady_clock::now();
        campaign_report report;
        report.mode = config.mode;
        report.unassigned = plan.unassigned;

        {
            worker_pool pool(active);
            connection_manager connections(pool.executor(), transports_, credentials_, config.retry);
            for (const auto& acc : accounts)
                connections.register_account(acc);

            {
                std::lock_guard<std::mutex> lock(mutex_);
                pool_ = &pool;
                if (cancel_requested_)
                    pool.cancel();
            }

            pool.start(plan, worker_environment{connections, *errors, *progress, *attachments_, config});

            if (config.run_timeout)
            {
                if (!pool.wait_for(*config.run_timeout))
                {
                    MAILCAST_LOG_WARN("CAMPAIGN", "run timeout reached, cancelling");
                    report.timed_out = true;
                    pool.cancel();
                    pool.wait();
                }
            }
            else
            {
                pool.wait();
            }

            {
                std::lock_guard<std::mutex> lock(mutex_);
                pool_ = nullptr;
            }

            try
            {
                asio::co_spawn(pool.executor(), connections.release_all(), asio::use_future).get();
            }
            catch (const std::exception& exc)
            {
                MAILCAST_LOG_ERROR("CAMPAIGN", "releasing sessions failed: " << exc.what());
            }
            pool.join();

            report.cancelled = pool.cancelled();
            report.sessions_opened = connections.sessions_opened();
            report.sessions_closed = connections.sessions_closed();
        }

        progress->freeze();
        report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);

        const progress_snapshot final_state = progress->snapshot();
        report.totals = final_state.totals;
        report.accounts.reserve(final_state.accounts.size());
        for (const auto& p : final_state.accounts)
            report.accounts.push_back(account_report{p, errors->histogram(p.account), errors->history(p.account)});

        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_ = false;
        }

        MAILCAST_LOG_INFO("CAMPAIGN", "finished: sent " << report.totals.sent << ", failed " << report.totals.failed
            << ", skipped " << report.totals.skipped << ", cancelled " << report.totals.cancelled);
        return report;
    }

    /**
     * Stop the current run: no new sends start, pacing and backoff waits end, untouched
     * recipients are counted as cancelled. run() returns once every worker has exited and
     * every session is released. Has no effect when no run is in progress.
     */
    void cancel()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_)
            return;
        cancel_requested_ = true;
        if (pool_ != nullptr)
            pool_->cancel();
    }

    /// Live counters of the current run, or the frozen ones of the last run.
    [[nodiscard]] progress_snapshot snapshot() const
    {
        std::shared_ptr<progress_aggregator> progress;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            progress = progress_;
        }
        if (!progress)
            return {};
        return progress->snapshot();
    }

    [[nodiscard]] bool running() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return running_;
    }

private:
    transport_registry transports_;
    std::shared_ptr<credential_store> credentials_;
    std::shared_ptr<content::attachment_provider> attachments_;

    mutable std::mutex mutex_;
    bool running_ = false;
    bool cancel_requested_ = false;
    worker_pool* pool_ = nullptr;
    std::shared_ptr<progress_aggregator> progress_;
};

} // namespace mailcast
