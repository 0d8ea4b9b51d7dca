/*

test_campaign_controller.cpp
----------------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE campaign_controller_test

#include <boost/test/unit_test.hpp>

#include <algorithm>
#include <chrono>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <mailcast/dispatch/campaign_controller.hpp>

#include "support/fake_transport.hpp"

using mailcast::account_status;
using mailcast::campaign_config;
using mailcast::campaign_controller;
using mailcast::errc;
using mailcast::error_kind;
using mailcast::testing::fake_script;
using mailcast::testing::fake_transport;
using mailcast::testing::make_accounts;
using mailcast::testing::make_recipients;


namespace
{

struct harness
{
    explicit harness(std::size_t account_count,
        std::shared_ptr<mailcast::content::attachment_provider> attachments = std::make_shared<mailcast::content::no_attachments>())
        : script(std::make_shared<fake_script>())
        , accounts(make_accounts(account_count))
        , controller(mailcast::transport_registry::single(std::make_shared<fake_transport>(script)),
              mailcast::testing::make_store(accounts), std::move(attachments))
    {
    }

    std::shared_ptr<fake_script> script;
    std::vector<mailcast::account> accounts;
    campaign_controller controller;
};

// every assigned recipient ends in exactly one bucket
void check_accounted(const mailcast::campaign_report& report)
{
    for (const auto& a : report.accounts)
    {
        const auto& p = a.progress;
        BOOST_TEST(p.sent + p.failed + p.skipped + p.cancelled == p.assigned);
        BOOST_TEST(p.attempted == p.sent + p.failed);
        BOOST_TEST(mailcast::is_terminal(p.status));
    }
    BOOST_TEST(report.sessions_opened == report.sessions_closed);
}

class failing_attachments : public mailcast::content::attachment_provider
{
public:
    explicit failing_attachments(std::string victim)
        : victim_(std::move(victim))
    {
    }

    mailcast::result<std::optional<mailcast::attachment>> build(const std::string& recipient) override
    {
        if (recipient == victim_)
            return mailcast::fail<std::optional<mailcast::attachment>>(mailcast::errc::attachment_too_large, "too big");
        return std::optional<mailcast::attachment>{mailcast::attachment{"a.txt", "text/plain", "hello"}};
    }

private:
    std::string victim_;
};

class throwing_attachments : public mailcast::content::attachment_provider
{
public:
    explicit throwing_attachments(std::string victim)
        : victim_(std::move(victim))
    {
    }

    mailcast::result<std::optional<mailcast::attachment>> build(const std::string& recipient) override
    {
        if (recipient == victim_)
            throw std::runtime_error("attachment index corrupted");
        return std::optional<mailcast::attachment>{};
    }

private:
    std::string victim_;
};

} // namespace


BOOST_AUTO_TEST_CASE(all_recipients_delivered_once)
{
    harness h(3);
    const auto recipients = make_recipients(10);

    auto report = h.controller.run(h.accounts, recipients, campaign_config::fast_test());
    BOOST_REQUIRE(report.has_value());

    BOOST_TEST(report->totals.sent == 10u);
    BOOST_TEST(report->totals.failed == 0u);
    BOOST_TEST(report->unassigned.empty());
    BOOST_TEST(!report->cancelled);
    BOOST_REQUIRE_EQUAL(report->accounts.size(), 3u);
    BOOST_TEST(report->accounts[0].progress.sent == 4u);
    BOOST_TEST(report->accounts[1].progress.sent == 3u);
    BOOST_TEST(report->accounts[2].progress.sent == 3u);
    for (const auto& a : report->accounts)
        BOOST_TEST(a.progress.status == account_status::completed);

    std::multiset<std::string> delivered;
    for (const auto& [from, to] : h.script->deliveries())
        delivered.insert(to);
    BOOST_TEST(delivered.size() == 10u);
    for (const auto& r : recipients)
        BOOST_TEST(delivered.count(r) == 1u);

    // one session per account, closed at the end
    BOOST_TEST(h.script->opened_count() == 3u);
    BOOST_TEST(h.script->closed_count() == 3u);
    check_accounted(*report);
    BOOST_TEST(!h.controller.running());
    BOOST_TEST(h.controller.snapshot().frozen);
}

BOOST_AUTO_TEST_CASE(rejected_authentication_fails_one_account_only)
{
    harness h(3);
    h.script->on_open = [](const mailcast::account& acc, const mailcast::credential&) -> std::optional<mailcast::error_info> {
        if (acc.address() == "sender0@example.com")
            return mailcast::testing::auth_rejected();
        return std::nullopt;
    };

    auto report = h.controller.run(h.accounts, make_recipients(10), campaign_config::fast_test());
    BOOST_REQUIRE(report.has_value());

    const auto* failed = report->find(h.accounts[0].id);
    BOOST_REQUIRE(failed != nullptr);
    BOOST_TEST(failed->progress.status == account_status::failed);
    BOOST_TEST(failed->progress.attempted == 1u);
    BOOST_TEST(failed->progress.failed == 1u);
    BOOST_TEST(failed->progress.skipped == 3u);
    BOOST_TEST(failed->errors.at(error_kind::authentication_failed) == 1u);
    BOOST_REQUIRE_EQUAL(failed->history.size(), 1u);
    BOOST_TEST(failed->history[0].recipient == "rcpt0@example.org");

    BOOST_TEST(report->find(h.accounts[1].id)->progress.sent == 3u);
    BOOST_TEST(report->find(h.accounts[2].id)->progress.sent == 3u);
    BOOST_TEST(report->totals.sent == 6u);
    check_accounted(*report);
}

BOOST_AUTO_TEST_CASE(rejected_authentication_on_send_stops_after_one_attempt)
{
    harness h(1);
    h.script->on_send = [](const mailcast::account&, const mailcast::message&) -> std::optional<mailcast::error_info> {
        return mailcast::testing::auth_rejected();
    };

    auto report = h.controller.run(h.accounts, make_recipients(5), campaign_config::fast_test());
    BOOST_REQUIRE(report.has_value());

    const auto& acc = report->accounts.at(0);
    BOOST_TEST(h.script->attempts_for("sender0@example.com") == 1u);
    BOOST_TEST(acc.progress.status == account_status::failed);
    BOOST_TEST(acc.progress.attempted == 1u);
    BOOST_TEST(acc.progress.failed == 1u);
    BOOST_TEST(acc.progress.skipped == 4u);
    BOOST_TEST(acc.progress.sent == 0u);
    BOOST_TEST(acc.errors.at(error_kind::authentication_failed) == 1u);
    BOOST_TEST(h.script->deliveries().empty());
    check_accounted(*report);
}

BOOST_AUTO_TEST_CASE(exception_in_worker_aborts_the_account)
{
    harness h(1, std::make_shared<throwing_attachments>("rcpt1@example.org"));

    auto report = h.controller.run(h.accounts, make_recipients(4), campaign_config::fast_test());
    BOOST_REQUIRE(report.has_value());

    const auto& acc = report->accounts.at(0);
    BOOST_TEST(acc.progress.sent == 1u);
    BOOST_TEST(acc.progress.failed == 1u);
    BOOST_TEST(acc.progress.skipped == 2u);
    BOOST_TEST(acc.progress.status == account_status::failed);
    BOOST_TEST(acc.errors.at(error_kind::worker_internal_error) == 1u);
    BOOST_REQUIRE_EQUAL(acc.history.size(), 1u);
    BOOST_TEST(acc.history[0].recipient == "rcpt1@example.org");
    BOOST_TEST(h.script->opened_count() == h.script->closed_count());
    check_accounted(*report);
}

BOOST_AUTO_TEST_CASE(rejected_recipient_does_not_stop_the_account)
{
    harness h(1);
    h.script->on_send = [](const mailcast::account&, const mailcast::message& msg) -> std::optional<mailcast::error_info> {
        if (msg.to == "rcpt1@example.org")
            return mailcast::testing::recipient_rejected();
        return std::nullopt;
    };

    auto report = h.controller.run(h.accounts, make_recipients(4), campaign_config::fast_test());
    BOOST_REQUIRE(report.has_value());
    BOOST_TEST(report->totals.sent == 3u);
    BOOST_TEST(report->totals.failed == 1u);
    BOOST_TEST(report->accounts[0].progress.status == account_status::completed);
    BOOST_TEST(report->errors().at(error_kind::invalid_recipient) == 1u);
    BOOST_TEST(h.script->opened_count() == 1u);
    check_accounted(*report);
}

BOOST_AUTO_TEST_CASE(sends_are_paced_per_account)
{
    harness h(2);
    auto config = campaign_config::fast_test();
    config.send_delay = std::chrono::milliseconds{60};

    auto report = h.controller.run(h.accounts, make_recipients(8), config);
    BOOST_REQUIRE(report.has_value());
    BOOST_TEST(report->totals.sent == 8u);

    for (const auto& acc : h.accounts)
    {
        const auto starts = h.script->starts_for(acc.address());
        BOOST_REQUIRE_EQUAL(starts.size(), 4u);
        for (std::size_t i = 1; i < starts.size(); ++i)
        {
            const auto gap = std::chrono::duration_cast<std::chrono::milliseconds>(starts[i] - starts[i - 1]);
            BOOST_TEST(gap.count() >= 50);
        }
    }
}

BOOST_AUTO_TEST_CASE(cancel_from_another_thread)
{
    harness h(2);
    auto config = campaign_config::fast_test();
    config.send_delay = std::chrono::milliseconds{200};

    std::thread canceller([&h]() {
        std::this_thread::sleep_for(std::chrono::milliseconds{350});
        h.controller.cancel();
    });
    const auto started = std::chrono::steady_clock::now();
    auto report = h.controller.run(h.accounts, make_recipients(40), config);
    const auto elapsed = std::chrono::steady_clock::now() - started;
    canceller.join();

    BOOST_REQUIRE(report.has_value());
    BOOST_TEST(report->cancelled);
    BOOST_TEST(!report->timed_out);
    BOOST_TEST(report->totals.cancelled > 0u);
    BOOST_TEST(report->totals.sent < 40u);
    for (const auto& a : report->accounts)
        BOOST_TEST(a.progress.status == account_status::cancelled);
    check_accounted(*report);
    BOOST_TEST(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() < 3000);
}

BOOST_AUTO_TEST_CASE(cancel_during_retry_keeps_the_cause)
{
    harness h(1);
    h.script->on_send = [](const mailcast::account&, const mailcast::message&) -> std::optional<mailcast::error_info> {
        return mailcast::testing::connection_reset();
    };
    auto config = campaign_config::fast_test();
    config.retry.max_attempts = 5;
    config.retry.initial_delay = std::chrono::seconds{10};
    config.retry.max_delay = std::chrono::seconds{10};

    std::thread canceller([&h]() {
        std::this_thread::sleep_for(std::chrono::milliseconds{200});
        h.controller.cancel();
    });
    auto report = h.controller.run(h.accounts, make_recipients(3), config);
    canceller.join();

    BOOST_REQUIRE(report.has_value());
    const auto& acc = report->accounts.at(0);
    BOOST_TEST(acc.progress.status == account_status::cancelled);
    BOOST_TEST(acc.progress.cancelled == 3u);
    BOOST_TEST(acc.progress.failed == 0u);
    BOOST_TEST(acc.errors.at(error_kind::unknown_transient) == 1u);
    BOOST_REQUIRE_EQUAL(acc.history.size(), 1u);
    BOOST_TEST(acc.history[0].code == errc::net_connection_reset);
    BOOST_TEST(acc.history[0].recipient == "rcpt0@example.org");
    check_accounted(*report);
}

BOOST_AUTO_TEST_CASE(cancel_without_run_is_ignored)
{
    harness h(1);
    h.controller.cancel();
    auto report = h.controller.run(h.accounts, make_recipients(2), campaign_config::fast_test());
    BOOST_REQUIRE(report.has_value());
    BOOST_TEST(!report->cancelled);
    BOOST_TEST(report->totals.sent == 2u);
}

BOOST_AUTO_TEST_CASE(run_timeout_cancels_the_rest)
{
    harness h(1);
    auto config = campaign_config::fast_test();
    config.send_delay = std::chrono::milliseconds{100};
    config.run_timeout = std::chrono::milliseconds{250};

    auto report = h.controller.run(h.accounts, make_recipients(50), config);
    BOOST_REQUIRE(report.has_value());
    BOOST_TEST(report->timed_out);
    BOOST_TEST(report->totals.cancelled > 0u);
    BOOST_TEST(report->totals.sent < 50u);
    check_accounted(*report);
    BOOST_TEST(mailcast::render_text(*report).find("run timeout reached") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(attachment_failure_skips_only_that_recipient)
{
    harness h(1, std::make_shared<failing_attachments>("rcpt1@example.org"));

    auto report = h.controller.run(h.accounts, make_recipients(3), campaign_config::fast_test());
    BOOST_REQUIRE(report.has_value());
    BOOST_TEST(report->totals.sent == 2u);
    BOOST_TEST(report->totals.failed == 1u);
    BOOST_TEST(report->accounts[0].progress.status == account_status::completed);
    BOOST_REQUIRE_EQUAL(report->accounts[0].history.size(), 1u);
    BOOST_TEST(report->accounts[0].history[0].kind == error_kind::attachment_too_large);
    BOOST_TEST(report->accounts[0].history[0].recipient == "rcpt1@example.org");
    check_accounted(*report);
}

BOOST_AUTO_TEST_CASE(broadcast_sends_full_list_from_every_account)
{
    harness h(2);
    auto config = campaign_config::fast_test();
    config.mode = mailcast::distribution_mode::broadcast;

    auto report = h.controller.run(h.accounts, make_recipients(3), config);
    BOOST_REQUIRE(report.has_value());
    BOOST_TEST(report->totals.sent == 6u);
    BOOST_TEST(report->mode == mailcast::distribution_mode::broadcast);

    const auto deliveries = h.script->deliveries();
    for (const auto& acc : h.accounts)
    {
        const auto n = std::count_if(deliveries.begin(), deliveries.end(),
            [&acc](const auto& d) { return d.first == acc.address(); });
        BOOST_TEST(n == 3);
    }
}

BOOST_AUTO_TEST_CASE(cap_leaves_recipients_unassigned)
{
    harness h(2);
    auto config = campaign_config::fast_test();
    config.per_account_cap = 2;

    auto report = h.controller.run(h.accounts, make_recipients(5), config);
    BOOST_REQUIRE(report.has_value());
    BOOST_TEST(report->totals.sent == 4u);
    BOOST_REQUIRE_EQUAL(report->unassigned.size(), 1u);
    BOOST_TEST(report->unassigned[0] == "rcpt4@example.org");
}

BOOST_AUTO_TEST_CASE(messages_use_configured_content)
{
    harness h(1);
    auto config = campaign_config::fast_test();
    config.subjects = {"Quarterly update"};
    config.bodies = {"Hello there"};
    auto seen = std::make_shared<std::vector<std::string>>();
    h.script->on_send = [seen](const mailcast::account&, const mailcast::message& msg) -> std::optional<mailcast::error_info> {
        seen->push_back(msg.subject + "|" + msg.body + "|" + msg.from);
        return std::nullopt;
    };

    auto report = h.controller.run(h.accounts, make_recipients(2), config);
    BOOST_REQUIRE(report.has_value());
    BOOST_REQUIRE_EQUAL(seen->size(), 2u);
    for (const auto& s : *seen)
        BOOST_TEST(s == "Quarterly update|Hello there|sender0@example.com");
}

BOOST_AUTO_TEST_CASE(zero_recipients_completes_immediately)
{
    harness h(2);
    auto report = h.controller.run(h.accounts, {}, campaign_config::fast_test());
    BOOST_REQUIRE(report.has_value());
    BOOST_TEST(report->totals.assigned == 0u);
    for (const auto& a : report->accounts)
        BOOST_TEST(a.progress.status == account_status::completed);
    BOOST_TEST(h.script->opened_count() == 0u);
}

BOOST_AUTO_TEST_CASE(rejected_inputs)
{
    harness h(2);

    auto none = h.controller.run({}, make_recipients(3), campaign_config::fast_test());
    BOOST_REQUIRE(!none.has_value());
    BOOST_TEST(none.error().code == errc::no_accounts);

    auto twice = h.accounts;
    twice.push_back(h.accounts[0]);
    auto dup = h.controller.run(twice, make_recipients(3), campaign_config::fast_test());
    BOOST_REQUIRE(!dup.has_value());
    BOOST_TEST(dup.error().code == errc::input_invalid);

    auto config = campaign_config::fast_test();
    config.subjects.clear();
    auto bad = h.controller.run(h.accounts, make_recipients(3), config);
    BOOST_REQUIRE(!bad.has_value());
    BOOST_TEST(bad.error().code == errc::config_invalid);

    BOOST_TEST(h.script->open_attempts == 0u);
}

BOOST_AUTO_TEST_CASE(controller_can_run_again)
{
    harness h(2);
    BOOST_TEST(h.controller.run(h.accounts, make_recipients(4), campaign_config::fast_test())->totals.sent == 4u);
    BOOST_TEST(h.controller.run(h.accounts, make_recipients(4), campaign_config::fast_test())->totals.sent == 4u);
    BOOST_TEST(h.script->deliveries().size() == 8u);
}
