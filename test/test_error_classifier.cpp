/*

test_error_classifier.cpp
-------------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE error_classifier_test

#include <boost/test/unit_test.hpp>

#include <set>
#include <string>
#include <thread>
#include <vector>

#include <mailcast/errors/error_classifier.hpp>
#include <mailcast/errors/error_kind.hpp>

#include "support/fake_transport.hpp"

using mailcast::classify;
using mailcast::errc;
using mailcast::error_kind;
using mailcast::make_error;
using mailcast::recovery_policy;


namespace
{

mailcast::error_info smtp_error(errc code, int reply, std::string text, std::string enhanced = {})
{
    auto err = make_error(code, std::move(text));
    err.reply_code = reply;
    err.enhanced_status = std::move(enhanced);
    return err;
}

} // namespace


BOOST_AUTO_TEST_CASE(taxonomy_is_closed_and_every_kind_has_one_policy)
{
    std::set<std::string> names;
    for (std::size_t i = 0; i < mailcast::error_kind_count; ++i)
    {
        const auto kind = static_cast<error_kind>(i);
        names.insert(std::string(mailcast::to_string(kind)));
        BOOST_TEST(!mailcast::recovery_hint(kind).empty());
    }
    BOOST_TEST(names.size() == mailcast::error_kind_count);
    BOOST_TEST(mailcast::to_string(error_kind::authentication_failed) == "authentication-failed");

    BOOST_TEST(mailcast::policy_for(error_kind::authentication_failed) == recovery_policy::abort_account);
    BOOST_TEST(mailcast::policy_for(error_kind::quota_exceeded) == recovery_policy::abort_account);
    BOOST_TEST(mailcast::policy_for(error_kind::account_suspended) == recovery_policy::abort_account);
    BOOST_TEST(mailcast::policy_for(error_kind::credential_unavailable) == recovery_policy::abort_account);
    BOOST_TEST(mailcast::policy_for(error_kind::unknown_fatal) == recovery_policy::abort_account);
    BOOST_TEST(mailcast::policy_for(error_kind::worker_internal_error) == recovery_policy::abort_account);
    BOOST_TEST(mailcast::policy_for(error_kind::unsupported_provider) == recovery_policy::abort_account);
    BOOST_TEST(mailcast::policy_for(error_kind::rate_limited) == recovery_policy::retry_same_session);
    BOOST_TEST(mailcast::policy_for(error_kind::connection_timeout) == recovery_policy::reopen_and_retry);
    BOOST_TEST(mailcast::policy_for(error_kind::unknown_transient) == recovery_policy::reopen_and_retry);
    BOOST_TEST(mailcast::policy_for(error_kind::invalid_recipient) == recovery_policy::skip_recipient_continue);
    BOOST_TEST(mailcast::policy_for(error_kind::protocol_rejected) == recovery_policy::skip_recipient_continue);
    BOOST_TEST(mailcast::policy_for(error_kind::attachment_too_large) == recovery_policy::skip_recipient_continue);
}

BOOST_AUTO_TEST_CASE(network_failures)
{
    BOOST_TEST(classify(make_error(errc::net_timeout, "read: timed out")).kind == error_kind::connection_timeout);
    BOOST_TEST(classify(make_error(errc::net_connection_reset, "reset")).kind == error_kind::unknown_transient);
    BOOST_TEST(classify(make_error(errc::net_eof, "eof")).policy == recovery_policy::reopen_and_retry);
    BOOST_TEST(classify(make_error(errc::tls_verify_failed, "certificate verify failed")).kind == error_kind::unknown_fatal);
}

BOOST_AUTO_TEST_CASE(smtp_replies)
{
    BOOST_TEST(classify(mailcast::testing::auth_rejected()).kind == error_kind::authentication_failed);
    BOOST_TEST(classify(mailcast::testing::recipient_rejected()).kind == error_kind::invalid_recipient);
    BOOST_TEST(classify(smtp_error(errc::smtp_rejected_recipient, 450, "Mailbox busy")).kind == error_kind::unknown_transient);
    BOOST_TEST(classify(smtp_error(errc::smtp_data_rejected, 554, "Message rejected")).kind == error_kind::protocol_rejected);
    BOOST_TEST(classify(smtp_error(errc::smtp_message_too_large, 552, "Message size exceeds fixed limit")).kind
        == error_kind::attachment_too_large);
    BOOST_TEST(classify(smtp_error(errc::smtp_service_not_available, 421, "Service not available")).kind
        == error_kind::unknown_transient);
    BOOST_TEST(classify(smtp_error(errc::smtp_permanent_failure, 554, "Transaction failed")).kind == error_kind::unknown_fatal);
}

BOOST_AUTO_TEST_CASE(server_text_refines_kind)
{
    BOOST_TEST(classify(smtp_error(errc::smtp_data_rejected, 550, "Daily user sending quota exceeded", "5.4.5")).kind
        == error_kind::quota_exceeded);
    BOOST_TEST(classify(smtp_error(errc::smtp_auth_failed, 534, "Your account has been disabled")).kind
        == error_kind::account_suspended);
    BOOST_TEST(classify(mailcast::testing::rate_limited()).kind == error_kind::rate_limited);
    BOOST_TEST(classify(smtp_error(errc::smtp_temporary_failure, 421, "Temporary System Problem", "4.7.0")).kind
        == error_kind::rate_limited);
}

BOOST_AUTO_TEST_CASE(recipient_address_in_detail_does_not_leak_into_kind)
{
    auto err = mailcast::testing::recipient_rejected();
    err.detail = "rcpt=blocked.user@example.com\n";
    BOOST_TEST(classify(err).kind == error_kind::invalid_recipient);
}

BOOST_AUTO_TEST_CASE(resource_and_internal_failures)
{
    BOOST_TEST(classify(make_error(errc::credential_unavailable, "no token")).kind == error_kind::credential_unavailable);
    BOOST_TEST(classify(make_error(errc::attachment_too_large, "too big")).kind == error_kind::attachment_too_large);
    BOOST_TEST(classify(make_error(errc::attachment_unavailable, "no files")).kind == error_kind::unknown_transient);
    BOOST_TEST(classify(make_error(errc::provider_unsupported, "unknown domain")).kind == error_kind::unsupported_provider);
    BOOST_TEST(classify(make_error(errc::internal_error, "boom")).kind == error_kind::worker_internal_error);
}

BOOST_AUTO_TEST_CASE(classify_is_idempotent)
{
    const std::vector<mailcast::error_info> inputs = {
        mailcast::testing::auth_rejected(),
        mailcast::testing::connection_reset(),
        mailcast::testing::recipient_rejected(),
        mailcast::testing::rate_limited(),
        make_error(errc::internal_error, "boom"),
    };
    for (const auto& err : inputs)
    {
        const auto first = classify(err);
        for (int i = 0; i < 5; ++i)
            BOOST_TEST((classify(err) == first));
    }
}

BOOST_AUTO_TEST_CASE(history_is_append_only_and_ordered)
{
    mailcast::error_classifier classifier;
    const mailcast::account_id id{"joe@example.com", mailcast::protocol_kind::smtp};
    classifier.register_account(id);

    classifier.record(id, mailcast::testing::recipient_rejected(), "a@example.org");
    classifier.record(id, mailcast::testing::recipient_rejected(), "b@example.org");
    const auto cls = classifier.record(id, mailcast::testing::auth_rejected(), "c@example.org");
    BOOST_TEST(cls.kind == error_kind::authentication_failed);

    const auto history = classifier.history(id);
    BOOST_REQUIRE_EQUAL(history.size(), 3u);
    BOOST_TEST(history[0].recipient == "a@example.org");
    BOOST_TEST(history[1].recipient == "b@example.org");
    BOOST_TEST(history[2].kind == error_kind::authentication_failed);
    BOOST_TEST((history[0].timestamp <= history[2].timestamp));

    const auto hist = classifier.histogram(id);
    BOOST_TEST(hist.at(error_kind::invalid_recipient) == 2u);
    BOOST_TEST(hist.at(error_kind::authentication_failed) == 1u);
    BOOST_TEST(hist.count(error_kind::rate_limited) == 0u);
}

BOOST_AUTO_TEST_CASE(histories_are_per_account_under_concurrency)
{
    mailcast::error_classifier classifier;
    std::vector<mailcast::account_id> ids;
    for (int i = 0; i < 4; ++i)
    {
        ids.push_back(mailcast::account_id{"sender" + std::to_string(i) + "@example.com", mailcast::protocol_kind::smtp});
        classifier.register_account(ids.back());
    }

    std::vector<std::thread> threads;
    for (const auto& id : ids)
    {
        threads.emplace_back([&classifier, id]() {
            for (int n = 0; n < 200; ++n)
                classifier.record(id, mailcast::testing::connection_reset());
        });
    }
    for (auto& t : threads)
        t.join();

    for (const auto& id : ids)
        BOOST_TEST(classifier.size(id) == 200u);
    BOOST_TEST(classifier.histogram().at(error_kind::unknown_transient) == 800u);
}
