/*

test_campaign_planner.cpp
-------------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE campaign_planner_test

#include <boost/test/unit_test.hpp>

#include <set>
#include <string>
#include <vector>

#include <mailcast/dispatch/campaign_planner.hpp>

#include "support/fake_transport.hpp"

using mailcast::campaign_planner;
using mailcast::distribution_mode;
using mailcast::testing::make_accounts;
using mailcast::testing::make_recipients;


BOOST_AUTO_TEST_CASE(three_accounts_ten_recipients)
{
    const auto accounts = make_accounts(3);
    const auto recipients = make_recipients(10);

    const auto plan = campaign_planner::distribute(accounts, recipients, distribution_mode::distribute);

    BOOST_REQUIRE_EQUAL(plan.entries.size(), 3u);
    BOOST_TEST(plan.entries[0].recipients.size() == 4u);
    BOOST_TEST(plan.entries[1].recipients.size() == 3u);
    BOOST_TEST(plan.entries[2].recipients.size() == 3u);
    BOOST_TEST(plan.unassigned.empty());

    std::set<std::string> seen;
    for (const auto& entry : plan.entries)
    {
        for (const auto& r : entry.recipients)
            BOOST_TEST(seen.insert(r).second);
    }
    BOOST_TEST(seen.size() == recipients.size());
}

BOOST_AUTO_TEST_CASE(slices_follow_input_order)
{
    const auto accounts = make_accounts(2);
    const auto recipients = make_recipients(5);

    const auto plan = campaign_planner::distribute(accounts, recipients, distribution_mode::distribute);

    BOOST_REQUIRE_EQUAL(plan.entries.size(), 2u);
    BOOST_TEST(plan.entries[0].account == accounts[0].id);
    BOOST_TEST(plan.entries[0].recipients == std::vector<std::string>(recipients.begin(), recipients.begin() + 3));
    BOOST_TEST(plan.entries[1].recipients == std::vector<std::string>(recipients.begin() + 3, recipients.end()));
}

BOOST_AUTO_TEST_CASE(union_is_recipient_set_for_many_shapes)
{
    for (std::size_t a = 1; a <= 7; ++a)
    {
        for (std::size_t r = a; r <= 40; r += 3)
        {
            const auto accounts = make_accounts(a);
            const auto recipients = make_recipients(r);
            const auto plan = campaign_planner::distribute(accounts, recipients, distribution_mode::distribute);

            std::vector<std::string> joined;
            for (const auto& entry : plan.entries)
                joined.insert(joined.end(), entry.recipients.begin(), entry.recipients.end());
            BOOST_TEST(joined == recipients);
            BOOST_TEST(plan.unassigned.empty());
        }
    }
}

BOOST_AUTO_TEST_CASE(cap_truncates_without_reassigning)
{
    const auto accounts = make_accounts(3);
    const auto recipients = make_recipients(10);

    const auto plan = campaign_planner::distribute(accounts, recipients, distribution_mode::distribute, 2);

    BOOST_REQUIRE_EQUAL(plan.entries.size(), 3u);
    for (const auto& entry : plan.entries)
        BOOST_TEST(entry.recipients.size() == 2u);
    BOOST_TEST(plan.assigned_count() == 6u);
    BOOST_REQUIRE_EQUAL(plan.unassigned.size(), 4u);
    BOOST_TEST(plan.unassigned.front() == recipients[6]);
    BOOST_TEST(plan.unassigned.back() == recipients[9]);
}

BOOST_AUTO_TEST_CASE(cap_of_zero_leaves_everyone_unassigned)
{
    const auto plan = campaign_planner::distribute(make_accounts(2), make_recipients(5), distribution_mode::distribute, 0);
    BOOST_TEST(plan.assigned_count() == 0u);
    BOOST_TEST(plan.unassigned.size() == 5u);
}

BOOST_AUTO_TEST_CASE(broadcast_gives_everyone_the_full_list)
{
    const auto accounts = make_accounts(4);
    const auto recipients = make_recipients(7);

    const auto plan = campaign_planner::distribute(accounts, recipients, distribution_mode::broadcast, 2);

    BOOST_REQUIRE_EQUAL(plan.entries.size(), 4u);
    for (const auto& entry : plan.entries)
        BOOST_TEST(entry.recipients == recipients);
    BOOST_TEST(plan.unassigned.empty());
}

BOOST_AUTO_TEST_CASE(zero_accounts_yields_empty_assignment)
{
    const auto recipients = make_recipients(3);
    const auto plan = campaign_planner::distribute({}, recipients, distribution_mode::distribute);
    BOOST_TEST(plan.empty());
    BOOST_TEST(plan.unassigned == recipients);
}

BOOST_AUTO_TEST_CASE(zero_recipients_gives_empty_lists)
{
    const auto plan = campaign_planner::distribute(make_accounts(3), {}, distribution_mode::distribute);
    BOOST_REQUIRE_EQUAL(plan.entries.size(), 3u);
    for (const auto& entry : plan.entries)
        BOOST_TEST(entry.recipients.empty());
}

BOOST_AUTO_TEST_CASE(more_accounts_than_recipients)
{
    const auto plan = campaign_planner::distribute(make_accounts(5), make_recipients(2), distribution_mode::distribute);
    BOOST_REQUIRE_EQUAL(plan.entries.size(), 5u);
    BOOST_TEST(plan.entries[0].recipients.size() == 1u);
    BOOST_TEST(plan.entries[1].recipients.size() == 1u);
    BOOST_TEST(plan.entries[2].recipients.empty());
    BOOST_TEST(plan.assigned_count() == 2u);
}

BOOST_AUTO_TEST_CASE(identical_inputs_identical_plan)
{
    const auto accounts = make_accounts(4);
    const auto recipients = make_recipients(23);

    const auto first = campaign_planner::distribute(accounts, recipients, distribution_mode::distribute, 5);
    const auto second = campaign_planner::distribute(accounts, recipients, distribution_mode::distribute, 5);

    BOOST_REQUIRE_EQUAL(first.entries.size(), second.entries.size());
    for (std::size_t i = 0; i < first.entries.size(); ++i)
    {
        BOOST_TEST(first.entries[i].account == second.entries[i].account);
        BOOST_TEST(first.entries[i].recipients == second.entries[i].recipients);
    }
    BOOST_TEST(first.unassigned == second.unassigned);
}

BOOST_AUTO_TEST_CASE(mode_names)
{
    BOOST_TEST(mailcast::to_string(distribution_mode::broadcast) == "broadcast");
    BOOST_TEST(mailcast::distribution_mode_from_string("distribute").value() == distribution_mode::distribute);
    BOOST_TEST(!mailcast::distribution_mode_from_string("round-robin").has_value());
}
