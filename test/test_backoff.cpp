/*

test_backoff.cpp
----------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE backoff_test

#include <boost/test/unit_test.hpp>

#include <chrono>

#include <mailcast/detail/backoff.hpp>

using mailcast::detail::retry_policy;
using std::chrono::milliseconds;


BOOST_AUTO_TEST_CASE(default_schedule)
{
    const retry_policy policy;
    BOOST_TEST(policy.max_attempts == 3u);
    BOOST_TEST(policy.delay(1).count() == 1000);
    BOOST_TEST(policy.delay(2).count() == 2000);
    BOOST_TEST(policy.delay(3).count() == 4000);
}

BOOST_AUTO_TEST_CASE(delay_is_capped)
{
    retry_policy policy;
    policy.initial_delay = milliseconds{1000};
    policy.max_delay = milliseconds{5000};
    BOOST_TEST(policy.delay(3).count() == 4000);
    BOOST_TEST(policy.delay(4).count() == 5000);
    BOOST_TEST(policy.delay(20).count() == 5000);
}

BOOST_AUTO_TEST_CASE(attempt_budget_includes_first_try)
{
    const retry_policy policy;
    BOOST_TEST(policy.should_retry(1));
    BOOST_TEST(policy.should_retry(2));
    BOOST_TEST(!policy.should_retry(3));

    BOOST_TEST(!retry_policy::none().should_retry(1));
}

BOOST_AUTO_TEST_CASE(same_attempt_same_delay)
{
    const retry_policy policy;
    for (unsigned int n = 1; n < 6; ++n)
        BOOST_TEST(policy.delay(n).count() == policy.delay(n).count());
}

BOOST_AUTO_TEST_CASE(jitter_stays_in_band)
{
    retry_policy policy;
    policy.jitter_factor = 0.25;
    for (int i = 0; i < 50; ++i)
    {
        const auto d = policy.delay(2).count();
        BOOST_TEST(d >= 1500);
        BOOST_TEST(d <= 2500);
    }
}

BOOST_AUTO_TEST_CASE(immediate_preset)
{
    const auto policy = retry_policy::immediate(4);
    BOOST_TEST(policy.max_attempts == 4u);
    BOOST_TEST(policy.delay(1).count() == 1);
    BOOST_TEST(policy.delay(10).count() == 5);
}
