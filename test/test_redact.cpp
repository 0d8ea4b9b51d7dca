/*

test_redact.cpp
---------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE redact_test

#include <boost/test/unit_test.hpp>
#include <mailcast/detail/redact.hpp>


BOOST_AUTO_TEST_CASE(redact_auth_plain)
{
    BOOST_TEST(mailcast::detail::redact_line("AUTH PLAIN dGVzdA==") == "AUTH PLAIN <redacted>");
}

BOOST_AUTO_TEST_CASE(redact_auth_xoauth2_keeps_crlf)
{
    BOOST_TEST(mailcast::detail::redact_line("AUTH XOAUTH2 dXNlcj1qb2VAZXhhbXBsZS5jb20BYXV0aD1CZWFyZXIgeHl6AQE=\r\n")
        == "AUTH XOAUTH2 <redacted>\r\n");
}

BOOST_AUTO_TEST_CASE(redact_login_continuation)
{
    BOOST_TEST(mailcast::detail::redact_line("am9lQGV4YW1wbGUuY29t") == "<redacted>");
    BOOST_TEST(mailcast::detail::redact_line("c2VjcmV0\r\n") == "<redacted>\r\n");
}

BOOST_AUTO_TEST_CASE(plain_commands_untouched)
{
    BOOST_TEST(mailcast::detail::redact_line("AUTH LOGIN") == "AUTH LOGIN");
    BOOST_TEST(mailcast::detail::redact_line("QUIT\r\n") == "QUIT\r\n");
    BOOST_TEST(mailcast::detail::redact_line("NOOP") == "NOOP");
    BOOST_TEST(mailcast::detail::redact_line("MAIL FROM:<joe@example.com>") == "MAIL FROM:<joe@example.com>");
}

BOOST_AUTO_TEST_CASE(mask_secret_keeps_prefix)
{
    BOOST_TEST(mailcast::detail::mask_secret("hunter2") == "hu*****");
    BOOST_TEST(mailcast::detail::mask_secret("ab") == "**");
}
