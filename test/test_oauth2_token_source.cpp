/*

test_oauth2_token_source.cpp
----------------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE oauth2_token_source_test

#include <boost/test/unit_test.hpp>

#include <chrono>
#include <memory>

#include <mailcast/codec/base64.hpp>
#include <mailcast/credentials/credential_store.hpp>
#include <mailcast/oauth2/token.hpp>
#include <mailcast/oauth2/token_source.hpp>


namespace
{

mailcast::account oauth_account()
{
    mailcast::account acc;
    acc.id = mailcast::account_id{"joe@gmail.com", mailcast::protocol_kind::smtp_oauth2};
    acc.credential_ref = "joe";
    return acc;
}

} // namespace


BOOST_AUTO_TEST_CASE(refresh_called_when_expired)
{
    int calls = 0;
    const auto now = std::chrono::system_clock::now();
    mailcast::oauth2::token initial{"old_access", "refresh", now - std::chrono::minutes{5}};

    mailcast::oauth2::token_source source(initial,
        [&](const mailcast::oauth2::token& current) -> mailcast::result<mailcast::oauth2::token> {
            ++calls;
            BOOST_TEST(current.access_token == "old_access");
            mailcast::oauth2::token refreshed{
                "new_access",
                current.refresh_token,
                std::chrono::system_clock::now() + std::chrono::hours{1}};
            return mailcast::ok(refreshed);
        });

    auto res = source.get_access_token();
    BOOST_TEST(calls == 1);
    BOOST_TEST(res.has_value());
    BOOST_TEST(res.value() == "new_access");
    BOOST_TEST(source.refresh_count() == 1u);
}

BOOST_AUTO_TEST_CASE(refresh_not_called_when_valid)
{
    int calls = 0;
    const auto now = std::chrono::system_clock::now();
    mailcast::oauth2::token initial{"access", "refresh", now + std::chrono::minutes{10}};

    mailcast::oauth2::token_source source(initial,
        [&](const mailcast::oauth2::token&) -> mailcast::result<mailcast::oauth2::token> {
            ++calls;
            return mailcast::fail<mailcast::oauth2::token>(
                mailcast::errc::net_io_failed,
                "refresh should not be called");
        });

    auto res = source.get_access_token();
    BOOST_TEST(calls == 0);
    BOOST_TEST(res.has_value());
    BOOST_TEST(res.value() == "access");
}

BOOST_AUTO_TEST_CASE(refresh_error_becomes_credential_unavailable)
{
    int calls = 0;
    const auto now = std::chrono::system_clock::now();
    mailcast::oauth2::token initial{"access", "refresh", now - std::chrono::minutes{1}};

    mailcast::oauth2::token_source source(initial,
        [&](const mailcast::oauth2::token&) -> mailcast::result<mailcast::oauth2::token> {
            ++calls;
            return mailcast::fail<mailcast::oauth2::token>(
                mailcast::errc::net_io_failed,
                "refresh failed");
        });

    auto res = source.get_access_token();
    BOOST_TEST(calls == 1);
    BOOST_TEST(!res.has_value());
    BOOST_TEST(mailcast::to_string(res.error().code) == "credential_unavailable");
    BOOST_TEST(res.error().message == "refresh failed");
}

BOOST_AUTO_TEST_CASE(forced_refresh_ignores_expiry)
{
    int calls = 0;
    const auto now = std::chrono::system_clock::now();
    mailcast::oauth2::token initial{"access", "refresh", now + std::chrono::hours{1}};

    mailcast::oauth2::token_source source(initial,
        [&](const mailcast::oauth2::token& current) -> mailcast::result<mailcast::oauth2::token> {
            ++calls;
            return mailcast::ok(mailcast::oauth2::token{"rotated", current.refresh_token, current.expires_at});
        });

    auto res = source.refresh_access_token();
    BOOST_TEST(calls == 1);
    BOOST_TEST(res.value() == "rotated");
}

BOOST_AUTO_TEST_CASE(missing_refresh_function)
{
    const auto now = std::chrono::system_clock::now();
    mailcast::oauth2::token_source source(
        mailcast::oauth2::token{"access", "", now - std::chrono::minutes{1}}, nullptr);

    auto res = source.get_access_token();
    BOOST_TEST(!res.has_value());
    BOOST_TEST(res.error().code == mailcast::errc::credential_unavailable);
}

BOOST_AUTO_TEST_CASE(xoauth2_initial_response_format)
{
    const std::string encoded = mailcast::oauth2::xoauth2_initial_response("joe@gmail.com", "ya29.token");
    const auto decoded = mailcast::codec::base64_decode(encoded);
    BOOST_REQUIRE(decoded.has_value());
    BOOST_TEST(*decoded == std::string("user=joe@gmail.com\x01" "auth=Bearer ya29.token\x01\x01"));
}

BOOST_AUTO_TEST_CASE(credential_store_uses_token_source)
{
    const auto now = std::chrono::system_clock::now();
    auto source = std::make_shared<mailcast::oauth2::token_source>(
        mailcast::oauth2::token{"first", "refresh", now + std::chrono::hours{1}},
        [](const mailcast::oauth2::token& current) -> mailcast::result<mailcast::oauth2::token> {
            return mailcast::ok(mailcast::oauth2::token{"second", current.refresh_token, current.expires_at});
        });

    mailcast::oauth2_credential_store store;
    store.add_token_source("joe", source);

    const auto acc = oauth_account();
    auto cred = store.resolve(acc);
    BOOST_REQUIRE(cred.has_value());
    BOOST_TEST(cred->secret == "first");
    BOOST_TEST(cred->username == "joe@gmail.com");
    BOOST_TEST((cred->kind == mailcast::credential::kind_t::oauth2_token));

    auto refreshed = store.refresh(acc);
    BOOST_REQUIRE(refreshed.has_value());
    BOOST_TEST(refreshed->secret == "second");
}

BOOST_AUTO_TEST_CASE(static_store_without_entry)
{
    mailcast::static_credential_store store;
    auto cred = store.resolve(oauth_account());
    BOOST_TEST(!cred.has_value());
    BOOST_TEST(cred.error().code == mailcast::errc::credential_unavailable);

    auto refreshed = store.refresh(oauth_account());
    BOOST_TEST(!refreshed.has_value());
}
