/*

test_input_files.cpp
--------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE input_files_test

#include <boost/test/unit_test.hpp>

#include <sstream>
#include <string>

#include <mailcast/io/input_files.hpp>

using mailcast::errc;
using mailcast::protocol_kind;


namespace
{

mailcast::result<mailcast::io::account_list> accounts_from(const std::string& text)
{
    std::istringstream in(text);
    return mailcast::io::parse_accounts(in);
}

mailcast::result<std::vector<std::string>> recipients_from(const std::string& text)
{
    std::istringstream in(text);
    return mailcast::io::parse_recipients(in);
}

} // namespace


BOOST_AUTO_TEST_CASE(accounts_in_file_order)
{
    const auto list = accounts_from(
        "joe@example.com,hunter2\n"
        "\n"
        "  ann@gmail.com , ya29.token , oauth2 \n"
        "bob@example.net,pa,ss,word\n");
    BOOST_REQUIRE(list.has_value());
    BOOST_REQUIRE_EQUAL(list->accounts.size(), 3u);

    BOOST_TEST(list->accounts[0].address() == "joe@example.com");
    BOOST_TEST(list->accounts[0].protocol() == protocol_kind::smtp);
    BOOST_TEST(list->accounts[1].address() == "ann@gmail.com");
    BOOST_TEST(list->accounts[1].protocol() == protocol_kind::smtp_oauth2);
    BOOST_TEST(list->accounts[2].address() == "bob@example.net");

    BOOST_REQUIRE_EQUAL(list->credentials.size(), 3u);
    BOOST_TEST(list->credentials[0].second.secret == "hunter2");
    BOOST_TEST(list->credentials[1].second.secret == "ya29.token");
    BOOST_TEST((list->credentials[1].second.kind == mailcast::credential::kind_t::oauth2_token));
    BOOST_TEST(list->credentials[2].second.secret == "pa,ss,word");
}

BOOST_AUTO_TEST_CASE(explicit_smtp_field_is_stripped)
{
    const auto list = accounts_from("joe@example.com,secret,SMTP\n");
    BOOST_REQUIRE(list.has_value());
    BOOST_TEST(list->credentials[0].second.secret == "secret");
    BOOST_TEST(list->accounts[0].protocol() == protocol_kind::smtp);
}

BOOST_AUTO_TEST_CASE(duplicate_accounts_are_dropped)
{
    const auto list = accounts_from("joe@example.com,one\njoe@example.com,two\n");
    BOOST_REQUIRE(list.has_value());
    BOOST_REQUIRE_EQUAL(list->accounts.size(), 1u);
    BOOST_TEST(list->credentials[0].second.secret == "one");
}

BOOST_AUTO_TEST_CASE(installed_credentials_resolve)
{
    const auto list = accounts_from("joe@example.com,hunter2\n");
    BOOST_REQUIRE(list.has_value());

    mailcast::static_credential_store store;
    list->install(store);
    const auto cred = store.resolve(list->accounts[0]);
    BOOST_REQUIRE(cred.has_value());
    BOOST_TEST(cred->username == "joe@example.com");
    BOOST_TEST(cred->secret == "hunter2");
}

BOOST_AUTO_TEST_CASE(malformed_account_lines)
{
    auto no_comma = accounts_from("joe@example.com,ok\njoe@example.com\n");
    BOOST_REQUIRE(!no_comma.has_value());
    BOOST_TEST(no_comma.error().code == errc::input_invalid);
    BOOST_TEST(no_comma.error().message == "line 2: missing comma");

    auto empty_secret = accounts_from("joe@example.com,  \n");
    BOOST_REQUIRE(!empty_secret.has_value());
    BOOST_TEST(empty_secret.error().message == "line 1: empty address or secret");

    auto bad_address = accounts_from("not-an-address,secret\n");
    BOOST_REQUIRE(!bad_address.has_value());
    BOOST_TEST(bad_address.error().message.find("invalid address") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(recipients_keep_order_and_duplicates)
{
    const auto list = recipients_from("a@example.org\n\n  b@example.org  \na@example.org\n");
    BOOST_REQUIRE(list.has_value());
    BOOST_TEST(*list == (std::vector<std::string>{"a@example.org", "b@example.org", "a@example.org"}));
}

BOOST_AUTO_TEST_CASE(malformed_recipient)
{
    auto list = recipients_from("a@example.org\nJoe <joe@example.org>\n");
    BOOST_REQUIRE(!list.has_value());
    BOOST_TEST(list.error().code == errc::input_invalid);
    BOOST_TEST(list.error().message.rfind("line 2:", 0) == 0u);
}

BOOST_AUTO_TEST_CASE(missing_files)
{
    BOOST_TEST(mailcast::io::load_accounts("/nonexistent/accounts.txt").error().code == errc::input_invalid);
    BOOST_TEST(mailcast::io::load_recipients("/nonexistent/recipients.txt").error().code == errc::input_invalid);
}
