/*

test_message.cpp
----------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE message_test

#include <boost/test/unit_test.hpp>

#include <regex>
#include <set>
#include <string>

#include <smtpxx/message.hpp>

using namespace smtpxx;

namespace
{

email simple_email()
{
    email mail;
    mail.from = "sender@example.com";
    mail.to = {"a@example.com"};
    mail.cc = {"b@example.com"};
    mail.bcc = {"c@example.com"};
    mail.content = "Subject: hi\r\n\r\nbody\r\n";
    return mail;
}

} // namespace


BOOST_AUTO_TEST_CASE(valid_addresses)
{
    BOOST_TEST(validate_address("user@example.com").has_value());
    BOOST_TEST(validate_address("first.last+tag@sub.example.co.uk").has_value());
    BOOST_TEST(validate_address(std::string(64, 'a') + "@example.com").has_value());
}

BOOST_AUTO_TEST_CASE(invalid_addresses)
{
    for (const char* bad : {"", "no-at-sign", "two@@example.com", "a@b@example.com", "@example.com", "user@",
        "user@exa\r\nmple.com", "us\ter@example.com"})
    {
        auto res = validate_address(bad);
        BOOST_TEST_CONTEXT("address: " << bad)
        {
            BOOST_REQUIRE(!res.has_value());
            BOOST_TEST(res.error().code == errc::invalid_address);
        }
    }
}

BOOST_AUTO_TEST_CASE(address_length_limits)
{
    BOOST_TEST(!validate_address(std::string(65, 'a') + "@example.com").has_value());

    const std::string long_domain = "user@" + std::string(250, 'd');
    auto res = validate_address(long_domain);
    BOOST_REQUIRE(!res.has_value());
    BOOST_TEST(res.error().detail.find("address=") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(recipients_in_order)
{
    const auto mail = simple_email();
    const std::vector<std::string> expected{"a@example.com", "b@example.com", "c@example.com"};
    BOOST_TEST(mail.all_recipients() == expected, boost::test_tools::per_element());
    BOOST_TEST(mail.recipient_count() == 3u);
}

BOOST_AUTO_TEST_CASE(encode_passes_content_through)
{
    raw_message_encoder encoder("mail.example.org");
    auto encoded = encoder.encode(simple_email());
    BOOST_REQUIRE(encoded.has_value());
    BOOST_TEST(encoded->data == "Subject: hi\r\n\r\nbody\r\n");

    static const std::regex id_format(
        R"(<[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}\.[0-9]+@mail\.example\.org>)");
    BOOST_TEST(std::regex_match(encoded->message_id, id_format));
}

BOOST_AUTO_TEST_CASE(explicit_message_id_is_kept)
{
    auto mail = simple_email();
    mail.message_id = "<fixed@example.com>";
    raw_message_encoder encoder;
    BOOST_TEST(encoder.encode(mail)->message_id == "<fixed@example.com>");
}

BOOST_AUTO_TEST_CASE(generated_ids_are_unique)
{
    raw_message_encoder encoder;
    std::set<std::string> ids;
    for (int i = 0; i < 1000; ++i)
        ids.insert(encoder.generate_message_id());
    BOOST_TEST(ids.size() == 1000u);
}

BOOST_AUTO_TEST_CASE(encode_rejects_bad_envelope)
{
    raw_message_encoder encoder;

    auto mail = simple_email();
    mail.from = "not-an-address";
    BOOST_TEST(encoder.encode(mail).error().code == errc::invalid_address);

    mail = simple_email();
    mail.to.clear();
    mail.cc.clear();
    mail.bcc.clear();
    BOOST_TEST(encoder.encode(mail).error().code == errc::invalid_argument);

    mail = simple_email();
    mail.bcc.push_back("broken@");
    BOOST_TEST(encoder.encode(mail).error().code == errc::invalid_address);
}

BOOST_AUTO_TEST_CASE(repeated_recipients_collapse)
{
    email mail;
    mail.from = "sender@example.com";
    mail.to = {"a@example.com", "B@Example.com"};
    mail.cc = {"a@EXAMPLE.COM"};
    mail.bcc = {"B@example.COM", "d@example.com"};
    const std::vector<std::string> expected{"a@example.com", "B@Example.com", "d@example.com"};
    BOOST_TEST(mail.all_recipients() == expected, boost::test_tools::per_element());
    BOOST_TEST(mail.recipient_count() == 5u);
}

BOOST_AUTO_TEST_CASE(local_part_case_keeps_recipients_distinct)
{
    email mail;
    mail.from = "sender@example.com";
    mail.to = {"John@example.com"};
    mail.cc = {"john@example.com", "JOHN@Example.com"};
    const std::vector<std::string> expected{"John@example.com", "john@example.com", "JOHN@Example.com"};
    BOOST_TEST(mail.all_recipients() == expected, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(mailbox_key_folds_domain_only)
{
    BOOST_TEST(smtp::mailbox_key("John.Doe@Example.COM") == "John.Doe@example.com");
    BOOST_TEST(smtp::mailbox_key("\"a@b\"@Host.Org") == "\"a@b\"@host.org");
    BOOST_TEST(smtp::mailbox_key("NoDomain") == "NoDomain");
}
