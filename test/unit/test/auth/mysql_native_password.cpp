//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <mysqlstream/client_errc.hpp>

#include "auth/auth.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/test/unit_test.hpp>

#include <cstdint>
#include <string>
#include <vector>

#include "test_unit/assert_buffer_equals.hpp"

using namespace mysqlstream;
using detail::auth_response;
using detail::compute_auth_response;
using boost::asio::buffer;

namespace {

BOOST_AUTO_TEST_SUITE(test_mysql_native_password)

// Values snooped using Wireshark
const std::vector<std::uint8_t> challenge{0x79, 0x64, 0x3d, 0x12, 0x1d, 0x71, 0x74, 0x47, 0x5f, 0x48,
                                          0x3e, 0x3e, 0x0b, 0x62, 0x0a, 0x03, 0x3d, 0x27, 0x3a, 0x4c};
const std::vector<std::uint8_t> expected{0xf1, 0xb2, 0xfb, 0x1c, 0x8d, 0xe7, 0x5d, 0xb8, 0xeb, 0xa8,
                                         0x12, 0x6a, 0xd1, 0x0f, 0xe9, 0xb1, 0x10, 0x50, 0xd4, 0x28};

BOOST_AUTO_TEST_CASE(nonempty_password)
{
    auth_response resp;
    auto err = compute_auth_response("mysql_native_password", "root", buffer(challenge), resp);
    BOOST_TEST(err == error_code());
    MYSQLSTREAM_ASSERT_BUFFER_EQUALS(resp.data, expected);
    BOOST_TEST(resp.plugin_name == "mysql_native_password");
}

BOOST_AUTO_TEST_CASE(empty_password)
{
    auth_response resp;
    resp.data = {0x01, 0x02};
    auto err = compute_auth_response("mysql_native_password", "", buffer(challenge), resp);
    BOOST_TEST(err == error_code());
    BOOST_TEST(resp.data.empty());
    BOOST_TEST(resp.plugin_name == "mysql_native_password");
}

BOOST_AUTO_TEST_CASE(bad_challenge_length)
{
    struct
    {
        const char* name;
        std::vector<std::uint8_t> challenge;
    } test_cases[] = {
        {"empty",     {}                                  },
        {"too_short", std::vector<std::uint8_t>(19, 0x01)},
        {"too_long",  std::vector<std::uint8_t>(21, 0x01)},
    };

    for (const auto& tc : test_cases)
    {
        BOOST_TEST_CONTEXT(tc.name)
        {
            auth_response resp;
            auto err = compute_auth_response("mysql_native_password", "root", buffer(tc.challenge), resp);
            BOOST_TEST(err == client_errc::protocol_value_error);
        }
    }
}

BOOST_AUTO_TEST_CASE(unknown_plugin)
{
    const char* test_cases[] = {"", "caching_sha2_password", "mysql_clear_password", "MYSQL_NATIVE_PASSWORD"};

    for (const char* tc : test_cases)
    {
        BOOST_TEST_CONTEXT(tc)
        {
            auth_response resp;
            auto err = compute_auth_response(tc, "root", buffer(challenge), resp);
            BOOST_TEST(err == client_errc::unknown_auth_plugin);
        }
    }
}

BOOST_AUTO_TEST_SUITE_END()

}  // namespace
