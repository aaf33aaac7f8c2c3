//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <mysqlstream/client_errc.hpp>

#include "protocol/packet_reader.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/test/unit_test.hpp>

#include <cstdint>
#include <vector>

#include "test_unit/printing.hpp"

using namespace mysqlstream::detail;
using mysqlstream::client_errc;
using mysqlstream::error_code;
using boost::asio::buffer;

BOOST_AUTO_TEST_SUITE(test_packet_reader)

BOOST_AUTO_TEST_CASE(fixed_integers)
{
    const std::vector<std::uint8_t> buff{0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08, 0x09, 0x0a,
                                         0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08};
    packet_reader reader(buffer(buff));

    BOOST_TEST(reader.read_int1() == 0x01u);
    BOOST_TEST(reader.read_int2() == 0x0302u);
    BOOST_TEST(reader.read_int3() == 0x060504u);
    BOOST_TEST(reader.read_int4() == 0x0a090807u);
    BOOST_TEST(reader.read_int8() == 0x0807060504030201u);
    BOOST_TEST(reader.remaining() == 0u);
    BOOST_TEST(reader.finish() == error_code());
}

BOOST_AUTO_TEST_CASE(int_lenenc)
{
    struct
    {
        const char* name;
        std::vector<std::uint8_t> serialized;
        std::uint64_t expected;
    } test_cases[] = {
        {"1_byte",      {0xfa},                                                 0xfa              },
        {"1_byte_0xfb", {0xfb},                                                 0xfb              },
        {"2_bytes",     {0xfc, 0xfb, 0x00},                                     0xfb              },
        {"2_bytes_max", {0xfc, 0xff, 0xff},                                     0xffff            },
        {"3_bytes",     {0xfd, 0x00, 0x00, 0x01},                               0x010000          },
        {"8_bytes",     {0xfe, 0x08, 0x07, 0x06, 0x05, 0x04, 0x03, 0x02, 0x01}, 0x0102030405060708},
    };

    for (const auto& tc : test_cases)
    {
        BOOST_TEST_CONTEXT(tc.name)
        {
            packet_reader reader(buffer(tc.serialized));
            BOOST_TEST(reader.read_int_lenenc() == tc.expected);
            BOOST_TEST(reader.finish() == error_code());
        }
    }
}

BOOST_AUTO_TEST_CASE(int_lenenc_incomplete)
{
    struct
    {
        const char* name;
        std::vector<std::uint8_t> serialized;
    } test_cases[] = {
        {"empty",           {}                                  },
        {"2_bytes_partial", {0xfc, 0x01}                        },
        {"3_bytes_partial", {0xfd, 0x01, 0x02}                  },
        {"8_bytes_partial", {0xfe, 0x01, 0x02, 0x03, 0x04, 0x05}},
    };

    for (const auto& tc : test_cases)
    {
        BOOST_TEST_CONTEXT(tc.name)
        {
            packet_reader reader(buffer(tc.serialized));
            BOOST_TEST(reader.read_int_lenenc() == 0u);
            BOOST_TEST(reader.error() == client_errc::incomplete_message);
        }
    }
}

BOOST_AUTO_TEST_CASE(incomplete_read_consumes_nothing)
{
    const std::vector<std::uint8_t> buff{0x01, 0x02, 0x03};
    packet_reader reader(buffer(buff));

    BOOST_TEST(reader.read_int4() == 0u);
    BOOST_TEST(reader.error() == client_errc::incomplete_message);
    BOOST_TEST(reader.remaining() == 3u);
}

BOOST_AUTO_TEST_CASE(error_is_sticky)
{
    const std::vector<std::uint8_t> buff{0x05, 'a', 'b', 0x01, 0x02};
    packet_reader reader(buffer(buff));

    // The declared length exceeds the message
    BOOST_TEST(reader.read_string_lenenc() == "");
    BOOST_TEST(reader.error() == client_errc::incomplete_message);

    // Reads that would otherwise succeed return nothing
    BOOST_TEST(reader.read_int1() == 0u);
    BOOST_TEST(reader.read_string_eof() == "");
    BOOST_TEST(reader.finish() == client_errc::incomplete_message);
}

BOOST_AUTO_TEST_CASE(fail_keeps_first_error)
{
    const std::vector<std::uint8_t> buff{0x01};
    packet_reader reader(buffer(buff));

    reader.fail(client_errc::protocol_value_error);
    reader.fail(client_errc::server_unsupported);
    BOOST_TEST(reader.read_int1() == 0u);
    BOOST_TEST(reader.error() == client_errc::protocol_value_error);
}

BOOST_AUTO_TEST_CASE(string_null)
{
    const std::vector<std::uint8_t> buff{'a', 'b', 0, 0, 'c'};
    packet_reader reader(buffer(buff));

    BOOST_TEST(reader.read_string_null() == "ab");
    BOOST_TEST(reader.read_string_null() == "");
    BOOST_TEST(reader.remaining() == 1u);
    BOOST_TEST(reader.error() == error_code());

    // No terminator
    BOOST_TEST(reader.read_string_null() == "");
    BOOST_TEST(reader.error() == client_errc::incomplete_message);
}

BOOST_AUTO_TEST_CASE(string_lenenc)
{
    const std::vector<std::uint8_t> buff{0x03, 'a', 'b', 'c', 0x00, 0x05, 'd'};
    packet_reader reader(buffer(buff));

    BOOST_TEST(reader.read_string_lenenc() == "abc");
    BOOST_TEST(reader.read_string_lenenc() == "");
    BOOST_TEST(reader.error() == error_code());

    BOOST_TEST(reader.read_string_lenenc() == "");
    BOOST_TEST(reader.error() == client_errc::incomplete_message);
}

BOOST_AUTO_TEST_CASE(string_eof_and_rest)
{
    const std::vector<std::uint8_t> buff{0x01, 'a', 'b', 'c'};
    packet_reader reader(buffer(buff));

    reader.skip(1);
    BOOST_TEST(reader.rest().size() == 3u);
    BOOST_TEST(reader.rest().data() == buff.data() + 1);
    BOOST_TEST(reader.read_string_eof() == "abc");
    BOOST_TEST(reader.empty());
    BOOST_TEST(reader.finish() == error_code());
}

BOOST_AUTO_TEST_CASE(finish_extra_bytes)
{
    const std::vector<std::uint8_t> buff{0x01, 0x02};
    packet_reader reader(buffer(buff));

    reader.read_int1();
    BOOST_TEST(reader.error() == error_code());
    BOOST_TEST(reader.finish() == client_errc::extra_bytes);
}

BOOST_AUTO_TEST_CASE(empty_message)
{
    packet_reader reader(boost::asio::const_buffer{});
    BOOST_TEST(reader.empty());
    BOOST_TEST(reader.read_fixed(0) == "");
    BOOST_TEST(reader.finish() == error_code());
}

BOOST_AUTO_TEST_SUITE_END()
