//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "protocol/packet_writer.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/test/unit_test.hpp>

#include <cstdint>
#include <vector>

#include "test_unit/assert_buffer_equals.hpp"

using namespace mysqlstream::detail;

BOOST_AUTO_TEST_SUITE(test_packet_writer)

BOOST_AUTO_TEST_CASE(fixed_integers)
{
    std::vector<std::uint8_t> buff{0xaa};
    packet_writer writer(buff);

    writer.write_int1(0x01);
    writer.write_int2(0x0302);
    writer.write_int3(0x060504);
    writer.write_int4(0x0a090807);
    writer.write_int8(0x0807060504030201);

    // Existing contents are kept
    const std::vector<std::uint8_t> expected{0xaa, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08, 0x09, 0x0a,
                                             0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08};
    MYSQLSTREAM_ASSERT_BUFFER_EQUALS(buff, expected);
}

BOOST_AUTO_TEST_CASE(int_lenenc)
{
    struct
    {
        const char* name;
        std::uint64_t value;
        std::vector<std::uint8_t> expected;
    } test_cases[] = {
        {"1_byte",      0xfa,               {0xfa}                                                },
        {"2_bytes",     0xfb,               {0xfc, 0xfb, 0x00}                                    },
        {"2_bytes_max", 0xffff,             {0xfc, 0xff, 0xff}                                    },
        {"3_bytes",     0xabcdef,           {0xfd, 0xef, 0xcd, 0xab}                              },
        {"8_bytes",     0x0102030405060708, {0xfe, 0x08, 0x07, 0x06, 0x05, 0x04, 0x03, 0x02, 0x01}},
    };

    for (const auto& tc : test_cases)
    {
        BOOST_TEST_CONTEXT(tc.name)
        {
            std::vector<std::uint8_t> buff;
            packet_writer(buff).write_int_lenenc(tc.value);
            MYSQLSTREAM_ASSERT_BUFFER_EQUALS(buff, tc.expected);
        }
    }
}

BOOST_AUTO_TEST_CASE(strings)
{
    std::vector<std::uint8_t> buff;
    packet_writer writer(buff);

    writer.write_string_null("ab");
    writer.write_string_lenenc("cd");
    writer.write_string_lenenc("");
    writer.write_string_eof("ef");

    const std::vector<std::uint8_t> expected{'a', 'b', 0x00, 0x02, 'c', 'd', 0x00, 'e', 'f'};
    MYSQLSTREAM_ASSERT_BUFFER_EQUALS(buff, expected);
}

BOOST_AUTO_TEST_CASE(bytes_and_zeros)
{
    const std::vector<std::uint8_t> data{0x10, 0x20};
    std::vector<std::uint8_t> buff;
    packet_writer writer(buff);

    writer.write_bytes(boost::asio::buffer(data));
    writer.write_zeros(3);
    writer.write_bytes(boost::asio::const_buffer());

    const std::vector<std::uint8_t> expected{0x10, 0x20, 0x00, 0x00, 0x00};
    MYSQLSTREAM_ASSERT_BUFFER_EQUALS(buff, expected);
}

BOOST_AUTO_TEST_SUITE_END()
