//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLSTREAM_SRC_PROTOCOL_CONSTANTS_HPP
#define MYSQLSTREAM_SRC_PROTOCOL_CONSTANTS_HPP

#include <cstddef>
#include <cstdint>

namespace mysqlstream {
namespace detail {

constexpr std::size_t max_packet_size = 0xffffff;
constexpr std::size_t frame_header_size = 4;

// Message type headers
constexpr std::uint8_t ok_packet_header = 0x00;
constexpr std::uint8_t error_packet_header = 0xff;
constexpr std::uint8_t eof_packet_header = 0xfe;
constexpr std::uint8_t auth_switch_request_header = 0xfe;
constexpr std::uint8_t auth_more_data_header = 0x01;

// EOF packets are distinguished from rows starting with 0xfe by their size
constexpr std::size_t max_eof_packet_size = 9;

// In text rows, 0xfb marks a NULL column
constexpr std::uint8_t null_column_marker = 0xfb;

// Command codes
constexpr std::uint8_t com_quit = 0x01;
constexpr std::uint8_t com_query = 0x03;

constexpr std::uint8_t handshake_protocol_version_9 = 9;
constexpr std::uint8_t handshake_protocol_version_10 = 10;

constexpr std::size_t sql_state_size = 5;

}  // namespace detail
}  // namespace mysqlstream

#endif
