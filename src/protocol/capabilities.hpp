//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLSTREAM_SRC_PROTOCOL_CAPABILITIES_HPP
#define MYSQLSTREAM_SRC_PROTOCOL_CAPABILITIES_HPP

#include <cstdint>

namespace mysqlstream {
namespace detail {

// CLIENT_* bits exchanged during the handshake
using capability_flags = std::uint32_t;

namespace capability {

constexpr capability_flags long_password = 0x1;
constexpr capability_flags long_flag = 0x4;
constexpr capability_flags connect_with_db = 0x8;
constexpr capability_flags protocol_41 = 0x200;
constexpr capability_flags transactions = 0x2000;
constexpr capability_flags secure_connection = 0x8000;
constexpr capability_flags plugin_auth = 0x80000;
constexpr capability_flags plugin_auth_lenenc_data = 0x200000;

}  // namespace capability

// Without these we can't talk to the server. CLIENT_DEPRECATE_EOF is never
// requested, so text resultsets always end with an EOF packet
constexpr capability_flags required_caps = capability::protocol_41 | capability::secure_connection |
                                           capability::plugin_auth | capability::plugin_auth_lenenc_data;

// Requested when the server offers them
constexpr capability_flags wanted_caps = capability::long_password | capability::long_flag |
                                         capability::transactions;

constexpr bool has_all(capability_flags caps, capability_flags subset) { return (caps & subset) == subset; }

}  // namespace detail
}  // namespace mysqlstream

#endif
