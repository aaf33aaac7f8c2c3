//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLSTREAM_SRC_AUTH_AUTH_HPP
#define MYSQLSTREAM_SRC_AUTH_AUTH_HPP

#include <mysqlstream/error_code.hpp>
#include <mysqlstream/string_view.hpp>

#include <boost/asio/buffer.hpp>

#include <cstdint>
#include <vector>

namespace mysqlstream {
namespace detail {

struct auth_response
{
    std::vector<std::uint8_t> data;
    string_view plugin_name;
};

// Computes the response to an authentication challenge sent by the server, for the given plugin.
// Only mysql_native_password is supported; other plugins yield client_errc::unknown_auth_plugin
error_code compute_auth_response(
    string_view plugin_name,
    string_view password,
    boost::asio::const_buffer challenge,
    auth_response& output
);

}  // namespace detail
}  // namespace mysqlstream

#endif
