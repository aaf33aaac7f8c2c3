//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLSTREAM_SRC_NETWORK_ALGORITHMS_HANDSHAKE_HPP
#define MYSQLSTREAM_SRC_NETWORK_ALGORITHMS_HANDSHAKE_HPP

#include <mysqlstream/connect_params.hpp>
#include <mysqlstream/diagnostics.hpp>
#include <mysqlstream/error_code.hpp>

#include "connection_impl.hpp"

namespace mysqlstream {
namespace detail {

// Performs the MySQL handshake over an already connected stream.
// Marks the connection as connected on success
void handshake(connection_impl& conn, const connect_params& params, error_code& err, diagnostics& diag);

}  // namespace detail
}  // namespace mysqlstream

#endif
