//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLSTREAM_SRC_NETWORK_ALGORITHMS_QUERY_HPP
#define MYSQLSTREAM_SRC_NETWORK_ALGORITHMS_QUERY_HPP

#include <mysqlstream/cursor.hpp>
#include <mysqlstream/diagnostics.hpp>
#include <mysqlstream/error_code.hpp>
#include <mysqlstream/ok_result.hpp>
#include <mysqlstream/string_view.hpp>

#include "connection_impl.hpp"

namespace mysqlstream {
namespace detail {

// Sends a COM_QUERY and reads the resultset head. Returns an invalid cursor on error
cursor query(connection_impl& conn, string_view sql, error_code& err, diagnostics& diag);

// Sends a COM_QUERY and reads a single OK or error packet
ok_result execute(connection_impl& conn, string_view sql, error_code& err, diagnostics& diag);

// Sends a COM_QUIT. Doesn't close the stream
void quit(connection_impl& conn, error_code& err);

}  // namespace detail
}  // namespace mysqlstream

#endif
