//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLSTREAM_SRC_NETWORK_ALGORITHMS_READ_TEXT_ROW_HPP
#define MYSQLSTREAM_SRC_NETWORK_ALGORITHMS_READ_TEXT_ROW_HPP

#include <mysqlstream/diagnostics.hpp>
#include <mysqlstream/error_code.hpp>
#include <mysqlstream/row_source.hpp>

#include "channel/channel.hpp"

namespace mysqlstream {
namespace detail {

// Reads the next message of a text resultset, after its column definitions.
// The message may be a row, the EOF packet ending the resultset or an error packet
read_row_result read_text_row(channel& chan, bytestring& packet, error_code& err, diagnostics& diag);

}  // namespace detail
}  // namespace mysqlstream

#endif
