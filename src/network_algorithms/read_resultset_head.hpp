//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLSTREAM_SRC_NETWORK_ALGORITHMS_READ_RESULTSET_HEAD_HPP
#define MYSQLSTREAM_SRC_NETWORK_ALGORITHMS_READ_RESULTSET_HEAD_HPP

#include <mysqlstream/column_metadata.hpp>
#include <mysqlstream/diagnostics.hpp>
#include <mysqlstream/error_code.hpp>

#include "channel/channel.hpp"

#include <vector>

namespace mysqlstream {
namespace detail {

struct resultset_head
{
    // false if the server answered with an OK packet
    bool has_rows{false};
    std::vector<column_metadata> columns;
};

// Reads the response to a query, up to the first row: the column count,
// the column definitions and the EOF packet that follows them
void read_resultset_head(channel& chan, resultset_head& output, error_code& err, diagnostics& diag);

}  // namespace detail
}  // namespace mysqlstream

#endif
