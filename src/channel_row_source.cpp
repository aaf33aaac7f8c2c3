//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <mysqlstream/is_fatal_error.hpp>

#include "channel_row_source.hpp"
#include "logging.hpp"
#include "network_algorithms/read_text_row.hpp"

mysqlstream::read_row_result mysqlstream::detail::channel_row_source::read_row(
    bytestring& packet,
    error_code& err,
    diagnostics& diag
)
{
    auto res = read_text_row(conn_->get_channel(), packet, err, diag);
    if (res == read_row_result::eof)
    {
        get_logger().debug("Resultset complete");
        conn_->set_pending_rows(false);
    }
    else if (res == read_row_result::error)
    {
        get_logger().debug("Error reading rows: {}", err.message());
        conn_->set_pending_rows(false);
        if (is_fatal_error(err))
            conn_->set_connected(false);
    }
    return res;
}
