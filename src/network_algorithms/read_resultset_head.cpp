//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <mysqlstream/client_errc.hpp>

#include "network_algorithms/read_resultset_head.hpp"
#include "protocol/messages.hpp"

#include <boost/asio/buffer.hpp>

#include <utility>

void mysqlstream::detail::read_resultset_head(
    channel& chan,
    resultset_head& output,
    error_code& err,
    diagnostics& diag
)
{
    err.clear();
    diag.clear();
    output.has_rows = false;
    output.columns.clear();
    auto& buff = chan.shared_buffer();

    // Response header
    chan.read(buff, err);
    if (err)
        return;
    auto response = parse_query_response(boost::asio::buffer(buff), diag);
    switch (response.kind)
    {
    case query_response::kind_t::error: err = response.err; return;
    case query_response::kind_t::ok: return;
    default: break;
    }

    // Column definitions
    output.columns.reserve(response.num_columns);
    for (std::size_t i = 0; i < response.num_columns; ++i)
    {
        chan.read(buff, err);
        if (err)
            return;
        column_metadata meta;
        err = parse_column_definition(boost::asio::buffer(buff), meta);
        if (err)
            return;
        output.columns.push_back(std::move(meta));
    }

    // CLIENT_DEPRECATE_EOF is never negotiated, so an EOF packet follows the metadata
    chan.read(buff, err);
    if (err)
        return;
    switch (classify_row_packet(boost::asio::buffer(buff), err, diag))
    {
    case row_packet_kind::eof: output.has_rows = true; return;
    case row_packet_kind::error: return;
    default: err = make_error_code(client_errc::protocol_value_error); return;
    }
}
