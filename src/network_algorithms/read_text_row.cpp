//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "network_algorithms/read_text_row.hpp"
#include "protocol/messages.hpp"

#include <boost/asio/buffer.hpp>

mysqlstream::read_row_result mysqlstream::detail::read_text_row(
    channel& chan,
    bytestring& packet,
    error_code& err,
    diagnostics& diag
)
{
    err.clear();
    diag.clear();

    chan.read(packet, err);
    if (err)
        return read_row_result::error;

    switch (classify_row_packet(boost::asio::buffer(packet), err, diag))
    {
    case row_packet_kind::row: return read_row_result::row;
    case row_packet_kind::eof: return read_row_result::eof;
    default: return read_row_result::error;
    }
}
