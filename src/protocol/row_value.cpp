//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <mysqlstream/client_errc.hpp>

#include "protocol/constants.hpp"
#include "protocol/packet_reader.hpp"
#include "protocol/row_value.hpp"

mysqlstream::error_code mysqlstream::detail::read_row_value(
    boost::asio::const_buffer packet,
    std::size_t offset,
    row_value& output
)
{
    if (offset >= packet.size())
        return client_errc::incomplete_message;

    packet_reader reader(packet + offset);

    // NULL values are a single marker byte, instead of a length-encoded string
    if (*static_cast<const std::uint8_t*>(reader.rest().data()) == null_column_marker)
    {
        output = row_value{string_view(), offset + 1, true};
        return error_code();
    }

    string_view value = reader.read_string_lenenc();
    if (reader.error())
        return reader.error();

    output = row_value{value, packet.size() - reader.remaining(), false};
    return error_code();
}
