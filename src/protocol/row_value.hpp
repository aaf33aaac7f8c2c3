//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLSTREAM_SRC_PROTOCOL_ROW_VALUE_HPP
#define MYSQLSTREAM_SRC_PROTOCOL_ROW_VALUE_HPP

#include <mysqlstream/error_code.hpp>
#include <mysqlstream/string_view.hpp>

#include <boost/asio/buffer.hpp>

#include <cstddef>

namespace mysqlstream {
namespace detail {

// A single column of a text row
struct row_value
{
    string_view value;        // points into the packet. Empty if is_null
    std::size_t next_offset;  // where the next column starts
    bool is_null;
};

// Reads the column starting at offset in a text row packet. Doesn't modify anything else.
// Returns client_errc::incomplete_message if there is no column at offset or it's truncated
error_code read_row_value(boost::asio::const_buffer packet, std::size_t offset, row_value& output);

}  // namespace detail
}  // namespace mysqlstream

#endif
