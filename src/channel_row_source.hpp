//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLSTREAM_SRC_CHANNEL_ROW_SOURCE_HPP
#define MYSQLSTREAM_SRC_CHANNEL_ROW_SOURCE_HPP

#include <mysqlstream/row_source.hpp>

#include "connection_impl.hpp"

namespace mysqlstream {
namespace detail {

// Reads the rows of the resultset being sent by the server over a connection.
// Releases the connection's pending rows flag once the resultset ends or fails
class channel_row_source final : public row_source
{
    connection_impl* conn_;

public:
    explicit channel_row_source(connection_impl& conn) noexcept : conn_(&conn) {}
    read_row_result read_row(bytestring& packet, error_code& err, diagnostics& diag) override;
};

// Used for statements that don't generate a resultset
class empty_row_source final : public row_source
{
public:
    read_row_result read_row(bytestring&, error_code& err, diagnostics& diag) override
    {
        err.clear();
        diag.clear();
        return read_row_result::eof;
    }
};

}  // namespace detail
}  // namespace mysqlstream

#endif
