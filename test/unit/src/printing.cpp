//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <mysqlstream/cursor.hpp>
#include <mysqlstream/diagnostics.hpp>
#include <mysqlstream/row_source.hpp>

#include <ostream>

#include "test_unit/printing.hpp"

std::ostream& mysqlstream::operator<<(std::ostream& os, const diagnostics& value)
{
    return os << "diagnostics{ .client_message = " << value.client_message()
              << ", .server_message = " << value.server_message() << ", .sql_state = " << value.sql_state()
              << " }";
}

std::ostream& mysqlstream::operator<<(std::ostream& os, cursor_state v)
{
    switch (v)
    {
    case cursor_state::pending: return os << "pending";
    case cursor_state::on_row: return os << "on_row";
    case cursor_state::ended: return os << "ended";
    case cursor_state::failed: return os << "failed";
    default: return os << "<unknown cursor_state>";
    }
}

std::ostream& mysqlstream::operator<<(std::ostream& os, read_row_result v)
{
    switch (v)
    {
    case read_row_result::error: return os << "error";
    case read_row_result::row: return os << "row";
    case read_row_result::eof: return os << "eof";
    default: return os << "<unknown read_row_result>";
    }
}
