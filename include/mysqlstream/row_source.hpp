//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLSTREAM_ROW_SOURCE_HPP
#define MYSQLSTREAM_ROW_SOURCE_HPP

#include <mysqlstream/diagnostics.hpp>
#include <mysqlstream/error_code.hpp>

#include <cstdint>
#include <vector>

namespace mysqlstream {

/// Owning byte buffer holding a raw protocol message.
using bytestring = std::vector<std::uint8_t>;

/// The outcome of \ref row_source::read_row.
enum class read_row_result
{
    /// The operation failed. The error code and diagnostics have been set.
    error,

    /// A row packet has been stored in the output buffer.
    row,

    /// The server sent the end of the resultset. No more rows will be produced.
    eof,
};

/**
 * \brief Produces the raw text-protocol row packets of a resultset, one at a time.
 * \details
 * A \ref cursor reads rows from a row source. \ref connection::query creates
 * a source that reads from the connection's transport; other implementations
 * may serve rows from memory.
 *
 * After \ref read_row_result::eof or \ref read_row_result::error is returned,
 * \ref cursor won't call \ref read_row again.
 */
class row_source
{
public:
    virtual ~row_source() {}

    /**
     * \brief Reads the next row packet.
     * \details
     * On success, replaces the contents of `packet` with the row's payload
     * (without the frame header) and returns \ref read_row_result::row.
     * Returns \ref read_row_result::eof when the resultset has been fully read.
     * Otherwise, sets `err` and `diag` and returns \ref read_row_result::error.
     */
    virtual read_row_result read_row(bytestring& packet, error_code& err, diagnostics& diag) = 0;
};

}  // namespace mysqlstream

#endif
