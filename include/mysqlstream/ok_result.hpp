//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLSTREAM_OK_RESULT_HPP
#define MYSQLSTREAM_OK_RESULT_HPP

#include <cstdint>
#include <string>

namespace mysqlstream {

/**
 * \brief The acknowledgment returned by \ref connection::execute.
 * \details Holds the contents of the OK packet sent by the server
 * after a statement that doesn't generate rows.
 */
struct ok_result
{
    /// The number of rows affected by the statement.
    std::uint64_t affected_rows{};

    /// The last AUTO_INCREMENT ID generated by the statement, if any.
    std::uint64_t last_insert_id{};

    /// Server status flags (SERVER_STATUS_xxx).
    std::uint16_t status_flags{};

    /// The number of warnings generated by the statement.
    std::uint16_t warnings{};

    /// Additional human-readable information about the statement, as sent by the server.
    std::string info;
};

}  // namespace mysqlstream

#endif
