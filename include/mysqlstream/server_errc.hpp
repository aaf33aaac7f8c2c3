//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLSTREAM_SERVER_ERRC_HPP
#define MYSQLSTREAM_SERVER_ERRC_HPP

#include <mysqlstream/error_code.hpp>

#include <boost/system/error_code.hpp>

#include <cstdint>

namespace mysqlstream {

/**
 * \brief Returns the error_category used for errors reported by the server in ERR packets.
 * \details
 * Error codes in this category hold the numeric code sent by the server
 * (e.g. 1064 for a syntax error). There is no fixed list: servers keep adding codes.
 * The server-supplied message is stored in a \ref diagnostics object.
 *
 * \par Thread safety
 * This function is thread-safe.
 */
const boost::system::error_category& get_server_category() noexcept;

/// Creates an \ref error_code in the server category from a numeric server error code.
inline error_code make_server_error_code(std::uint16_t code)
{
    return error_code(static_cast<int>(code), get_server_category());
}

}  // namespace mysqlstream

#endif
