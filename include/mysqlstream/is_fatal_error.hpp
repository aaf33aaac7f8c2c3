//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLSTREAM_IS_FATAL_ERROR_HPP
#define MYSQLSTREAM_IS_FATAL_ERROR_HPP

#include <mysqlstream/error_code.hpp>

namespace mysqlstream {

/**
 * \brief Checks whether an error requires re-connection.
 * \details
 * After an operation on a \ref connection fails with a fatal error, the connection
 * is left in an unspecified state and reports itself as not connected.
 * Fatal errors include network errors and malformed or unexpected server messages.
 * \n
 * Errors reported by the server in error packets, conversion errors,
 * \ref client_errc::pending_rows and \ref client_errc::not_connected are not fatal.
 *
 * \par Exception safety
 * No-throw guarantee.
 */
bool is_fatal_error(error_code ec) noexcept;

}  // namespace mysqlstream

#endif
