//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLSTREAM_CLIENT_ERRC_HPP
#define MYSQLSTREAM_CLIENT_ERRC_HPP

#include <mysqlstream/error_code.hpp>

#include <boost/system/error_code.hpp>

#include <iosfwd>

namespace mysqlstream {

/**
 * \brief MySQL client-defined error codes.
 * \details These errors are produced by the client itself, rather than the server.
 */
enum class client_errc : int
{
    /**
     * \brief An incomplete message was received from the server, or a column was read
     * past the end of the current row.
     */
    incomplete_message = 1,

    /**
     * \brief An unexpected value was found in a server-received message (indicates a deserialization
     * error or packet mismatch).
     */
    protocol_value_error,

    /// The server does not support the minimum required capabilities to establish the connection.
    server_unsupported,

    /// Unexpected extra bytes at the end of a message were received.
    extra_bytes,

    /// Mismatched sequence numbers (usually caused by a packet mismatch).
    sequence_number_mismatch,

    /// The user employs an authentication plugin not known to this library.
    unknown_auth_plugin,

    /**
     * \brief A command was issued while the rows of a previous query were still unread.
     * \details Drain the previous \ref cursor by calling \ref cursor::advance until it returns
     * false, or discard the connection.
     */
    pending_rows,

    /// The operation requires an established connection.
    not_connected,
};

/**
 * \brief Returns the error_category associated to \ref client_errc.
 * \par Thread safety
 * This function is thread-safe.
 */
const boost::system::error_category& get_client_category() noexcept;

/// Creates an \ref error_code from a \ref client_errc.
error_code make_error_code(client_errc error);

/// Streams a \ref client_errc.
std::ostream& operator<<(std::ostream& os, client_errc v);

}  // namespace mysqlstream

namespace boost {
namespace system {

template <>
struct is_error_code_enum<::mysqlstream::client_errc>
{
    static constexpr bool value = true;
};

}  // namespace system
}  // namespace boost

#endif
