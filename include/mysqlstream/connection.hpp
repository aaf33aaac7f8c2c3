//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLSTREAM_CONNECTION_HPP
#define MYSQLSTREAM_CONNECTION_HPP

#include <mysqlstream/connect_params.hpp>
#include <mysqlstream/connection_params.hpp>
#include <mysqlstream/cursor.hpp>
#include <mysqlstream/diagnostics.hpp>
#include <mysqlstream/error_code.hpp>
#include <mysqlstream/ok_result.hpp>
#include <mysqlstream/string_view.hpp>

#include <mysqlstream/detail/any_stream.hpp>

#include <boost/asio/io_context.hpp>

#include <memory>

namespace mysqlstream {

namespace detail {
class connection_impl;
}

/**
 * \brief A connection to a MySQL server, using the text protocol.
 * \details
 * Represents a connection to a MySQL server over TCP. All operations are synchronous.
 * \n
 * A connection can only run one command at a time. After \ref query returns a \ref cursor
 * for a resultset, the connection has pending rows until the cursor is read until its end
 * (\ref cursor::advance returns false). While rows are pending, \ref query and \ref execute
 * fail with \ref client_errc::pending_rows without touching the transport. If a cursor
 * is abandoned before reaching its end, the connection can't be used anymore and
 * should be discarded.
 * \n
 * This is a move-only type. Moving a connection, either by construction or assignment,
 * doesn't invalidate the cursors it created. Move-assigning to a connection destroys the
 * target's previous state: cursors created by the target before the assignment must not be
 * used afterwards.
 *
 * \par Thread safety
 * Distinct objects: safe. Shared objects: unsafe.
 */
class connection
{
public:
    /**
     * \brief Constructs a connection object that will use a TCP socket bound to `ctx`.
     * \details The connection is created in a disconnected state. Call \ref connect to use it.
     */
    explicit connection(boost::asio::io_context& ctx, const connection_params& params = {});

    /**
     * \brief Constructs a connection object over an arbitrary stream.
     * \details Private, do not use. Used by tests to supply in-memory transports.
     */
    explicit connection(std::unique_ptr<detail::any_stream> stream, const connection_params& params = {});

    connection(const connection&) = delete;
    connection(connection&&) noexcept;
    connection& operator=(const connection&) = delete;
    connection& operator=(connection&&) noexcept;
    ~connection();

    /// Returns whether the connection completed the handshake and hasn't been closed.
    bool is_connected() const noexcept;

    /// Returns whether a cursor created by \ref query still has unread rows.
    bool has_pending_rows() const noexcept;

    /**
     * \brief Establishes a connection to a MySQL server.
     * \details
     * Resolves the host name, connects the transport and performs
     * the MySQL handshake, authenticating with `mysql_native_password`.
     */
    void connect(const connect_params& params, error_code& err, diagnostics& diag);

    /// \copydoc connect
    void connect(const connect_params& params);

    /**
     * \brief Executes a text query and returns a cursor over its rows.
     * \details
     * Sends `sql` to the server and reads the resultset head (column definitions).
     * On success, returns a valid cursor in the \ref cursor_state::pending state. If the
     * statement produces no resultset (e.g. an `UPDATE`), the returned cursor is valid but
     * yields no rows. On failure, returns an invalid cursor.
     * \n
     * The connection has pending rows until the cursor is read until its end.
     * The cursor must not outlive this connection.
     */
    cursor query(string_view sql, error_code& err, diagnostics& diag);

    /// \copydoc query
    cursor query(string_view sql);

    /**
     * \brief Executes a statement that doesn't produce rows.
     * \details
     * Sends `sql` to the server and reads exactly one response message, which must be an
     * OK or an error packet. A statement producing a resultset results in
     * \ref client_errc::protocol_value_error, and the connection should be discarded.
     */
    ok_result execute(string_view sql, error_code& err, diagnostics& diag);

    /// \copydoc execute
    ok_result execute(string_view sql);

    /**
     * \brief Closes the connection to the server.
     * \details Sends a quit request and closes the underlying transport.
     */
    void close(error_code& err, diagnostics& diag);

    /// \copydoc close
    void close();

private:
    std::unique_ptr<detail::connection_impl> impl_;
};

}  // namespace mysqlstream

#endif
