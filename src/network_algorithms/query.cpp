//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <mysqlstream/is_fatal_error.hpp>

#include "channel_row_source.hpp"
#include "logging.hpp"
#include "network_algorithms/query.hpp"
#include "network_algorithms/read_resultset_head.hpp"
#include "protocol/messages.hpp"

#include <boost/asio/buffer.hpp>

#include <memory>
#include <utility>

namespace mysqlstream {
namespace detail {
namespace {

// Common part of query and execute. Checks the connection state and sends the request
void send_query(connection_impl& conn, string_view sql, error_code& err)
{
    err = conn.check_ready();
    if (err)
    {
        get_logger().debug("Refusing to run a command: {}", err.message());
        return;
    }

    get_logger().trace("Running query: {}", log_view(sql));
    auto& buff = conn.write_buffer();
    buff.clear();
    write_query(buff, sql);
    conn.get_channel().reset_sequence_number();
    conn.get_channel().write(boost::asio::buffer(buff), err);
}

void process_error(connection_impl& conn, const error_code& err)
{
    get_logger().debug("Command failed: {}", err.message());
    if (is_fatal_error(err))
        conn.set_connected(false);
}

}  // namespace
}  // namespace detail
}  // namespace mysqlstream

mysqlstream::cursor mysqlstream::detail::query(
    connection_impl& conn,
    string_view sql,
    error_code& err,
    diagnostics& diag
)
{
    err.clear();
    diag.clear();

    send_query(conn, sql, err);
    if (err)
    {
        process_error(conn, err);
        return cursor();
    }

    resultset_head head;
    read_resultset_head(conn.get_channel(), head, err, diag);
    if (err)
    {
        process_error(conn, err);
        return cursor();
    }

    if (!head.has_rows)
    {
        get_logger().debug("Query completed without a resultset");
        return cursor(std::unique_ptr<row_source>(new empty_row_source));
    }

    get_logger().debug("Query returned a resultset with {} columns", head.columns.size());
    conn.set_pending_rows(true);
    return cursor(std::unique_ptr<row_source>(new channel_row_source(conn)), std::move(head.columns));
}

mysqlstream::ok_result mysqlstream::detail::execute(
    connection_impl& conn,
    string_view sql,
    error_code& err,
    diagnostics& diag
)
{
    err.clear();
    diag.clear();

    send_query(conn, sql, err);
    if (err)
    {
        process_error(conn, err);
        return ok_result();
    }

    auto& chan = conn.get_channel();
    chan.read(chan.shared_buffer(), err);
    if (err)
    {
        process_error(conn, err);
        return ok_result();
    }

    ok_view ok{};
    err = parse_ok_or_err(boost::asio::buffer(chan.shared_buffer()), ok, diag);
    if (err)
    {
        process_error(conn, err);
        return ok_result();
    }

    get_logger().debug("Statement completed, {} rows affected", ok.affected_rows);
    return to_ok_result(ok);
}

void mysqlstream::detail::quit(connection_impl& conn, error_code& err)
{
    auto& buff = conn.write_buffer();
    buff.clear();
    write_quit(buff);
    conn.get_channel().reset_sequence_number();
    conn.get_channel().write(boost::asio::buffer(buff), err);
}
