//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <mysqlstream/client_errc.hpp>
#include <mysqlstream/connection.hpp>
#include <mysqlstream/throw_on_error.hpp>

#include "connection_impl.hpp"
#include "logging.hpp"
#include "network_algorithms/handshake.hpp"
#include "network_algorithms/query.hpp"
#include "tcp_stream.hpp"

#include <utility>

mysqlstream::connection::connection(boost::asio::io_context& ctx, const connection_params& params)
    : connection(std::unique_ptr<detail::any_stream>(new detail::tcp_stream(ctx)), params)
{
}

mysqlstream::connection::connection(std::unique_ptr<detail::any_stream> stream, const connection_params& params)
    : impl_(new detail::connection_impl(std::move(stream), params))
{
}

mysqlstream::connection::connection(connection&&) noexcept = default;
mysqlstream::connection& mysqlstream::connection::operator=(connection&&) noexcept = default;
mysqlstream::connection::~connection() = default;

bool mysqlstream::connection::is_connected() const noexcept { return impl_ && impl_->is_connected(); }

bool mysqlstream::connection::has_pending_rows() const noexcept { return impl_ && impl_->has_pending_rows(); }

void mysqlstream::connection::connect(const connect_params& params, error_code& err, diagnostics& diag)
{
    err.clear();
    diag.clear();
    impl_->set_connected(false);
    impl_->set_pending_rows(false);

    detail::get_logger().debug("Connecting to {}:{}", params.server_host, params.server_port);
    impl_->stream().connect(params.server_host, params.server_port, err);
    if (err)
    {
        detail::get_logger().debug("Transport connection failed: {}", err.message());
        return;
    }

    detail::handshake(*impl_, params, err, diag);
    if (err)
    {
        detail::get_logger().debug("Handshake failed: {}", err.message());
        error_code ignored;
        impl_->stream().close(ignored);
        return;
    }
    detail::get_logger().debug("Connection established");
}

void mysqlstream::connection::connect(const connect_params& params)
{
    error_code err;
    diagnostics diag;
    connect(params, err, diag);
    throw_on_error(err, diag);
}

mysqlstream::cursor mysqlstream::connection::query(string_view sql, error_code& err, diagnostics& diag)
{
    return detail::query(*impl_, sql, err, diag);
}

mysqlstream::cursor mysqlstream::connection::query(string_view sql)
{
    error_code err;
    diagnostics diag;
    auto res = query(sql, err, diag);
    throw_on_error(err, diag);
    return res;
}

mysqlstream::ok_result mysqlstream::connection::execute(string_view sql, error_code& err, diagnostics& diag)
{
    return detail::execute(*impl_, sql, err, diag);
}

mysqlstream::ok_result mysqlstream::connection::execute(string_view sql)
{
    error_code err;
    diagnostics diag;
    auto res = execute(sql, err, diag);
    throw_on_error(err, diag);
    return res;
}

void mysqlstream::connection::close(error_code& err, diagnostics& diag)
{
    err.clear();
    diag.clear();

    if (!impl_->is_connected())
    {
        err = client_errc::not_connected;
        return;
    }

    // Notify the server, then close the transport, even if notifying failed
    detail::get_logger().debug("Closing connection");
    detail::quit(*impl_, err);
    impl_->set_connected(false);
    impl_->set_pending_rows(false);
    error_code close_err;
    impl_->stream().close(close_err);
    if (!err)
        err = close_err;
}

void mysqlstream::connection::close()
{
    error_code err;
    diagnostics diag;
    close(err, diag);
    throw_on_error(err, diag);
}
