//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "tcp_stream.hpp"

#include <boost/asio/connect.hpp>

std::size_t mysqlstream::detail::tcp_stream::read_some(boost::asio::mutable_buffer buff, error_code& ec)
{
    return sock_.read_some(buff, ec);
}

std::size_t mysqlstream::detail::tcp_stream::write_some(boost::asio::const_buffer buff, error_code& ec)
{
    return sock_.write_some(buff, ec);
}

void mysqlstream::detail::tcp_stream::connect(const std::string& host, unsigned short port, error_code& ec)
{
    // Close any previous connection, so the object can be reused
    if (sock_.is_open())
    {
        error_code ignored;
        sock_.close(ignored);
    }

    // Resolve endpoints
    auto endpoints = resolv_.resolve(host, std::to_string(port), ec);
    if (ec)
        return;

    // Connect stream
    boost::asio::connect(sock_, endpoints, ec);
    if (ec)
        return;

    sock_.set_option(boost::asio::ip::tcp::no_delay(true), ec);
}

void mysqlstream::detail::tcp_stream::close(error_code& ec)
{
    // Shutdown fails if the server already closed the connection
    error_code ignored;
    sock_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
    sock_.close(ec);
}
