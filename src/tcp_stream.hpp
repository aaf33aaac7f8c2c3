//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLSTREAM_SRC_TCP_STREAM_HPP
#define MYSQLSTREAM_SRC_TCP_STREAM_HPP

#include <mysqlstream/error_code.hpp>

#include <mysqlstream/detail/any_stream.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <cstddef>
#include <string>

namespace mysqlstream {
namespace detail {

// The transport used by connections created from an io_context
class tcp_stream final : public any_stream
{
    boost::asio::ip::tcp::socket sock_;
    boost::asio::ip::tcp::resolver resolv_;

public:
    explicit tcp_stream(boost::asio::io_context& ctx) : sock_(ctx), resolv_(ctx) {}

    std::size_t read_some(boost::asio::mutable_buffer buff, error_code& ec) override;
    std::size_t write_some(boost::asio::const_buffer buff, error_code& ec) override;
    void connect(const std::string& host, unsigned short port, error_code& ec) override;
    void close(error_code& ec) override;
    bool is_open() const noexcept override { return sock_.is_open(); }
};

}  // namespace detail
}  // namespace mysqlstream

#endif
