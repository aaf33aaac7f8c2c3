//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLSTREAM_DETAIL_ANY_STREAM_HPP
#define MYSQLSTREAM_DETAIL_ANY_STREAM_HPP

#include <mysqlstream/error_code.hpp>

#include <boost/asio/buffer.hpp>

#include <cstddef>
#include <string>

namespace mysqlstream {
namespace detail {

// A type-erased, synchronous byte stream. The connection owns one.
class any_stream
{
public:
    virtual ~any_stream() {}

    // Reading
    virtual std::size_t read_some(boost::asio::mutable_buffer, error_code& ec) = 0;

    // Writing
    virtual std::size_t write_some(boost::asio::const_buffer, error_code& ec) = 0;

    // Connect and close
    virtual void connect(const std::string& host, unsigned short port, error_code& ec) = 0;
    virtual void close(error_code& ec) = 0;
    virtual bool is_open() const noexcept = 0;
};

}  // namespace detail
}  // namespace mysqlstream

#endif
