//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLSTREAM_SRC_PROTOCOL_PACKET_READER_HPP
#define MYSQLSTREAM_SRC_PROTOCOL_PACKET_READER_HPP

#include <mysqlstream/client_errc.hpp>
#include <mysqlstream/error_code.hpp>
#include <mysqlstream/string_view.hpp>

#include <boost/asio/buffer.hpp>

#include <cstddef>
#include <cstdint>

namespace mysqlstream {
namespace detail {

// Reads protocol fields from a message body, front to back.
// The first failed read sets error() and every read after it returns zero
// or an empty view without consuming anything, so a sequence of reads
// only needs a single check at the end. Views point into the message.
class packet_reader
{
public:
    explicit packet_reader(boost::asio::const_buffer msg) noexcept
        : first_(static_cast<const std::uint8_t*>(msg.data())), last_(first_ + msg.size())
    {
    }

    std::size_t remaining() const noexcept { return static_cast<std::size_t>(last_ - first_); }
    bool empty() const noexcept { return first_ == last_; }
    error_code error() const noexcept { return err_; }

    // The unread part of the message
    boost::asio::const_buffer rest() const noexcept { return boost::asio::const_buffer(first_, remaining()); }

    // Records a semantic error found by the caller. The first error wins
    void fail(client_errc ec)
    {
        if (!err_)
            err_ = ec;
    }

    // Fixed size little endian integers
    std::uint8_t read_int1();
    std::uint16_t read_int2();
    std::uint32_t read_int3();
    std::uint32_t read_int4();
    std::uint64_t read_int8();

    // Length-encoded integer: a single byte, or 0xfc, 0xfd, 0xfe followed by 2, 3 or 8 bytes
    std::uint64_t read_int_lenenc();

    string_view read_fixed(std::size_t size);
    string_view read_string_null();
    string_view read_string_lenenc();
    string_view read_string_eof();
    void skip(std::size_t size) { take(size); }

    // The read error, if any. Otherwise, extra_bytes if part of the message was left unread
    error_code finish() const;

private:
    const std::uint8_t* first_;
    const std::uint8_t* last_;
    error_code err_;

    // Consumes size bytes. Returns nullptr and sets the error if there aren't enough
    const std::uint8_t* take(std::size_t size);
};

}  // namespace detail
}  // namespace mysqlstream

#endif
