//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLSTREAM_SRC_CHANNEL_CHANNEL_HPP
#define MYSQLSTREAM_SRC_CHANNEL_CHANNEL_HPP

#include <mysqlstream/error_code.hpp>
#include <mysqlstream/row_source.hpp>

#include <mysqlstream/detail/any_stream.hpp>

#include "protocol/constants.hpp"

#include <boost/asio/buffer.hpp>

#include <array>
#include <cstddef>
#include <cstdint>

namespace mysqlstream {
namespace detail {

// Reads and writes whole protocol messages over a stream, handling
// frame headers and sequence numbers. Messages bigger than max_packet_size
// are split into several frames.
class channel
{
public:
    channel(any_stream& stream, std::size_t initial_buffer_size);

    any_stream& stream() noexcept { return *stream_; }

    // A buffer for callers that need a scratch space to read messages into
    bytestring& shared_buffer() noexcept { return shared_buffer_; }

    // Every command starts a new sequence
    void reset_sequence_number(std::uint8_t value = 0) noexcept { sequence_number_ = value; }
    std::uint8_t sequence_number() const noexcept { return sequence_number_; }

    // Reads a message, replacing the contents of buffer
    void read(bytestring& buffer, error_code& err);

    // Writes a message. buffer should contain the payload, without any frame header
    void write(boost::asio::const_buffer buffer, error_code& err);

private:
    any_stream* stream_;
    std::array<std::uint8_t, frame_header_size> header_buffer_{};
    bytestring shared_buffer_;
    std::uint8_t sequence_number_{0};

    error_code process_header_read(std::uint32_t& size_to_read);
    void process_header_write(std::uint32_t size_to_write);
};

}  // namespace detail
}  // namespace mysqlstream

#endif
