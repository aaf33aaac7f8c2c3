//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLSTREAM_SRC_PROTOCOL_PACKET_WRITER_HPP
#define MYSQLSTREAM_SRC_PROTOCOL_PACKET_WRITER_HPP

#include <mysqlstream/row_source.hpp>
#include <mysqlstream/string_view.hpp>

#include <boost/asio/buffer.hpp>

#include <cstddef>
#include <cstdint>

namespace mysqlstream {
namespace detail {

// Appends protocol fields to the end of a buffer. Integers are little endian
class packet_writer
{
public:
    explicit packet_writer(bytestring& buff) noexcept : buff_(buff) {}

    void write_int1(std::uint8_t v) { buff_.push_back(v); }
    void write_int2(std::uint16_t v);
    void write_int3(std::uint32_t v);
    void write_int4(std::uint32_t v);
    void write_int8(std::uint64_t v);
    void write_int_lenenc(std::uint64_t v);

    void write_bytes(boost::asio::const_buffer data);
    void write_zeros(std::size_t size) { buff_.insert(buff_.end(), size, std::uint8_t(0)); }
    void write_string_eof(string_view v) { write_bytes(boost::asio::buffer(v.data(), v.size())); }
    void write_string_null(string_view v);
    void write_string_lenenc(string_view v);

private:
    bytestring& buff_;

    std::uint8_t* grow(std::size_t size);
};

}  // namespace detail
}  // namespace mysqlstream

#endif
