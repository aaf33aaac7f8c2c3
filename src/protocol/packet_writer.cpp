//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "protocol/packet_writer.hpp"

#include <boost/endian/conversion.hpp>

std::uint8_t* mysqlstream::detail::packet_writer::grow(std::size_t size)
{
    std::size_t old_size = buff_.size();
    buff_.resize(old_size + size);
    return buff_.data() + old_size;
}

void mysqlstream::detail::packet_writer::write_int2(std::uint16_t v)
{
    boost::endian::store_little_u16(grow(2), v);
}

void mysqlstream::detail::packet_writer::write_int3(std::uint32_t v)
{
    boost::endian::store_little_u24(grow(3), v);
}

void mysqlstream::detail::packet_writer::write_int4(std::uint32_t v)
{
    boost::endian::store_little_u32(grow(4), v);
}

void mysqlstream::detail::packet_writer::write_int8(std::uint64_t v)
{
    boost::endian::store_little_u64(grow(8), v);
}

void mysqlstream::detail::packet_writer::write_int_lenenc(std::uint64_t v)
{
    if (v < 251)
    {
        write_int1(static_cast<std::uint8_t>(v));
    }
    else if (v < 0x10000)
    {
        write_int1(0xfc);
        write_int2(static_cast<std::uint16_t>(v));
    }
    else if (v < 0x1000000)
    {
        write_int1(0xfd);
        write_int3(static_cast<std::uint32_t>(v));
    }
    else
    {
        write_int1(0xfe);
        write_int8(v);
    }
}

void mysqlstream::detail::packet_writer::write_bytes(boost::asio::const_buffer data)
{
    const auto* first = static_cast<const std::uint8_t*>(data.data());
    buff_.insert(buff_.end(), first, first + data.size());
}

void mysqlstream::detail::packet_writer::write_string_null(string_view v)
{
    write_string_eof(v);
    write_int1(0);
}

void mysqlstream::detail::packet_writer::write_string_lenenc(string_view v)
{
    write_int_lenenc(v.size());
    write_string_eof(v);
}
