//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "protocol/packet_reader.hpp"

#include <boost/endian/conversion.hpp>

#include <algorithm>

const std::uint8_t* mysqlstream::detail::packet_reader::take(std::size_t size)
{
    if (err_)
        return nullptr;
    if (size > remaining())
    {
        err_ = client_errc::incomplete_message;
        return nullptr;
    }
    const std::uint8_t* res = first_;
    first_ += size;
    return res;
}

std::uint8_t mysqlstream::detail::packet_reader::read_int1()
{
    const std::uint8_t* p = take(1);
    return p ? *p : 0u;
}

std::uint16_t mysqlstream::detail::packet_reader::read_int2()
{
    const std::uint8_t* p = take(2);
    return p ? boost::endian::load_little_u16(p) : 0u;
}

std::uint32_t mysqlstream::detail::packet_reader::read_int3()
{
    const std::uint8_t* p = take(3);
    return p ? boost::endian::load_little_u24(p) : 0u;
}

std::uint32_t mysqlstream::detail::packet_reader::read_int4()
{
    const std::uint8_t* p = take(4);
    return p ? boost::endian::load_little_u32(p) : 0u;
}

std::uint64_t mysqlstream::detail::packet_reader::read_int8()
{
    const std::uint8_t* p = take(8);
    return p ? boost::endian::load_little_u64(p) : 0u;
}

std::uint64_t mysqlstream::detail::packet_reader::read_int_lenenc()
{
    std::uint8_t first = read_int1();
    switch (first)
    {
    case 0xfc: return read_int2();
    case 0xfd: return read_int3();
    case 0xfe: return read_int8();
    default: return first;
    }
}

mysqlstream::string_view mysqlstream::detail::packet_reader::read_fixed(std::size_t size)
{
    const std::uint8_t* p = take(size);
    return p ? string_view(reinterpret_cast<const char*>(p), size) : string_view();
}

mysqlstream::string_view mysqlstream::detail::packet_reader::read_string_null()
{
    if (err_)
        return string_view();
    const std::uint8_t* terminator = std::find(first_, last_, std::uint8_t(0));
    if (terminator == last_)
    {
        err_ = client_errc::incomplete_message;
        return string_view();
    }
    string_view res(reinterpret_cast<const char*>(first_), static_cast<std::size_t>(terminator - first_));
    first_ = terminator + 1;
    return res;
}

mysqlstream::string_view mysqlstream::detail::packet_reader::read_string_lenenc()
{
    std::uint64_t size = read_int_lenenc();
    if (err_)
        return string_view();
    if (size > remaining())
    {
        err_ = client_errc::incomplete_message;
        return string_view();
    }
    return read_fixed(static_cast<std::size_t>(size));
}

mysqlstream::string_view mysqlstream::detail::packet_reader::read_string_eof() { return read_fixed(remaining()); }

mysqlstream::error_code mysqlstream::detail::packet_reader::finish() const
{
    if (err_)
        return err_;
    return empty() ? error_code() : error_code(client_errc::extra_bytes);
}
