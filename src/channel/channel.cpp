//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <mysqlstream/client_errc.hpp>

#include "channel/channel.hpp"

#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <boost/endian/conversion.hpp>

#include <algorithm>

mysqlstream::detail::channel::channel(any_stream& stream, std::size_t initial_buffer_size) : stream_(&stream)
{
    shared_buffer_.reserve(initial_buffer_size);
}

mysqlstream::error_code mysqlstream::detail::channel::process_header_read(std::uint32_t& size_to_read)
{
    std::uint8_t got = header_buffer_[3];
    if (got != sequence_number_)
    {
        return make_error_code(client_errc::sequence_number_mismatch);
    }
    ++sequence_number_;
    size_to_read = boost::endian::load_little_u24(header_buffer_.data());
    return error_code();
}

void mysqlstream::detail::channel::process_header_write(std::uint32_t size_to_write)
{
    boost::endian::store_little_u24(header_buffer_.data(), size_to_write);
    header_buffer_[3] = sequence_number_++;
}

void mysqlstream::detail::channel::read(bytestring& buffer, error_code& err)
{
    std::size_t transferred_size = 0;
    std::uint32_t size_to_read = 0;
    buffer.clear();
    err.clear();

    do
    {
        boost::asio::read(*stream_, boost::asio::buffer(header_buffer_), err);
        if (err)
            return;
        err = process_header_read(size_to_read);
        if (err)
            return;
        buffer.resize(buffer.size() + size_to_read);
        boost::asio::read(*stream_, boost::asio::buffer(buffer.data() + transferred_size, size_to_read), err);
        if (err)
            return;
        transferred_size += size_to_read;
    } while (size_to_read == max_packet_size);
}

void mysqlstream::detail::channel::write(boost::asio::const_buffer buffer, error_code& err)
{
    std::size_t transferred_size = 0;
    std::size_t bufsize = buffer.size();
    const auto* first = static_cast<const std::uint8_t*>(buffer.data());
    std::uint32_t size_to_write = 0;
    err.clear();

    // A frame of exactly max_packet_size must be followed by another
    // frame, even if it's empty. Empty messages take a single, empty frame
    do
    {
        size_to_write = static_cast<std::uint32_t>((std::min)(max_packet_size, bufsize - transferred_size));
        process_header_write(size_to_write);
        boost::asio::write(*stream_, boost::asio::buffer(header_buffer_), err);
        if (err)
            return;
        boost::asio::write(*stream_, boost::asio::buffer(first + transferred_size, size_to_write), err);
        if (err)
            return;
        transferred_size += size_to_write;
    } while (size_to_write == max_packet_size);
}
