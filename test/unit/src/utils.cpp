//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <mysqlstream/error_code.hpp>

#include "protocol/capabilities.hpp"
#include "protocol/constants.hpp"
#include "protocol/packet_writer.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/assert.hpp>
#include <boost/endian/conversion.hpp>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <iomanip>
#include <ostream>
#include <vector>

#include "test_unit/assert_buffer_equals.hpp"
#include "test_unit/create_coldef_frame.hpp"
#include "test_unit/create_err.hpp"
#include "test_unit/create_frame.hpp"
#include "test_unit/create_hello.hpp"
#include "test_unit/create_ok.hpp"
#include "test_unit/create_row_message.hpp"
#include "test_unit/test_stream.hpp"

using namespace mysqlstream;
using namespace mysqlstream::test;
namespace asio = boost::asio;

//
// assert_buffer_equals.hpp
//
std::ostream& mysqlstream::test::operator<<(std::ostream& os, buffer_printer buff)
{
    const auto* data = static_cast<const std::uint8_t*>(buff.buff.data());
    os << "{ ";
    for (std::size_t i = 0; i < buff.buff.size(); ++i)
    {
        os << "0x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]) << ", ";
    }
    return os << "}" << std::dec;
}

bool mysqlstream::test::buffer_equals(asio::const_buffer b1, asio::const_buffer b2)
{
    // If any of the buffers are empty (data() == nullptr), prevent
    // calling memcmp (UB)
    if (b1.size() == 0 || b2.size() == 0)
        return b1.size() == 0 && b2.size() == 0;

    if (b1.size() != b2.size())
        return false;

    return std::memcmp(b1.data(), b2.data(), b1.size()) == 0;
}

//
// test_stream.hpp
//
std::size_t mysqlstream::test::test_stream::get_size_to_read(std::size_t buffer_size) const
{
    auto it = read_break_offsets_.upper_bound(num_bytes_read_);
    std::size_t max_bytes_by_break = it == read_break_offsets_.end() ? std::size_t(-1)
                                                                     : *it - num_bytes_read_;
    return (std::min)({num_unread_bytes(), buffer_size, max_bytes_by_break});
}

std::size_t mysqlstream::test::test_stream::read_some(asio::mutable_buffer buff, error_code& ec)
{
    // Fail count
    error_code err = fail_count_.maybe_fail();
    if (err)
    {
        ec = err;
        return 0;
    }

    // If the user requested some bytes but we don't have any,
    // fail. In the real world, the stream would block until more
    // bytes are received, but this is a test, and this condition
    // indicates an error.
    if (num_unread_bytes() == 0 && buff.size() != 0)
    {
        ec = asio::error::eof;
        return 0;
    }

    // Actually read
    std::size_t bytes_to_transfer = get_size_to_read(buff.size());
    if (bytes_to_transfer)
    {
        std::memcpy(buff.data(), bytes_to_read_.data() + num_bytes_read_, bytes_to_transfer);
        num_bytes_read_ += bytes_to_transfer;
    }

    // Clear errors
    ec = error_code();

    return bytes_to_transfer;
}

std::size_t mysqlstream::test::test_stream::write_some(asio::const_buffer buff, error_code& ec)
{
    // Fail count
    error_code err = fail_count_.maybe_fail();
    if (err)
    {
        ec = err;
        return 0;
    }

    // Actually write
    std::size_t num_bytes_to_transfer = (std::min)(buff.size(), write_break_size_);
    const auto* first = static_cast<const std::uint8_t*>(buff.data());
    bytes_written_.insert(bytes_written_.end(), first, first + num_bytes_to_transfer);

    // Clear errors
    ec = error_code();

    return num_bytes_to_transfer;
}

void mysqlstream::test::test_stream::connect(const std::string& host, unsigned short port, error_code& ec)
{
    host_ = host;
    port_ = port;
    ec = connect_error_;
    open_ = !ec;
}

void mysqlstream::test::test_stream::close(error_code& ec)
{
    ++num_close_calls_;
    open_ = false;
    ec = error_code();
}

test_stream& mysqlstream::test::test_stream::add_bytes(const std::vector<std::uint8_t>& bytes)
{
    bytes_to_read_.insert(bytes_to_read_.end(), bytes.begin(), bytes.end());
    return *this;
}

test_stream& mysqlstream::test::test_stream::add_break(std::size_t byte_num)
{
    BOOST_ASSERT(byte_num <= bytes_to_read_.size());
    read_break_offsets_.insert(byte_num);
    return *this;
}

//
// create_frame.hpp
//
std::vector<std::uint8_t> mysqlstream::test::create_frame(
    std::uint8_t seqnum,
    const std::vector<std::uint8_t>& body
)
{
    BOOST_ASSERT(body.size() <= detail::max_packet_size);  // it should fit in a single frame

    // Compose the frame header
    std::array<std::uint8_t, detail::frame_header_size> frame_header{};
    boost::endian::store_little_u24(frame_header.data(), static_cast<std::uint32_t>(body.size()));
    frame_header[3] = seqnum;

    // Compose the frame.
    // Inserting the header separately (instead of using the range constructor)
    // avoids spurious gcc warnings
    std::vector<std::uint8_t> res;
    res.insert(res.end(), frame_header.begin(), frame_header.end());
    res.insert(res.end(), body.begin(), body.end());
    return res;
}

std::vector<std::uint8_t> mysqlstream::test::concat(
    std::vector<std::uint8_t> lhs,
    const std::vector<std::uint8_t>& rhs
)
{
    lhs.insert(lhs.end(), rhs.begin(), rhs.end());
    return lhs;
}

//
// create_ok.hpp
//
std::vector<std::uint8_t> mysqlstream::test::ok_builder::build_ok_body() const
{
    std::vector<std::uint8_t> res;
    detail::packet_writer writer(res);
    writer.write_int1(detail::ok_packet_header);
    writer.write_int_lenenc(affected_rows_);
    writer.write_int_lenenc(last_insert_id_);
    writer.write_int2(flags_);
    writer.write_int2(warnings_);
    if (!info_.empty())
        writer.write_string_lenenc(info_);
    return res;
}

std::vector<std::uint8_t> mysqlstream::test::ok_builder::build_eof_body() const
{
    std::vector<std::uint8_t> res;
    detail::packet_writer writer(res);
    writer.write_int1(detail::eof_packet_header);
    writer.write_int2(warnings_);
    writer.write_int2(flags_);
    return res;
}

//
// create_err.hpp
//
std::vector<std::uint8_t> mysqlstream::test::err_builder::build_body() const
{
    BOOST_ASSERT(sql_state_.size() == detail::sql_state_size);

    std::vector<std::uint8_t> res;
    detail::packet_writer writer(res);
    writer.write_int1(detail::error_packet_header);
    writer.write_int2(code_);
    if (has_sql_state_)
    {
        writer.write_int1('#');
        writer.write_string_eof(sql_state_);
    }
    writer.write_string_eof(msg_);
    return res;
}

//
// create_coldef_frame.hpp
//
std::vector<std::uint8_t> mysqlstream::test::create_coldef_body(const coldef_fields& def)
{
    // Fixed-length fields are transmitted as a length-encoded string
    std::vector<std::uint8_t> fixed_fields;
    detail::packet_writer fixed_writer(fixed_fields);
    fixed_writer.write_int2(def.collation_id);
    fixed_writer.write_int4(def.column_length);
    fixed_writer.write_int1(def.type);
    fixed_writer.write_int2(def.flags);
    fixed_writer.write_int1(def.decimals);
    fixed_writer.write_zeros(2);  // filler

    std::vector<std::uint8_t> res;
    detail::packet_writer writer(res);
    writer.write_string_lenenc("def");
    writer.write_string_lenenc(def.database);
    writer.write_string_lenenc(def.table);
    writer.write_string_lenenc(def.org_table);
    writer.write_string_lenenc(def.name);
    writer.write_string_lenenc(def.org_name);
    writer.write_string_lenenc(
        string_view(reinterpret_cast<const char*>(fixed_fields.data()), fixed_fields.size())
    );
    return res;
}

//
// create_row_message.hpp
//
std::vector<std::uint8_t> mysqlstream::test::create_text_row_body(std::initializer_list<text_field> fields)
{
    std::vector<std::uint8_t> res;
    detail::packet_writer writer(res);
    for (const auto& field : fields)
    {
        if (field.is_null)
            writer.write_int1(detail::null_column_marker);
        else
            writer.write_string_lenenc(field.value);
    }
    return res;
}

//
// create_hello.hpp
//
std::vector<std::uint8_t> mysqlstream::test::mnp_challenge()
{
    return {0x79, 0x64, 0x3d, 0x12, 0x1d, 0x71, 0x74, 0x47, 0x5f, 0x48,
            0x3e, 0x3e, 0x0b, 0x62, 0x0a, 0x03, 0x3d, 0x27, 0x3a, 0x4c};
}

std::vector<std::uint8_t> mysqlstream::test::hello_builder::build_body() const
{
    BOOST_ASSERT(auth_data_.size() >= 8u);

    std::vector<std::uint8_t> res;
    detail::packet_writer writer(res);
    writer.write_int1(detail::handshake_protocol_version_10);
    writer.write_string_null(server_version_);
    writer.write_int4(connection_id_);

    // First 8 bytes of the challenge, then a filler
    writer.write_bytes(asio::buffer(auth_data_.data(), 8));
    writer.write_zeros(1);

    writer.write_int2(static_cast<std::uint16_t>(caps_ & 0xffff));
    writer.write_int1(45);  // character set
    writer.write_int2(2);   // status flags
    writer.write_int2(static_cast<std::uint16_t>(caps_ >> 16));
    writer.write_int1(static_cast<std::uint8_t>(auth_data_.size() + 1));
    writer.write_zeros(10);  // reserved

    // Rest of the challenge, NULL-terminated and padded to at least 13 bytes
    std::size_t part2_size = auth_data_.size() - 8;
    writer.write_bytes(asio::buffer(auth_data_.data() + 8, part2_size));
    writer.write_zeros((std::max)(part2_size + 1u, std::size_t(13u)) - part2_size);

    writer.write_string_null(auth_plugin_);
    return res;
}

std::vector<std::uint8_t> mysqlstream::test::create_auth_switch_body(
    string_view plugin_name,
    const std::vector<std::uint8_t>& data
)
{
    std::vector<std::uint8_t> res;
    detail::packet_writer writer(res);
    writer.write_int1(detail::auth_switch_request_header);
    writer.write_string_null(plugin_name);
    writer.write_bytes(asio::buffer(data));
    writer.write_zeros(1);
    return res;
}
