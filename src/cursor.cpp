//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <mysqlstream/client_errc.hpp>
#include <mysqlstream/cursor.hpp>

#include "logging.hpp"
#include "protocol/row_value.hpp"
#include "protocol/text_conversion.hpp"

#include <boost/asio/buffer.hpp>

#include <utility>

mysqlstream::cursor::cursor(std::unique_ptr<row_source> source, std::vector<column_metadata> columns)
    : source_(std::move(source)), columns_(std::move(columns))
{
}

void mysqlstream::cursor::latch(error_code err, const diagnostics& diag)
{
    // First error wins
    if (err_)
        return;
    detail::get_logger().debug("Cursor error: {}", err.message());
    err_ = err;
    diag_ = diag;
}

bool mysqlstream::cursor::advance()
{
    if (!source_ || state_ == cursor_state::ended || state_ == cursor_state::failed || err_)
        return false;

    error_code err;
    diagnostics diag;
    switch (source_->read_row(packet_, err, diag))
    {
    case read_row_result::row:
        offset_ = 0;
        state_ = cursor_state::on_row;
        return true;
    case read_row_result::eof:
        packet_.clear();
        state_ = cursor_state::ended;
        return false;
    default:
        packet_.clear();
        state_ = cursor_state::failed;
        latch(err, diag);
        return false;
    }
}

bool mysqlstream::cursor::next_column(string_view& value, bool& is_null)
{
    if (state_ != cursor_state::on_row)
    {
        diagnostics diag;
        detail::diagnostics_access::assign_client(diag, "No row is loaded. Call advance() before reading columns");
        latch(client_errc::incomplete_message, diag);
        return false;
    }

    detail::row_value res{};
    auto err = detail::read_row_value(boost::asio::buffer(packet_), offset_, res);
    if (err)
    {
        diagnostics diag;
        detail::diagnostics_access::assign_client(diag, "Attempt to read past the last column of the row");
        latch(err, diag);
        return false;
    }

    offset_ = res.next_offset;
    value = res.value;
    is_null = res.is_null;
    return true;
}

template <class T>
mysqlstream::nullable<T> mysqlstream::cursor::read_nullable_parsed()
{
    nullable<T> res;
    string_view value;
    bool is_null = false;
    if (!next_column(value, is_null))
        return res;

    if (is_null)
    {
        res.is_null = true;
        return res;
    }

    // On failure, res.value is left value-initialized
    auto err = detail::parse_text_value(value, res.value);
    if (err)
        latch(err);
    return res;
}

mysqlstream::nullable<mysqlstream::blob> mysqlstream::cursor::read_nullable_bytes()
{
    nullable<blob> res;
    string_view value;
    if (next_column(value, res.is_null))
        res.value.assign(value.begin(), value.end());
    return res;
}

mysqlstream::nullable<std::string> mysqlstream::cursor::read_nullable_string()
{
    nullable<std::string> res;
    string_view value;
    if (next_column(value, res.is_null))
        res.value.assign(value.data(), value.size());
    return res;
}

mysqlstream::nullable<mysqlstream::string_view> mysqlstream::cursor::read_nullable_string_view()
{
    nullable<string_view> res;
    next_column(res.value, res.is_null);
    return res;
}

mysqlstream::nullable<int> mysqlstream::cursor::read_nullable_int() { return read_nullable_parsed<int>(); }

mysqlstream::nullable<std::int8_t> mysqlstream::cursor::read_nullable_int8()
{
    return read_nullable_parsed<std::int8_t>();
}

mysqlstream::nullable<std::int16_t> mysqlstream::cursor::read_nullable_int16()
{
    return read_nullable_parsed<std::int16_t>();
}

mysqlstream::nullable<std::int32_t> mysqlstream::cursor::read_nullable_int32()
{
    return read_nullable_parsed<std::int32_t>();
}

mysqlstream::nullable<std::int64_t> mysqlstream::cursor::read_nullable_int64()
{
    return read_nullable_parsed<std::int64_t>();
}

mysqlstream::nullable<float> mysqlstream::cursor::read_nullable_float() { return read_nullable_parsed<float>(); }

mysqlstream::nullable<double> mysqlstream::cursor::read_nullable_double()
{
    return read_nullable_parsed<double>();
}

mysqlstream::nullable<bool> mysqlstream::cursor::read_nullable_bool() { return read_nullable_parsed<bool>(); }
