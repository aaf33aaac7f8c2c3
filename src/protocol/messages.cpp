//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <mysqlstream/client_errc.hpp>
#include <mysqlstream/server_errc.hpp>

#include "protocol/constants.hpp"
#include "protocol/messages.hpp"
#include "protocol/packet_reader.hpp"
#include "protocol/packet_writer.hpp"

#include <algorithm>
#include <string>

namespace mysqlstream {
namespace detail {
namespace {

std::string to_string(string_view v) { return std::string(v.data(), v.size()); }

// Length of the scramble sent in the first part of the server hello
constexpr std::size_t hello_auth_part1_size = 8;

error_code parse_hello_body(packet_reader& reader, server_hello& output)
{
    output.server_version = reader.read_string_null();
    output.connection_id = reader.read_int4();
    string_view auth1 = reader.read_fixed(hello_auth_part1_size);
    reader.skip(1);  // filler
    capability_flags caps = reader.read_int2();
    reader.skip(3);  // character set and status flags
    caps |= static_cast<capability_flags>(reader.read_int2()) << 16;
    if (reader.error())
        return reader.error();

    // The rest of the layout depends on CLIENT_PLUGIN_AUTH
    if (!has_all(caps, capability::plugin_auth))
        return client_errc::server_unsupported;

    std::size_t declared_auth_size = reader.read_int1();
    reader.skip(10);  // reserved

    // The second part of the scramble is at least 13 bytes long, NULL terminator included
    std::size_t auth2_size = declared_auth_size > hello_auth_part1_size ? declared_auth_size - hello_auth_part1_size
                                                                        : 0u;
    auth2_size = (std::max)(auth2_size, static_cast<std::size_t>(13u));
    string_view auth2 = reader.read_fixed(auth2_size);
    output.auth_plugin_name = reader.read_string_null();
    auto err = reader.finish();
    if (err)
        return err;

    output.server_capabilities = caps;
    output.auth_plugin_data.assign(auth1.begin(), auth1.end());
    output.auth_plugin_data.insert(output.auth_plugin_data.end(), auth2.begin(), auth2.end() - 1);
    return error_code();
}

error_code parse_auth_switch_body(packet_reader& reader, auth_switch& output)
{
    output.plugin_name = reader.read_string_null();
    string_view data = reader.read_string_eof();
    if (reader.error())
        return reader.error();

    // The scramble is followed by a NULL byte that isn't part of it
    if (!data.empty() && data.back() == '\0')
        data.remove_suffix(1);
    output.auth_data = boost::asio::const_buffer(data.data(), data.size());
    return error_code();
}

}  // namespace
}  // namespace detail
}  // namespace mysqlstream

mysqlstream::error_code mysqlstream::detail::parse_ok_body(boost::asio::const_buffer body, ok_view& output)
{
    packet_reader reader(body);
    output.affected_rows = reader.read_int_lenenc();
    output.last_insert_id = reader.read_int_lenenc();
    output.status_flags = reader.read_int2();
    output.warnings = reader.read_int2();

    // The info string may be omitted entirely. CLIENT_SESSION_TRACK is never requested
    output.info = reader.empty() ? string_view() : reader.read_string_lenenc();
    return reader.finish();
}

mysqlstream::ok_result mysqlstream::detail::to_ok_result(const ok_view& ok)
{
    ok_result res;
    res.affected_rows = ok.affected_rows;
    res.last_insert_id = ok.last_insert_id;
    res.status_flags = ok.status_flags;
    res.warnings = ok.warnings;
    res.info = to_string(ok.info);
    return res;
}

mysqlstream::error_code mysqlstream::detail::parse_err_body(
    boost::asio::const_buffer body,
    err_view& output,
    bool has_sql_state
)
{
    packet_reader reader(body);
    output.code = reader.read_int2();
    if (has_sql_state)
    {
        reader.skip(1);  // '#'
        output.sql_state = reader.read_fixed(sql_state_size);
    }
    else
    {
        output.sql_state = string_view();
    }
    output.message = reader.read_string_eof();
    return reader.finish();
}

mysqlstream::error_code mysqlstream::detail::server_error_from_body(
    boost::asio::const_buffer body,
    diagnostics& diag,
    bool has_sql_state
)
{
    err_view pack{};
    auto err = parse_err_body(body, pack, has_sql_state);
    if (err)
        return err;

    diagnostics_access::assign_server(diag, to_string(pack.message), to_string(pack.sql_state));

    // Any code is accepted: servers add new ones all the time
    return make_server_error_code(pack.code);
}

mysqlstream::error_code mysqlstream::detail::parse_ok_or_err(
    boost::asio::const_buffer msg,
    ok_view& output,
    diagnostics& diag
)
{
    packet_reader reader(msg);
    std::uint8_t header = reader.read_int1();
    if (reader.error())
        return reader.error();

    switch (header)
    {
    case ok_packet_header: return parse_ok_body(reader.rest(), output);
    case error_packet_header: return server_error_from_body(reader.rest(), diag);
    default: return client_errc::protocol_value_error;
    }
}

mysqlstream::detail::query_response mysqlstream::detail::parse_query_response(
    boost::asio::const_buffer msg,
    diagnostics& diag
)
{
    query_response res{};
    res.kind = query_response::kind_t::error;

    packet_reader reader(msg);
    if (reader.empty())
    {
        res.err = client_errc::incomplete_message;
        return res;
    }

    std::uint8_t header = *static_cast<const std::uint8_t*>(msg.data());
    if (header == ok_packet_header)
    {
        reader.skip(1);
        res.err = parse_ok_body(reader.rest(), res.ok);
        if (!res.err)
            res.kind = query_response::kind_t::ok;
    }
    else if (header == error_packet_header)
    {
        reader.skip(1);
        res.err = server_error_from_body(reader.rest(), diag);
    }
    else
    {
        // The whole message is the column count. LOCAL INFILE requests (0xfb and
        // a file name) end up here too, and fail with extra_bytes
        std::uint64_t num_columns = reader.read_int_lenenc();
        res.err = reader.finish();
        if (res.err)
            return res;
        if (num_columns == 0u || num_columns > 0xffffu)
        {
            res.err = client_errc::protocol_value_error;
            return res;
        }
        res.kind = query_response::kind_t::columns;
        res.num_columns = static_cast<std::size_t>(num_columns);
    }
    return res;
}

mysqlstream::error_code mysqlstream::detail::parse_column_definition(
    boost::asio::const_buffer msg,
    column_metadata& output
)
{
    packet_reader reader(msg);
    reader.read_string_lenenc();  // catalog, always "def"
    string_view database = reader.read_string_lenenc();
    string_view table = reader.read_string_lenenc();
    reader.read_string_lenenc();  // physical table
    string_view name = reader.read_string_lenenc();
    string_view org_name = reader.read_string_lenenc();
    string_view fixed = reader.read_string_lenenc();
    auto err = reader.finish();
    if (err)
        return err;

    // Fields may be appended to this block in newer servers, so bytes past
    // the ones we know about are ignored
    packet_reader fixed_reader(boost::asio::buffer(fixed.data(), fixed.size()));
    fixed_reader.skip(2);  // collation
    std::uint32_t column_length = fixed_reader.read_int4();
    std::uint8_t type = fixed_reader.read_int1();
    std::uint16_t flags = fixed_reader.read_int2();
    std::uint8_t decimals = fixed_reader.read_int1();
    if (fixed_reader.error())
        return fixed_reader.error();

    output = column_metadata(
        to_string(database),
        to_string(table),
        to_string(name),
        to_string(org_name),
        type,
        flags,
        decimals,
        column_length
    );
    return error_code();
}

mysqlstream::detail::row_packet_kind mysqlstream::detail::classify_row_packet(
    boost::asio::const_buffer msg,
    error_code& err,
    diagnostics& diag
)
{
    err.clear();
    if (msg.size() == 0u)
    {
        err = client_errc::incomplete_message;
        return row_packet_kind::error;
    }

    std::uint8_t header = *static_cast<const std::uint8_t*>(msg.data());

    // 0xfe also starts a row whose first value has an 8 byte length prefix.
    // Those are never shorter than an EOF packet
    if (header == eof_packet_header && msg.size() < max_eof_packet_size)
        return row_packet_kind::eof;

    if (header == error_packet_header)
    {
        err = server_error_from_body(msg + 1, diag);
        return row_packet_kind::error;
    }
    return row_packet_kind::row;
}

mysqlstream::error_code mysqlstream::detail::parse_server_hello(
    boost::asio::const_buffer msg,
    server_hello& output,
    diagnostics& diag
)
{
    packet_reader reader(msg);
    std::uint8_t protocol_version = reader.read_int1();
    if (reader.error())
        return reader.error();

    switch (protocol_version)
    {
    case handshake_protocol_version_10: return parse_hello_body(reader, output);
    case handshake_protocol_version_9: return client_errc::server_unsupported;

    // The server doesn't know our capabilities yet, so it assumes
    // no CLIENT_PROTOCOL_41 and omits the SQL state
    case error_packet_header: return server_error_from_body(reader.rest(), diag, false);
    default: return client_errc::protocol_value_error;
    }
}

mysqlstream::detail::login_response mysqlstream::detail::parse_login_response(
    boost::asio::const_buffer msg,
    diagnostics& diag
)
{
    login_response res{};
    res.kind = login_response::kind_t::error;

    packet_reader reader(msg);
    std::uint8_t header = reader.read_int1();
    if (reader.error())
    {
        res.err = reader.error();
        return res;
    }

    switch (header)
    {
    case ok_packet_header:
    {
        ok_view ok{};
        res.err = parse_ok_body(reader.rest(), ok);
        if (!res.err)
            res.kind = login_response::kind_t::ok;
        break;
    }
    case error_packet_header: res.err = server_error_from_body(reader.rest(), diag); break;
    case auth_switch_request_header:
        res.err = parse_auth_switch_body(reader, res.auth_sw);
        if (!res.err)
            res.kind = login_response::kind_t::auth_switch;
        break;
    case auth_more_data_header:
        res.kind = login_response::kind_t::more_data;
        res.more_data = reader.rest();
        break;
    default: res.err = client_errc::protocol_value_error; break;
    }
    return res;
}

void mysqlstream::detail::write_query(bytestring& buff, string_view sql)
{
    packet_writer writer(buff);
    writer.write_int1(com_query);
    writer.write_string_eof(sql);
}

void mysqlstream::detail::write_quit(bytestring& buff) { packet_writer(buff).write_int1(com_quit); }

void mysqlstream::detail::write_login_request(bytestring& buff, const login_request& req)
{
    packet_writer writer(buff);
    writer.write_int4(req.caps);
    writer.write_int4(req.max_packet_size);
    writer.write_int1(static_cast<std::uint8_t>(req.collation_id));
    writer.write_zeros(23);
    writer.write_string_null(req.username);
    writer.write_string_lenenc(
        string_view(static_cast<const char*>(req.auth_response.data()), req.auth_response.size())
    );
    if (has_all(req.caps, capability::connect_with_db))
        writer.write_string_null(req.database);
    writer.write_string_null(req.auth_plugin_name);
}

void mysqlstream::detail::write_auth_response(bytestring& buff, boost::asio::const_buffer auth_response)
{
    packet_writer(buff).write_bytes(auth_response);
}
