//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLSTREAM_SRC_PROTOCOL_MESSAGES_HPP
#define MYSQLSTREAM_SRC_PROTOCOL_MESSAGES_HPP

#include <mysqlstream/column_metadata.hpp>
#include <mysqlstream/diagnostics.hpp>
#include <mysqlstream/error_code.hpp>
#include <mysqlstream/ok_result.hpp>
#include <mysqlstream/row_source.hpp>
#include <mysqlstream/string_view.hpp>

#include "protocol/capabilities.hpp"

#include <boost/asio/buffer.hpp>

#include <cstddef>
#include <cstdint>

namespace mysqlstream {
namespace detail {

//
// Parsing. Messages come without their frame headers. Functions named
// parse_*_body expect the message type byte to be already consumed.
// Views in the outputs point into the message.
//

struct ok_view
{
    std::uint64_t affected_rows;
    std::uint64_t last_insert_id;
    std::uint16_t status_flags;
    std::uint16_t warnings;
    string_view info;
};
error_code parse_ok_body(boost::asio::const_buffer body, ok_view& output);

// Copies an ok_view into the public, owning type
ok_result to_ok_result(const ok_view& ok);

struct err_view
{
    std::uint16_t code;
    string_view sql_state;
    string_view message;
};
error_code parse_err_body(boost::asio::const_buffer body, err_view& output, bool has_sql_state = true);

// Parses an ERR packet body and translates it into a server error code,
// storing the server message in diag. Returns a client error if the packet is malformed
error_code server_error_from_body(boost::asio::const_buffer body, diagnostics& diag, bool has_sql_state = true);

// A message that must be either OK or ERR, like the answer to COM_QUIT or to a non-SELECT query
error_code parse_ok_or_err(boost::asio::const_buffer msg, ok_view& output, diagnostics& diag);

// First message of a query response: a column count, OK or ERR
struct query_response
{
    enum class kind_t
    {
        columns,
        ok,
        error
    } kind;
    std::size_t num_columns;
    ok_view ok;
    error_code err;
};
query_response parse_query_response(boost::asio::const_buffer msg, diagnostics& diag);

error_code parse_column_definition(boost::asio::const_buffer msg, column_metadata& output);

// Messages in a text resultset, after the column definitions
enum class row_packet_kind
{
    row,
    eof,
    error
};
row_packet_kind classify_row_packet(boost::asio::const_buffer msg, error_code& err, diagnostics& diag);

struct server_hello
{
    string_view server_version;
    std::uint32_t connection_id;
    bytestring auth_plugin_data;
    capability_flags server_capabilities{};
    string_view auth_plugin_name;
};
error_code parse_server_hello(boost::asio::const_buffer msg, server_hello& output, diagnostics& diag);

struct auth_switch
{
    string_view plugin_name;
    boost::asio::const_buffer auth_data;
};

// What the server may answer to our login request
struct login_response
{
    enum class kind_t
    {
        ok,
        error,
        auth_switch,
        more_data
    } kind;
    error_code err;
    auth_switch auth_sw;
    boost::asio::const_buffer more_data;
};
login_response parse_login_response(boost::asio::const_buffer msg, diagnostics& diag);

//
// Serialization. Functions append the message payload to the buffer.
//

void write_query(bytestring& buff, string_view sql);
void write_quit(bytestring& buff);

struct login_request
{
    capability_flags caps;
    std::uint32_t max_packet_size;
    std::uint32_t collation_id;
    string_view username;
    boost::asio::const_buffer auth_response;
    string_view database;
    string_view auth_plugin_name;
};
void write_login_request(bytestring& buff, const login_request& req);

// Answer to an auth switch request: the raw auth response
void write_auth_response(bytestring& buff, boost::asio::const_buffer auth_response);

}  // namespace detail
}  // namespace mysqlstream

#endif
