//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <mysqlstream/client_errc.hpp>

#include "auth/auth.hpp"
#include "logging.hpp"
#include "network_algorithms/handshake.hpp"
#include "protocol/capabilities.hpp"
#include "protocol/constants.hpp"
#include "protocol/messages.hpp"

#include <boost/asio/buffer.hpp>

namespace mysqlstream {
namespace detail {
namespace {

// The plugin we answer the server hello with. If the user account employs
// another one, the server asks us to switch
constexpr const char* default_auth_plugin = "mysql_native_password";

error_code process_capabilities(
    capability_flags server_caps,
    const connect_params& params,
    capability_flags& negotiated
)
{
    if (!has_all(server_caps, required_caps))
        return client_errc::server_unsupported;

    negotiated = required_caps | (server_caps & wanted_caps);
    if (!params.database.empty())
    {
        if (!has_all(server_caps, capability::connect_with_db))
            return client_errc::server_unsupported;
        negotiated |= capability::connect_with_db;
    }
    return error_code();
}

}  // namespace
}  // namespace detail
}  // namespace mysqlstream

void mysqlstream::detail::handshake(
    connection_impl& conn,
    const connect_params& params,
    error_code& err,
    diagnostics& diag
)
{
    err.clear();
    diag.clear();

    auto& chan = conn.get_channel();
    auto& read_buff = chan.shared_buffer();
    auto& write_buff = conn.write_buffer();
    chan.reset_sequence_number();

    // Read server greeting
    chan.read(read_buff, err);
    if (err)
        return;

    // Deserialize server greeting
    server_hello hello;
    err = parse_server_hello(boost::asio::buffer(read_buff), hello, diag);
    if (err)
        return;
    get_logger().debug(
        "Server greeting: version {}, connection id {}, auth plugin {}",
        log_view(hello.server_version),
        hello.connection_id,
        log_view(hello.auth_plugin_name)
    );

    // Capabilities
    capability_flags negotiated = 0;
    err = process_capabilities(hello.server_capabilities, params, negotiated);
    if (err)
        return;

    // Compute the auth response
    auth_response auth;
    err = compute_auth_response(
        default_auth_plugin,
        params.password,
        boost::asio::buffer(hello.auth_plugin_data),
        auth
    );
    if (err)
        return;

    // Send the login request
    write_buff.clear();
    write_login_request(
        write_buff,
        login_request{
            negotiated,
            static_cast<std::uint32_t>(max_packet_size),
            params.connection_collation,
            params.username,
            boost::asio::buffer(auth.data),
            params.database,
            auth.plugin_name,
        }
    );
    chan.write(boost::asio::buffer(write_buff), err);
    if (err)
        return;

    // Receive the response, until the server accepts or rejects us
    while (true)
    {
        chan.read(read_buff, err);
        if (err)
            return;

        auto response = parse_login_response(boost::asio::buffer(read_buff), diag);
        switch (response.kind)
        {
        case login_response::kind_t::ok:
            conn.set_connected(true);
            get_logger().debug("Logged in as {}", params.username);
            return;
        case login_response::kind_t::error: err = response.err; return;
        case login_response::kind_t::auth_switch:
            get_logger().debug("Server requested auth switch to {}", log_view(response.auth_sw.plugin_name));
            err = compute_auth_response(
                response.auth_sw.plugin_name,
                params.password,
                response.auth_sw.auth_data,
                auth
            );
            if (err)
                return;
            write_buff.clear();
            write_auth_response(write_buff, boost::asio::buffer(auth.data));
            chan.write(boost::asio::buffer(write_buff), err);
            if (err)
                return;
            break;
        default:
            // mysql_native_password never sends more data
            err = make_error_code(client_errc::protocol_value_error);
            return;
        }
    }
}
