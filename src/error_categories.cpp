//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <mysqlstream/client_errc.hpp>
#include <mysqlstream/conversion_errc.hpp>
#include <mysqlstream/server_errc.hpp>

#include <ostream>
#include <string>

namespace mysqlstream {
namespace detail {

namespace {

const char* error_to_string(client_errc error) noexcept
{
    switch (error)
    {
    case client_errc::incomplete_message: return "An incomplete message was received from the server";
    case client_errc::extra_bytes: return "Unexpected extra bytes at the end of a message were received";
    case client_errc::sequence_number_mismatch: return "Mismatched sequence numbers";
    case client_errc::server_unsupported:
        return "The server does not support the minimum required capabilities to establish the "
               "connection";
    case client_errc::protocol_value_error:
        return "An unexpected value was found in a server-received message";
    case client_errc::unknown_auth_plugin:
        return "The user employs an authentication plugin not known to this library";
    case client_errc::pending_rows:
        return "The connection has unread rows from a previous query. Read the cursor until its end "
               "before issuing another command";
    case client_errc::not_connected: return "The connection is not established";
    default: return "<unknown mysqlstream client error>";
    }
}

const char* error_to_string(conversion_errc error) noexcept
{
    switch (error)
    {
    case conversion_errc::invalid_syntax: return "The value has an invalid syntax for the requested type";
    case conversion_errc::out_of_range: return "The value is out of the range of the requested type";
    default: return "<unknown mysqlstream conversion error>";
    }
}

class client_category_t : public boost::system::error_category
{
public:
    const char* name() const noexcept final override { return "mysqlstream.client"; }
    std::string message(int ev) const final override { return error_to_string(static_cast<client_errc>(ev)); }
};

class conversion_category_t : public boost::system::error_category
{
public:
    const char* name() const noexcept final override { return "mysqlstream.conversion"; }
    std::string message(int ev) const final override
    {
        return error_to_string(static_cast<conversion_errc>(ev));
    }
};

class server_category_t : public boost::system::error_category
{
public:
    const char* name() const noexcept final override { return "mysqlstream.server"; }
    std::string message(int ev) const final override
    {
        // The server message is transmitted in the diagnostics object
        return "Server error " + std::to_string(ev);
    }
};

}  // namespace

}  // namespace detail
}  // namespace mysqlstream

const boost::system::error_category& mysqlstream::get_client_category() noexcept
{
    static detail::client_category_t res;
    return res;
}

const boost::system::error_category& mysqlstream::get_conversion_category() noexcept
{
    static detail::conversion_category_t res;
    return res;
}

const boost::system::error_category& mysqlstream::get_server_category() noexcept
{
    static detail::server_category_t res;
    return res;
}

mysqlstream::error_code mysqlstream::make_error_code(client_errc error)
{
    return error_code(static_cast<int>(error), get_client_category());
}

mysqlstream::error_code mysqlstream::make_error_code(conversion_errc error)
{
    return error_code(static_cast<int>(error), get_conversion_category());
}

std::ostream& mysqlstream::operator<<(std::ostream& os, client_errc v)
{
    return os << detail::error_to_string(v);
}

std::ostream& mysqlstream::operator<<(std::ostream& os, conversion_errc v)
{
    return os << detail::error_to_string(v);
}
