//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <mysqlstream/client_errc.hpp>
#include <mysqlstream/conversion_errc.hpp>
#include <mysqlstream/is_fatal_error.hpp>
#include <mysqlstream/server_errc.hpp>

bool mysqlstream::is_fatal_error(error_code ec) noexcept
{
    // If there is no failure, it's not fatal
    if (!ec)
        return false;

    // Retrieve the error category
    const auto& cat = ec.category();

    if (cat == get_server_category() || cat == get_conversion_category())
    {
        return false;
    }
    else if (cat == get_client_category())
    {
        auto code = static_cast<client_errc>(ec.value());
        switch (code)
        {
        // These are detected before any I/O takes place
        case client_errc::pending_rows:
        case client_errc::not_connected: return false;
        default: return true;
        }
    }
    else
    {
        // Network errors are fatal
        return true;
    }
}
