//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <mysqlstream/error_with_diagnostics.hpp>

#include <string>

boost::system::system_error mysqlstream::error_with_diagnostics::create_base(
    const error_code& err,
    const diagnostics& diag
)
{
    string_view msg = diag.server_message().empty() ? diag.client_message() : diag.server_message();
    return msg.empty() ? boost::system::system_error(err)
                       : boost::system::system_error(err, std::string(msg.data(), msg.size()));
}
