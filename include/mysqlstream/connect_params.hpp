//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLSTREAM_CONNECT_PARAMS_HPP
#define MYSQLSTREAM_CONNECT_PARAMS_HPP

#include <cstdint>
#include <string>

namespace mysqlstream {

/// The default TCP port for the MySQL protocol.
constexpr unsigned short default_port = 3306;

/**
 * \brief Parameters to be used in \ref connection::connect.
 * \details Contains the server address and the credentials to log in with.
 */
struct connect_params
{
    /// Host name or IP address of the server.
    std::string server_host{"localhost"};

    /// TCP port of the server.
    unsigned short server_port{default_port};

    /// User name to authenticate as.
    std::string username;

    /// Password for that username, possibly empty.
    std::string password;

    /// Database name to use, or empty string for no database (this is the default).
    std::string database;

    /**
     * \brief The ID of the collation to use for the connection.
     * \details Impacts how text queries and prepared statements are interpreted. Defaults to
     * `utf8mb4_general_ci`.
     */
    std::uint16_t connection_collation{45};
};

}  // namespace mysqlstream

#endif
