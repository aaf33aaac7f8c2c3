//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLSTREAM_CONNECTION_PARAMS_HPP
#define MYSQLSTREAM_CONNECTION_PARAMS_HPP

#include <cstddef>

namespace mysqlstream {

/**
 * \brief Configuration parameters for \ref connection objects.
 * \details Passed to the connection's constructor.
 */
struct connection_params
{
    /**
     * \brief Initial size of the connection's read buffer, in bytes.
     * \details The buffer grows as required to hold bigger messages.
     */
    std::size_t initial_read_buffer_size{1024};
};

}  // namespace mysqlstream

#endif
