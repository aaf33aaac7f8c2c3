//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLSTREAM_THROW_ON_ERROR_HPP
#define MYSQLSTREAM_THROW_ON_ERROR_HPP

#include <mysqlstream/diagnostics.hpp>
#include <mysqlstream/error_code.hpp>
#include <mysqlstream/error_with_diagnostics.hpp>

#include <boost/throw_exception.hpp>

namespace mysqlstream {

/**
 * \brief Throws an exception in case of error, including diagnostic information.
 * \details
 * If err indicates a failure (`err.failed() == true`), throws an exception that
 * derives from \ref error_with_diagnostics. The exception will make
 * `diag` available in \ref error_with_diagnostics::get_diagnostics.
 *
 * Typical use is checking a \ref cursor after the read loop:
 * `throw_on_error(cur.last_error(), cur.last_diagnostics())`.
 */
inline void throw_on_error(error_code err, const diagnostics& diag = {})
{
    if (err)
    {
        ::boost::throw_exception(error_with_diagnostics(err, diag));
    }
}

}  // namespace mysqlstream

#endif
