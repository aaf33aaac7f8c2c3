//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLSTREAM_CONVERSION_ERRC_HPP
#define MYSQLSTREAM_CONVERSION_ERRC_HPP

#include <mysqlstream/error_code.hpp>

#include <boost/system/error_code.hpp>

#include <iosfwd>

namespace mysqlstream {

/**
 * \brief Errors produced when converting a column's text into a typed value.
 * \details These are latched by \ref cursor accessors; they never end the row stream.
 */
enum class conversion_errc : int
{
    /// The column text is not a valid representation of the requested type.
    invalid_syntax = 1,

    /// The column text is a valid number, but it does not fit in the requested type.
    out_of_range,
};

/**
 * \brief Returns the error_category associated to \ref conversion_errc.
 * \par Thread safety
 * This function is thread-safe.
 */
const boost::system::error_category& get_conversion_category() noexcept;

/// Creates an \ref error_code from a \ref conversion_errc.
error_code make_error_code(conversion_errc error);

/// Streams a \ref conversion_errc.
std::ostream& operator<<(std::ostream& os, conversion_errc v);

}  // namespace mysqlstream

namespace boost {
namespace system {

template <>
struct is_error_code_enum<::mysqlstream::conversion_errc>
{
    static constexpr bool value = true;
};

}  // namespace system
}  // namespace boost

#endif
