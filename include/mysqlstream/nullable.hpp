//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLSTREAM_NULLABLE_HPP
#define MYSQLSTREAM_NULLABLE_HPP

namespace mysqlstream {

/**
 * \brief A column value together with its NULL flag.
 * \details
 * Returned by the `read_nullable_xxx` family of \ref cursor functions.
 * When `is_null` is true, `value` holds a value-initialized `T`.
 * A value-initialized `T` with `is_null == false` is returned when the column
 * could not be read or converted; check \ref cursor::last_error to tell it
 * apart from a genuine zero.
 */
template <class T>
struct nullable
{
    /// The column value. Value-initialized if the column is NULL.
    T value{};

    /// Whether the column was NULL.
    bool is_null{};
};

template <class T>
bool operator==(const nullable<T>& lhs, const nullable<T>& rhs)
{
    return lhs.value == rhs.value && lhs.is_null == rhs.is_null;
}

template <class T>
bool operator!=(const nullable<T>& lhs, const nullable<T>& rhs)
{
    return !(lhs == rhs);
}

}  // namespace mysqlstream

#endif
