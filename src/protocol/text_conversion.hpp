//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLSTREAM_SRC_PROTOCOL_TEXT_CONVERSION_HPP
#define MYSQLSTREAM_SRC_PROTOCOL_TEXT_CONVERSION_HPP

#include <mysqlstream/error_code.hpp>
#include <mysqlstream/string_view.hpp>

#include <cstdint>
#include <limits>
#include <type_traits>

namespace mysqlstream {
namespace detail {

// The text protocol sends every value as a string. These functions convert them
// to C++ types, returning a conversion_errc on failure. The output is left untouched on failure.

// Base 10, optional sign. Values outside [min_value, max_value] are out_of_range
error_code parse_integer(string_view from, std::int64_t min_value, std::int64_t max_value, std::int64_t& to);

// Decimal or exponent notation. NaN and infinity are rejected, since the SQL standard forbids them
error_code parse_double(string_view from, double& to);
error_code parse_float(string_view from, float& to);

// 1 t T TRUE true True / 0 f F FALSE false False
error_code parse_bool(string_view from, bool& to);

inline error_code parse_text_value(string_view from, double& to) { return parse_double(from, to); }
inline error_code parse_text_value(string_view from, float& to) { return parse_float(from, to); }
inline error_code parse_text_value(string_view from, bool& to) { return parse_bool(from, to); }

template <class IntType>
error_code parse_text_value(string_view from, IntType& to)
{
    static_assert(
        std::is_integral<IntType>::value && std::is_signed<IntType>::value,
        "parse_text_value requires a signed integer type"
    );
    std::int64_t res = 0;
    auto err = parse_integer(
        from,
        (std::numeric_limits<IntType>::min)(),
        (std::numeric_limits<IntType>::max)(),
        res
    );
    if (!err)
        to = static_cast<IntType>(res);
    return err;
}

}  // namespace detail
}  // namespace mysqlstream

#endif
