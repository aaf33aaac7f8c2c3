//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <mysqlstream/conversion_errc.hpp>

#include "protocol/text_conversion.hpp"

#include <boost/lexical_cast/try_lexical_convert.hpp>

#include <cmath>
#include <cstddef>

namespace mysqlstream {
namespace detail {
namespace {

bool is_digit(char c) { return c >= '0' && c <= '9'; }

// Skips a run of digits starting at i, returning the number of digits skipped
std::size_t skip_digits(string_view from, std::size_t& i)
{
    std::size_t first = i;
    while (i < from.size() && is_digit(from[i]))
        ++i;
    return i - first;
}

void skip_sign(string_view from, std::size_t& i)
{
    if (i < from.size() && (from[i] == '+' || from[i] == '-'))
        ++i;
}

// [+-]digits
bool is_integer_syntax(string_view from)
{
    std::size_t i = 0;
    skip_sign(from, i);
    return skip_digits(from, i) > 0u && i == from.size();
}

// [+-](digits[.digits] | .digits)[(e|E)[+-]digits]
// Rejects the nan and inf literals that lexical_cast would otherwise accept
bool is_floating_point_syntax(string_view from)
{
    std::size_t i = 0;
    skip_sign(from, i);
    std::size_t num_digits = skip_digits(from, i);
    if (i < from.size() && from[i] == '.')
    {
        ++i;
        num_digits += skip_digits(from, i);
    }
    if (num_digits == 0u)
        return false;
    if (i < from.size() && (from[i] == 'e' || from[i] == 'E'))
    {
        ++i;
        skip_sign(from, i);
        if (skip_digits(from, i) == 0u)
            return false;
    }
    return i == from.size();
}

}  // namespace
}  // namespace detail
}  // namespace mysqlstream

mysqlstream::error_code mysqlstream::detail::parse_integer(
    string_view from,
    std::int64_t min_value,
    std::int64_t max_value,
    std::int64_t& to
)
{
    if (!is_integer_syntax(from))
        return conversion_errc::invalid_syntax;

    // The syntax is valid, so a failure here means that the value doesn't fit in 64 bits
    std::int64_t v = 0;
    bool ok = boost::conversion::try_lexical_convert(from.data(), from.size(), v);
    if (!ok || v < min_value || v > max_value)
        return conversion_errc::out_of_range;

    to = v;
    return error_code();
}

mysqlstream::error_code mysqlstream::detail::parse_double(string_view from, double& to)
{
    if (!is_floating_point_syntax(from))
        return conversion_errc::invalid_syntax;

    double v = 0.0;
    bool ok = boost::conversion::try_lexical_convert(from.data(), from.size(), v);
    if (!ok || std::isinf(v))
        return conversion_errc::out_of_range;

    to = v;
    return error_code();
}

mysqlstream::error_code mysqlstream::detail::parse_float(string_view from, float& to)
{
    double v = 0.0;
    auto err = parse_double(from, v);
    if (err)
        return err;

    // Values slightly above FLT_MAX still round to it
    float f = static_cast<float>(v);
    if (std::isinf(f))
        return conversion_errc::out_of_range;

    to = f;
    return error_code();
}

mysqlstream::error_code mysqlstream::detail::parse_bool(string_view from, bool& to)
{
    if (from == "1" || from == "t" || from == "T" || from == "TRUE" || from == "true" || from == "True")
    {
        to = true;
        return error_code();
    }
    if (from == "0" || from == "f" || from == "F" || from == "FALSE" || from == "false" || from == "False")
    {
        to = false;
        return error_code();
    }
    return conversion_errc::invalid_syntax;
}
