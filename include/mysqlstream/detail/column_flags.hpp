//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLSTREAM_DETAIL_COLUMN_FLAGS_HPP
#define MYSQLSTREAM_DETAIL_COLUMN_FLAGS_HPP

#include <cstdint>

namespace mysqlstream {
namespace detail {

// Column flags, as sent in column definitions
namespace column_flags {

constexpr std::uint16_t not_null = 1;      // Field can't be NULL.
constexpr std::uint16_t pri_key = 2;       // Field is part of a primary key.
constexpr std::uint16_t unique_key = 4;    // Field is part of a unique key.
constexpr std::uint16_t multiple_key = 8;  // Field is part of a key.
constexpr std::uint16_t blob = 16;         // Field is a blob.
constexpr std::uint16_t unsigned_ = 32;    // Field is unsigned.
constexpr std::uint16_t zerofill = 64;     // Field is zerofill.
constexpr std::uint16_t binary = 128;      // Field is binary.

}  // namespace column_flags

}  // namespace detail
}  // namespace mysqlstream

#endif
