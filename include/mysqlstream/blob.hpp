//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLSTREAM_BLOB_HPP
#define MYSQLSTREAM_BLOB_HPP

#include <vector>

namespace mysqlstream {

/// Type used to represent raw column bytes, as returned by \ref cursor::read_bytes.
using blob = std::vector<unsigned char>;

}  // namespace mysqlstream

#endif
