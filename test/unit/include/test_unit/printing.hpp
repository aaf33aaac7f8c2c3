//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLSTREAM_TEST_UNIT_INCLUDE_TEST_UNIT_PRINTING_HPP
#define MYSQLSTREAM_TEST_UNIT_INCLUDE_TEST_UNIT_PRINTING_HPP

#include <iosfwd>

namespace mysqlstream {

class diagnostics;
std::ostream& operator<<(std::ostream& os, const diagnostics& v);

enum class cursor_state;
std::ostream& operator<<(std::ostream& os, cursor_state v);

enum class read_row_result;
std::ostream& operator<<(std::ostream& os, read_row_result v);

}  // namespace mysqlstream

#endif
