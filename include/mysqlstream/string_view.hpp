//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLSTREAM_STRING_VIEW_HPP
#define MYSQLSTREAM_STRING_VIEW_HPP

#include <boost/utility/string_view.hpp>

namespace mysqlstream {

/// Non-owning string type used throughout the library.
using string_view = boost::string_view;

}  // namespace mysqlstream

#endif
