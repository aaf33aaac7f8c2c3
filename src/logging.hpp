//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLSTREAM_SRC_LOGGING_HPP
#define MYSQLSTREAM_SRC_LOGGING_HPP

#include <mysqlstream/string_view.hpp>

#include <spdlog/logger.h>

#include <memory>

namespace mysqlstream {
namespace detail {

// Name of the spdlog logger the library writes to. Applications may register
// their own logger under this name before using the library to redirect output.
constexpr const char* logger_name = "mysqlstream";

// Returns the library logger, creating it on first use. If no logger
// named logger_name is registered, a stderr logger at the warn level is created.
spdlog::logger& get_logger();

// Formats a string_view without copying it
inline spdlog::string_view_t log_view(string_view v) noexcept { return spdlog::string_view_t(v.data(), v.size()); }

}  // namespace detail
}  // namespace mysqlstream

#endif
