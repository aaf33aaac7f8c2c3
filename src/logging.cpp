//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace mysqlstream {
namespace detail {
namespace {

std::shared_ptr<spdlog::logger> create_logger()
{
    auto res = spdlog::get(logger_name);
    if (!res)
    {
        res = spdlog::stderr_color_mt(logger_name);
        res->set_level(spdlog::level::warn);
    }
    return res;
}

}  // namespace
}  // namespace detail
}  // namespace mysqlstream

spdlog::logger& mysqlstream::detail::get_logger()
{
    static std::shared_ptr<spdlog::logger> res = create_logger();
    return *res;
}
