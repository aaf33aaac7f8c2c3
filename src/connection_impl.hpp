//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLSTREAM_SRC_CONNECTION_IMPL_HPP
#define MYSQLSTREAM_SRC_CONNECTION_IMPL_HPP

#include <mysqlstream/client_errc.hpp>
#include <mysqlstream/connection_params.hpp>
#include <mysqlstream/error_code.hpp>
#include <mysqlstream/row_source.hpp>

#include <mysqlstream/detail/any_stream.hpp>

#include "channel/channel.hpp"

#include <memory>

namespace mysqlstream {
namespace detail {

// The state shared between a connection and the cursors it creates.
// Lives in the heap, so moving a connection doesn't invalidate cursors.
class connection_impl
{
    std::unique_ptr<any_stream> stream_;
    channel chan_;
    bytestring write_buffer_;
    bool connected_{false};
    bool pending_rows_{false};

public:
    connection_impl(std::unique_ptr<any_stream> stream, const connection_params& params)
        : stream_(std::move(stream)), chan_(*stream_, params.initial_read_buffer_size)
    {
    }

    any_stream& stream() noexcept { return *stream_; }
    channel& get_channel() noexcept { return chan_; }

    // Cleared by each command before serializing its request
    bytestring& write_buffer() noexcept { return write_buffer_; }

    bool is_connected() const noexcept { return connected_; }
    void set_connected(bool v) noexcept { connected_ = v; }

    // Whether a cursor still has rows to read from the channel
    bool has_pending_rows() const noexcept { return pending_rows_; }
    void set_pending_rows(bool v) noexcept { pending_rows_ = v; }

    // Checks that a new command can be written to the channel
    error_code check_ready() const noexcept
    {
        if (!connected_)
            return client_errc::not_connected;
        if (pending_rows_)
            return client_errc::pending_rows;
        return error_code();
    }
};

}  // namespace detail
}  // namespace mysqlstream

#endif
