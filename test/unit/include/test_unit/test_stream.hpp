//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLSTREAM_TEST_UNIT_INCLUDE_TEST_UNIT_TEST_STREAM_HPP
#define MYSQLSTREAM_TEST_UNIT_INCLUDE_TEST_UNIT_TEST_STREAM_HPP

#include <mysqlstream/client_errc.hpp>
#include <mysqlstream/error_code.hpp>

#include <mysqlstream/detail/any_stream.hpp>

#include <cstddef>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace mysqlstream {
namespace test {

// Makes the N-th I/O operation fail with the given error
class fail_count
{
    std::size_t fail_after_;
    error_code err_;

public:
    static constexpr std::size_t never_fail = std::size_t(-1);

    explicit fail_count(
        std::size_t fail_after = never_fail,
        error_code err = make_error_code(client_errc::server_unsupported)
    ) noexcept
        : fail_after_(fail_after), err_(err)
    {
    }

    error_code maybe_fail() noexcept
    {
        if (fail_after_ == never_fail)
            return error_code();
        return --fail_after_ == 0 ? err_ : error_code();
    }
};

// An in-memory stream. Reads are served from the bytes added with add_bytes,
// and writes are recorded so they can be inspected later
class test_stream final : public detail::any_stream
{
public:
    test_stream() = default;

    // Setters
    test_stream& add_bytes(const std::vector<std::uint8_t>& bytes);
    test_stream& add_break(std::size_t byte_num);
    test_stream& add_break() { return add_break(bytes_to_read_.size()); }
    test_stream& set_write_break_size(std::size_t size) noexcept
    {
        write_break_size_ = size;
        return *this;
    }
    test_stream& set_fail_count(const fail_count& fc) noexcept
    {
        fail_count_ = fc;
        return *this;
    }
    test_stream& set_connect_error(error_code err) noexcept
    {
        connect_error_ = err;
        return *this;
    }
    void clear_bytes_written() { bytes_written_.clear(); }

    // Getting test results
    std::size_t num_bytes_read() const noexcept { return num_bytes_read_; }
    std::size_t num_unread_bytes() const noexcept { return bytes_to_read_.size() - num_bytes_read_; }
    const std::vector<std::uint8_t>& bytes_written() const noexcept { return bytes_written_; }
    const std::string& connected_host() const noexcept { return host_; }
    unsigned short connected_port() const noexcept { return port_; }
    std::size_t num_close_calls() const noexcept { return num_close_calls_; }

    // Stream operations
    std::size_t read_some(boost::asio::mutable_buffer buff, error_code& ec) override;
    std::size_t write_some(boost::asio::const_buffer buff, error_code& ec) override;
    void connect(const std::string& host, unsigned short port, error_code& ec) override;
    void close(error_code& ec) override;
    bool is_open() const noexcept override { return open_; }

private:
    std::vector<std::uint8_t> bytes_to_read_;
    std::set<std::size_t> read_break_offsets_;
    std::size_t num_bytes_read_{0};
    std::vector<std::uint8_t> bytes_written_;
    fail_count fail_count_;
    std::size_t write_break_size_{1024};
    error_code connect_error_;
    std::string host_;
    unsigned short port_{0};
    bool open_{false};
    std::size_t num_close_calls_{0};

    std::size_t get_size_to_read(std::size_t buffer_size) const;
};

}  // namespace test
}  // namespace mysqlstream

#endif
