//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLSTREAM_DIAGNOSTICS_HPP
#define MYSQLSTREAM_DIAGNOSTICS_HPP

#include <mysqlstream/string_view.hpp>

#include <string>
#include <utility>

namespace mysqlstream {

namespace detail {
struct diagnostics_access;
}

/**
 * \brief Contains additional information about errors.
 * \details
 * This class is a container for additional diagnostics about an operation that
 * failed. It can contain server-generated messages (\ref server_message), together with
 * the SQL state the server reported (\ref sql_state), or client-side messages (\ref client_message).
 */
class diagnostics
{
public:
    /**
     * \brief Constructs a diagnostics object with empty error messages.
     * \par Exception safety
     * No-throw guarantee.
     */
    diagnostics() = default;

    /**
     * \brief Gets the client-generated error message.
     * \details
     * Contrary to \ref server_message, the client message never contains any string data
     * returned by the server, and is always ASCII-encoded.
     *
     * \par Object lifetimes
     * The returned view is valid as long as `*this` is alive, hasn't been assigned-to
     * or moved-from, and \ref clear hasn't been called.
     */
    string_view client_message() const noexcept { return is_server_ ? string_view() : string_view(msg_); }

    /**
     * \brief Gets the server-generated error message.
     * \details
     * It's encoded according to the connection's character set. It may potentially contain user input.
     *
     * \par Object lifetimes
     * The returned view is valid as long as `*this` is alive, hasn't been assigned-to
     * or moved-from, and \ref clear hasn't been called.
     */
    string_view server_message() const noexcept { return is_server_ ? string_view(msg_) : string_view(); }

    /**
     * \brief Gets the five-character SQL state sent by the server, if any.
     * \details Empty for client-generated errors and for errors sent before the handshake completes.
     */
    string_view sql_state() const noexcept { return string_view(sql_state_); }

    /**
     * \brief Clears the error messages.
     * \par Exception safety
     * No-throw guarantee.
     */
    void clear() noexcept
    {
        is_server_ = false;
        msg_.clear();
        sql_state_.clear();
    }

private:
    bool is_server_{};
    std::string msg_;
    std::string sql_state_;

    friend bool operator==(const diagnostics& lhs, const diagnostics& rhs) noexcept;
    friend struct detail::diagnostics_access;
};

/**
 * \relates diagnostics
 * \brief Compares two diagnostics objects.
 */
inline bool operator==(const diagnostics& lhs, const diagnostics& rhs) noexcept
{
    return lhs.is_server_ == rhs.is_server_ && lhs.msg_ == rhs.msg_ && lhs.sql_state_ == rhs.sql_state_;
}

/**
 * \relates diagnostics
 * \brief Compares two diagnostics objects.
 */
inline bool operator!=(const diagnostics& lhs, const diagnostics& rhs) noexcept { return !(lhs == rhs); }

namespace detail {

struct diagnostics_access
{
    static void assign_client(diagnostics& obj, std::string from)
    {
        obj.msg_ = std::move(from);
        obj.sql_state_.clear();
        obj.is_server_ = false;
    }

    static void assign_server(diagnostics& obj, std::string from, std::string sql_state = {})
    {
        obj.msg_ = std::move(from);
        obj.sql_state_ = std::move(sql_state);
        obj.is_server_ = true;
    }
};

}  // namespace detail

}  // namespace mysqlstream

#endif
