//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLSTREAM_CURSOR_HPP
#define MYSQLSTREAM_CURSOR_HPP

#include <mysqlstream/blob.hpp>
#include <mysqlstream/column_metadata.hpp>
#include <mysqlstream/diagnostics.hpp>
#include <mysqlstream/error_code.hpp>
#include <mysqlstream/nullable.hpp>
#include <mysqlstream/row_source.hpp>
#include <mysqlstream/string_view.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace mysqlstream {

/// The state of a \ref cursor.
enum class cursor_state
{
    /// No row has been read yet.
    pending,

    /// A row is loaded. Columns may be read.
    on_row,

    /// The resultset was read until its end. Terminal.
    ended,

    /// The row source failed. Terminal.
    failed,
};

/**
 * \brief A forward-only cursor over the rows of a resultset.
 * \details
 * Rows are read one at a time by calling \ref advance. Once a row is loaded,
 * its columns are read in order, one column per accessor call, converting
 * each column's text into the requested type. No random access or rewind is possible.
 * \n
 * Accessors never throw. The first error encountered, either while reading rows
 * or while converting a value, is latched and reported by \ref last_error. Once an
 * error is latched, \ref advance returns false. Always check \ref last_error after
 * the read loop:
 * \code
 * while (cur.advance())
 * {
 *     auto id = cur.read_int64();
 *     auto name = cur.read_nullable_string();
 * }
 * throw_on_error(cur.last_error(), cur.last_diagnostics());
 * \endcode
 *
 * Cursors created by \ref connection::query keep the connection busy until
 * \ref advance returns false. Such cursors must not outlive their connection.
 * \n
 * Distinct objects: safe. Shared objects: unsafe.
 */
class cursor
{
public:
    /**
     * \brief Default constructor.
     * \details Default constructed cursors have `this->valid() == false`.
     */
    cursor() = default;

    /**
     * \brief Constructs a cursor reading rows from `source`.
     * \details `columns` describes the columns of each row, as returned by \ref columns.
     * \par Preconditions
     * `source != nullptr`
     */
    explicit cursor(std::unique_ptr<row_source> source, std::vector<column_metadata> columns = {});

    cursor(const cursor&) = delete;
    cursor(cursor&&) = default;
    cursor& operator=(const cursor&) = delete;
    cursor& operator=(cursor&&) = default;
    ~cursor() = default;

    /**
     * \brief Returns whether this object holds a row source.
     * \details Failed calls to \ref connection::query return invalid cursors.
     * Calling \ref advance on an invalid cursor returns false.
     */
    bool valid() const noexcept { return source_ != nullptr; }

    /**
     * \brief Loads the next row.
     * \details
     * Returns true if a row was loaded. Returns false if the resultset was read until
     * its end, if the row source failed or if an error has been latched. Once this
     * function returns false, it will keep returning false.
     * \n
     * This function may block on the underlying transport.
     */
    bool advance();

    /// Returns the current state.
    cursor_state state() const noexcept { return state_; }

    /// Returns true if the resultset was read until its end.
    bool complete() const noexcept { return state_ == cursor_state::ended; }

    /// Returns the first error encountered, or an empty error code.
    const error_code& last_error() const noexcept { return err_; }

    /// Returns the diagnostics associated to \ref last_error.
    const diagnostics& last_diagnostics() const noexcept { return diag_; }

    /// Returns metadata about the columns in each row.
    const std::vector<column_metadata>& columns() const noexcept { return columns_; }

    /**
     * \name Column accessors
     * \details
     * Each call consumes the next column of the current row.
     * The `read_nullable_xxx` functions report whether the column was NULL.
     * The `read_xxx` functions discard this flag, returning a value-initialized
     * object for NULL columns.
     * \n
     * If the column can't be read (there is no current row or all of its columns
     * have been consumed), \ref client_errc::incomplete_message is latched.
     * If its text can't be converted to the requested type, a \ref conversion_errc is latched.
     * In both cases, a value-initialized object is returned with `is_null == false`.
     */
    ///@{
    blob read_bytes() { return read_nullable_bytes().value; }
    nullable<blob> read_nullable_bytes();

    std::string read_string() { return read_nullable_string().value; }
    nullable<std::string> read_nullable_string();

    /**
     * \brief Reads a string without copying it.
     * \details The returned view points into the current row. It's
     * invalidated by the next call to \ref advance.
     */
    string_view read_string_view() { return read_nullable_string_view().value; }
    nullable<string_view> read_nullable_string_view();

    int read_int() { return read_nullable_int().value; }
    nullable<int> read_nullable_int();

    std::int8_t read_int8() { return read_nullable_int8().value; }
    nullable<std::int8_t> read_nullable_int8();

    std::int16_t read_int16() { return read_nullable_int16().value; }
    nullable<std::int16_t> read_nullable_int16();

    std::int32_t read_int32() { return read_nullable_int32().value; }
    nullable<std::int32_t> read_nullable_int32();

    std::int64_t read_int64() { return read_nullable_int64().value; }
    nullable<std::int64_t> read_nullable_int64();

    float read_float() { return read_nullable_float().value; }
    nullable<float> read_nullable_float();

    double read_double() { return read_nullable_double().value; }
    nullable<double> read_nullable_double();

    bool read_bool() { return read_nullable_bool().value; }
    nullable<bool> read_nullable_bool();
    ///@}

private:
    std::unique_ptr<row_source> source_;
    std::vector<column_metadata> columns_;
    bytestring packet_;
    std::size_t offset_{};
    cursor_state state_{cursor_state::pending};
    error_code err_;
    diagnostics diag_;

    void latch(error_code err, const diagnostics& diag = {});
    bool next_column(string_view& value, bool& is_null);

    template <class T>
    nullable<T> read_nullable_parsed();
};

}  // namespace mysqlstream

#endif
