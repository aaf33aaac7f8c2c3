//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MYSQLSTREAM_COLUMN_METADATA_HPP
#define MYSQLSTREAM_COLUMN_METADATA_HPP

#include <mysqlstream/string_view.hpp>

#include <mysqlstream/detail/column_flags.hpp>

#include <cstdint>
#include <string>
#include <utility>

namespace mysqlstream {

/**
 * \brief Metadata about a column in a SQL query.
 * \details This is a regular, value type. Instances of this class are not created by the user
 * directly, but by the library, from the column definitions the server sends before the rows.
 * They are available through \ref cursor::columns.
 */
class column_metadata
{
public:
    /// Default constructor.
    column_metadata() = default;

    // Private, do not use
    column_metadata(
        std::string database,
        std::string table,
        std::string name,
        std::string original_name,
        std::uint8_t type,
        std::uint16_t flags,
        std::uint8_t decimals,
        std::uint32_t column_length
    )
        : database_(std::move(database)),
          table_(std::move(table)),
          name_(std::move(name)),
          org_name_(std::move(original_name)),
          type_(type),
          flags_(flags),
          decimals_(decimals),
          column_length_(column_length)
    {
    }

    /// Returns the name of the database (schema) the column belongs to.
    string_view database() const noexcept { return database_; }

    /**
     * \brief Returns the name of the virtual table the column belongs to.
     * \details If the table was aliased, this will be the name of the alias.
     */
    string_view table() const noexcept { return table_; }

    /**
     * \brief Returns the name of the column.
     * \details If the column was aliased, this will be the name of the alias
     * (e.g. `"name"` in `"SELECT id AS name FROM t"`).
     */
    string_view column_name() const noexcept { return name_; }

    /// Returns the original (physical) name of the column, before any aliasing.
    string_view original_column_name() const noexcept { return org_name_; }

    /// Returns the protocol column type byte (MYSQL_TYPE_xxx).
    std::uint8_t type() const noexcept { return type_; }

    /// Returns the column definition flags (NOT_NULL_FLAG, UNSIGNED_FLAG...).
    std::uint16_t flags() const noexcept { return flags_; }

    /// Returns the number of decimals of the column.
    unsigned decimals() const noexcept { return decimals_; }

    /// Returns the maximum length of the column.
    unsigned column_length() const noexcept { return column_length_; }

    /// Returns true if the column is not allowed to be NULL.
    bool is_not_null() const noexcept { return flag_set(detail::column_flags::not_null); }

    /// Returns true if the column is unsigned.
    bool is_unsigned() const noexcept { return flag_set(detail::column_flags::unsigned_); }

    /// Returns true if the column is part of the table's primary key.
    bool is_primary_key() const noexcept { return flag_set(detail::column_flags::pri_key); }

private:
    std::string database_;
    std::string table_;
    std::string name_;
    std::string org_name_;
    std::uint8_t type_{};
    std::uint16_t flags_{};
    std::uint8_t decimals_{};
    std::uint32_t column_length_{};

    bool flag_set(std::uint16_t flag) const noexcept { return flags_ & flag; }
};

}  // namespace mysqlstream

#endif
