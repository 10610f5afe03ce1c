// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0

#ifndef BIDDS_UTILS_TABLECSV_HPP
#define BIDDS_UTILS_TABLECSV_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bidds
{

//
// Row-wise table of text cells read from a CSV file. The first row holds the column
// names. Cells are trimmed of surrounding whitespace and may be quoted with '"' to contain
// separators; a doubled quote inside a quoted cell is a literal quote.
//
class Table
{
  std::vector<std::string> header;
  std::vector<std::vector<std::string>> rows;

public:
  Table() = default;

  // Parse a table from text. Throws std::invalid_argument for rows with a different number
  // of cells than the header, or for an unterminated quoted cell.
  explicit Table(std::string_view table_str, char col_separator = ',');

  [[nodiscard]] bool empty() const { return header.empty(); }
  [[nodiscard]] std::size_t n_cols() const { return header.size(); }
  [[nodiscard]] std::size_t n_rows() const { return rows.size(); }

  [[nodiscard]] const std::vector<std::string> &columns() const { return header; }
  [[nodiscard]] std::optional<std::size_t> column_index(std::string_view name) const;

  [[nodiscard]] const std::string &at(std::size_t row, std::size_t col) const
  {
    return rows.at(row).at(col);
  }
  [[nodiscard]] const std::string &at(std::size_t row, std::string_view col) const;
};

// Read a CSV file into a Table. Throws LoadError if the file cannot be read and
// MalformedInput if its content is not a well-formed table.
Table ReadTableCSV(const std::string &filename, char col_separator = ',');

}  // namespace bidds

#endif  // BIDDS_UTILS_TABLECSV_HPP
