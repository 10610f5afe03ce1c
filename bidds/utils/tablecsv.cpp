// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0

#include "tablecsv.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <fmt/format.h>
#include "utils/errors.hpp"
#include "utils/resolution.hpp"
#include "utils/strings.hpp"

namespace bidds
{

namespace
{

// Splits the table text into rows of cells. Quotes are tracked across the whole input so
// that quoted cells may contain separators and line breaks.
class csv_split_r
{
  std::string_view full_view;
  std::size_t cursor = 0;
  char col_separator;

public:
  csv_split_r(std::string_view full_view, char col_separator)
    : full_view(full_view), col_separator(col_separator)
  {
  }

  bool at_end() const { return cursor >= full_view.size(); }

  // Return the cells of the next row (empty for a blank line).
  std::vector<std::string> next()
  {
    std::vector<std::string> cells;
    std::string cell;
    bool quoted = false, was_quoted = false, any_content = false;
    auto Flush = [&]()
    {
      cells.emplace_back(was_quoted ? cell : std::string(utils::Trim(cell)));
      cell.clear();
      was_quoted = false;
    };
    while (cursor < full_view.size())
    {
      char c = full_view[cursor++];
      if (quoted)
      {
        if (c == '"')
        {
          if (cursor < full_view.size() && full_view[cursor] == '"')
          {
            cell += '"';
            cursor++;
          }
          else
          {
            quoted = false;
          }
        }
        else
        {
          cell += c;
        }
        continue;
      }
      if (c == '"' && utils::Trim(cell).empty())
      {
        quoted = was_quoted = true;
        cell.clear();
        any_content = true;
      }
      else if (c == col_separator)
      {
        Flush();
        any_content = true;
      }
      else if (c == '\n')
      {
        break;
      }
      else if (c != '\r')
      {
        if (!was_quoted)
        {
          cell += c;
        }
        any_content = any_content || utils::whitespace.find(c) == std::string_view::npos;
      }
    }
    if (quoted)
    {
      throw std::invalid_argument("Unterminated quoted cell in CSV table");
    }
    if (any_content)
    {
      Flush();
    }
    return cells;
  }
};

}  // namespace

Table::Table(std::string_view table_str, char col_separator)
{
  csv_split_r row_split(table_str, col_separator);

  // Handle first non-blank row separately since it defines the columns.
  while (header.empty() && !row_split.at_end())
  {
    header = row_split.next();
  }
  std::size_t line = 1;
  while (!row_split.at_end())
  {
    auto cells = row_split.next();
    line++;
    if (cells.empty())
    {
      continue;
    }
    if (cells.size() != header.size())
    {
      throw std::invalid_argument(
          fmt::format("CSV row {} has {} cells but the header has {} columns", line,
                      cells.size(), header.size()));
    }
    rows.push_back(std::move(cells));
  }
}

std::optional<std::size_t> Table::column_index(std::string_view name) const
{
  auto it = std::find(header.begin(), header.end(), name);
  if (it == header.end())
  {
    return std::nullopt;
  }
  return static_cast<std::size_t>(it - header.begin());
}

const std::string &Table::at(std::size_t row, std::string_view col) const
{
  auto idx = column_index(col);
  if (!idx)
  {
    throw std::out_of_range(fmt::format("CSV table has no column \"{}\"", col));
  }
  return at(row, *idx);
}

Table ReadTableCSV(const std::string &filename, char col_separator)
{
  std::error_code ec;
  if (!fs::is_regular_file(filename, ec))
  {
    throw LoadError(filename, "no such file");
  }
  std::ifstream file_buffer(filename, std::ios_base::in);
  if (!file_buffer.good())
  {
    throw LoadError(filename, "file could not be opened for reading");
  }
  std::stringstream file_buffer_str;
  file_buffer_str << file_buffer.rdbuf();
  try
  {
    return Table(file_buffer_str.str(), col_separator);
  }
  catch (const std::invalid_argument &e)
  {
    throw MalformedInput(filename, e.what());
  }
}

}  // namespace bidds
