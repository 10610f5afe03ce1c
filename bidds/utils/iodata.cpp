// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0

#include "iodata.hpp"

#include <fstream>
#include <set>
#include <sstream>
#include <stack>
#include <string>
#include <system_error>
#include <fmt/format.h>
#include <fmt/os.h>
#include "utils/errors.hpp"
#include "utils/logging.hpp"
#include "utils/resolution.hpp"

namespace bidds
{

json LoadData(const std::string &filename)
{
  // Read the whole file into memory.
  std::stringstream buffer;
  {
    std::error_code ec;
    if (!fs::exists(filename, ec))
    {
      throw LoadError(filename, "no such file");
    }
    if (fs::is_directory(filename, ec))
    {
      throw LoadError(filename, "is a directory");
    }
    std::ifstream fi(filename);
    if (!fi.is_open())
    {
      throw LoadError(filename, "file could not be opened for reading");
    }
    buffer << fi.rdbuf();
    if (fi.bad())
    {
      throw LoadError(filename, "read failure");
    }
  }

  // Parse the document. Use a callback function to detect and throw errors for duplicate
  // keys, which the parser would otherwise silently overwrite.
  json data;
  std::stack<std::set<std::string>> parse_stack;
  json::parser_callback_t check_duplicate_keys =
      [&](int, json::parse_event_t event, json &parsed)
  {
    switch (event)
    {
      case json::parse_event_t::object_start:
        parse_stack.push(std::set<std::string>());
        break;
      case json::parse_event_t::object_end:
        parse_stack.pop();
        break;
      case json::parse_event_t::key:
        {
          const auto result = parse_stack.top().insert(parsed.get<std::string>());
          if (!result.second)
          {
            throw MalformedInput(
                filename, fmt::format("Duplicate key {} was already seen in this object!",
                                      parsed.dump()));
          }
        }
        break;
      default:
        break;
    }
    return true;
  };
  try
  {
    data = json::parse(buffer, check_duplicate_keys);
  }
  catch (const json::exception &e)
  {
    // Syntax errors, but also out-of-range numbers like 1e400.
    throw MalformedInput(filename, e.what());
  }
  Log::Debug("Loaded data from {}\n", filename);
  return data;
}

void DumpData(const json &data, const std::string &filename, int indent)
{
  // Encode before opening so that an existing file is left intact on failure.
  std::string text;
  try
  {
    text = data.dump(indent);
  }
  catch (const json::exception &e)
  {
    throw MalformedInput(filename, e.what());
  }
  try
  {
    auto out = fmt::output_file(filename,
                                fmt::file::WRONLY | fmt::file::CREATE | fmt::file::TRUNC);
    out.print("{}\n", text);
    out.close();
  }
  catch (const std::system_error &e)
  {
    throw LoadError(filename, e.what());
  }
  Log::Debug("Dumped data to {}\n", filename);
}

Model Load(const EntityType &type, const std::string &filename)
{
  const auto path = fs::absolute(fs::path(filename)).lexically_normal();
  const auto base = path.parent_path();
  ScopedBaseDirectory scope(base);
  json record = LoadData(path.string());
  try
  {
    return Validate(type, record, base);
  }
  catch (const SchemaViolation &e)
  {
    Log::Error("Failed to validate {}\n  {}\n", filename, e.what());
    throw;
  }
}

}  // namespace bidds
