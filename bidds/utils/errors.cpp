// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0

#include "errors.hpp"

#include <utility>
#include <fmt/format.h>

namespace bidds
{

namespace
{

std::string DisplayPath(const std::string &path)
{
  return path.empty() ? std::string("<root>") : path;
}

}  // namespace

LoadError::LoadError(std::string filename, std::string_view reason)
  : Error(fmt::format("Unable to access file \"{}\": {}", filename, reason)),
    filename_(std::move(filename))
{
}

MalformedInput::MalformedInput(std::string filename, std::string detail)
  : Error(fmt::format("Error parsing file \"{}\"!\n  {}", filename, detail)),
    filename_(std::move(filename)), detail_(std::move(detail))
{
}

SchemaViolation::SchemaViolation(Kind kind, std::string path, std::string field,
                                 const std::string &message)
  : Error(message), kind_(kind), path_(std::move(path)), field_(std::move(field))
{
}

UnknownField::UnknownField(std::string path, std::string field)
  : SchemaViolation(
        Kind::UNKNOWN_FIELD, path, std::move(field),
        fmt::format("Unknown field \"{}\" (extra fields are not permitted)", DisplayPath(path)))
{
}

MissingField::MissingField(std::string path, std::string field)
  : SchemaViolation(Kind::MISSING_FIELD, path, std::move(field),
                    fmt::format("Missing required field \"{}\"", DisplayPath(path)))
{
}

TypeMismatch::TypeMismatch(std::string path, std::string field, std::string expected,
                           std::string actual)
  : SchemaViolation(Kind::TYPE_MISMATCH, path, std::move(field),
                    fmt::format("Invalid value for \"{}\": expected {}, got {}",
                                DisplayPath(path), expected, actual)),
    expected_(std::move(expected)), actual_(std::move(actual))
{
}

const char *ToString(SchemaViolation::Kind kind)
{
  switch (kind)
  {
    case SchemaViolation::Kind::UNKNOWN_FIELD:
      return "UnknownField";
    case SchemaViolation::Kind::MISSING_FIELD:
      return "MissingField";
    case SchemaViolation::Kind::TYPE_MISMATCH:
      return "TypeMismatch";
  }
  return "SchemaViolation";
}

std::string JoinPath(std::string_view prefix, std::string_view name)
{
  if (prefix.empty())
  {
    return std::string(name);
  }
  return fmt::format("{}.{}", prefix, name);
}

std::string IndexPath(std::string_view prefix, std::size_t index)
{
  return fmt::format("{}[{}]", prefix, index);
}

}  // namespace bidds
