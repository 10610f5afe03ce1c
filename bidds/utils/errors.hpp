// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0

#ifndef BIDDS_UTILS_ERRORS_HPP
#define BIDDS_UTILS_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace bidds
{

//
// Exceptions raised by the data model layer. Everything thrown for bad input derives from
// bidds::Error, so a driver can report any failure with a single handler.
//

class Error : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

// A file could not be opened, read, or written.
class LoadError : public Error
{
  std::string filename_;

public:
  LoadError(std::string filename, std::string_view reason);

  [[nodiscard]] const std::string &filename() const { return filename_; }
};

// A file was read but its content is not a valid JSON document.
class MalformedInput : public Error
{
  std::string filename_, detail_;

public:
  MalformedInput(std::string filename, std::string detail);

  [[nodiscard]] const std::string &filename() const { return filename_; }
  [[nodiscard]] const std::string &detail() const { return detail_; }
};

// Base for every failure to match a record against its entity type. The path locates the
// offending value inside the record, for example "network.generators[1].bus".
class SchemaViolation : public Error
{
public:
  enum class Kind
  {
    UNKNOWN_FIELD,
    MISSING_FIELD,
    TYPE_MISMATCH
  };

private:
  Kind kind_;
  std::string path_, field_;

protected:
  SchemaViolation(Kind kind, std::string path, std::string field,
                  const std::string &message);

public:
  [[nodiscard]] Kind kind() const { return kind_; }
  [[nodiscard]] const std::string &path() const { return path_; }
  [[nodiscard]] const std::string &field() const { return field_; }
};

class UnknownField : public SchemaViolation
{
public:
  UnknownField(std::string path, std::string field);
};

class MissingField : public SchemaViolation
{
public:
  MissingField(std::string path, std::string field);
};

class TypeMismatch : public SchemaViolation
{
  std::string expected_, actual_;

public:
  TypeMismatch(std::string path, std::string field, std::string expected,
               std::string actual);

  [[nodiscard]] const std::string &expected() const { return expected_; }
  [[nodiscard]] const std::string &actual() const { return actual_; }
};

const char *ToString(SchemaViolation::Kind kind);

// Helpers for building record paths: JoinPath("network", "generators") is
// "network.generators" and IndexPath("generators", 1) is "generators[1]".
std::string JoinPath(std::string_view prefix, std::string_view name);
std::string IndexPath(std::string_view prefix, std::size_t index);

}  // namespace bidds

#endif  // BIDDS_UTILS_ERRORS_HPP
