// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0

#ifndef BIDDS_UTILS_MODEL_HPP
#define BIDDS_UTILS_MODEL_HPP

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>
#include "utils/fields.hpp"
#include "utils/resolution.hpp"

namespace bidds
{

// Records keep their keys in document order so that the first violation reported is the
// first one a reader of the file would find.
using json = nlohmann::ordered_json;

class Model;

namespace internal
{

class Validator;

}  // namespace internal

// Validate a raw record against an entity type and return the resulting model. Relative
// PATH values and file references are resolved against base, or against
// ResolutionContext::BaseDirectory() if base is empty. Throws a SchemaViolation subclass
// on the first violation found.
Model Validate(const EntityType &type, const json &record, const fs::path &base = {});

//
// A validated instance of an entity type. A model owns its nested models and can only be
// created by validation; the only mutation is Set, which validates the new value first.
//
class Model
{
public:
  // Stored value of one field. Scalars (including resolved paths) live in scalar, nested
  // records in entities (a single element for ENTITY fields).
  struct Value
  {
    json scalar;
    std::vector<Model> entities;
  };

private:
  const EntityType *type_;

  // Present fields keyed by internal name. Absent optional fields have no entry.
  std::map<std::string, Value, std::less<>> values;

  explicit Model(const EntityType &type) : type_(&type) {}

  const Value &Get(std::string_view name, FieldType expected) const;

  friend class internal::Validator;

public:
  [[nodiscard]] const EntityType &type() const { return *type_; }

  [[nodiscard]] bool Has(std::string_view name) const;

  // Typed accessors by internal field name. These throw std::out_of_range if the field is
  // not declared, not set, or of a different semantic type.
  [[nodiscard]] const json &Scalar(std::string_view name) const;
  [[nodiscard]] std::string GetString(std::string_view name) const;
  [[nodiscard]] double GetNumber(std::string_view name) const;
  [[nodiscard]] std::int64_t GetInteger(std::string_view name) const;
  [[nodiscard]] bool GetBoolean(std::string_view name) const;
  [[nodiscard]] fs::path GetPath(std::string_view name) const;
  [[nodiscard]] const Model &Entity(std::string_view name) const;
  [[nodiscard]] const std::vector<Model> &Entities(std::string_view name) const;

  // Assign a raw value to a field, accepting the same input as validation of a full record
  // would. A null value clears an optional field. On failure the model is left unchanged.
  void Set(std::string_view name, const json &value);

  bool operator==(const Model &other) const;
  bool operator!=(const Model &other) const { return !(*this == other); }
};

bool operator==(const Model::Value &lhs, const Model::Value &rhs);

}  // namespace bidds

#endif  // BIDDS_UTILS_MODEL_HPP
