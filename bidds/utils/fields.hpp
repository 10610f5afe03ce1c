// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0

#ifndef BIDDS_UTILS_FIELDS_HPP
#define BIDDS_UTILS_FIELDS_HPP

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace bidds
{

//
// Declarative schema tables. An EntityType is an ordered list of FieldDescriptors, and the
// same table drives validation, serialization, and schema export.
//

class EntityType;

// Semantic type of a field value.
enum class FieldType
{
  STRING,
  NUMBER,
  INTEGER,
  BOOLEAN,
  PATH,         // String naming a file, resolved against the base directory
  ENTITY,       // Nested record of another entity type
  ENTITY_LIST   // Sequence of nested records
};

// Name used in messages and as the JSON Schema primitive ("string", "array", ...).
const char *ToString(FieldType type);

struct FieldDescriptor
{
  // Internal field name.
  std::string name;

  FieldType type = FieldType::STRING;

  bool required = true;

  // Key used in the serialized form when serializing by alias. Empty means the name.
  std::string alias = "";

  // Human readable metadata for schema export.
  std::string title = "";
  std::string description = "";

  // Nested entity type for ENTITY and ENTITY_LIST fields.
  const EntityType *entity = nullptr;

  // For ENTITY fields, also accept a string naming a JSON file holding the nested record.
  bool allow_file_reference = false;

  FieldDescriptor(std::string name, FieldType type);
  FieldDescriptor(std::string name, FieldType type, const EntityType &entity);

  // Chainable modifiers used when declaring entity types.
  FieldDescriptor &Optional();
  FieldDescriptor &Alias(std::string key);
  FieldDescriptor &Title(std::string text);
  FieldDescriptor &Description(std::string text);
  FieldDescriptor &AllowFileReference();

  [[nodiscard]] const std::string &ExternalName() const
  {
    return alias.empty() ? name : alias;
  }
  [[nodiscard]] const std::string &Key(bool by_alias) const
  {
    return by_alias ? ExternalName() : name;
  }
  [[nodiscard]] bool IsComposite() const
  {
    return type == FieldType::ENTITY || type == FieldType::ENTITY_LIST;
  }
};

class EntityType
{
  std::string name_, title_, description_;
  std::vector<FieldDescriptor> fields_;

public:
  // Throws std::invalid_argument for duplicate field names or external names, and for
  // composite fields without a nested entity type.
  EntityType(std::string name, std::vector<FieldDescriptor> fields, std::string title = "",
             std::string description = "");

  EntityType(const EntityType &) = delete;
  EntityType &operator=(const EntityType &) = delete;

  [[nodiscard]] const std::string &name() const { return name_; }
  [[nodiscard]] const std::string &title() const { return title_.empty() ? name_ : title_; }
  [[nodiscard]] const std::string &description() const { return description_; }
  [[nodiscard]] const std::vector<FieldDescriptor> &fields() const { return fields_; }

  // Lookup by internal name only.
  [[nodiscard]] const FieldDescriptor *Find(std::string_view name) const;

  // Lookup by a record key, which may be either the external name or the internal name.
  [[nodiscard]] const FieldDescriptor *FindByKey(std::string_view key) const;
};

//
// Owner of a closed set of entity types. A type can only nest types already declared in
// the same registry, which keeps the composition graph acyclic.
//
class EntityRegistry
{
  std::vector<std::unique_ptr<EntityType>> types;
  std::map<std::string, const EntityType *, std::less<>> index;

public:
  EntityRegistry() = default;
  EntityRegistry(const EntityRegistry &) = delete;
  EntityRegistry &operator=(const EntityRegistry &) = delete;

  const EntityType &Declare(std::string name, std::vector<FieldDescriptor> fields,
                            std::string title = "", std::string description = "");

  [[nodiscard]] bool Contains(const EntityType &type) const;
  [[nodiscard]] const EntityType *Find(std::string_view name) const;

  // Throws std::invalid_argument if no type with the given name was declared.
  [[nodiscard]] const EntityType &at(std::string_view name) const;

  // Entity type names in declaration order.
  [[nodiscard]] std::vector<std::string> Names() const;

  [[nodiscard]] auto size() const { return types.size(); }
  [[nodiscard]] auto empty() const { return types.empty(); }
};

}  // namespace bidds

#endif  // BIDDS_UTILS_FIELDS_HPP
