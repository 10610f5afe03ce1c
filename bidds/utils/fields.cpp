// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0

#include "fields.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <utility>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace bidds
{

const char *ToString(FieldType type)
{
  switch (type)
  {
    case FieldType::STRING:
    case FieldType::PATH:
      return "string";
    case FieldType::NUMBER:
      return "number";
    case FieldType::INTEGER:
      return "integer";
    case FieldType::BOOLEAN:
      return "boolean";
    case FieldType::ENTITY:
      return "object";
    case FieldType::ENTITY_LIST:
      return "array";
  }
  return "unknown";
}

FieldDescriptor::FieldDescriptor(std::string name, FieldType type)
  : name(std::move(name)), type(type)
{
}

FieldDescriptor::FieldDescriptor(std::string name, FieldType type, const EntityType &entity)
  : name(std::move(name)), type(type), entity(&entity)
{
}

FieldDescriptor &FieldDescriptor::Optional()
{
  required = false;
  return *this;
}

FieldDescriptor &FieldDescriptor::Alias(std::string key)
{
  alias = std::move(key);
  return *this;
}

FieldDescriptor &FieldDescriptor::Title(std::string text)
{
  title = std::move(text);
  return *this;
}

FieldDescriptor &FieldDescriptor::Description(std::string text)
{
  description = std::move(text);
  return *this;
}

FieldDescriptor &FieldDescriptor::AllowFileReference()
{
  allow_file_reference = true;
  return *this;
}

EntityType::EntityType(std::string name, std::vector<FieldDescriptor> fields,
                       std::string title, std::string description)
  : name_(std::move(name)), title_(std::move(title)), description_(std::move(description)),
    fields_(std::move(fields))
{
  if (name_.empty())
  {
    throw std::invalid_argument("Entity type name must not be empty!");
  }
  std::set<std::string_view> keys;
  for (const auto &field : fields_)
  {
    if (field.name.empty())
    {
      throw std::invalid_argument(
          fmt::format("Entity type \"{}\" declares a field without a name!", name_));
    }
    if (field.IsComposite() && !field.entity)
    {
      throw std::invalid_argument(
          fmt::format("Field \"{}.{}\" of type {} requires a nested entity type!", name_,
                      field.name, ToString(field.type)));
    }
    if (!field.IsComposite() && field.entity)
    {
      throw std::invalid_argument(fmt::format(
          "Scalar field \"{}.{}\" cannot reference an entity type!", name_, field.name));
    }
    if (field.allow_file_reference && field.type != FieldType::ENTITY)
    {
      throw std::invalid_argument(fmt::format(
          "Only entity fields can accept file references (\"{}.{}\")!", name_, field.name));
    }

    // A key is either a name or an alias, and both namespaces are shared: an alias equal
    // to another field's name would make record keys ambiguous.
    if (!keys.insert(field.name).second)
    {
      throw std::invalid_argument(
          fmt::format("Duplicate field key \"{}\" in entity type \"{}\"!", field.name, name_));
    }
    if (!field.alias.empty() && field.alias != field.name &&
        !keys.insert(field.alias).second)
    {
      throw std::invalid_argument(fmt::format(
          "Duplicate field key \"{}\" in entity type \"{}\"!", field.alias, name_));
    }
  }
}

const FieldDescriptor *EntityType::Find(std::string_view name) const
{
  auto it = std::find_if(fields_.begin(), fields_.end(),
                         [name](const FieldDescriptor &field) { return field.name == name; });
  return (it != fields_.end()) ? &(*it) : nullptr;
}

const FieldDescriptor *EntityType::FindByKey(std::string_view key) const
{
  auto it = std::find_if(fields_.begin(), fields_.end(),
                         [key](const FieldDescriptor &field)
                         { return field.name == key || field.ExternalName() == key; });
  return (it != fields_.end()) ? &(*it) : nullptr;
}

const EntityType &EntityRegistry::Declare(std::string name,
                                          std::vector<FieldDescriptor> fields,
                                          std::string title, std::string description)
{
  if (index.find(name) != index.end())
  {
    throw std::invalid_argument(
        fmt::format("Entity type \"{}\" is already declared!", name));
  }
  for (const auto &field : fields)
  {
    if (field.entity && !Contains(*field.entity))
    {
      throw std::invalid_argument(
          fmt::format("Field \"{}.{}\" references entity type \"{}\" which is not declared "
                      "before it in this registry!",
                      name, field.name, field.entity->name()));
    }
  }
  auto &type = types.emplace_back(std::make_unique<EntityType>(
      std::move(name), std::move(fields), std::move(title), std::move(description)));
  index.emplace(type->name(), type.get());
  return *type;
}

bool EntityRegistry::Contains(const EntityType &type) const
{
  auto it = index.find(type.name());
  return it != index.end() && it->second == &type;
}

const EntityType *EntityRegistry::Find(std::string_view name) const
{
  auto it = index.find(name);
  return (it != index.end()) ? it->second : nullptr;
}

const EntityType &EntityRegistry::at(std::string_view name) const
{
  const auto *type = Find(name);
  if (!type)
  {
    throw std::invalid_argument(fmt::format("Unknown entity type \"{}\"; declared types: {}",
                                            name, fmt::join(Names(), ", ")));
  }
  return *type;
}

std::vector<std::string> EntityRegistry::Names() const
{
  std::vector<std::string> names;
  names.reserve(types.size());
  for (const auto &type : types)
  {
    names.push_back(type->name());
  }
  return names;
}

}  // namespace bidds
