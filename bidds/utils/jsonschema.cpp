// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0

#include "jsonschema.hpp"

#include <algorithm>
#include <charconv>
#include <sstream>
#include <stdexcept>
#include <vector>
#include <fmt/format.h>
#include <nlohmann/json-schema.hpp>

namespace bidds
{

using json_validator = nlohmann::json_schema::json_validator;
using error_handler = nlohmann::json_schema::error_handler;

namespace
{

constexpr const char *schema_draft = "http://json-schema.org/draft-07/schema#";

std::string DefinitionRef(const EntityType &type)
{
  return fmt::format("#/definitions/{}", type.name());
}

// Collect the nested entity types reachable from a type, depth-first in order of first
// reference. Two distinct types sharing a name cannot both be exported.
void CollectDefinitions(const EntityType &root, const EntityType &type,
                        std::vector<const EntityType *> &defs)
{
  for (const auto &field : type.fields())
  {
    if (!field.entity)
    {
      continue;
    }
    const auto *entity = field.entity;
    auto it = std::find_if(defs.begin(), defs.end(), [entity](const EntityType *def)
                           { return def->name() == entity->name(); });
    if (it != defs.end() || entity->name() == root.name())
    {
      if ((it != defs.end() && *it != entity) || (it == defs.end() && entity != &root))
      {
        throw std::invalid_argument(fmt::format(
            "Cannot export schema: entity type name \"{}\" is used by two different types!",
            entity->name()));
      }
      continue;
    }
    defs.push_back(entity);
    CollectDefinitions(root, *entity, defs);
  }
}

json PropertySchema(const FieldDescriptor &field)
{
  json prop = json::object();
  prop["title"] = field.title.empty() ? field.name : field.title;
  if (!field.description.empty())
  {
    prop["description"] = field.description;
  }
  switch (field.type)
  {
    case FieldType::STRING:
    case FieldType::NUMBER:
    case FieldType::INTEGER:
    case FieldType::BOOLEAN:
      prop["type"] = ToString(field.type);
      break;
    case FieldType::PATH:
      prop["type"] = ToString(field.type);
      prop["format"] = "path";
      break;
    case FieldType::ENTITY:
      if (field.allow_file_reference)
      {
        prop["anyOf"] = json::array({{{"$ref", DefinitionRef(*field.entity)}},
                                     {{"type", "string"}, {"format", "path"}}});
      }
      else
      {
        // Keep "$ref" under allOf so the sibling title is not ignored by draft-07.
        prop["allOf"] = json::array({{{"$ref", DefinitionRef(*field.entity)}}});
      }
      break;
    case FieldType::ENTITY_LIST:
      prop["type"] = ToString(field.type);
      prop["items"] = {{"$ref", DefinitionRef(*field.entity)}};
      break;
  }
  return prop;
}

json EntitySchema(const EntityType &type, bool by_alias)
{
  json schema = json::object();
  schema["title"] = type.title();
  if (!type.description().empty())
  {
    schema["description"] = type.description();
  }
  schema["type"] = "object";
  json properties = json::object(), required = json::array();
  for (const auto &field : type.fields())
  {
    const auto &key = field.Key(by_alias);
    properties[key] = PropertySchema(field);
    if (field.required)
    {
      required.push_back(key);
    }
  }
  schema["properties"] = std::move(properties);
  if (!required.empty())
  {
    schema["required"] = std::move(required);
  }
  schema["additionalProperties"] = false;
  return schema;
}

// Convert "/network/generators/1/bus" to "network.generators[1].bus". Tokens are unescaped
// ("~1" is "/", "~0" is "~") and shown as indices only where the record holds an array.
std::string FormatPath(const std::string &ptr, const nlohmann::json &root)
{
  if (ptr.empty())
  {
    return "record";
  }
  std::string result;
  const nlohmann::json *node = &root;
  std::size_t pos = 1;
  while (pos <= ptr.size())
  {
    std::size_t next = std::min(ptr.find('/', pos), ptr.size());
    std::string token;
    for (std::size_t i = pos; i < next; i++)
    {
      if (ptr[i] == '~' && i + 1 < next && (ptr[i + 1] == '0' || ptr[i + 1] == '1'))
      {
        token += (ptr[++i] == '1') ? '/' : '~';
      }
      else
      {
        token += ptr[i];
      }
    }
    if (node && node->is_array())
    {
      result += "[" + token + "]";
      std::size_t idx = 0;
      auto [p, ec] = std::from_chars(token.data(), token.data() + token.size(), idx);
      node = (ec == std::errc() && p == token.data() + token.size() && idx < node->size())
                 ? &(*node)[idx]
                 : nullptr;
    }
    else
    {
      result += (result.empty() ? "" : ".") + token;
      if (node && node->is_object())
      {
        auto it = node->find(token);
        node = (it != node->end()) ? &(*it) : nullptr;
      }
      else
      {
        node = nullptr;
      }
    }
    pos = next + 1;
  }
  return result;
}

// Error handler that collects every violation with its record path.
class SchemaErrorHandler : public error_handler
{
  const nlohmann::json &root;
  std::ostringstream errors;
  bool has_error = false;

public:
  explicit SchemaErrorHandler(const nlohmann::json &root) : root(root) {}

  void error(const nlohmann::json::json_pointer &ptr, const nlohmann::json &instance,
             const std::string &message) override
  {
    errors << "At " << FormatPath(ptr.to_string(), root) << ": " << message;
    if (message == "unexpected instance type")
    {
      errors << " (got " << instance.type_name() << ")";
    }
    errors << "\n";
    has_error = true;
  }

  operator bool() const { return has_error; }
  std::string get_errors() const { return errors.str(); }
};

// Format checker for string formats. "path" is specific to this schema exporter, others are
// handled by the library's default checks.
void CheckFormat(const std::string &format, const std::string &value)
{
  if (format == "path")
  {
    if (value.empty())
    {
      throw std::invalid_argument("path must not be empty");
    }
    return;
  }
  nlohmann::json_schema::default_string_format_check(format, value);
}

}  // namespace

json ExportSchema(const EntityType &type, bool by_alias)
{
  std::vector<const EntityType *> defs;
  CollectDefinitions(type, type, defs);

  json schema = {{"$schema", schema_draft}};
  schema.update(EntitySchema(type, by_alias));
  if (!defs.empty())
  {
    json definitions = json::object();
    for (const auto *def : defs)
    {
      definitions[def->name()] = EntitySchema(*def, by_alias);
    }
    schema["definitions"] = std::move(definitions);
  }
  return schema;
}

std::string SchemaJson(const EntityType &type, bool by_alias, int indent)
{
  return ExportSchema(type, by_alias).dump(indent);
}

std::string ValidateAgainstSchema(const json &record, const json &schema)
{
  // The validator works on the unordered json type.
  nlohmann::json instance = nlohmann::json::parse(record.dump());
  nlohmann::json root_schema = nlohmann::json::parse(schema.dump());

  json_validator validator(nullptr, CheckFormat);
  try
  {
    validator.set_root_schema(root_schema);
    SchemaErrorHandler handler(instance);
    validator.validate(instance, handler);
    if (handler)
    {
      return handler.get_errors();
    }
    return "";
  }
  catch (std::exception &e)
  {
    return e.what();
  }
}

}  // namespace bidds
