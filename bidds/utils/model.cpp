// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0

#include "model.hpp"

#include <cmath>
#include <limits>
#include <optional>
#include <stdexcept>
#include <utility>
#include <fmt/format.h>
#include <scn/scan.h>
#include "utils/errors.hpp"
#include "utils/iodata.hpp"
#include "utils/logging.hpp"
#include "utils/strings.hpp"

namespace bidds
{

namespace
{

// Numeric coercion from strings: the whole (trimmed) string must be consumed.
std::optional<double> ParseNumber(std::string_view str)
{
  if (str.empty())
  {
    return std::nullopt;
  }
  auto result = scn::scan<double>(str, "{}");
  if (!result || !result->range().empty() || !std::isfinite(result->value()))
  {
    return std::nullopt;
  }
  return result->value();
}

std::optional<std::int64_t> ParseInteger(std::string_view str)
{
  if (str.empty())
  {
    return std::nullopt;
  }
  auto result = scn::scan<std::int64_t>(str, "{}");
  if (!result || !result->range().empty())
  {
    return std::nullopt;
  }
  return result->value();
}

// Strings must be encodable when the model is serialized. The JSON parser guarantees this
// for documents, but records built in code (from CSV tables, for example) may not be UTF-8.
bool IsUtf8(const std::string &str)
{
  try
  {
    static_cast<void>(json(str).dump());
  }
  catch (const json::type_error &)
  {
    return false;
  }
  return true;
}

std::optional<std::int64_t> IntegralValue(const json &value)
{
  if (value.is_number_integer() && !value.is_number_unsigned())
  {
    return value.get<std::int64_t>();
  }
  if (value.is_number_unsigned())
  {
    auto u = value.get<std::uint64_t>();
    if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
    {
      return std::nullopt;
    }
    return static_cast<std::int64_t>(u);
  }
  if (value.is_number_float())
  {
    // Accept floats with no fractional part, like 2.0.
    double d = value.get<double>();
    if (std::isfinite(d) && std::trunc(d) == d &&
        d >= static_cast<double>(std::numeric_limits<std::int64_t>::min()) &&
        d < static_cast<double>(std::numeric_limits<std::int64_t>::max()))
    {
      return static_cast<std::int64_t>(d);
    }
  }
  return std::nullopt;
}

}  // namespace

namespace internal
{

// Recursive validation of records against entity types. All errors are raised with the
// full path from the root record.
class Validator
{
  fs::path base;

public:
  explicit Validator(fs::path base) : base(std::move(base)) {}

  Model Record(const EntityType &type, const json &record, const std::string &path,
               const std::string &field_name) const
  {
    if (!record.is_object())
    {
      throw TypeMismatch(path, field_name, "object", record.type_name());
    }

    // Match every key to a declared field. Unknown keys are rejected unconditionally, and
    // a field given under both its alias and its name counts the second key as unknown.
    const auto &fields = type.fields();
    std::vector<const json *> slots(fields.size(), nullptr);
    std::vector<std::string> keys(fields.size());
    for (const auto &[key, value] : record.items())
    {
      const auto *field = type.FindByKey(key);
      if (!field)
      {
        throw UnknownField(JoinPath(path, key), key);
      }
      auto i = static_cast<std::size_t>(field - fields.data());
      if (slots[i])
      {
        throw UnknownField(JoinPath(path, key), key);
      }
      slots[i] = &value;
      keys[i] = key;
    }

    for (std::size_t i = 0; i < fields.size(); i++)
    {
      if (!slots[i] && fields[i].required)
      {
        throw MissingField(JoinPath(path, fields[i].ExternalName()), fields[i].name);
      }
    }

    Model model(type);
    for (std::size_t i = 0; i < fields.size(); i++)
    {
      if (!slots[i])
      {
        continue;
      }
      const auto &field = fields[i];
      auto field_path = JoinPath(path, keys[i]);
      if (slots[i]->is_null())
      {
        if (field.required)
        {
          throw TypeMismatch(field_path, field.name, ToString(field.type), "null");
        }
        continue;
      }
      model.values.emplace(field.name, FieldValue(field, *slots[i], field_path));
    }
    return model;
  }

  Model::Value FieldValue(const FieldDescriptor &field, const json &value,
                          const std::string &path) const
  {
    Model::Value out;
    switch (field.type)
    {
      case FieldType::ENTITY:
        out.entities.push_back(EntityValue(field, value, path));
        break;
      case FieldType::ENTITY_LIST:
        if (!value.is_array())
        {
          throw TypeMismatch(path, field.name, "array", value.type_name());
        }
        out.entities.reserve(value.size());
        for (std::size_t i = 0; i < value.size(); i++)
        {
          out.entities.push_back(
              Record(*field.entity, value[i], IndexPath(path, i), field.name));
        }
        break;
      default:
        out.scalar = ScalarValue(field, value, path);
        break;
    }
    return out;
  }

private:
  json ScalarValue(const FieldDescriptor &field, const json &value,
                   const std::string &path) const
  {
    auto Mismatch = [&]()
    { return TypeMismatch(path, field.name, ToString(field.type), value.type_name()); };
    if (value.is_string() && !IsUtf8(value.get_ref<const std::string &>()))
    {
      throw TypeMismatch(path, field.name, "UTF-8 string", "invalid UTF-8");
    }
    switch (field.type)
    {
      case FieldType::STRING:
        if (value.is_string())
        {
          return std::string(utils::Trim(value.get_ref<const std::string &>()));
        }
        break;
      case FieldType::NUMBER:
        if (value.is_number())
        {
          double d = value.get<double>();
          if (!std::isfinite(d))
          {
            throw TypeMismatch(path, field.name, "finite number", "non-finite number");
          }
          return d;
        }
        if (value.is_string())
        {
          if (auto num = ParseNumber(utils::Trim(value.get_ref<const std::string &>())))
          {
            return *num;
          }
        }
        break;
      case FieldType::INTEGER:
        if (value.is_number())
        {
          if (auto num = IntegralValue(value))
          {
            return *num;
          }
        }
        else if (value.is_string())
        {
          if (auto num = ParseInteger(utils::Trim(value.get_ref<const std::string &>())))
          {
            return *num;
          }
        }
        break;
      case FieldType::BOOLEAN:
        if (value.is_boolean())
        {
          return value.get<bool>();
        }
        if (value.is_string())
        {
          auto str = utils::ToLower(utils::Trim(value.get_ref<const std::string &>()));
          if (str == "true" || str == "false")
          {
            return str == "true";
          }
        }
        break;
      case FieldType::PATH:
        if (value.is_string())
        {
          auto str = utils::Trim(value.get_ref<const std::string &>());
          if (str.empty())
          {
            throw TypeMismatch(path, field.name, "non-empty path", "empty string");
          }
          return ResolutionContext::Resolve(fs::path(str), base).string();
        }
        break;
      case FieldType::ENTITY:
      case FieldType::ENTITY_LIST:
        break;
    }
    throw Mismatch();
  }

  Model EntityValue(const FieldDescriptor &field, const json &value,
                    const std::string &path) const
  {
    if (value.is_object())
    {
      return Record(*field.entity, value, path, field.name);
    }
    if (field.allow_file_reference && value.is_string())
    {
      auto str = utils::Trim(value.get_ref<const std::string &>());
      if (str.empty())
      {
        throw TypeMismatch(path, field.name, "object or file path", "empty string");
      }

      // The referenced file is validated with its own directory as the base, like a
      // top-level load.
      auto filename = ResolutionContext::Resolve(fs::path(str), base);
      json record = LoadData(filename.string());
      ScopedBaseDirectory scope(filename.parent_path());
      return Validator(filename.parent_path()).Record(*field.entity, record, path, field.name);
    }
    throw TypeMismatch(path, field.name,
                       field.allow_file_reference ? "object or file path" : "object",
                       value.type_name());
  }
};

}  // namespace internal

Model Validate(const EntityType &type, const json &record, const fs::path &base)
{
  internal::Validator validator(base.empty() ? ResolutionContext::BaseDirectory() : base);
  return validator.Record(type, record, "", "");
}

const Model::Value &Model::Get(std::string_view name, FieldType expected) const
{
  const auto *field = type_->Find(name);
  if (!field)
  {
    throw std::out_of_range(
        fmt::format("Entity type \"{}\" has no field \"{}\"!", type_->name(), name));
  }
  if (field->type != expected &&
      !(expected == FieldType::STRING && field->type == FieldType::PATH))
  {
    throw std::out_of_range(fmt::format("Field \"{}.{}\" does not hold a value of type {}!",
                                        type_->name(), name, ToString(expected)));
  }
  auto it = values.find(name);
  if (it == values.end())
  {
    throw std::out_of_range(
        fmt::format("Optional field \"{}.{}\" is not set!", type_->name(), name));
  }
  return it->second;
}

bool Model::Has(std::string_view name) const
{
  return values.find(name) != values.end();
}

const json &Model::Scalar(std::string_view name) const
{
  const auto *field = type_->Find(name);
  if (field && field->IsComposite())
  {
    throw std::out_of_range(fmt::format("Field \"{}.{}\" does not hold a scalar value!",
                                        type_->name(), name));
  }
  return Get(name, field ? field->type : FieldType::STRING).scalar;
}

std::string Model::GetString(std::string_view name) const
{
  return Get(name, FieldType::STRING).scalar.get<std::string>();
}

double Model::GetNumber(std::string_view name) const
{
  return Get(name, FieldType::NUMBER).scalar.get<double>();
}

std::int64_t Model::GetInteger(std::string_view name) const
{
  return Get(name, FieldType::INTEGER).scalar.get<std::int64_t>();
}

bool Model::GetBoolean(std::string_view name) const
{
  return Get(name, FieldType::BOOLEAN).scalar.get<bool>();
}

fs::path Model::GetPath(std::string_view name) const
{
  return fs::path(Get(name, FieldType::PATH).scalar.get<std::string>());
}

const Model &Model::Entity(std::string_view name) const
{
  return Get(name, FieldType::ENTITY).entities.front();
}

const std::vector<Model> &Model::Entities(std::string_view name) const
{
  return Get(name, FieldType::ENTITY_LIST).entities;
}

void Model::Set(std::string_view name, const json &value)
{
  const auto *field = type_->Find(name);
  if (!field)
  {
    throw UnknownField(std::string(name), std::string(name));
  }
  if (value.is_null())
  {
    if (field->required)
    {
      throw TypeMismatch(field->ExternalName(), field->name, ToString(field->type), "null");
    }
    if (auto it = values.find(name); it != values.end())
    {
      values.erase(it);
    }
    return;
  }

  // Validate into a temporary first so a failure leaves the model untouched.
  internal::Validator validator(ResolutionContext::BaseDirectory());
  auto new_value = validator.FieldValue(*field, value, field->ExternalName());
  values.insert_or_assign(field->name, std::move(new_value));
  Log::Debug("Assigned field \"{}.{}\"\n", type_->name(), field->name);
}

bool Model::operator==(const Model &other) const
{
  return type_ == other.type_ && values == other.values;
}

bool operator==(const Model::Value &lhs, const Model::Value &rhs)
{
  return lhs.scalar == rhs.scalar && lhs.entities == rhs.entities;
}

}  // namespace bidds
