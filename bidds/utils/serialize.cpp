// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0

#include "serialize.hpp"

#include "utils/errors.hpp"

namespace bidds
{

namespace
{

json SerializeModel(const Model &model, const SerializeOptions &options,
                    const std::string &prefix)
{
  json data = json::object();
  for (const auto &field : model.type().fields())
  {
    auto path = JoinPath(prefix, field.name);
    if (!model.Has(field.name) || options.exclude.count(path))
    {
      continue;
    }
    const auto &key = field.Key(options.by_alias);
    switch (field.type)
    {
      case FieldType::ENTITY:
        data[key] = SerializeModel(model.Entity(field.name), options, path);
        break;
      case FieldType::ENTITY_LIST:
        {
          json list = json::array();
          for (const auto &item : model.Entities(field.name))
          {
            list.push_back(SerializeModel(item, options, path));
          }
          data[key] = std::move(list);
        }
        break;
      default:
        data[key] = model.Scalar(field.name);
        break;
    }
  }
  return data;
}

}  // namespace

json Serialize(const Model &model, const SerializeOptions &options)
{
  return SerializeModel(model, options, "");
}

}  // namespace bidds
