// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0

#include "biddsmodel.hpp"

#include <array>
#include <utility>
#include <fmt/format.h>
#include "utils/errors.hpp"
#include "utils/logging.hpp"
#include "utils/tablecsv.hpp"

namespace bidds::models
{

namespace
{

struct BidModelTypes
{
  EntityRegistry registry;
  const EntityType *generator, *network, *scenario, *model;

  BidModelTypes()
  {
    generator = &registry.Declare(
        "Generator", {FieldDescriptor("uid", FieldType::STRING).Title("uid"),
                      FieldDescriptor("bus", FieldType::STRING).Title("bus")});
    network = &registry.Declare(
        "Network",
        {FieldDescriptor("generators", FieldType::ENTITY_LIST, *generator)
             .Title("generators")});
    scenario = &registry.Declare("Scenario", {});
    model = &registry.Declare(
        "Model",
        {FieldDescriptor("network", FieldType::ENTITY, *network)
             .Title("network")
             .AllowFileReference(),
         FieldDescriptor("scenario", FieldType::ENTITY, *scenario)
             .Title("scenario")
             .AllowFileReference()},
        "BidDSJsonModel");
  }
};

const BidModelTypes &Types()
{
  static const BidModelTypes types;
  return types;
}

// Generator table column -> Generator field.
constexpr std::array<std::pair<std::string_view, std::string_view>, 2> gen_columns = {
    {{gen_uid_column, "uid"}, {gen_bus_column, "bus"}}};

}  // namespace

const EntityRegistry &Registry()
{
  return Types().registry;
}

const EntityType &GeneratorType()
{
  return *Types().generator;
}

const EntityType &NetworkType()
{
  return *Types().network;
}

const EntityType &ScenarioType()
{
  return *Types().scenario;
}

const EntityType &ModelType()
{
  return *Types().model;
}

json GeneratorRecordsFromTable(const Table &table, std::string_view source)
{
  std::array<std::size_t, gen_columns.size()> idx;
  for (std::size_t j = 0; j < gen_columns.size(); j++)
  {
    auto col = table.column_index(gen_columns[j].first);
    if (!col)
    {
      throw MalformedInput(std::string(source),
                           fmt::format("Missing generator table column \"{}\"",
                                       gen_columns[j].first));
    }
    idx[j] = *col;
  }

  json records = json::array();
  for (std::size_t i = 0; i < table.n_rows(); i++)
  {
    json record = json::object();
    for (std::size_t j = 0; j < gen_columns.size(); j++)
    {
      record[std::string(gen_columns[j].second)] = table.at(i, idx[j]);
    }
    records.push_back(std::move(record));
  }
  return records;
}

Model BuildModelFromGeneratorCsv(const std::string &filename)
{
  Table table = ReadTableCSV(filename);
  json record = {{"network", {{"generators", GeneratorRecordsFromTable(table, filename)}}},
                 {"scenario", json::object()}};
  Log::Debug("Read {:d} generators from {}\n", table.n_rows(), filename);
  try
  {
    return Validate(ModelType(), record);
  }
  catch (const SchemaViolation &e)
  {
    Log::Error("Failed to validate generators from {}\n  {}\n", filename, e.what());
    throw;
  }
}

}  // namespace bidds::models
