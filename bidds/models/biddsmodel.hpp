// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0

#ifndef BIDDS_MODELS_BIDDSMODEL_HPP
#define BIDDS_MODELS_BIDDSMODEL_HPP

#include <string>
#include <string_view>
#include "utils/model.hpp"

namespace bidds
{

class Table;

namespace models
{

//
// Entity types of the power network bid data set:
//
//   Model     { network: Network, scenario: Scenario }
//   Network   { generators: [Generator] }
//   Generator { uid: string, bus: string }
//   Scenario  { }
//
// The network and scenario of a Model may also be given as paths to separate JSON files,
// relative to the file that references them.
//
const EntityRegistry &Registry();

const EntityType &GeneratorType();
const EntityType &NetworkType();
const EntityType &ScenarioType();
const EntityType &ModelType();

// Column names of the RTS-GMLC generator table and the Generator fields they populate.
inline constexpr std::string_view gen_uid_column = "GEN UID";
inline constexpr std::string_view gen_bus_column = "Bus ID";

// Map the rows of a generator table to raw Generator records. Columns are renamed to field
// names and columns without a counterpart are dropped. Throws MalformedInput (naming
// source) if a required column is missing.
json GeneratorRecordsFromTable(const Table &table, std::string_view source);

// Read a generator CSV file and build a validated Model with an empty scenario.
Model BuildModelFromGeneratorCsv(const std::string &filename);

}  // namespace models

}  // namespace bidds

#endif  // BIDDS_MODELS_BIDDSMODEL_HPP
