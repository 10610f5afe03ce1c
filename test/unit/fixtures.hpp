// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0

#ifndef BIDDS_FIXTURES_HPP
#define BIDDS_FIXTURES_HPP

#include <filesystem>
#include <string>
#include <string_view>
#include "utils/fields.hpp"
#include "utils/model.hpp"

namespace bidds::test
{

// Fixture that creates a temporary directory for each test and cleans it up automatically.
struct TempDirFixture
{
  fs::path temp_dir;

  TempDirFixture();
  ~TempDirFixture();

  // Write text to a file below the temporary directory, creating parent directories.
  fs::path WriteFile(const fs::path &relative_path, std::string_view content) const;
};

// Changes the working directory for the lifetime of the object.
class ScopedCurrentPath
{
  fs::path previous;

public:
  explicit ScopedCurrentPath(const fs::path &path);
  ~ScopedCurrentPath();
};

// Path to a file in the test data directory.
std::string DataFile(std::string_view relative_path);

//
// Entity types used to exercise the engine beyond the bid model:
//
//   Dataset { name: string, source: path, rows?: integer, weight?: number ("Weight"),
//             enabled?: boolean }
//   Catalog { title: string ("Title"), datasets: [Dataset], primary?: Dataset (or file) }
//
const EntityRegistry &TestRegistry();
const EntityType &DatasetType();
const EntityType &CatalogType();

}  // namespace bidds::test

#endif  // BIDDS_FIXTURES_HPP
