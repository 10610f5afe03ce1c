// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0

#include "fixtures.hpp"

#include <fstream>
#include <random>

namespace bidds::test
{

TempDirFixture::TempDirFixture()
{
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<> dis(10000, 99999);
  int random_num = dis(gen);
  temp_dir = fs::temp_directory_path() / ("bidds_test_" + std::to_string(random_num));
  fs::create_directories(temp_dir);
}

TempDirFixture::~TempDirFixture()
{
  std::error_code ec;
  fs::remove_all(temp_dir, ec);
}

fs::path TempDirFixture::WriteFile(const fs::path &relative_path,
                                   std::string_view content) const
{
  auto path = temp_dir / relative_path;
  fs::create_directories(path.parent_path());
  std::ofstream f(path);
  f << content;
  return path;
}

ScopedCurrentPath::ScopedCurrentPath(const fs::path &path) : previous(fs::current_path())
{
  fs::current_path(path);
}

ScopedCurrentPath::~ScopedCurrentPath()
{
  std::error_code ec;
  fs::current_path(previous, ec);
}

std::string DataFile(std::string_view relative_path)
{
  return (fs::path(BIDDS_TEST_DIR) / "data" / relative_path).string();
}

namespace
{

struct TestTypes
{
  EntityRegistry registry;
  const EntityType *dataset, *catalog;

  TestTypes()
  {
    dataset = &registry.Declare(
        "Dataset",
        {FieldDescriptor("name", FieldType::STRING).Title("Name"),
         FieldDescriptor("source", FieldType::PATH)
             .Title("Source")
             .Description("Data file, relative to the referencing file"),
         FieldDescriptor("rows", FieldType::INTEGER).Optional(),
         FieldDescriptor("weight", FieldType::NUMBER).Optional().Alias("Weight"),
         FieldDescriptor("enabled", FieldType::BOOLEAN).Optional()});
    catalog = &registry.Declare(
        "Catalog",
        {FieldDescriptor("title", FieldType::STRING).Alias("Title"),
         FieldDescriptor("datasets", FieldType::ENTITY_LIST, *dataset),
         FieldDescriptor("primary", FieldType::ENTITY, *dataset)
             .Optional()
             .AllowFileReference()},
        "", "Collection of data sets");
  }
};

const TestTypes &Types()
{
  static const TestTypes types;
  return types;
}

}  // namespace

const EntityRegistry &TestRegistry()
{
  return Types().registry;
}

const EntityType &DatasetType()
{
  return *Types().dataset;
}

const EntityType &CatalogType()
{
  return *Types().catalog;
}

}  // namespace bidds::test
