// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "fixtures.hpp"
#include "models/biddsmodel.hpp"
#include "utils/errors.hpp"
#include "utils/iodata.hpp"
#include "utils/resolution.hpp"
#include "utils/serialize.hpp"

using namespace bidds;
using test::DataFile;

namespace
{

fs::path DataPath(std::string_view relative_path)
{
  return fs::path(DataFile(relative_path)).lexically_normal();
}

}  // namespace

TEST_CASE("Load Model File", "[iodata][model]")
{
  auto model = Load(models::ModelType(), DataFile("model.json"));
  const auto &generators = model.Entity("network").Entities("generators");
  REQUIRE(generators.size() == 2);
  CHECK(generators[0].GetString("uid") == "101_CT_1");
  CHECK(generators[0].GetString("bus") == "101");
  CHECK(generators[1].GetString("uid") == "101_STEAM_3");
  CHECK(generators[1].GetString("bus") == "101");

  SECTION("Violations are reported with their path")
  {
    try
    {
      Load(models::ModelType(), DataFile("model_missing_bus.json"));
      FAIL("Expected a missing field error");
    }
    catch (const MissingField &e)
    {
      CHECK(e.path() == "network.generators[1].bus");
      CHECK(e.field() == "bus");
    }

    CHECK_THROWS_AS(Load(models::ModelType(), DataFile("model_unknown_field.json")),
                    UnknownField);
  }

  SECTION("Nested records from referenced files")
  {
    auto with_refs = Load(models::ModelType(), DataFile("model_with_refs.json"));
    CHECK(with_refs == model);
  }
}

TEST_CASE("Load Data Errors", "[iodata]")
{
  SECTION("Missing file")
  {
    auto filename = DataFile("does_not_exist.json");
    try
    {
      LoadData(filename);
      FAIL("Expected a load error");
    }
    catch (const LoadError &e)
    {
      CHECK(e.filename() == filename);
      CHECK_THAT(e.what(), Catch::Matchers::ContainsSubstring("no such file"));
    }
  }

  SECTION("Directory")
  {
    CHECK_THROWS_AS(LoadData(DataFile("nested")), LoadError);
  }

  SECTION("Syntax error")
  {
    try
    {
      LoadData(DataFile("malformed.json"));
      FAIL("Expected a parse error");
    }
    catch (const MalformedInput &e)
    {
      CHECK(e.filename() == DataFile("malformed.json"));
      CHECK_FALSE(e.detail().empty());
    }
  }

  SECTION("Duplicate keys")
  {
    try
    {
      LoadData(DataFile("duplicate_key.json"));
      FAIL("Expected a duplicate key error");
    }
    catch (const MalformedInput &e)
    {
      CHECK_THAT(e.detail(), Catch::Matchers::ContainsSubstring("Duplicate key \"network\""));
    }
  }

  SECTION("Number out of range")
  {
    try
    {
      LoadData(DataFile("overflow.json"));
      FAIL("Expected a parse error");
    }
    catch (const MalformedInput &e)
    {
      CHECK(e.filename() == DataFile("overflow.json"));
      CHECK_THAT(e.detail(), Catch::Matchers::ContainsSubstring("1e400"));
    }
  }

  SECTION("Load errors are not schema violations")
  {
    CHECK_THROWS_AS(Load(models::ModelType(), DataFile("malformed.json")), MalformedInput);
    CHECK_THROWS_AS(Load(models::ModelType(), DataFile("overflow.json")), MalformedInput);
    CHECK_THROWS_AS(Load(models::ModelType(), DataFile("duplicate_key.json")), MalformedInput);
    CHECK_THROWS_AS(Load(models::ModelType(), DataFile("missing.json")), LoadError);
  }
}

TEST_CASE_METHOD(test::TempDirFixture, "Resolution Context Restoration", "[iodata]")
{
  ScopedBaseDirectory outer(temp_dir);
  const auto base = ResolutionContext::BaseDirectory();
  REQUIRE(base == fs::absolute(temp_dir).lexically_normal());

  SECTION("Success")
  {
    Load(models::ModelType(), DataFile("model_with_refs.json"));
    CHECK(ResolutionContext::BaseDirectory() == base);
  }

  SECTION("Schema violation")
  {
    CHECK_THROWS_AS(Load(models::ModelType(), DataFile("model_missing_bus.json")),
                    SchemaViolation);
    CHECK(ResolutionContext::BaseDirectory() == base);
  }

  SECTION("Malformed input")
  {
    CHECK_THROWS_AS(Load(models::ModelType(), DataFile("malformed.json")), MalformedInput);
    CHECK(ResolutionContext::BaseDirectory() == base);
  }

  SECTION("Missing file")
  {
    CHECK_THROWS_AS(Load(models::ModelType(), DataFile("missing.json")), LoadError);
    CHECK(ResolutionContext::BaseDirectory() == base);
  }

  SECTION("Failure inside a referenced file")
  {
    auto filename =
        WriteFile("model.json", R"({"network": "sub/network.json", "scenario": {}})");
    WriteFile("sub/network.json", R"({"generators": [{"uid": "G1"}]})");
    try
    {
      Load(models::ModelType(), filename.string());
      FAIL("Expected a missing field error");
    }
    catch (const MissingField &e)
    {
      CHECK(e.path() == "network.generators[0].bus");
    }
    CHECK(ResolutionContext::BaseDirectory() == base);

    WriteFile("model.json", R"({"network": "sub/missing.json", "scenario": {}})");
    CHECK_THROWS_AS(Load(models::ModelType(), filename.string()), LoadError);
    CHECK(ResolutionContext::BaseDirectory() == base);
  }

  SECTION("Nested scopes")
  {
    {
      ScopedBaseDirectory inner(temp_dir / "sub");
      CHECK(ResolutionContext::BaseDirectory() == base / "sub");
      CHECK(ResolutionContext::Resolve("a.csv") == base / "sub" / "a.csv");
    }
    CHECK(ResolutionContext::BaseDirectory() == base);
    CHECK(ResolutionContext::Resolve("a.csv") == base / "a.csv");
    CHECK(ResolutionContext::Resolve("/opt/a.csv") == fs::path("/opt/a.csv"));
  }
}

TEST_CASE_METHOD(test::TempDirFixture, "Relative Path Resolution", "[iodata]")
{
  const auto gen_csv = DataPath("gen.csv");

  auto CheckCatalog = [&](const Model &catalog)
  {
    CHECK(catalog.GetString("title") == "RTS-GMLC source tables");
    const auto &datasets = catalog.Entities("datasets");
    REQUIRE(datasets.size() == 2);
    CHECK(datasets[0].GetPath("source") == gen_csv);
    CHECK(datasets[0].GetInteger("rows") == 4);
    CHECK_THAT(datasets[0].GetNumber("weight"), Catch::Matchers::WithinRel(0.5));
    CHECK(datasets[1].GetPath("source") == fs::path("/opt/rts/bus.csv"));
    CHECK_FALSE(datasets[1].GetBoolean("enabled"));

    // The referenced file resolves its own paths against its own directory.
    const auto &primary = catalog.Entity("primary");
    CHECK(primary.GetString("name") == "primary");
    CHECK(primary.GetPath("source") == gen_csv);
  };

  SECTION("Independent of the working directory")
  {
    test::ScopedCurrentPath cwd(temp_dir);
    CheckCatalog(Load(test::CatalogType(), DataFile("catalog.json")));
  }

  SECTION("Relative file name")
  {
    test::ScopedCurrentPath cwd(DataPath("nested"));
    CheckCatalog(Load(test::CatalogType(), "../catalog.json"));
  }

  SECTION("Saved and reloaded elsewhere")
  {
    auto catalog = Load(test::CatalogType(), DataFile("catalog.json"));
    auto filename = (temp_dir / "copy" / "catalog.json").string();
    fs::create_directories(temp_dir / "copy");
    DumpData(Serialize(catalog), filename);

    auto reloaded = Load(test::CatalogType(), filename);
    CheckCatalog(reloaded);
    CHECK(reloaded == catalog);
  }
}

TEST_CASE_METHOD(test::TempDirFixture, "Dump Data", "[iodata]")
{
  const auto filename = (temp_dir / "out.json").string();

  SECTION("Overwrites existing files")
  {
    DumpData(json::parse(R"({"a": [1, 2, 3], "b": "a longer value to truncate"})"), filename);
    const auto data = json::parse(R"({"a": 1})");
    DumpData(data, filename, -1);
    CHECK(LoadData(filename) == data);
  }

  SECTION("Preserves key order")
  {
    const auto data = json::parse(R"({"zeta": 1, "alpha": 2})");
    DumpData(data, filename);
    CHECK(LoadData(filename).begin().key() == "zeta");
  }

  SECTION("Invalid UTF-8 leaves the file intact")
  {
    const auto data = json::parse(R"({"a": 1})");
    DumpData(data, filename);
    CHECK_THROWS_AS(DumpData(json({{"uid", std::string("G\xe9n1")}}), filename),
                    MalformedInput);
    CHECK(LoadData(filename) == data);
  }

  SECTION("Unwritable destination")
  {
    auto bad = (temp_dir / "missing" / "out.json").string();
    try
    {
      DumpData(json::object(), bad);
      FAIL("Expected a load error");
    }
    catch (const LoadError &e)
    {
      CHECK(e.filename() == bad);
    }
  }
}
