// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0

#include <charconv>
#include <string>
#include <string_view>
#include <vector>
#include <fmt/format.h>
#include "models/biddsmodel.hpp"
#include "utils/errors.hpp"
#include "utils/iodata.hpp"
#include "utils/jsonschema.hpp"
#include "utils/logging.hpp"
#include "utils/serialize.hpp"

using namespace bidds;

namespace
{

struct Options
{
  std::string command = "";
  std::vector<std::string> inputs = {};
  std::string output = "";
  std::string type = "Model";
  bool by_alias = true;
  int indent = 2;
  std::vector<std::string> exclude = {};
};

void Help(std::string_view executable_path)
{
  Log::Print("Usage: {} [OPTIONS] COMMAND ARGS\n\n"
             "Commands:\n"
             "  validate FILE             Load FILE and check it against the entity type\n"
             "  normalize FILE -o OUT     Load FILE and write its canonical form to OUT\n"
             "  schema [-o OUT]           Print or write the JSON Schema of the entity type\n"
             "  convert GEN_CSV -o OUT    Build a model from a generator CSV table\n\n"
             "Options:\n"
             "  -h, --help                Show this help message and exit\n"
             "  -v, --verbose             Print debugging output\n"
             "  -q, --quiet               Only print errors\n"
             "  -o, --output FILE         Output file\n"
             "  --type NAME               Entity type (default: \"Model\")\n"
             "  --no-alias                Use internal field names in output\n"
             "  --indent N                JSON indentation, -1 for compact (default: 2)\n"
             "  --exclude PATH            Omit a dotted field path from normalize output\n\n",
             executable_path.substr(executable_path.find_last_of('/') + 1));
}

void WriteOrPrint(const json &data, const Options &opts)
{
  if (opts.output.empty())
  {
    fmt::print("{}\n", data.dump(opts.indent));
  }
  else
  {
    DumpData(data, opts.output, opts.indent);
    Log::Print("Wrote \"{}\"\n", opts.output);
  }
}

int Run(const Options &opts)
{
  const auto &type = models::Registry().at(opts.type);
  if (opts.command == "validate")
  {
    for (const auto &input : opts.inputs)
    {
      Model model = Load(type, input);
      Log::Print("{}: valid {}\n", input, model.type().name());
    }
    return 0;
  }
  if (opts.command == "normalize")
  {
    Model model = Load(type, opts.inputs.front());
    SerializeOptions serialize_opts;
    serialize_opts.by_alias = opts.by_alias;
    serialize_opts.exclude.insert(opts.exclude.begin(), opts.exclude.end());
    WriteOrPrint(Serialize(model, serialize_opts), opts);
    return 0;
  }
  if (opts.command == "schema")
  {
    WriteOrPrint(ExportSchema(type, opts.by_alias), opts);
    return 0;
  }
  if (opts.command == "convert")
  {
    Model model = models::BuildModelFromGeneratorCsv(opts.inputs.front());
    if (model.Entity("network").Entities("generators").empty())
    {
      Log::Warning("No generators found in \"{}\"", opts.inputs.front());
    }
    SerializeOptions serialize_opts;
    serialize_opts.by_alias = opts.by_alias;
    WriteOrPrint(Serialize(model, serialize_opts), opts);
    return 0;
  }
  return 1;
}

}  // namespace

int main(int argc, char *argv[])
{
  // Parse command-line options.
  std::vector<std::string_view> argv_sv(argv, argv + argc);
  Options opts;
  auto Usage = [&argv_sv](std::string_view message)
  {
    Log::Error("{}\n", message);
    Help(argv_sv[0]);
    return 1;
  };
  for (int i = 1; i < argc; i++)
  {
    std::string_view argv_i = argv_sv.at(i);
    auto NextArg = [&]() -> std::string_view
    { return (i + 1 < argc) ? argv_sv.at(++i) : std::string_view(); };
    if ((argv_i == "-h") || (argv_i == "--help"))
    {
      Help(argv_sv[0]);
      return 0;
    }
    if ((argv_i == "-v") || (argv_i == "--verbose"))
    {
      Log::SetVerbosity(Log::DEBUG);
    }
    else if ((argv_i == "-q") || (argv_i == "--quiet"))
    {
      Log::SetVerbosity(Log::QUIET);
    }
    else if ((argv_i == "-o") || (argv_i == "--output"))
    {
      opts.output = NextArg();
      if (opts.output.empty())
      {
        return Usage("Missing value for --output!");
      }
    }
    else if (argv_i == "--type")
    {
      opts.type = NextArg();
    }
    else if (argv_i == "--no-alias")
    {
      opts.by_alias = false;
    }
    else if (argv_i == "--indent")
    {
      auto value = NextArg();
      auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), opts.indent);
      if (value.empty() || ec != std::errc() || ptr != value.data() + value.size())
      {
        return Usage(fmt::format("Invalid value \"{}\" for --indent!", value));
      }
    }
    else if (argv_i == "--exclude")
    {
      auto value = NextArg();
      if (value.empty())
      {
        return Usage("Missing value for --exclude!");
      }
      opts.exclude.emplace_back(value);
    }
    else if (argv_i.size() > 1 && argv_i[0] == '-')
    {
      return Usage(fmt::format("Unknown option \"{}\"!", argv_i));
    }
    else if (opts.command.empty())
    {
      opts.command = argv_i;
    }
    else
    {
      opts.inputs.emplace_back(argv_i);
    }
  }

  if (opts.command.empty())
  {
    return Usage("Invalid usage!");
  }
  if (opts.command != "validate" && opts.command != "normalize" && opts.command != "schema" &&
      opts.command != "convert")
  {
    return Usage(fmt::format("Unknown command \"{}\"!", opts.command));
  }
  if (opts.command != "schema" && opts.inputs.empty())
  {
    return Usage(fmt::format("Command \"{}\" requires an input file!", opts.command));
  }

  if (opts.command != "validate" && opts.inputs.size() > 1)
  {
    return Usage(fmt::format("Command \"{}\" takes a single input file!", opts.command));
  }
  if (!opts.exclude.empty() && opts.command != "normalize")
  {
    Log::Warning("--exclude only applies to \"normalize\" and is ignored for \"{}\"",
                 opts.command);
  }

  try
  {
    return Run(opts);
  }
  catch (const SchemaViolation &)
  {
    // Already reported by the loader.
    return 2;
  }
  catch (const Error &e)
  {
    Log::Error("{}\n", e.what());
    return 2;
  }
  catch (const json::exception &e)
  {
    // Encoding of output printed to the terminal.
    Log::Error("{}\n", e.what());
    return 2;
  }
  catch (const std::invalid_argument &e)
  {
    Log::Error("{}\n", e.what());
    return 1;
  }
}
