// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0

#ifndef BIDDS_UTILS_LOGGING_HPP
#define BIDDS_UTILS_LOGGING_HPP

#include <cstdio>
#include <utility>
#include <fmt/color.h>
#include <fmt/format.h>

namespace bidds
{

//
// Console output for the library and the command line driver. Regular output goes to
// stdout and is gated on the verbosity level, warnings and errors go to stderr.
//
class Log
{
public:
  enum Level
  {
    QUIET = 0,
    NORMAL = 1,
    DEBUG = 2
  };

  static void SetVerbosity(int level) { Instance().verbose = level; }
  static int Verbosity() { return Instance().verbose; }

  template <typename... T>
  static void Print(fmt::format_string<T...> fmt, T &&...args)
  {
    if (Verbosity() >= NORMAL)
    {
      fmt::print(fmt, std::forward<T>(args)...);
    }
  }

  template <typename... T>
  static void Debug(fmt::format_string<T...> fmt, T &&...args)
  {
    if (Verbosity() >= DEBUG)
    {
      fmt::print("{} ", fmt::styled("[debug]", fmt::fg(fmt::color::gray)));
      fmt::print(fmt, std::forward<T>(args)...);
    }
  }

  template <typename... T>
  static void Warning(fmt::format_string<T...> fmt, T &&...args)
  {
    if (Verbosity() >= NORMAL)
    {
      fmt::print(stderr, "\n{}\n", fmt::styled("--> Warning!", fmt::fg(fmt::color::yellow)));
      fmt::print(stderr, fmt, std::forward<T>(args)...);
      fmt::print(stderr, "\n");
    }
  }

  // Errors are always printed.
  template <typename... T>
  static void Error(fmt::format_string<T...> fmt, T &&...args)
  {
    fmt::print(stderr, "\n{}\n", fmt::styled("--> Error!", fmt::fg(fmt::color::red)));
    fmt::print(stderr, fmt, std::forward<T>(args)...);
    fmt::print(stderr, "\n");
  }

private:
  int verbose = NORMAL;

  Log() = default;

  // Access the singleton instance.
  static Log &Instance()
  {
    static Log log;
    return log;
  }
};

}  // namespace bidds

#endif  // BIDDS_UTILS_LOGGING_HPP
