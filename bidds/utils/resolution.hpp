// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0

#ifndef BIDDS_UTILS_RESOLUTION_HPP
#define BIDDS_UTILS_RESOLUTION_HPP

#include <filesystem>

namespace bidds
{

namespace fs = std::filesystem;

//
// Base directory used to resolve relative paths found inside records. Validation takes the
// base as an explicit argument; this thread-local value is the default used when none is
// given (for example when assigning to a field of an existing model). An empty base means
// the current working directory.
//
class ResolutionContext
{
public:
  [[nodiscard]] static const fs::path &BaseDirectory();

  // Resolve a path against the given base, or against BaseDirectory() if the base is
  // empty. Absolute paths are returned lexically normalized.
  [[nodiscard]] static fs::path Resolve(const fs::path &path, const fs::path &base = {});

private:
  friend class ScopedBaseDirectory;
  static fs::path &Current();
};

// Sets the thread's base directory for the lifetime of the object and restores the
// previous value on destruction, including during stack unwinding.
class ScopedBaseDirectory
{
  fs::path previous;

public:
  explicit ScopedBaseDirectory(const fs::path &base);
  ~ScopedBaseDirectory();

  ScopedBaseDirectory(const ScopedBaseDirectory &) = delete;
  ScopedBaseDirectory(ScopedBaseDirectory &&) = delete;
  ScopedBaseDirectory &operator=(const ScopedBaseDirectory &) = delete;
  ScopedBaseDirectory &operator=(ScopedBaseDirectory &&) = delete;
};

}  // namespace bidds

#endif  // BIDDS_UTILS_RESOLUTION_HPP
