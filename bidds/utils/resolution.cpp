// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0

#include "resolution.hpp"

#include <utility>

namespace bidds
{

fs::path &ResolutionContext::Current()
{
  thread_local fs::path base;
  return base;
}

const fs::path &ResolutionContext::BaseDirectory()
{
  return Current();
}

fs::path ResolutionContext::Resolve(const fs::path &path, const fs::path &base)
{
  if (path.is_absolute())
  {
    return path.lexically_normal();
  }
  const fs::path &dir = base.empty() ? Current() : base;
  return fs::absolute(dir.empty() ? path : dir / path).lexically_normal();
}

ScopedBaseDirectory::ScopedBaseDirectory(const fs::path &base)
  : previous(ResolutionContext::Current())
{
  ResolutionContext::Current() = fs::absolute(base).lexically_normal();
}

ScopedBaseDirectory::~ScopedBaseDirectory()
{
  ResolutionContext::Current() = std::move(previous);
}

}  // namespace bidds
