// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0

#ifndef BIDDS_UTILS_SERIALIZE_HPP
#define BIDDS_UTILS_SERIALIZE_HPP

#include <set>
#include <string>
#include "utils/model.hpp"

namespace bidds
{

struct SerializeOptions
{
  // Use field aliases as keys rather than internal names.
  bool by_alias = true;

  // Dotted paths of internal field names to omit, for example "network.generators" or
  // "network.generators.bus". A path through a list applies to every element.
  std::set<std::string, std::less<>> exclude = {};
};

// Convert a model into its canonical record: plain objects, arrays, and scalars in field
// declaration order, with unset optional fields omitted. The result validates back to an
// equal model for the same entity type.
json Serialize(const Model &model, const SerializeOptions &options = {});

}  // namespace bidds

#endif  // BIDDS_UTILS_SERIALIZE_HPP
