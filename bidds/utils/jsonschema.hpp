// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0

#ifndef BIDDS_UTILS_JSONSCHEMA_HPP
#define BIDDS_UTILS_JSONSCHEMA_HPP

#include <string>
#include "utils/model.hpp"

namespace bidds
{

// Build a JSON Schema (draft-07) document describing the records accepted by Validate for
// the given entity type. Nested entity types are listed once under "definitions" and
// referenced with "$ref". Output is deterministic: fields follow declaration order.
json ExportSchema(const EntityType &type, bool by_alias = true);

// ExportSchema as text. A negative indent produces compact output.
std::string SchemaJson(const EntityType &type, bool by_alias = true, int indent = -1);

// Validate a record against a schema document using a generic JSON Schema validator.
// Returns empty string on success, error message on failure.
std::string ValidateAgainstSchema(const json &record, const json &schema);

}  // namespace bidds

#endif  // BIDDS_UTILS_JSONSCHEMA_HPP
