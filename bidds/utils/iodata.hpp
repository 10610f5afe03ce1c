// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0

#ifndef BIDDS_UTILS_IODATA_HPP
#define BIDDS_UTILS_IODATA_HPP

#include <string>
#include "utils/model.hpp"

namespace bidds
{

// Read and parse a JSON document. Throws LoadError if the file cannot be read and
// MalformedInput if it is not valid JSON or repeats a key within one object.
json LoadData(const std::string &filename);

// Write a JSON document, replacing any existing file. A negative indent writes compact
// output. Throws MalformedInput if the data cannot be encoded (invalid UTF-8) and LoadError
// if the file cannot be written.
void DumpData(const json &data, const std::string &filename, int indent = 2);

// Load a record from a file and validate it against the given entity type. The file's
// directory is the base for relative paths inside the record, independent of the current
// working directory, and the thread's previous base directory is restored on return or on
// any error.
Model Load(const EntityType &type, const std::string &filename);

}  // namespace bidds

#endif  // BIDDS_UTILS_IODATA_HPP
