// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0

#ifndef BIDDS_UTILS_STRINGS_HPP
#define BIDDS_UTILS_STRINGS_HPP

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace bidds::utils
{

inline constexpr std::string_view whitespace = " \t\n\r\f\v";

// Remove leading and trailing whitespace.
inline std::string_view Trim(std::string_view str)
{
  auto prefix = str.find_first_not_of(whitespace);
  if (prefix == std::string_view::npos)
  {
    return {};
  }
  auto suffix = str.find_last_not_of(whitespace);
  return str.substr(prefix, suffix - prefix + 1);
}

inline std::string ToLower(std::string_view str)
{
  std::string out(str);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

}  // namespace bidds::utils

#endif  // BIDDS_UTILS_STRINGS_HPP
