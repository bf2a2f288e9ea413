// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#include "cosync/core/CommandLine.hpp"
#include "cosync/core/Error.hpp"
// std
#include <cctype>
#include <limits>
#include <sstream>

namespace cosync::core {

std::string nextArgument(int argc, const char **argv, int &i)
{
  const std::string option = argv[i];
  if (i + 1 >= argc || argv[i + 1] == nullptr) {
    throw SyncError(ErrorCode::CONFIGURATION_ERROR,
        "option '" + option + "' expects a value");
  }
  return argv[++i];
}

uint16_t parsePort(const std::string &option, const std::string &value)
{
  const auto port = parseUnsigned(option, value);
  if (port == 0 || port > std::numeric_limits<uint16_t>::max()) {
    throw SyncError(ErrorCode::CONFIGURATION_ERROR,
        "invalid port '" + value + "' for option '" + option + "'");
  }
  return uint16_t(port);
}

uint64_t parseUnsigned(const std::string &option, const std::string &value)
{
  bool digitsOnly = !value.empty() && value.size() <= 19;
  for (char c : value)
    digitsOnly = digitsOnly && std::isdigit(static_cast<unsigned char>(c));

  if (!digitsOnly) {
    throw SyncError(ErrorCode::CONFIGURATION_ERROR,
        "invalid number '" + value + "' for option '" + option + "'");
  }

  return std::stoull(value);
}

std::vector<std::string> parseList(const std::string &value)
{
  std::vector<std::string> items;
  std::stringstream ss(value);
  std::string item;
  while (std::getline(ss, item, ',')) {
    if (!item.empty())
      items.push_back(item);
  }
  return items;
}

} // namespace cosync::core
