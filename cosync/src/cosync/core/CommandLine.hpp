// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

// std
#include <cstdint>
#include <string>
#include <vector>

namespace cosync::core {

// Small helpers shared by the settings parsers. All of them throw
// SyncError{CONFIGURATION_ERROR} on bad input.

// Returns argv[++i], or throws if 'option' was the last argument
std::string nextArgument(int argc, const char **argv, int &i);

uint16_t parsePort(const std::string &option, const std::string &value);
uint64_t parseUnsigned(const std::string &option, const std::string &value);

// "a,b,c" -> {"a", "b", "c"}, empty items dropped
std::vector<std::string> parseList(const std::string &value);

} // namespace cosync::core
