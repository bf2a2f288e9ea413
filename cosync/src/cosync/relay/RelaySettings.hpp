// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

// std
#include <cstdint>
#include <string>
// cosync_network
#include "cosync/network/Protocol.hpp"

namespace cosync::relay {

struct RelaySettings
{
  std::string bindAddress{"0.0.0.0"};
  uint16_t port{network::DEFAULT_RELAY_PORT};
  std::string logFile; // empty = in-memory only
  size_t retain{10000}; // records kept in memory for resuming clients
  bool verbose{false};
  bool help{false};

  // Throws SyncError{CONFIGURATION_ERROR} on unknown options or bad values
  void parseCommandLine(int argc, const char **argv);
};

const char *relayUsage();

} // namespace cosync::relay
