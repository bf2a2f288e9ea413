// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

// std
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
// cosync_network
#include "cosync/network/Protocol.hpp"

namespace cosync::client {

struct SyncSettings
{
  std::string host{"127.0.0.1"};
  uint16_t port{network::DEFAULT_RELAY_PORT};
  std::string clientId; // generated when left empty

  std::chrono::milliseconds backoffInitial{500};
  std::chrono::milliseconds backoffMax{10000};
  uint32_t retryLimit{8}; // dependency scheduler passes before discarding

  std::vector<std::string> types; // replicated types, empty = all
  bool resume{false}; // ask for missed records instead of a full snapshot
  bool pollEdits{false}; // diff on every poll, not only on notifyLocalEdit()
  bool verbose{false};
  bool help{false};

  // Throws SyncError{CONFIGURATION_ERROR} on unknown options or bad values.
  // Also fills in a generated client id if none was given.
  void parseCommandLine(int argc, const char **argv);
};

// "client-" followed by 8 random hex digits
std::string generateClientId();

const char *syncUsage();

} // namespace cosync::client
