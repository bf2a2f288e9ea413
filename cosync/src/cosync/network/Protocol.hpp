// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

// std
#include <cstdint>

namespace cosync::network {

constexpr uint16_t DEFAULT_RELAY_PORT = 25600;

// Message types exchanged between relay and clients
enum MessageType
{
  // client -> relay: {clientId, resumeFrom}
  HELLO = 0,
  // relay -> client: {headSequence, creates}
  FULL_SNAPSHOT,
  // both directions: {records}
  CHANGE_BATCH,
  // relay -> client: last stamped sequence of the client's batch
  // client -> relay: last sequence the client applied
  ACK,

  // All disconnections
  DISCONNECT,

  // All errors
  ERROR = 255
};

const char *toString(MessageType type);

// Inlined definitions ////////////////////////////////////////////////////////

inline const char *toString(MessageType type)
{
  switch (type) {
  case HELLO:
    return "HELLO";
  case FULL_SNAPSHOT:
    return "FULL_SNAPSHOT";
  case CHANGE_BATCH:
    return "CHANGE_BATCH";
  case ACK:
    return "ACK";
  case DISCONNECT:
    return "DISCONNECT";
  case ERROR:
    return "ERROR";
  }
  return "UNKNOWN";
}

} // namespace cosync::network
