// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

// std
#include <cstdint>
#include <string>
#include <vector>
// cosync_core
#include "cosync/core/ChangeRecord.hpp"

namespace cosync::client {

// Receives everything a transport learns about its relay connection. Calls
// may arrive on any thread.
struct TransportListener
{
  virtual ~TransportListener() = default;

  virtual void onConnected() = 0;
  // A connection attempt failed or an established connection was lost
  virtual void onDisconnected(const std::string &reason) = 0;

  virtual void onFullSnapshot(
      uint64_t headSequence, std::vector<core::ChangeRecord> creates) = 0;
  virtual void onChangeBatch(std::vector<core::ChangeRecord> records) = 0;
  virtual void onAck(uint64_t sequence) = 0;
  virtual void onRelayError(const std::string &message) = 0;
};

// Reliable, ordered message channel from one client to the relay
struct ClientTransport
{
  virtual ~ClientTransport() = default;

  void setListener(TransportListener *listener);

  // Asynchronous; the outcome is reported to the listener
  virtual void connect() = 0;
  // Intentional close, not reported to the listener
  virtual void close() = 0;

  // Return false if the message could not be queued for sending
  virtual bool sendHello(const std::string &clientId, uint64_t resumeFrom) = 0;
  virtual bool sendChangeBatch(
      const std::vector<core::ChangeRecord> &records) = 0;
  virtual bool sendAck(uint64_t sequence) = 0;

 protected:
  TransportListener *m_listener{nullptr};
};

// Inlined definitions ////////////////////////////////////////////////////////

inline void ClientTransport::setListener(TransportListener *listener)
{
  m_listener = listener;
}

} // namespace cosync::client
