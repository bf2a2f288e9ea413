// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

// std
#include <atomic>
#include <memory>
// cosync_network
#include "cosync/network/NetworkChannel.hpp"
// cosync_relay
#include "cosync/relay/Relay.hpp"
#include "cosync/relay/RelaySettings.hpp"

namespace cosync::relay {

// Runs a Relay behind a NetworkServer. Every message is handled on the
// server's IO thread; the thread calling run() only watches for shutdown.
struct RelayServer : public RelaySink
{
  RelayServer(int argc, const char **argv);
  explicit RelayServer(const RelaySettings &settings);
  ~RelayServer() override;

  // Opens the log, starts listening and blocks until requestShutdown()
  void run();
  void requestShutdown(); // safe to call from any thread or signal handler

  const RelaySettings &settings() const;
  uint16_t listeningPort() const; // 0 unless run() is accepting connections

  // RelaySink //

  void sendFullSnapshot(SessionID session,
      uint64_t headSequence,
      const std::vector<core::ChangeRecord> &creates) override;
  void sendChangeBatch(SessionID session,
      const std::vector<core::ChangeRecord> &records) override;
  void sendAck(SessionID session, uint64_t sequence) override;
  void sendError(SessionID session, const std::string &message) override;

 private:
  enum class ServerMode
  {
    STARTING,
    LISTENING,
    SHUTDOWN
  };

  void setup_Relay();
  void setup_Messaging();
  void report_Sessions();

  RelaySettings m_settings;

  std::unique_ptr<Relay> m_relay;
  std::shared_ptr<network::NetworkServer> m_server;

  std::atomic<bool> m_shutdownRequested{false};
  std::atomic<uint16_t> m_listeningPort{0};
  ServerMode m_currentMode{ServerMode::STARTING};
  size_t m_reportedSessions{0};
};

} // namespace cosync::relay
