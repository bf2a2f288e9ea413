// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "cosync/relay/ChangeLog.hpp"
#include "cosync/relay/RelayState.hpp"
// std
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cosync::relay {

using SessionID = uint32_t;

// Where the relay's outgoing messages go; RelayServer maps these onto
// network connections, tests record them.
struct RelaySink
{
  virtual ~RelaySink() = default;

  virtual void sendFullSnapshot(SessionID session,
      uint64_t headSequence,
      const std::vector<core::ChangeRecord> &creates) = 0;
  virtual void sendChangeBatch(
      SessionID session, const std::vector<core::ChangeRecord> &records) = 0;
  virtual void sendAck(SessionID session, uint64_t sequence) = 0;
  virtual void sendError(SessionID session, const std::string &message) = 0;
};

// Authoritative end of the star: stamps every incoming record with the next
// global sequence number, logs it, folds it into the compacted state and fans
// it out to every other live session. All entry points must be called from a
// single thread.
struct Relay
{
  explicit Relay(RelaySink &sink, size_t retain = 10000);

  Relay(const Relay &) = delete;
  Relay &operator=(const Relay &) = delete;

  // Persists to 'logPath', first replaying whatever it already holds.
  // Throws SyncError{CONFIGURATION_ERROR} if the file is unusable.
  void open(const std::string &logPath);

  // Session events //

  void onConnect(SessionID session);
  void onHello(
      SessionID session, const std::string &clientId, uint64_t resumeFrom);
  void onChangeBatch(SessionID session, std::vector<core::ChangeRecord> batch);
  void onAck(SessionID session, uint64_t sequence);
  void onDisconnect(SessionID session);

  // Inspection //

  uint64_t headSequence() const;
  const RelayState &state() const;
  const ChangeLog &log() const;

  size_t numberOfSessions() const;
  size_t numberOfLiveSessions() const; // sessions which said hello

  // Last sequence 'clientId' acknowledged, kept across its disconnects
  std::optional<uint64_t> lastAcknowledged(const std::string &clientId) const;

 private:
  struct Session
  {
    std::string clientId;
    bool live{false};
    uint64_t acknowledged{0};
  };

  bool isValid(const core::ChangeRecord &r, std::string &problem) const;
  void remember(const Session &s);

  RelaySink *m_sink{nullptr};
  ChangeLog m_log;
  RelayState m_state;

  core::FlatMap<SessionID, Session> m_sessions;
  core::FlatMap<std::string, uint64_t> m_acknowledged;
};

} // namespace cosync::relay
