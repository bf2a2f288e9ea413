// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

// std
#include <atomic>
#include <chrono>
#include <deque>
#include <string>
#include <vector>
// cosync_core
#include "cosync/core/ConcurrentQueue.hpp"
#include "cosync/core/snapshot/SnapshotEncoder.hpp"
// cosync_client
#include "cosync/client/ClientTransport.hpp"
#include "cosync/client/DependencyScheduler.hpp"
#include "cosync/client/SyncSettings.hpp"

namespace cosync::client {

enum class SyncState
{
  DISCONNECTED,
  CONNECTING,
  SYNCING, // hello sent, waiting for the relay state
  LIVE
};

const char *toString(SyncState s);

// Something the host may want to show its user
struct SyncEvent
{
  enum class Type
  {
    STATE_CHANGED,
    CONNECTION_LOST,
    UNRESOLVED_DEPENDENCY,
    RELAY_ERROR
  };

  Type type{Type::STATE_CHANGED};
  SyncState state{SyncState::DISCONNECTED}; // state after the event
  std::string message;
};

// Keeps one HostScene in step with the relay. Transport callbacks only queue
// work; the host scene is read and written exclusively inside poll(), which
// the host calls from its own thread between edits.
struct SyncClient : public TransportListener
{
  SyncClient(core::HostScene &scene,
      ClientTransport &transport,
      const SyncSettings &settings);
  ~SyncClient() override;

  SyncClient(const SyncClient &) = delete;
  SyncClient &operator=(const SyncClient &) = delete;

  // Host side //

  void connect(); // keeps reconnecting until disconnect()
  void disconnect();
  void poll();
  void notifyLocalEdit(); // thread safe

  std::vector<SyncEvent> takeEvents();

  // Inspection //

  SyncState state() const;
  const std::string &clientId() const;
  uint64_t lastAppliedSequence() const;
  size_t numberOfBatchesInFlight() const;
  size_t numberOfDeferred() const;
  const core::Snapshot &acknowledgedSnapshot() const;
  std::chrono::milliseconds currentBackoff() const;

  // TransportListener, any thread //

  void onConnected() override;
  void onDisconnected(const std::string &reason) override;
  void onFullSnapshot(uint64_t headSequence,
      std::vector<core::ChangeRecord> creates) override;
  void onChangeBatch(std::vector<core::ChangeRecord> records) override;
  void onAck(uint64_t sequence) override;
  void onRelayError(const std::string &message) override;

 private:
  using Clock = std::chrono::steady_clock;

  struct Incoming
  {
    enum class Kind
    {
      CONNECTED,
      DISCONNECTED,
      FULL_SNAPSHOT,
      CHANGE_BATCH,
      ACK,
      RELAY_ERROR
    };

    Kind kind{Kind::CONNECTED};
    uint64_t sequence{0}; // head sequence or ack
    std::vector<core::ChangeRecord> records;
    std::string message;
  };

  void handle(Incoming &msg);
  void handleConnected();
  void handleDisconnected(const std::string &reason);
  void handleFullSnapshot(
      uint64_t headSequence, std::vector<core::ChangeRecord> &creates);
  void handleChangeBatch(std::vector<core::ChangeRecord> &records);
  void handleAck(uint64_t sequence);

  void applyRemote(const std::vector<core::ChangeRecord> &records,
      bool catchingUp);
  bool mask(core::ChangeRecord &record); // false if nothing is left
  void sendLocalChanges();
  void collectDiscarded();
  void tryReconnect();

  void setState(SyncState s);
  void dropSession();
  void pushEvent(SyncEvent::Type type, std::string message = {});

  core::HostScene *m_scene{nullptr};
  ClientTransport *m_transport{nullptr};
  SyncSettings m_settings;

  core::SnapshotEncoder m_encoder;
  DependencyScheduler m_scheduler;

  SyncState m_state{SyncState::DISCONNECTED};
  bool m_wantConnection{false};
  Clock::time_point m_nextAttempt{};
  std::chrono::milliseconds m_backoff{0};

  core::ConcurrentQueue<Incoming> m_inbox;
  std::atomic<bool> m_localEditPending{false};

  uint64_t m_lastApplied{0};
  uint64_t m_lastReportedAck{0};

  // What the relay has of ours (acked) and what it will have once every
  // batch in flight is stamped (sent). Local edits are diffed against sent.
  core::Snapshot m_acked;
  core::Snapshot m_sent;
  std::deque<std::vector<core::ChangeRecord>> m_inFlight;

  std::vector<SyncEvent> m_events;
};

} // namespace cosync::client
