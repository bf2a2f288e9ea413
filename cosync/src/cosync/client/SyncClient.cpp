// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#include "cosync/client/SyncClient.hpp"
// cosync_core
#include "cosync/core/Error.hpp"
#include "cosync/core/Logging.hpp"
#include "cosync/core/algorithms/diffSnapshots.hpp"
// std
#include <algorithm>
#include <cinttypes>
#include <set>

namespace cosync::client {

using namespace cosync::core;

const char *toString(SyncState s)
{
  switch (s) {
  case SyncState::DISCONNECTED:
    return "Disconnected";
  case SyncState::CONNECTING:
    return "Connecting";
  case SyncState::SYNCING:
    return "Syncing";
  case SyncState::LIVE:
    return "Live";
  }
  return "Unknown";
}

SyncClient::SyncClient(
    HostScene &scene, ClientTransport &transport, const SyncSettings &settings)
    : m_scene(&scene),
      m_transport(&transport),
      m_settings(settings),
      m_encoder(settings.types),
      m_scheduler(scene, settings.retryLimit)
{
  if (m_settings.clientId.empty())
    m_settings.clientId = generateClientId();
  m_transport->setListener(this);
}

SyncClient::~SyncClient()
{
  m_transport->close();
  m_transport->setListener(nullptr);
}

///////////////////////////////////////////////////////////////////////////////
// Host side //////////////////////////////////////////////////////////////////
///////////////////////////////////////////////////////////////////////////////

void SyncClient::connect()
{
  m_wantConnection = true;
  if (m_state != SyncState::DISCONNECTED)
    return;

  m_backoff = std::chrono::milliseconds(0);
  m_nextAttempt = Clock::now();
  tryReconnect();
}

void SyncClient::disconnect()
{
  m_wantConnection = false;
  if (m_state == SyncState::DISCONNECTED)
    return;

  m_transport->close();
  m_inbox.clear();
  dropSession();
  setState(SyncState::DISCONNECTED);
}

void SyncClient::poll()
{
  for (auto &msg : m_inbox.drain())
    handle(msg);

  tryReconnect();

  if (m_state == SyncState::LIVE) {
    const bool edited = m_localEditPending.exchange(false);
    if (edited || m_settings.pollEdits)
      sendLocalChanges();
  }

  collectDiscarded();
}

void SyncClient::notifyLocalEdit()
{
  m_localEditPending = true;
}

std::vector<SyncEvent> SyncClient::takeEvents()
{
  std::vector<SyncEvent> events;
  events.swap(m_events);
  return events;
}

SyncState SyncClient::state() const
{
  return m_state;
}

const std::string &SyncClient::clientId() const
{
  return m_settings.clientId;
}

uint64_t SyncClient::lastAppliedSequence() const
{
  return m_lastApplied;
}

size_t SyncClient::numberOfBatchesInFlight() const
{
  return m_inFlight.size();
}

size_t SyncClient::numberOfDeferred() const
{
  return m_scheduler.numberOfDeferred();
}

const Snapshot &SyncClient::acknowledgedSnapshot() const
{
  return m_acked;
}

std::chrono::milliseconds SyncClient::currentBackoff() const
{
  return m_backoff;
}

///////////////////////////////////////////////////////////////////////////////
// TransportListener //////////////////////////////////////////////////////////
///////////////////////////////////////////////////////////////////////////////

void SyncClient::onConnected()
{
  Incoming msg;
  msg.kind = Incoming::Kind::CONNECTED;
  m_inbox.push(std::move(msg));
}

void SyncClient::onDisconnected(const std::string &reason)
{
  Incoming msg;
  msg.kind = Incoming::Kind::DISCONNECTED;
  msg.message = reason;
  m_inbox.push(std::move(msg));
}

void SyncClient::onFullSnapshot(
    uint64_t headSequence, std::vector<ChangeRecord> creates)
{
  Incoming msg;
  msg.kind = Incoming::Kind::FULL_SNAPSHOT;
  msg.sequence = headSequence;
  msg.records = std::move(creates);
  m_inbox.push(std::move(msg));
}

void SyncClient::onChangeBatch(std::vector<ChangeRecord> records)
{
  Incoming msg;
  msg.kind = Incoming::Kind::CHANGE_BATCH;
  msg.records = std::move(records);
  m_inbox.push(std::move(msg));
}

void SyncClient::onAck(uint64_t sequence)
{
  Incoming msg;
  msg.kind = Incoming::Kind::ACK;
  msg.sequence = sequence;
  m_inbox.push(std::move(msg));
}

void SyncClient::onRelayError(const std::string &message)
{
  Incoming msg;
  msg.kind = Incoming::Kind::RELAY_ERROR;
  msg.message = message;
  m_inbox.push(std::move(msg));
}

///////////////////////////////////////////////////////////////////////////////
// Incoming messages //////////////////////////////////////////////////////////
///////////////////////////////////////////////////////////////////////////////

void SyncClient::handle(Incoming &msg)
{
  switch (msg.kind) {
  case Incoming::Kind::CONNECTED:
    handleConnected();
    break;
  case Incoming::Kind::DISCONNECTED:
    handleDisconnected(msg.message);
    break;
  case Incoming::Kind::FULL_SNAPSHOT:
    handleFullSnapshot(msg.sequence, msg.records);
    break;
  case Incoming::Kind::CHANGE_BATCH:
    handleChangeBatch(msg.records);
    break;
  case Incoming::Kind::ACK:
    handleAck(msg.sequence);
    break;
  case Incoming::Kind::RELAY_ERROR:
    logError("[SyncClient] relay reported: %s", msg.message.c_str());
    pushEvent(SyncEvent::Type::RELAY_ERROR, msg.message);
    break;
  }
}

void SyncClient::handleConnected()
{
  if (m_state != SyncState::CONNECTING) {
    logDebug("[SyncClient] ignoring connection in state %s",
        toString(m_state));
    return;
  }

  const uint64_t resumeFrom = m_settings.resume ? m_lastApplied : 0;
  if (!m_transport->sendHello(m_settings.clientId, resumeFrom)) {
    logWarning("[SyncClient] could not send hello to the relay");
    return;
  }

  setState(SyncState::SYNCING);
}

void SyncClient::handleDisconnected(const std::string &reason)
{
  if (m_state == SyncState::DISCONNECTED)
    return;

  const bool wasConnected =
      m_state == SyncState::SYNCING || m_state == SyncState::LIVE;
  logWarning("[SyncClient] %s: %s",
      wasConnected ? "connection to relay lost" : "cannot reach relay",
      reason.c_str());

  dropSession();

  if (m_backoff.count() == 0)
    m_backoff = m_settings.backoffInitial;
  else
    m_backoff = std::min(m_backoff * 2, m_settings.backoffMax);
  m_nextAttempt = Clock::now() + m_backoff;

  setState(SyncState::DISCONNECTED);
  pushEvent(SyncEvent::Type::CONNECTION_LOST, reason);
}

void SyncClient::handleFullSnapshot(
    uint64_t headSequence, std::vector<ChangeRecord> &creates)
{
  if (m_state != SyncState::SYNCING) {
    logWarning("[SyncClient] unexpected full snapshot in state %s",
        toString(m_state));
    return;
  }

  creates.erase(std::remove_if(creates.begin(),
                    creates.end(),
                    [&](const ChangeRecord &r) {
                      return r.operation != Operation::CREATE
                          || !m_encoder.isReplicated(r.blockType);
                    }),
      creates.end());

  m_scheduler.clear();

  Snapshot relayState;
  for (const auto &c : creates)
    relayState.setBlock(c.blockId(), c.payload);

  if (creates.empty()) {
    logStatus("[SyncClient] relay state is empty, uploading local scene");
  } else {
    logStatus("[SyncClient] replacing local scene with %zu relay blocks",
        creates.size());

    std::vector<ChangeRecord> records;

    for (const auto &type : m_encoder.typesToCapture(*m_scene)) {
      m_scene->enumerateBlocks(
          type, [&](const std::string &name, const FieldMap &) {
            if (!relayState.contains({type, name}))
              records.push_back(makeDelete({type, name}));
          });
    }

    for (auto &c : creates) {
      const auto local = m_scene->findBlock(c.blockId());
      if (!local) {
        records.push_back(std::move(c));
        continue;
      }
      FieldMap fields = c.payload;
      for (const auto &f : *local) {
        if (!fields.contains(f.first))
          fields[f.first] = Value{};
      }
      records.push_back(makeUpdate(c.blockId(), std::move(fields)));
    }

    m_scheduler.applyBatch(records);
    m_scheduler.takeApplied();

    // Deferred blocks are not in the host yet and must stay out of the
    // baseline, otherwise the next diff reports them as local deletes.
    // They are folded in by applyRemote() once they resolve.
    try {
      relayState = m_encoder.capture(*m_scene);
    } catch (const SyncError &e) {
      logWarning("[SyncClient] baseline from relay state: %s", e.what());
      Snapshot known;
      for (const auto &entry : relayState) {
        if (m_scene->hasBlock(entry.first))
          known.setBlock(entry.first, entry.second.fields);
      }
      relayState = std::move(known);
    }

    if (m_scheduler.numberOfDeferred() > 0) {
      logStatus("[SyncClient] %zu relay records wait for missing blocks",
          m_scheduler.numberOfDeferred());
    }
  }

  m_acked = relayState;
  m_sent = std::move(relayState);
  m_inFlight.clear();
  m_lastApplied = headSequence;

  if (headSequence > 0 && m_transport->sendAck(headSequence))
    m_lastReportedAck = headSequence;

  m_backoff = std::chrono::milliseconds(0);
  setState(SyncState::LIVE);

  sendLocalChanges();
}

void SyncClient::handleChangeBatch(std::vector<ChangeRecord> &records)
{
  if (m_state == SyncState::SYNCING) {
    logStatus("[SyncClient] catching up on %zu missed records",
        records.size());
    applyRemote(records, true);
    m_backoff = std::chrono::milliseconds(0);
    setState(SyncState::LIVE);
    m_localEditPending = true; // resend whatever the relay never stamped
  } else if (m_state == SyncState::LIVE) {
    applyRemote(records, false);
  } else {
    logDebug("[SyncClient] dropping change batch in state %s",
        toString(m_state));
  }
}

void SyncClient::handleAck(uint64_t sequence)
{
  if (m_inFlight.empty()) {
    logDebug("[SyncClient] ack #%" PRIu64 " without a batch in flight",
        sequence);
    return;
  }

  m_acked = m_acked.patched(m_inFlight.front());
  m_inFlight.pop_front();

  // everything the relay stamped before our batch was delivered before the ack
  m_lastApplied = std::max(m_lastApplied, sequence);

  logDebug("[SyncClient] batch acknowledged at #%" PRIu64 ", %zu in flight",
      sequence,
      m_inFlight.size());
}

///////////////////////////////////////////////////////////////////////////////
// Synchronization ////////////////////////////////////////////////////////////
///////////////////////////////////////////////////////////////////////////////

void SyncClient::applyRemote(
    const std::vector<ChangeRecord> &records, bool catchingUp)
{
  std::vector<ChangeRecord> toApply;
  toApply.reserve(records.size());

  for (const auto &r : records) {
    if (r.sequence != 0 && r.sequence <= m_lastApplied) {
      logDebug("[SyncClient] skipping already applied record #%" PRIu64,
          r.sequence);
      continue;
    }
    m_lastApplied = std::max(m_lastApplied, r.sequence);

    if (!m_encoder.isReplicated(r.blockType))
      continue;

    if (r.originClientId == m_settings.clientId) {
      // stamped while we were away, the relay already has it
      if (catchingUp) {
        m_acked = m_acked.patched(r);
        m_sent = m_sent.patched(r);
      }
      continue;
    }

    ChangeRecord masked = r;
    if (mask(masked))
      toApply.push_back(std::move(masked));
  }

  if (!toApply.empty()) {
    m_scheduler.applyBatch(toApply);
    const auto applied = m_scheduler.takeApplied();
    m_acked = m_acked.patched(applied);
    m_sent = m_sent.patched(applied);
  }

  if (m_lastApplied > m_lastReportedAck
      && m_transport->sendAck(m_lastApplied)) {
    m_lastReportedAck = m_lastApplied;
  }
}

bool SyncClient::mask(ChangeRecord &record)
{
  if (m_inFlight.empty() || record.operation == Operation::DELETE)
    return true;

  const auto id = m_scheduler.resolveAlias(record.blockId());

  bool deleted = false;
  bool renamed = false;
  std::set<std::string> fields;

  for (const auto &batch : m_inFlight) {
    for (const auto &r : batch) {
      const auto key = m_scheduler.resolveAlias(
          r.operation == Operation::RENAME ? r.renamedId() : r.blockId());
      if (key != id)
        continue;
      switch (r.operation) {
      case Operation::DELETE:
        deleted = true;
        break;
      case Operation::RENAME:
        renamed = true;
        break;
      case Operation::CREATE:
      case Operation::UPDATE_FIELD:
        for (const auto &f : r.payload)
          fields.insert(f.first);
        break;
      }
    }
  }

  if (deleted) {
    logDebug("[SyncClient] masking %s, deleted locally",
        record.toString().c_str());
    return false;
  }

  if (record.operation == Operation::RENAME) {
    if (!renamed)
      return true;
    // our rename is stamped later and wins, but the relay will still know
    // the block by the remote name until then
    m_scheduler.addAlias({record.blockType, record.newName}, id.name);
    logDebug("[SyncClient] masking %s, renamed locally",
        record.toString().c_str());
    return false;
  }

  if (fields.empty())
    return true;

  FieldMap kept;
  bool removed = false;
  for (const auto &f : record.payload) {
    if (fields.count(f.first))
      removed = true;
    else
      kept[f.first] = f.second;
  }

  if (!removed)
    return true;

  logDebug("[SyncClient] masking %zu field(s) of %s",
      record.payload.size() - kept.size(),
      record.toString().c_str());

  if (kept.empty() && record.operation == Operation::UPDATE_FIELD)
    return false;

  record.payload = std::move(kept);
  return true;
}

void SyncClient::sendLocalChanges()
{
  Snapshot current;
  try {
    current = m_encoder.capture(*m_scene);
  } catch (const SyncError &e) {
    logDebug("[SyncClient] retrying capture on next poll: %s", e.what());
    m_localEditPending = true;
    return;
  }

  auto records = diffSnapshots(m_sent, current, m_settings.clientId);
  if (records.empty())
    return;

  if (!m_transport->sendChangeBatch(records)) {
    logWarning("[SyncClient] could not send %zu local changes",
        records.size());
    m_localEditPending = true;
    return;
  }

  for (const auto &r : records) {
    if (r.operation == Operation::RENAME)
      m_scheduler.addAlias(r.blockId(), r.newName);
  }

  logDebug("[SyncClient] sent %zu local changes", records.size());

  m_sent = std::move(current);
  m_inFlight.push_back(std::move(records));
}

void SyncClient::collectDiscarded()
{
  for (const auto &r : m_scheduler.takeDiscarded()) {
    pushEvent(SyncEvent::Type::UNRESOLVED_DEPENDENCY,
        std::string(core::toString(r.operation)) + " of '"
            + r.blockId().toString() + "' dropped, a referenced block never "
            + "arrived");
  }
}

void SyncClient::tryReconnect()
{
  if (m_state != SyncState::DISCONNECTED || !m_wantConnection
      || Clock::now() < m_nextAttempt)
    return;

  logStatus("[SyncClient] connecting to relay as '%s'...",
      m_settings.clientId.c_str());
  m_scheduler.clear();
  setState(SyncState::CONNECTING);
  m_transport->connect();
}

void SyncClient::setState(SyncState s)
{
  if (s == m_state)
    return;
  logDebug("[SyncClient] %s -> %s", toString(m_state), toString(s));
  m_state = s;
  pushEvent(SyncEvent::Type::STATE_CHANGED);
}

void SyncClient::dropSession()
{
  m_inFlight.clear();
  m_sent = m_acked;
  m_scheduler.clear();
  m_lastReportedAck = 0;
}

void SyncClient::pushEvent(SyncEvent::Type type, std::string message)
{
  SyncEvent e;
  e.type = type;
  e.state = m_state;
  e.message = std::move(message);
  m_events.push_back(std::move(e));
}

} // namespace cosync::client
