// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#include "cosync/relay/Relay.hpp"
// cosync_core
#include "cosync/core/Logging.hpp"
// std
#include <algorithm>
#include <cinttypes>

namespace cosync::relay {

using namespace cosync::core;

Relay::Relay(RelaySink &sink, size_t retain) : m_sink(&sink), m_log(retain) {}

void Relay::open(const std::string &logPath)
{
  const auto records = m_log.open(logPath);
  m_state.clear();
  for (const auto &r : records)
    m_state.apply(r);

  logStatus("[Relay] restored %zu blocks, next sequence %" PRIu64,
      m_state.size(),
      m_log.headSequence() + 1);
}

///////////////////////////////////////////////////////////////////////////////
// Session events /////////////////////////////////////////////////////////////
///////////////////////////////////////////////////////////////////////////////

void Relay::onConnect(SessionID session)
{
  m_sessions[session] = Session{};
  logDebug("[Relay] session %u connected", session);
}

void Relay::onHello(
    SessionID session, const std::string &clientId, uint64_t resumeFrom)
{
  if (clientId.empty()) {
    logWarning("[Relay] session %u sent hello without a client id", session);
    m_sink->sendError(session, "hello requires a client id");
    return;
  }

  auto &s = m_sessions[session];
  if (s.live && s.clientId != clientId)
    remember(s);

  for (const auto &other : m_sessions) {
    if (other.first != session && other.second.live
        && other.second.clientId == clientId) {
      logWarning("[Relay] client '%s' is connected more than once",
          clientId.c_str());
      break;
    }
  }

  uint64_t resume = resumeFrom;
  if (const auto *acked = m_acknowledged.at(clientId); acked && resume > 0)
    resume = std::min(resume, *acked);

  s.clientId = clientId;
  s.live = true;

  const auto head = m_log.headSequence();
  if (resume > 0 && resume <= head && m_log.covers(resume)) {
    auto missed = m_log.recordsAfter(resume);
    logStatus("[Relay] client '%s' resumes from #%" PRIu64 " (%zu records)",
        clientId.c_str(),
        resume,
        missed.size());
    s.acknowledged = resume;
    m_sink->sendChangeBatch(session, missed);
  } else {
    logStatus("[Relay] client '%s' joins at #%" PRIu64 " (%zu blocks)",
        clientId.c_str(),
        head,
        m_state.size());
    s.acknowledged = 0;
    m_sink->sendFullSnapshot(session, head, m_state.asCreates());
  }
}

void Relay::onChangeBatch(SessionID session, std::vector<ChangeRecord> batch)
{
  auto *s = m_sessions.at(session);
  if (!s || !s->live) {
    logWarning("[Relay] change batch from session %u before hello", session);
    m_sink->sendError(session, "change batch sent before hello");
    return;
  }

  std::vector<ChangeRecord> stamped;
  stamped.reserve(batch.size());

  size_t rejected = 0;

  for (auto &r : batch) {
    std::string problem;
    if (!isValid(r, problem)) {
      logWarning("[Relay] dropping record from '%s': %s",
          s->clientId.c_str(),
          problem.c_str());
      continue;
    }

    if (rejected > 0) {
      rejected++;
      continue;
    }

    r.sequence = m_log.headSequence() + 1;
    r.originClientId = s->clientId;
    if (!m_log.append(r)) {
      // unpersisted records are never stamped, nor anything after them
      rejected++;
      continue;
    }
    m_state.apply(r);
    logDebug("[Relay] stamped %s", r.toString().c_str());
    stamped.push_back(std::move(r));
  }

  if (rejected > 0) {
    logError("[Relay] could not log %zu records from '%s'",
        rejected,
        s->clientId.c_str());
    m_sink->sendError(session,
        "relay could not log " + std::to_string(rejected)
            + " records of the last batch, they were dropped");
  }

  m_sink->sendAck(session,
      stamped.empty() ? m_log.headSequence() : stamped.back().sequence);

  if (stamped.empty())
    return;

  for (const auto &other : m_sessions) {
    if (other.first != session && other.second.live)
      m_sink->sendChangeBatch(other.first, stamped);
  }
}

void Relay::onAck(SessionID session, uint64_t sequence)
{
  auto *s = m_sessions.at(session);
  if (!s || !s->live) {
    logDebug("[Relay] ignoring ack from session %u before hello", session);
    return;
  }

  if (sequence > m_log.headSequence()) {
    logWarning("[Relay] client '%s' acknowledged #%" PRIu64
               " beyond head #%" PRIu64,
        s->clientId.c_str(),
        sequence,
        m_log.headSequence());
    sequence = m_log.headSequence();
  }

  s->acknowledged = std::max(s->acknowledged, sequence);
  remember(*s);
}

void Relay::onDisconnect(SessionID session)
{
  const auto *s = m_sessions.at(session);
  if (!s)
    return;

  if (s->live) {
    remember(*s);
    logStatus("[Relay] client '%s' left at #%" PRIu64,
        s->clientId.c_str(),
        s->acknowledged);
  }

  m_sessions.erase(session);
}

///////////////////////////////////////////////////////////////////////////////
// Inspection /////////////////////////////////////////////////////////////////
///////////////////////////////////////////////////////////////////////////////

uint64_t Relay::headSequence() const
{
  return m_log.headSequence();
}

const RelayState &Relay::state() const
{
  return m_state;
}

const ChangeLog &Relay::log() const
{
  return m_log;
}

size_t Relay::numberOfSessions() const
{
  return m_sessions.size();
}

size_t Relay::numberOfLiveSessions() const
{
  return std::count_if(m_sessions.begin(),
      m_sessions.end(),
      [](const auto &s) { return s.second.live; });
}

std::optional<uint64_t> Relay::lastAcknowledged(
    const std::string &clientId) const
{
  if (const auto *acked = m_acknowledged.at(clientId))
    return *acked;
  return {};
}

bool Relay::isValid(const ChangeRecord &r, std::string &problem) const
{
  if (r.blockType.empty() || r.blockName.empty()) {
    problem = "record without block type or name";
    return false;
  }

  switch (r.operation) {
  case Operation::CREATE:
  case Operation::UPDATE_FIELD:
  case Operation::DELETE:
    return true;
  case Operation::RENAME:
    if (r.newName.empty()) {
      problem = "rename of '" + r.blockId().toString() + "' without new name";
      return false;
    }
    return true;
  }

  problem = "unknown operation";
  return false;
}

void Relay::remember(const Session &s)
{
  if (s.clientId.empty())
    return;
  auto &acked = m_acknowledged[s.clientId];
  acked = std::max(acked, s.acknowledged);
}

} // namespace cosync::relay
