// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#include "cosync/relay/RelayServer.hpp"
// cosync_core
#include "cosync/core/Error.hpp"
#include "cosync/core/Logging.hpp"
// cosync_network
#include "cosync/network/Protocol.hpp"
#include "cosync/network/messages/Ack.hpp"
#include "cosync/network/messages/ChangeBatch.hpp"
#include "cosync/network/messages/FullSnapshot.hpp"
#include "cosync/network/messages/Hello.hpp"
// std
#include <chrono>
#include <thread>

namespace cosync::relay {

using namespace cosync::network;

RelayServer::RelayServer(int argc, const char **argv)
{
  core::setLogToStdout();
  core::logStatus("[Server] Parsing command line...");
  m_settings.parseCommandLine(argc, argv);
  core::setLogVerbose(m_settings.verbose);
}

RelayServer::RelayServer(const RelaySettings &settings) : m_settings(settings)
{
  core::setLogVerbose(m_settings.verbose);
}

RelayServer::~RelayServer()
{
  if (m_server)
    m_server->stop();
}

void RelayServer::run()
{
  setup_Relay();
  setup_Messaging();

  m_server->start();
  m_currentMode = ServerMode::LISTENING;
  m_listeningPort = m_server->port();

  core::logStatus("[Server] Listening on %s:%i...",
      m_settings.bindAddress.c_str(),
      int(m_server->port()));

  while (m_currentMode != ServerMode::SHUTDOWN) {
    if (m_shutdownRequested) {
      m_currentMode = ServerMode::SHUTDOWN;
      continue;
    }
    report_Sessions();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  core::logStatus("[Server] Shutting down...");
  m_listeningPort = 0;

  m_server->stop();
  m_server->removeAllHandlers();

  core::logStatus("[Server] Head sequence at shutdown: %llu",
      static_cast<unsigned long long>(m_relay->headSequence()));
}

void RelayServer::requestShutdown()
{
  m_shutdownRequested = true;
}

const RelaySettings &RelayServer::settings() const
{
  return m_settings;
}

uint16_t RelayServer::listeningPort() const
{
  return m_listeningPort;
}

///////////////////////////////////////////////////////////////////////////////
// RelaySink //////////////////////////////////////////////////////////////////
///////////////////////////////////////////////////////////////////////////////

void RelayServer::sendFullSnapshot(SessionID session,
    uint64_t headSequence,
    const std::vector<core::ChangeRecord> &creates)
{
  messages::FullSnapshotData data;
  data.headSequence = headSequence;
  data.creates = creates;
  m_server->send(
      session, MessageType::FULL_SNAPSHOT, messages::FullSnapshot(data));
}

void RelayServer::sendChangeBatch(
    SessionID session, const std::vector<core::ChangeRecord> &records)
{
  m_server->send(
      session, MessageType::CHANGE_BATCH, messages::ChangeBatch(records));
}

void RelayServer::sendAck(SessionID session, uint64_t sequence)
{
  m_server->send(session, MessageType::ACK, messages::Ack(sequence));
}

void RelayServer::sendError(SessionID session, const std::string &message)
{
  m_server->send(session, make_message(MessageType::ERROR, message));
}

///////////////////////////////////////////////////////////////////////////////
// Setup //////////////////////////////////////////////////////////////////////
///////////////////////////////////////////////////////////////////////////////

void RelayServer::setup_Relay()
{
  core::logStatus("[Server] Setting up relay...");
  m_relay = std::make_unique<Relay>(*this, m_settings.retain);
  if (!m_settings.logFile.empty())
    m_relay->open(m_settings.logFile);
  else
    core::logStatus("[Server] No log file given, changes are kept in memory");
}

void RelayServer::setup_Messaging()
{
  core::logStatus("[Server] Setting up messaging...");

  m_server =
      std::make_shared<NetworkServer>(m_settings.bindAddress, m_settings.port);

  auto *relay = m_relay.get();

  m_server->setConnectionHandlers(
      [relay](ConnectionID id) { relay->onConnect(id); },
      [relay](ConnectionID id) { relay->onDisconnect(id); });

  // Handlers //

  m_server->registerHandler(
      MessageType::ERROR, [](ConnectionID id, const Message &msg) {
        std::string error;
        if (!payloadRead(msg, error))
          error = "<malformed>";
        core::logError(
            "[Server] Received error from connection #%u: '%s'",
            id,
            error.c_str());
      });

  m_server->registerHandler(
      MessageType::DISCONNECT, [this](ConnectionID id, const Message &) {
        core::logStatus("[Server] Connection #%u signaled disconnection.", id);
        m_server->disconnect(id);
      });

  m_server->registerHandler(MessageType::HELLO,
      [this, relay](ConnectionID id, const Message &msg) {
        messages::HelloData hello;
        try {
          messages::Hello(msg, &hello).execute();
        } catch (const core::SyncError &e) {
          core::logError("[Server] Invalid HELLO from #%u: %s", id, e.what());
          sendError(id, e.what());
          return;
        }
        relay->onHello(id, hello.clientId, hello.resumeFrom);
      });

  m_server->registerHandler(MessageType::CHANGE_BATCH,
      [this, relay](ConnectionID id, const Message &msg) {
        std::vector<core::ChangeRecord> batch;
        try {
          messages::ChangeBatch(msg, &batch).execute();
        } catch (const core::SyncError &e) {
          core::logError(
              "[Server] Invalid CHANGE_BATCH from #%u: %s", id, e.what());
          sendError(id, e.what());
          return;
        }
        relay->onChangeBatch(id, std::move(batch));
      });

  m_server->registerHandler(
      MessageType::ACK, [relay](ConnectionID id, const Message &msg) {
        uint64_t sequence = 0;
        try {
          messages::Ack(msg, &sequence).execute();
        } catch (const core::SyncError &e) {
          core::logError("[Server] Invalid ACK from #%u: %s", id, e.what());
          return;
        }
        relay->onAck(id, sequence);
      });
}

void RelayServer::report_Sessions()
{
  const auto sessions = m_server->numberOfConnections();
  if (sessions == m_reportedSessions)
    return;
  core::logStatus("[Server] %zu client(s) connected", sessions);
  m_reportedSessions = sessions;
}

} // namespace cosync::relay
