// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#include "cosync/client/NetworkTransport.hpp"
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

namespace cosync::client {

using namespace cosync::network;

// A send failed right away if its future is already holding an error
static bool queued(MessageFuture f)
{
  if (!is_ready(f))
    return true;
  return f.valid() && !f.get();
}

NetworkTransport::NetworkTransport(std::string host, uint16_t port)
    : m_host(std::move(host)), m_port(port)
{
  setup_Messaging();
}

NetworkTransport::~NetworkTransport()
{
  close();
}

void NetworkTransport::connect()
{
  core::logStatus("[NetworkTransport] Connecting to %s:%i...",
      m_host.c_str(),
      int(m_port));
  m_client.connect(m_host, m_port);
}

void NetworkTransport::close()
{
  if (m_client.isConnected()) {
    auto f = m_client.send(MessageType::DISCONNECT);
    if (f.wait_for(std::chrono::seconds(1)) != std::future_status::ready)
      core::logWarning("[NetworkTransport] relay did not take DISCONNECT");
  }
  m_client.disconnect();
}

bool NetworkTransport::sendHello(
    const std::string &clientId, uint64_t resumeFrom)
{
  messages::HelloData data;
  data.clientId = clientId;
  data.resumeFrom = resumeFrom;
  return queued(m_client.send(MessageType::HELLO, messages::Hello(data)));
}

bool NetworkTransport::sendChangeBatch(
    const std::vector<core::ChangeRecord> &records)
{
  return queued(
      m_client.send(MessageType::CHANGE_BATCH, messages::ChangeBatch(records)));
}

bool NetworkTransport::sendAck(uint64_t sequence)
{
  return queued(m_client.send(MessageType::ACK, messages::Ack(sequence)));
}

bool NetworkTransport::isConnected() const
{
  return m_client.isConnected();
}

void NetworkTransport::setup_Messaging()
{
  m_client.setConnectionHandlers(
      [this](const boost::system::error_code &error) {
        if (!m_listener)
          return;
        if (error)
          m_listener->onDisconnected(error.message());
        else
          m_listener->onConnected();
      },
      [this](const boost::system::error_code &error) {
        // operation_aborted: we closed the connection ourselves
        if (!m_listener || error == asio::error::operation_aborted)
          return;
        m_listener->onDisconnected(
            error ? error.message() : std::string("connection closed"));
      });

  // Handlers //

  m_client.registerHandler(MessageType::ERROR, [this](const Message &msg) {
    std::string error;
    if (!payloadRead(msg, error))
      error = "<malformed>";
    core::logError("[NetworkTransport] Received error from relay: '%s'",
        error.c_str());
    if (m_listener)
      m_listener->onRelayError(error);
  });

  m_client.registerHandler(MessageType::DISCONNECT, [](const Message &) {
    core::logStatus("[NetworkTransport] Relay signaled disconnection.");
  });

  m_client.registerHandler(
      MessageType::FULL_SNAPSHOT, [this](const Message &msg) {
        messages::FullSnapshotData data;
        try {
          messages::FullSnapshot(msg, &data).execute();
        } catch (const core::SyncError &e) {
          core::logError("[NetworkTransport] Invalid FULL_SNAPSHOT: %s",
              e.what());
          return;
        }
        if (m_listener)
          m_listener->onFullSnapshot(
              data.headSequence, std::move(data.creates));
      });

  m_client.registerHandler(
      MessageType::CHANGE_BATCH, [this](const Message &msg) {
        std::vector<core::ChangeRecord> records;
        try {
          messages::ChangeBatch(msg, &records).execute();
        } catch (const core::SyncError &e) {
          core::logError("[NetworkTransport] Invalid CHANGE_BATCH: %s",
              e.what());
          return;
        }
        if (m_listener)
          m_listener->onChangeBatch(std::move(records));
      });

  m_client.registerHandler(MessageType::ACK, [this](const Message &msg) {
    uint64_t sequence = 0;
    try {
      messages::Ack(msg, &sequence).execute();
    } catch (const core::SyncError &e) {
      core::logError("[NetworkTransport] Invalid ACK: %s", e.what());
      return;
    }
    if (m_listener)
      m_listener->onAck(sequence);
  });
}

} // namespace cosync::client
