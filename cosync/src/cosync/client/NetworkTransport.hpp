// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

// std
#include <string>
// cosync_network
#include "cosync/network/NetworkChannel.hpp"
// cosync_client
#include "cosync/client/ClientTransport.hpp"

namespace cosync::client {

// ClientTransport over a TCP connection to a cosyncRelay
struct NetworkTransport : public ClientTransport
{
  NetworkTransport(std::string host, uint16_t port);
  ~NetworkTransport() override;

  void connect() override;
  void close() override;

  bool sendHello(const std::string &clientId, uint64_t resumeFrom) override;
  bool sendChangeBatch(const std::vector<core::ChangeRecord> &records) override;
  bool sendAck(uint64_t sequence) override;

  bool isConnected() const;

 private:
  void setup_Messaging();

  std::string m_host;
  uint16_t m_port{0};
  network::NetworkClient m_client;
};

} // namespace cosync::client
