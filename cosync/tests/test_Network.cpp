// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

// catch
#include <catch2/catch.hpp>
// cosync
#include "cosync/client/NetworkTransport.hpp"
#include "cosync/client/SyncClient.hpp"
#include "cosync/core/scene/Scene.hpp"
#include "cosync/network/NetworkChannel.hpp"
#include "cosync/network/Protocol.hpp"
#include "cosync/network/messages/Ack.hpp"
#include "cosync/network/messages/ChangeBatch.hpp"
#include "cosync/relay/RelayServer.hpp"
// std
#include <chrono>
#include <functional>
#include <thread>

using namespace cosync;
using namespace std::chrono_literals;

static bool waitFor(const std::function<bool()> &condition,
    std::chrono::milliseconds timeout = 5s)
{
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!condition()) {
    if (std::chrono::steady_clock::now() > deadline)
      return false;
    std::this_thread::sleep_for(5ms);
  }
  return true;
}

SCENARIO("Framed messages cross a TCP connection", "[Network]")
{
  GIVEN("A server on an ephemeral localhost port and a client")
  {
    network::NetworkServer server("127.0.0.1", 0);
    std::atomic<size_t> received{0};

    server.registerHandler(network::MessageType::CHANGE_BATCH,
        [&](network::ConnectionID id, const network::Message &msg) {
          std::vector<core::ChangeRecord> records;
          network::messages::ChangeBatch(msg, &records).execute();
          received = records.size();
          server.send(id,
              network::MessageType::ACK,
              network::messages::Ack(records.size()));
        });
    server.start();
    REQUIRE(server.port() != 0);

    network::NetworkClient client;
    std::atomic<uint64_t> acked{0};
    client.registerHandler(
        network::MessageType::ACK, [&](const network::Message &msg) {
          uint64_t sequence = 0;
          network::messages::Ack(msg, &sequence).execute();
          acked = sequence;
        });

    client.connect("127.0.0.1", server.port());
    REQUIRE(waitFor([&]() { return client.isConnected(); }));

    WHEN("The client sends a change batch")
    {
      std::vector<core::ChangeRecord> batch{
          core::makeCreate({"object", "A"}, {}),
          core::makeCreate({"object", "B"}, {}),
          core::makeDelete({"object", "C"})};
      auto f = client.send(network::MessageType::CHANGE_BATCH,
          network::messages::ChangeBatch(batch));

      THEN("The server decodes it and the reply comes back")
      {
        REQUIRE(f.wait_for(5s) == std::future_status::ready);
        REQUIRE(!f.get());
        REQUIRE(waitFor([&]() { return acked == 3; }));
        REQUIRE(received == 3);
        REQUIRE(server.numberOfConnections() == 1);
      }
    }

    WHEN("The client disconnects")
    {
      client.disconnect();

      THEN("The server drops the connection")
      {
        REQUIRE(!client.isConnected());
        REQUIRE(waitFor([&]() { return server.numberOfConnections() == 0; }));
      }
    }

    client.disconnect();
    server.stop();
  }
}

SCENARIO("Clients synchronize through a relay server", "[Network]")
{
  GIVEN("A relay server running on localhost")
  {
    relay::RelaySettings settings;
    settings.bindAddress = "127.0.0.1";
    settings.port = 0;

    relay::RelayServer server(settings);
    std::thread serverThread([&]() { server.run(); });
    REQUIRE(waitFor([&]() { return server.listeningPort() != 0; }));
    const auto port = server.listeningPort();

    WHEN("Two clients connect and one of them edits")
    {
      client::SyncSettings syncSettings;
      syncSettings.backoffInitial = 10ms;
      syncSettings.backoffMax = 100ms;

      core::Scene sceneA({"object", "mesh"});
      client::NetworkTransport transportA("127.0.0.1", port);
      syncSettings.clientId = "alice";
      client::SyncClient alice(sceneA, transportA, syncSettings);

      core::Scene sceneB({"object", "mesh"});
      client::NetworkTransport transportB("127.0.0.1", port);
      syncSettings.clientId = "bob";
      client::SyncClient bob(sceneB, transportB, syncSettings);

      auto pollBoth = [&]() {
        alice.poll();
        bob.poll();
      };

      alice.connect();
      bob.connect();
      const bool live = waitFor([&]() {
        pollBoth();
        return alice.state() == client::SyncState::LIVE
            && bob.state() == client::SyncState::LIVE;
      });

      sceneA.createBlock({"mesh", "Plane"});
      sceneA.createBlock({"object", "Floor"});
      sceneA.setField(
          {"object", "Floor"}, "data", core::Value::reference("mesh", "Plane"));
      alice.notifyLocalEdit();

      const bool received = waitFor([&]() {
        pollBoth();
        return sceneB.hasBlock({"object", "Floor"});
      });

      THEN("The edit reaches the other client over the network")
      {
        REQUIRE(live);
        REQUIRE(received);
        REQUIRE(*sceneB.getField({"object", "Floor"}, "data")
            == core::Value::reference("mesh", "Plane"));
        REQUIRE(waitFor([&]() {
          pollBoth();
          return alice.numberOfBatchesInFlight() == 0
              && alice.lastAppliedSequence() == 2;
        }));
      }

      alice.disconnect();
      bob.disconnect();
    }

    server.requestShutdown();
    serverThread.join();
  }
}
