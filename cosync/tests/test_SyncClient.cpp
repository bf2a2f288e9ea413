// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

// catch
#include <catch2/catch.hpp>
// cosync
#include "LoopbackRelay.hpp"
#include "cosync/client/SyncClient.hpp"
#include "cosync/core/algorithms/relinkReferences.hpp"
#include "cosync/core/scene/Scene.hpp"
// std
#include <algorithm>
#include <thread>

using namespace cosync::core;
using namespace cosync::client;
using cosync::testing::LoopbackRelay;
using cosync::testing::LoopbackTransport;

namespace {

SyncSettings settingsFor(const std::string &clientId, SyncSettings s)
{
  s.clientId = clientId;
  return s;
}

SyncSettings immediateRetry()
{
  SyncSettings s;
  s.backoffInitial = std::chrono::milliseconds(0);
  s.backoffMax = std::chrono::milliseconds(0);
  return s;
}

// One editor session: a host scene, its link to the relay and its client
struct Peer
{
  Peer(LoopbackRelay &hub,
      const std::string &clientId,
      SyncSettings settings = immediateRetry())
      : scene({"object", "mesh", "material"}),
        transport(hub.makeTransport()),
        client(scene, *transport, settingsFor(clientId, settings))
  {}

  Scene scene;
  std::unique_ptr<LoopbackTransport> transport;
  SyncClient client;
};

void pump(std::initializer_list<Peer *> peers, int rounds = 8)
{
  for (int i = 0; i < rounds; i++) {
    for (auto *p : peers)
      p->client.poll();
  }
}

void buildCube(Scene &scene)
{
  scene.beginEdit();
  scene.createBlock({"material", "Steel"});
  scene.setField({"material", "Steel"}, "roughness", 0.25);
  scene.createBlock({"mesh", "CubeMesh"});
  scene.setField({"mesh", "CubeMesh"}, "vertices", Blob{0, 1, 2, 3});
  scene.setField(
      {"mesh", "CubeMesh"}, "material", Value::reference("material", "Steel"));
  scene.createBlock({"object", "Cube"});
  scene.setField(
      {"object", "Cube"}, "data", Value::reference("mesh", "CubeMesh"));
  scene.setField({"object", "Cube"}, "location", FloatArray{0.f, 0.f, 1.f});
  scene.endEdit();
}

Snapshot capture(const Scene &scene)
{
  return SnapshotEncoder().capture(scene);
}

std::vector<SyncState> stateChanges(const std::vector<SyncEvent> &events)
{
  std::vector<SyncState> states;
  for (const auto &e : events) {
    if (e.type == SyncEvent::Type::STATE_CHANGED)
      states.push_back(e.state);
  }
  return states;
}

bool hasEvent(const std::vector<SyncEvent> &events, SyncEvent::Type type)
{
  return std::any_of(events.begin(), events.end(), [&](const SyncEvent &e) {
    return e.type == type;
  });
}

} // namespace

SCENARIO("Clients converge through the relay", "[SyncClient]")
{
  GIVEN("Two connected clients")
  {
    LoopbackRelay hub;
    Peer alice(hub, "alice");
    Peer bob(hub, "bob");

    alice.client.connect();
    bob.client.connect();
    pump({&alice, &bob});

    THEN("Both are live after connecting and syncing")
    {
      REQUIRE(alice.client.state() == SyncState::LIVE);
      REQUIRE(bob.client.state() == SyncState::LIVE);
      REQUIRE(stateChanges(alice.client.takeEvents())
          == std::vector<SyncState>{SyncState::CONNECTING,
              SyncState::SYNCING,
              SyncState::LIVE});
      REQUIRE(hub.relay().numberOfLiveSessions() == 2);
    }

    WHEN("Alice builds an object with its mesh and material")
    {
      buildCube(alice.scene);
      const auto aliceVersion = alice.scene.editVersion();
      alice.client.notifyLocalEdit();
      pump({&alice, &bob});

      THEN("Bob receives every block with references intact")
      {
        REQUIRE(bob.scene.numberOfBlocks() == 3);
        REQUIRE(*bob.scene.getField({"object", "Cube"}, "data")
            == Value::reference("mesh", "CubeMesh"));
        REQUIRE(capture(bob.scene) == capture(alice.scene));
      }

      THEN("The relay stamped one record per block")
      {
        REQUIRE(hub.relay().headSequence() == 3);
        REQUIRE(alice.client.lastAppliedSequence() == 3);
        REQUIRE(bob.client.lastAppliedSequence() == 3);
        REQUIRE(alice.client.numberOfBatchesInFlight() == 0);
      }

      THEN("Alice's own changes are not applied back to her scene")
      {
        REQUIRE(alice.scene.editVersion() == aliceVersion);
        REQUIRE(alice.client.acknowledgedSnapshot() == capture(alice.scene));
      }

      AND_WHEN("A record stamped with Alice's own id reaches her")
      {
        const auto before = capture(alice.scene);
        auto echo = makeUpdate(
            {"object", "Cube"}, {{"location", FloatArray{9.f, 9.f, 9.f}}});
        echo.sequence = 4;
        echo.originClientId = "alice";
        alice.transport->listener()->onChangeBatch({echo});
        alice.client.poll();

        THEN("It is counted as seen but never applied")
        {
          REQUIRE(alice.client.lastAppliedSequence() == 4);
          REQUIRE(alice.scene.editVersion() == aliceVersion);
          REQUIRE(capture(alice.scene) == before);
          REQUIRE(alice.client.numberOfBatchesInFlight() == 0);
        }
      }

      AND_WHEN("Bob edits and deletes blocks in turn")
      {
        bob.scene.setField({"object", "Cube"}, "location", FloatArray{5.f});
        bob.client.notifyLocalEdit();
        pump({&alice, &bob});
        const auto afterUpdate = alice.client.lastAppliedSequence();

        bob.scene.deleteBlock({"material", "Steel"});
        relinkReferences(bob.scene, {"material", "Steel"}, {});
        bob.client.notifyLocalEdit();
        pump({&alice, &bob});

        THEN("Alice follows with strictly increasing sequences")
        {
          REQUIRE(afterUpdate == 4);
          REQUIRE(alice.client.lastAppliedSequence() > afterUpdate);
          REQUIRE(alice.scene.getField({"object", "Cube"}, "location")
                      ->getFloatArray()
              == FloatArray{5.f});
          REQUIRE(!alice.scene.hasBlock({"material", "Steel"}));
          REQUIRE(!alice.scene.getField({"mesh", "CubeMesh"}, "material")
                       ->holdsReference());
          REQUIRE(capture(bob.scene) == capture(alice.scene));
        }
      }
    }
  }
}

SCENARIO("Concurrent edits resolve to the later stamped change", "[SyncClient]")
{
  GIVEN("Two clients sharing a cube over slow links")
  {
    LoopbackRelay hub;
    Peer alice(hub, "alice");
    Peer bob(hub, "bob");

    alice.client.connect();
    bob.client.connect();
    pump({&alice, &bob});

    alice.scene.createBlock({"object", "Cube"});
    alice.scene.setField({"object", "Cube"}, "scale", 1.0);
    alice.client.notifyLocalEdit();
    pump({&alice, &bob});
    REQUIRE(bob.scene.hasBlock({"object", "Cube"}));

    alice.transport->hold();
    bob.transport->hold();

    WHEN("Both rename the cube before hearing from each other")
    {
      alice.scene.renameBlock({"object", "Cube"}, "AliceCube");
      alice.client.notifyLocalEdit();
      alice.client.poll();
      bob.scene.renameBlock({"object", "Cube"}, "BobCube");
      bob.client.notifyLocalEdit();
      bob.client.poll();

      alice.transport->release();
      bob.transport->release();
      pump({&alice, &bob});

      THEN("Everyone ends up with the name stamped last")
      {
        REQUIRE(alice.scene.hasBlock({"object", "BobCube"}));
        REQUIRE(bob.scene.hasBlock({"object", "BobCube"}));
        REQUIRE(alice.scene.numberOfBlocks() == 1);
        REQUIRE(bob.scene.numberOfBlocks() == 1);
        REQUIRE(hub.relay().state().contains({"object", "BobCube"}));
      }

      THEN("The renames do not bounce between the clients")
      {
        pump({&alice, &bob});
        REQUIRE(hub.relay().headSequence() == 3);
      }
    }

    WHEN("Both change the same field before hearing from each other")
    {
      alice.scene.setField({"object", "Cube"}, "scale", 2.0);
      alice.client.notifyLocalEdit();
      alice.client.poll();
      bob.scene.setField({"object", "Cube"}, "scale", 3.0);
      bob.client.notifyLocalEdit();
      bob.client.poll();

      alice.transport->release();
      bob.transport->release();
      pump({&alice, &bob});

      THEN("The later value wins everywhere")
      {
        REQUIRE(alice.scene.getField({"object", "Cube"}, "scale")->getFloat()
            == 3.0);
        REQUIRE(bob.scene.getField({"object", "Cube"}, "scale")->getFloat()
            == 3.0);
        REQUIRE(hub.relay()
                    .state()
                    .find({"object", "Cube"})
                    ->at("scale")
                    ->getFloat()
            == 3.0);
      }
    }

    WHEN("They change different fields of the same block")
    {
      alice.scene.setField({"object", "Cube"}, "hide", true);
      alice.client.notifyLocalEdit();
      alice.client.poll();
      bob.scene.setField({"object", "Cube"}, "label", "shared");
      bob.client.notifyLocalEdit();
      bob.client.poll();

      alice.transport->release();
      bob.transport->release();
      pump({&alice, &bob});

      THEN("Both changes survive")
      {
        REQUIRE(capture(alice.scene) == capture(bob.scene));
        REQUIRE(alice.scene.getField({"object", "Cube"}, "hide") != nullptr);
        REQUIRE(alice.scene.getField({"object", "Cube"}, "label") != nullptr);
      }
    }

    WHEN("One deletes the cube while the other edits it")
    {
      alice.scene.deleteBlock({"object", "Cube"});
      alice.client.notifyLocalEdit();
      alice.client.poll();
      bob.scene.setField({"object", "Cube"}, "scale", 4.0);
      bob.client.notifyLocalEdit();
      bob.client.poll();

      alice.transport->release();
      bob.transport->release();
      pump({&alice, &bob});

      THEN("The cube is gone everywhere")
      {
        REQUIRE(!alice.scene.hasBlock({"object", "Cube"}));
        REQUIRE(!bob.scene.hasBlock({"object", "Cube"}));
        REQUIRE(!hub.relay().state().contains({"object", "Cube"}));
      }
    }
  }
}

SCENARIO("Joining clients adopt the relay state", "[SyncClient]")
{
  GIVEN("A relay with no state and a client with a local scene")
  {
    LoopbackRelay hub;
    Peer alice(hub, "alice");
    buildCube(alice.scene);

    alice.client.connect();
    pump({&alice});

    THEN("The local scene is uploaded")
    {
      REQUIRE(hub.relay().state().size() == 3);
      REQUIRE(hub.relay().headSequence() == 3);
    }

    WHEN("A second client with diverging content joins")
    {
      Peer bob(hub, "bob");
      bob.scene.createBlock({"object", "Stale"});
      bob.scene.createBlock({"object", "Cube"});
      bob.scene.setField({"object", "Cube"}, "onlyOnBob", true);

      bob.client.connect();
      pump({&alice, &bob});

      THEN("Its scene is replaced by the relay state")
      {
        REQUIRE(!bob.scene.hasBlock({"object", "Stale"}));
        REQUIRE(bob.scene.getField({"object", "Cube"}, "onlyOnBob") == nullptr);
        REQUIRE(capture(bob.scene) == capture(alice.scene));
      }

      THEN("Nothing is sent back to the relay")
      {
        REQUIRE(hub.relay().headSequence() == 3);
        REQUIRE(bob.client.lastAppliedSequence() == 3);
      }

      THEN("Delivering the same records again changes nothing")
      {
        const auto version = bob.scene.editVersion();
        bob.transport->listener()->onChangeBatch(
            hub.relay().log().recordsAfter(0));
        bob.client.poll();
        REQUIRE(bob.scene.editVersion() == version);
        REQUIRE(bob.client.numberOfDeferred() == 0);
      }
    }
  }

  GIVEN("A client replicating a subset of types")
  {
    LoopbackRelay hub;
    Peer alice(hub, "alice");
    alice.scene.createBlock({"object", "Lamp"});
    alice.scene.createBlock({"mesh", "Plane"});
    alice.scene.createBlock({"material", "Paint"});
    alice.client.connect();
    pump({&alice});

    auto settings = immediateRetry();
    settings.types = {"object"};
    Peer bob(hub, "bob", settings);
    bob.client.connect();
    pump({&alice, &bob});

    THEN("Only blocks of those types are applied")
    {
      REQUIRE(bob.scene.numberOfBlocks("object") == 1);
      REQUIRE(bob.scene.numberOfBlocks("mesh") == 0);
      REQUIRE(bob.scene.numberOfBlocks("material") == 0);
    }
  }

  GIVEN("A subset client joining blocks that reference other types")
  {
    LoopbackRelay hub;
    Peer alice(hub, "alice");
    buildCube(alice.scene);
    alice.client.connect();
    pump({&alice});
    REQUIRE(hub.relay().headSequence() == 3);

    auto settings = immediateRetry();
    settings.types = {"object", "mesh"};
    Peer bob(hub, "bob", settings);
    bob.client.connect();
    pump({&alice, &bob});

    WHEN("The subset client looks for local edits")
    {
      bob.client.notifyLocalEdit();
      pump({&alice, &bob});

      THEN("Blocks it could not apply are held, not deleted on the relay")
      {
        REQUIRE(bob.client.state() == SyncState::LIVE);
        REQUIRE(bob.client.numberOfDeferred() == 2);
        REQUIRE(!bob.scene.hasBlock({"mesh", "CubeMesh"}));
        REQUIRE(hub.relay().headSequence() == 3);
        REQUIRE(hub.relay().state().contains({"mesh", "CubeMesh"}));
        REQUIRE(hub.relay().state().contains({"object", "Cube"}));
        REQUIRE(alice.scene.hasBlock({"mesh", "CubeMesh"}));
      }
    }
  }
}

SCENARIO("Clients reconnect after losing the relay", "[SyncClient]")
{
  GIVEN("A client whose relay is unreachable")
  {
    LoopbackRelay hub;
    hub.setOnline(false);

    SyncSettings settings;
    settings.backoffInitial = std::chrono::milliseconds(10);
    settings.backoffMax = std::chrono::milliseconds(40);
    Peer alice(hub, "alice", settings);

    alice.client.connect();
    alice.client.poll();

    THEN("Retries back off exponentially up to the maximum")
    {
      REQUIRE(alice.client.state() == SyncState::DISCONNECTED);
      REQUIRE(alice.client.currentBackoff().count() == 10);
      REQUIRE(hasEvent(
          alice.client.takeEvents(), SyncEvent::Type::CONNECTION_LOST));

      for (int expected : {20, 40, 40}) {
        std::this_thread::sleep_for(std::chrono::milliseconds(60));
        alice.client.poll(); // attempt
        alice.client.poll(); // refusal
        REQUIRE(alice.client.currentBackoff().count() == expected);
      }

      hub.setOnline(true);
      std::this_thread::sleep_for(std::chrono::milliseconds(60));
      pump({&alice});
      REQUIRE(alice.client.state() == SyncState::LIVE);
      REQUIRE(alice.client.currentBackoff().count() == 0);
    }

    THEN("Disconnecting stops the retries")
    {
      alice.client.disconnect();
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
      hub.setOnline(true);
      pump({&alice});
      REQUIRE(alice.client.state() == SyncState::DISCONNECTED);
      REQUIRE(hub.relay().numberOfSessions() == 0);
    }
  }

  GIVEN("Two live clients asking to resume on reconnect")
  {
    LoopbackRelay hub;
    auto settings = immediateRetry();
    settings.resume = true;
    Peer alice(hub, "alice", settings);
    Peer bob(hub, "bob", settings);

    alice.client.connect();
    bob.client.connect();
    pump({&alice, &bob});

    alice.scene.createBlock({"object", "First"});
    alice.client.notifyLocalEdit();
    pump({&alice, &bob});
    REQUIRE(bob.client.lastAppliedSequence() == 1);

    WHEN("Bob loses his connection while both keep editing")
    {
      hub.setOnline(false);
      bob.transport->drop();
      bob.client.poll();
      REQUIRE(bob.client.state() != SyncState::LIVE);

      alice.scene.createBlock({"object", "WhileAway"});
      alice.client.notifyLocalEdit();
      pump({&alice});

      bob.scene.createBlock({"object", "Offline"});
      bob.scene.setField({"object", "First"}, "note", "edited offline");
      bob.client.notifyLocalEdit();
      pump({&bob});

      hub.setOnline(true);
      pump({&alice, &bob});

      THEN("He resumes without a full snapshot")
      {
        REQUIRE(bob.client.state() == SyncState::LIVE);
        REQUIRE(hub.numberOfFullSnapshots() == 2);
      }

      THEN("He catches up on what he missed")
      {
        REQUIRE(bob.scene.hasBlock({"object", "WhileAway"}));
        REQUIRE(bob.client.lastAppliedSequence()
            == hub.relay().headSequence());
      }

      THEN("His offline edits reach the others")
      {
        REQUIRE(alice.scene.hasBlock({"object", "Offline"}));
        REQUIRE(alice.scene.getField({"object", "First"}, "note") != nullptr);
        REQUIRE(capture(alice.scene) == capture(bob.scene));
      }
    }
  }
}

SCENARIO("Clients report problems as events", "[SyncClient]")
{
  GIVEN("A live client which gives up on missing blocks immediately")
  {
    LoopbackRelay hub;
    auto settings = immediateRetry();
    settings.retryLimit = 0;
    Peer alice(hub, "alice", settings);
    alice.client.connect();
    pump({&alice});
    alice.client.takeEvents();

    WHEN("A record arrives which references a block that never existed")
    {
      auto record = makeCreate({"object", "Orphan"},
          {{"data", Value::reference("mesh", "Nowhere")}});
      record.sequence = 1;
      record.originClientId = "ghost";
      alice.transport->listener()->onChangeBatch({record});
      alice.client.poll();

      THEN("It is dropped and reported")
      {
        REQUIRE(!alice.scene.hasBlock({"object", "Orphan"}));
        REQUIRE(alice.client.numberOfDeferred() == 0);
        REQUIRE(hasEvent(alice.client.takeEvents(),
            SyncEvent::Type::UNRESOLVED_DEPENDENCY));
      }
    }

    WHEN("The relay reports an error")
    {
      alice.transport->listener()->onRelayError("bad request");
      alice.client.poll();

      THEN("The message is passed on")
      {
        const auto events = alice.client.takeEvents();
        REQUIRE(events.size() == 1);
        REQUIRE(events[0].type == SyncEvent::Type::RELAY_ERROR);
        REQUIRE(events[0].message == "bad request");
      }
    }
  }
}
