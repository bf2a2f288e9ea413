// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

// catch
#include <catch2/catch.hpp>
// cosync
#include "FileSizeLimit.hpp"
#include "cosync/relay/Relay.hpp"
// std
#include <filesystem>

using namespace cosync::core;
using namespace cosync::relay;

namespace {

struct Sent
{
  enum class Kind
  {
    FULL_SNAPSHOT,
    CHANGE_BATCH,
    ACK,
    ERROR
  };

  Kind kind;
  SessionID session{0};
  uint64_t sequence{0};
  std::vector<ChangeRecord> records;
  std::string message;
};

struct RecordingSink : public RelaySink
{
  void sendFullSnapshot(SessionID session,
      uint64_t headSequence,
      const std::vector<ChangeRecord> &creates) override
  {
    sent.push_back({Sent::Kind::FULL_SNAPSHOT, session, headSequence, creates});
  }

  void sendChangeBatch(
      SessionID session, const std::vector<ChangeRecord> &records) override
  {
    sent.push_back({Sent::Kind::CHANGE_BATCH, session, 0, records});
  }

  void sendAck(SessionID session, uint64_t sequence) override
  {
    sent.push_back({Sent::Kind::ACK, session, sequence});
  }

  void sendError(SessionID session, const std::string &message) override
  {
    sent.push_back({Sent::Kind::ERROR, session, 0, {}, message});
  }

  std::vector<Sent> to(SessionID session) const
  {
    std::vector<Sent> result;
    for (const auto &s : sent) {
      if (s.session == session)
        result.push_back(s);
    }
    return result;
  }

  std::vector<Sent> sent;
};

} // namespace

SCENARIO("cosync::relay::RelayState compacts stamped records", "[RelayState]")
{
  GIVEN("An empty state")
  {
    RelayState state;

    WHEN("Blocks are created, updated and referenced")
    {
      state.apply(makeCreate({"mesh", "M"}, {{"vertices", Blob{1}}}));
      state.apply(makeCreate(
          {"object", "Cube"}, {{"data", Value::reference("mesh", "M")}}));
      state.apply(makeUpdate({"object", "Cube"}, {{"scale", 2.0}}));

      THEN("The creates reproduce the blocks in creation order")
      {
        const auto creates = state.asCreates();
        REQUIRE(creates.size() == 2);
        REQUIRE(creates[0].blockId() == BlockId{"mesh", "M"});
        REQUIRE(creates[1].blockId() == BlockId{"object", "Cube"});
        REQUIRE(creates[1].payload.size() == 2);
      }

      THEN("A NONE value removes a field")
      {
        state.apply(makeUpdate({"object", "Cube"}, {{"scale", Value()}}));
        REQUIRE(!state.find({"object", "Cube"})->contains("scale"));
      }

      THEN("Renaming keeps the creation order and relinks references")
      {
        REQUIRE(state.apply(makeRename({"mesh", "M"}, "N")));
        const auto creates = state.asCreates();
        REQUIRE(creates[0].blockId() == BlockId{"mesh", "N"});
        REQUIRE(*state.find({"object", "Cube"})->at("data")
            == Value::reference("mesh", "N"));
      }

      THEN("Records using a stale name follow the rename")
      {
        state.apply(makeRename({"mesh", "M"}, "N"));
        REQUIRE(state.apply(makeUpdate({"mesh", "M"}, {{"smooth", true}})));
        REQUIRE(state.find({"mesh", "N"})->contains("smooth"));
        state.apply(makeCreate(
            {"object", "Cone"}, {{"data", Value::reference("mesh", "M")}}));
        REQUIRE(*state.find({"object", "Cone"})->at("data")
            == Value::reference("mesh", "N"));
      }

      THEN("Deleting a block nulls references to it")
      {
        REQUIRE(state.apply(makeDelete({"mesh", "M"})));
        REQUIRE(state.size() == 1);
        REQUIRE(!state.find({"object", "Cube"})->at("data")->holdsReference());
      }
    }

    THEN("Updating or deleting a missing block has no effect")
    {
      REQUIRE(!state.apply(makeUpdate({"object", "Ghost"}, {{"x", 1}})));
      REQUIRE(!state.apply(makeDelete({"object", "Ghost"})));
      REQUIRE(state.empty());
    }
  }
}

SCENARIO("cosync::relay::Relay sequences and fans out changes", "[Relay]")
{
  GIVEN("A relay with two live clients")
  {
    RecordingSink sink;
    Relay relay(sink);

    relay.onConnect(1);
    relay.onConnect(2);
    relay.onHello(1, "alice", 0);
    relay.onHello(2, "bob", 0);

    THEN("Each client is sent an empty full snapshot")
    {
      REQUIRE(relay.numberOfLiveSessions() == 2);
      REQUIRE(sink.sent.size() == 2);
      REQUIRE(sink.sent[0].kind == Sent::Kind::FULL_SNAPSHOT);
      REQUIRE(sink.sent[0].sequence == 0);
      REQUIRE(sink.sent[0].records.empty());
    }

    WHEN("Alice sends a batch")
    {
      sink.sent.clear();
      auto create = makeCreate({"object", "Cube"}, {{"scale", 1.0}});
      create.originClientId = "mallory";
      create.sequence = 99;
      relay.onChangeBatch(
          1, {create, makeUpdate({"object", "Cube"}, {{"scale", 2.0}})});

      THEN("Records are stamped with consecutive sequences and her id")
      {
        REQUIRE(relay.headSequence() == 2);
        const auto toBob = sink.to(2);
        REQUIRE(toBob.size() == 1);
        REQUIRE(toBob[0].kind == Sent::Kind::CHANGE_BATCH);
        REQUIRE(toBob[0].records.size() == 2);
        REQUIRE(toBob[0].records[0].sequence == 1);
        REQUIRE(toBob[0].records[1].sequence == 2);
        REQUIRE(toBob[0].records[0].originClientId == "alice");
      }

      THEN("Alice gets an ack for the last record and no echo")
      {
        const auto toAlice = sink.to(1);
        REQUIRE(toAlice.size() == 1);
        REQUIRE(toAlice[0].kind == Sent::Kind::ACK);
        REQUIRE(toAlice[0].sequence == 2);
      }

      THEN("The state holds the net effect")
      {
        REQUIRE(relay.state().size() == 1);
        REQUIRE(relay.state().find({"object", "Cube"})->at("scale")->getFloat()
            == 2.0);
      }

      AND_WHEN("A third client joins")
      {
        relay.onConnect(3);
        relay.onHello(3, "carol", 0);

        THEN("It receives the compacted state at the head sequence")
        {
          const auto toCarol = sink.to(3);
          REQUIRE(toCarol.size() == 1);
          REQUIRE(toCarol[0].kind == Sent::Kind::FULL_SNAPSHOT);
          REQUIRE(toCarol[0].sequence == 2);
          REQUIRE(toCarol[0].records.size() == 1);
          REQUIRE(toCarol[0].records[0].operation == Operation::CREATE);
        }
      }
    }

    WHEN("A batch holds only invalid records")
    {
      sink.sent.clear();
      ChangeRecord nameless;
      nameless.blockType = "object";
      relay.onChangeBatch(2, {nameless, makeRename({"object", "A"}, "")});

      THEN("Nothing is stamped but the sender is still acknowledged")
      {
        REQUIRE(relay.headSequence() == 0);
        REQUIRE(sink.sent.size() == 1);
        REQUIRE(sink.sent[0].kind == Sent::Kind::ACK);
        REQUIRE(sink.sent[0].session == 2);
      }
    }

    WHEN("Bob acknowledges and disconnects")
    {
      relay.onChangeBatch(1, {makeCreate({"object", "Cube"}, {})});
      relay.onAck(2, 1);
      relay.onDisconnect(2);

      THEN("His progress is remembered")
      {
        REQUIRE(relay.numberOfSessions() == 1);
        REQUIRE(relay.lastAcknowledged("bob") == std::optional<uint64_t>(1));
        REQUIRE(!relay.lastAcknowledged("nobody").has_value());
      }

      AND_WHEN("He reconnects asking to resume after more changes")
      {
        relay.onChangeBatch(1, {makeCreate({"object", "Cone"}, {})});
        sink.sent.clear();
        relay.onConnect(4);
        relay.onHello(4, "bob", 1);

        THEN("He is sent only the records he missed")
        {
          REQUIRE(sink.sent.size() == 1);
          REQUIRE(sink.sent[0].kind == Sent::Kind::CHANGE_BATCH);
          REQUIRE(sink.sent[0].records.size() == 1);
          REQUIRE(sink.sent[0].records[0].sequence == 2);
        }
      }

      AND_WHEN("He claims progress beyond what he acknowledged")
      {
        relay.onChangeBatch(1, {makeCreate({"object", "Cone"}, {})});
        relay.onChangeBatch(1, {makeCreate({"object", "Ball"}, {})});
        sink.sent.clear();
        relay.onConnect(4);
        relay.onHello(4, "bob", 3);

        THEN("Resumption starts at the acknowledged sequence")
        {
          REQUIRE(sink.sent.size() == 1);
          REQUIRE(sink.sent[0].kind == Sent::Kind::CHANGE_BATCH);
          REQUIRE(sink.sent[0].records.size() == 2);
        }
      }
    }

    WHEN("Acks beyond the head are received")
    {
      relay.onAck(1, 1000);

      THEN("They are clamped to the head")
      {
        REQUIRE(relay.lastAcknowledged("alice") == std::optional<uint64_t>(0));
      }
    }
  }

  GIVEN("A relay and a session which has not said hello")
  {
    RecordingSink sink;
    Relay relay(sink);
    relay.onConnect(7);

    WHEN("It sends a batch")
    {
      relay.onChangeBatch(7, {makeCreate({"object", "Cube"}, {})});

      THEN("It gets an error and nothing is stamped")
      {
        REQUIRE(relay.headSequence() == 0);
        REQUIRE(sink.sent.size() == 1);
        REQUIRE(sink.sent[0].kind == Sent::Kind::ERROR);
      }
    }

    WHEN("It says hello without a client id")
    {
      relay.onHello(7, "", 0);

      THEN("It gets an error and stays pending")
      {
        REQUIRE(sink.sent.size() == 1);
        REQUIRE(sink.sent[0].kind == Sent::Kind::ERROR);
        REQUIRE(relay.numberOfLiveSessions() == 0);
      }
    }

    WHEN("It asks to resume from a sequence the relay never reached")
    {
      relay.onHello(7, "dave", 5);

      THEN("It is sent a full snapshot instead")
      {
        REQUIRE(sink.sent.size() == 1);
        REQUIRE(sink.sent[0].kind == Sent::Kind::FULL_SNAPSHOT);
      }
    }
  }

  GIVEN("A relay whose retained history is shorter than a client's absence")
  {
    RecordingSink sink;
    Relay relay(sink, 2);
    relay.onConnect(1);
    relay.onHello(1, "alice", 0);
    for (int i = 0; i < 5; i++) {
      relay.onChangeBatch(
          1, {makeCreate({"object", "Block" + std::to_string(i)}, {})});
    }
    sink.sent.clear();

    WHEN("A client resumes from an evicted sequence")
    {
      relay.onConnect(2);
      relay.onHello(2, "bob", 1);

      THEN("It is sent a full snapshot")
      {
        REQUIRE(sink.sent.size() == 1);
        REQUIRE(sink.sent[0].kind == Sent::Kind::FULL_SNAPSHOT);
        REQUIRE(sink.sent[0].sequence == 5);
        REQUIRE(sink.sent[0].records.size() == 5);
      }
    }
  }

  GIVEN("A relay retaining no history")
  {
    RecordingSink sink;
    Relay relay(sink, 0);
    relay.onConnect(1);
    relay.onHello(1, "alice", 0);
    relay.onChangeBatch(1,
        {makeCreate({"object", "A"}, {}), makeCreate({"object", "B"}, {})});
    sink.sent.clear();

    WHEN("A client resumes exactly at the head")
    {
      relay.onConnect(2);
      relay.onHello(2, "bob", 2);

      THEN("It is sent an empty change batch, there is nothing it missed")
      {
        REQUIRE(sink.sent.size() == 1);
        REQUIRE(sink.sent[0].kind == Sent::Kind::CHANGE_BATCH);
        REQUIRE(sink.sent[0].records.empty());
      }
    }

    WHEN("A client resumes from any earlier sequence")
    {
      relay.onConnect(2);
      relay.onHello(2, "bob", 1);

      THEN("It is sent a full snapshot")
      {
        REQUIRE(sink.sent.size() == 1);
        REQUIRE(sink.sent[0].kind == Sent::Kind::FULL_SNAPSHOT);
        REQUIRE(sink.sent[0].sequence == 2);
      }
    }
  }
}

SCENARIO("cosync::relay::Relay survives a restart", "[Relay]")
{
  GIVEN("A relay which stamped 42 records to its log")
  {
    const auto path = (std::filesystem::temp_directory_path()
        / "cosync_relay_restart.log")
                          .string();
    std::filesystem::remove(path);

    {
      RecordingSink sink;
      Relay relay(sink);
      relay.open(path);
      relay.onConnect(1);
      relay.onHello(1, "alice", 0);
      for (int i = 0; i < 42; i++) {
        relay.onChangeBatch(
            1, {makeCreate({"object", "Block" + std::to_string(i)}, {})});
      }
      REQUIRE(relay.headSequence() == 42);
    }

    WHEN("A new relay opens the same log")
    {
      RecordingSink sink;
      Relay relay(sink);
      relay.open(path);

      THEN("The state is restored and the next record is stamped 43")
      {
        REQUIRE(relay.state().size() == 42);
        relay.onConnect(1);
        relay.onHello(1, "bob", 0);
        relay.onChangeBatch(1, {makeCreate({"object", "Next"}, {})});
        REQUIRE(relay.headSequence() == 43);
        REQUIRE(sink.to(1).back().sequence == 43);
      }
    }

    std::filesystem::remove(path);
  }

  GIVEN("A relay whose log file stops growing")
  {
    const auto path = (std::filesystem::temp_directory_path()
        / "cosync_relay_full.log")
                          .string();
    std::filesystem::remove(path);

    RecordingSink sink;
    Relay relay(sink);
    relay.open(path);
    relay.onConnect(1);
    relay.onConnect(2);
    relay.onHello(1, "alice", 0);
    relay.onHello(2, "bob", 0);
    sink.sent.clear();

    {
      cosync::testing::FileSizeLimit limit(
          std::filesystem::file_size(path) + 6);
      REQUIRE(limit.active());
      relay.onChangeBatch(1,
          {makeCreate({"object", std::string(64, 'a')}, {}),
              makeCreate({"object", std::string(64, 'b')}, {})});
    }

    THEN("Nothing is stamped or fanned out, and the sender is told")
    {
      REQUIRE(relay.headSequence() == 0);
      REQUIRE(relay.state().size() == 0);
      REQUIRE(sink.to(2).empty());
      const auto toAlice = sink.to(1);
      REQUIRE(toAlice.size() == 2);
      REQUIRE(toAlice[0].kind == Sent::Kind::ERROR);
      REQUIRE(toAlice[1].kind == Sent::Kind::ACK);
      REQUIRE(toAlice[1].sequence == 0);
    }

    WHEN("The log can grow again and the relay restarts")
    {
      relay.onChangeBatch(1, {makeCreate({"object", "Kept"}, {})});

      RecordingSink restartedSink;
      Relay restarted(restartedSink);
      restarted.open(path);

      THEN("Sequence numbers continue after the last broadcast one")
      {
        REQUIRE(relay.headSequence() == 1);
        REQUIRE(sink.to(2).back().records[0].sequence == 1);
        REQUIRE(restarted.headSequence() == 1);
        REQUIRE(restarted.state().contains({"object", "Kept"}));
      }
    }

    std::filesystem::remove(path);
  }
}
