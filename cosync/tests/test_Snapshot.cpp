// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

// catch
#include <catch2/catch.hpp>
// cosync
#include "cosync/core/Error.hpp"
#include "cosync/core/scene/Scene.hpp"
#include "cosync/core/snapshot/SnapshotEncoder.hpp"

using namespace cosync::core;

// Host whose graph changes while it is being walked
struct RacingScene : public Scene
{
  RacingScene() : Scene({"object"}) {}

  void enumerateBlocks(
      const std::string &type, const BlockVisitor &visitor) const override
  {
    Scene::enumerateBlocks(type, visitor);
    const_cast<RacingScene *>(this)->createBlock(
        {"object", "Spawned" + std::to_string(m_spawned++)});
  }

  mutable int m_spawned{0};
};

SCENARIO("Snapshots capture the replicated state of a host", "[Snapshot]")
{
  GIVEN("A scene with an object and a light")
  {
    Scene scene({"object", "light"});
    scene.createBlock({"object", "Cube"});
    scene.setField({"object", "Cube"}, "location", FloatArray{0.f, 1.f, 2.f});
    scene.createBlock({"light", "Sun"});

    WHEN("Every type is replicated")
    {
      SnapshotEncoder encoder;
      const auto snapshot = encoder.capture(scene);

      THEN("Every block is captured with its encoded fields")
      {
        REQUIRE(snapshot.size() == 2);
        const auto *e = snapshot.find({"object", "Cube"});
        REQUIRE(e != nullptr);
        REQUIRE(e->fields.size() == 1);
        REQUIRE(e->encoded.contains("location"));
      }

      THEN("Capturing twice gives equal snapshots")
      {
        REQUIRE(encoder.capture(scene) == snapshot);
      }

      THEN("A field change makes the snapshots differ")
      {
        scene.setField({"object", "Cube"}, "location", FloatArray{0.f});
        REQUIRE(encoder.capture(scene) != snapshot);
      }
    }

    WHEN("Only objects are replicated")
    {
      SnapshotEncoder encoder({"object"});
      const auto snapshot = encoder.capture(scene);

      THEN("Other types are left out")
      {
        REQUIRE(snapshot.size() == 1);
        REQUIRE(!snapshot.contains({"light", "Sun"}));
        REQUIRE(!encoder.isReplicated("light"));
      }
    }

    WHEN("A block holds a value without an encoding")
    {
      scene.setField(
          {"object", "Cube"}, "modifiers", Unsupported{"bpy_collection"});
      const auto snapshot = SnapshotEncoder().capture(scene);

      THEN("That field is skipped and the rest is kept")
      {
        const auto *e = snapshot.find({"object", "Cube"});
        REQUIRE(e != nullptr);
        REQUIRE(!e->fields.contains("modifiers"));
        REQUIRE(e->fields.contains("location"));
      }
    }

    WHEN("The host is in the middle of an edit")
    {
      scene.beginEdit();

      THEN("Capture throws SNAPSHOT_INCONSISTENT")
      {
        try {
          SnapshotEncoder().capture(scene);
          FAIL("expected SyncError");
        } catch (const SyncError &e) {
          REQUIRE(e.code() == ErrorCode::SNAPSHOT_INCONSISTENT);
        }
      }
    }
  }

  GIVEN("A host modified while the snapshot is taken")
  {
    RacingScene scene;

    THEN("Capture throws SNAPSHOT_INCONSISTENT")
    {
      REQUIRE_THROWS_AS(SnapshotEncoder().capture(scene), SyncError);
    }
  }
}

SCENARIO("Snapshots can be patched with change records", "[Snapshot]")
{
  GIVEN("A snapshot with an object referencing a mesh")
  {
    Snapshot s;
    s.setBlock({"mesh", "CubeMesh"}, {{"vertices", Blob{1, 2}}});
    s.setBlock({"object", "Cube"},
        {{"data", Value::reference("mesh", "CubeMesh")}, {"scale", 1.0}});

    WHEN("The mesh is renamed")
    {
      const auto p = s.patched(makeRename({"mesh", "CubeMesh"}, "BoxMesh"));

      THEN("The block moves and the reference follows")
      {
        REQUIRE(!p.contains({"mesh", "CubeMesh"}));
        REQUIRE(p.contains({"mesh", "BoxMesh"}));
        REQUIRE(*p.find({"object", "Cube"})->fields.at("data")
            == Value::reference("mesh", "BoxMesh"));
      }

      THEN("The original is untouched")
      {
        REQUIRE(s.contains({"mesh", "CubeMesh"}));
      }
    }

    WHEN("The mesh is deleted")
    {
      const auto p = s.patched(makeDelete({"mesh", "CubeMesh"}));

      THEN("The reference becomes null")
      {
        const auto *v = p.find({"object", "Cube"})->fields.at("data");
        REQUIRE(v != nullptr);
        REQUIRE(!v->holdsReference());
      }
    }

    WHEN("An update removes one field and sets another")
    {
      const auto p = s.patched(
          makeUpdate({"object", "Cube"}, {{"scale", Value()}, {"hide", true}}));

      THEN("Only the named fields change")
      {
        const auto &fields = p.find({"object", "Cube"})->fields;
        REQUIRE(!fields.contains("scale"));
        REQUIRE(fields.contains("hide"));
        REQUIRE(fields.contains("data"));
      }
    }
  }
}
