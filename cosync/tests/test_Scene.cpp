// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

// catch
#include <catch2/catch.hpp>
// cosync
#include "cosync/core/algorithms/relinkReferences.hpp"
#include "cosync/core/scene/Scene.hpp"

using namespace cosync::core;

SCENARIO("cosync::core::Scene interface", "[Scene]")
{
  GIVEN("A scene with registered types")
  {
    Scene scene({"object", "mesh"});

    THEN("The scene reports its types and no blocks")
    {
      REQUIRE(scene.blockTypes().size() == 2);
      REQUIRE(scene.numberOfBlocks() == 0);
      REQUIRE(scene.isStable());
    }

    WHEN("A block is created")
    {
      const BlockId cube{"object", "Cube"};
      const auto versionBefore = scene.editVersion();
      REQUIRE(scene.createBlock(cube));

      THEN("The block exists with no fields")
      {
        REQUIRE(scene.hasBlock(cube));
        REQUIRE(scene.findBlock(cube)->empty());
        REQUIRE(scene.numberOfBlocks("object") == 1);
        REQUIRE(scene.editVersion() > versionBefore);
      }

      THEN("Creating it again fails")
      {
        REQUIRE(!scene.createBlock(cube));
      }

      THEN("A block of another type may share its name")
      {
        REQUIRE(scene.createBlock({"mesh", "Cube"}));
        REQUIRE(scene.numberOfBlocks() == 2);
      }

      THEN("Fields can be set and removed")
      {
        REQUIRE(scene.setField(cube, "visible", true));
        REQUIRE(scene.getField(cube, "visible") != nullptr);
        REQUIRE(scene.getField(cube, "visible")->getBool());
        REQUIRE(scene.updateBlock(cube, "visible", Value()));
        REQUIRE(scene.getField(cube, "visible") == nullptr);
      }

      THEN("Renaming moves the fields to the new name")
      {
        scene.setField(cube, "scale", 2.0);
        REQUIRE(scene.renameBlock(cube, "Box"));
        REQUIRE(!scene.hasBlock(cube));
        REQUIRE(scene.getField({"object", "Box"}, "scale")->getFloat() == 2.0);
      }

      THEN("Renaming onto an existing name fails")
      {
        scene.createBlock({"object", "Box"});
        REQUIRE(!scene.renameBlock(cube, "Box"));
        REQUIRE(scene.hasBlock(cube));
      }

      THEN("Deleting removes the block")
      {
        REQUIRE(scene.deleteBlock(cube));
        REQUIRE(!scene.hasBlock(cube));
        REQUIRE(!scene.deleteBlock(cube));
      }
    }

    WHEN("Operating on a missing block")
    {
      const BlockId ghost{"object", "Ghost"};

      THEN("Every mutation reports failure")
      {
        REQUIRE(!scene.updateBlock(ghost, "x", 1));
        REQUIRE(!scene.deleteBlock(ghost));
        REQUIRE(!scene.renameBlock(ghost, "Other"));
        REQUIRE(!scene.findBlock(ghost).has_value());
      }
    }

    WHEN("An edit batch is open")
    {
      scene.beginEdit();

      THEN("The scene is not stable until the batch ends")
      {
        REQUIRE(!scene.isStable());
        scene.endEdit();
        REQUIRE(scene.isStable());
      }
    }
  }
}

SCENARIO("References are relinked after a rename or delete", "[Scene]")
{
  GIVEN("Two objects pointing at the same mesh")
  {
    Scene scene({"object", "mesh"});
    const BlockId mesh{"mesh", "CubeMesh"};
    scene.createBlock(mesh);
    scene.createBlock({"object", "A"});
    scene.createBlock({"object", "B"});
    const auto cubeMesh = Value::reference("mesh", "CubeMesh");
    scene.setField({"object", "A"}, "data", cubeMesh);
    scene.setField({"object", "B"}, "data", cubeMesh);
    scene.setField({"object", "B"}, "name", "CubeMesh");

    WHEN("The mesh is renamed and references relinked")
    {
      scene.renameBlock(mesh, "BoxMesh");
      const auto n = relinkReferences(scene, mesh, "BoxMesh");

      THEN("Both references point at the new name")
      {
        REQUIRE(n == 2);
        REQUIRE(*scene.getField({"object", "A"}, "data")
            == Value::reference("mesh", "BoxMesh"));
        REQUIRE(*scene.getField({"object", "B"}, "data")
            == Value::reference("mesh", "BoxMesh"));
      }

      THEN("Plain strings equal to the old name are left alone")
      {
        REQUIRE(scene.getField({"object", "B"}, "name")->getString()
            == "CubeMesh");
      }
    }

    WHEN("The mesh is deleted and references nulled")
    {
      scene.deleteBlock(mesh);
      relinkReferences(scene, mesh, {});

      THEN("The references are null but keep their type")
      {
        const auto *v = scene.getField({"object", "A"}, "data");
        REQUIRE(v != nullptr);
        REQUIRE(v->type() == ValueType::REFERENCE);
        REQUIRE(!v->holdsReference());
        REQUIRE(v->getReference().type == "mesh");
      }
    }
  }
}
