// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

// std
#include <chrono>
#include <cstdio>
#include <thread>
// cosync_core
#include "cosync/core/Error.hpp"
#include "cosync/core/Logging.hpp"
#include "cosync/core/scene/Scene.hpp"
// cosync_client
#include "cosync/client/NetworkTransport.hpp"
#include "cosync/client/SyncClient.hpp"

using namespace cosync;

static void printScene(const core::Scene &scene)
{
  for (const auto &type : scene.blockTypes()) {
    scene.enumerateBlocks(
        type, [&](const std::string &name, const core::FieldMap &fields) {
          std::printf("%s/%s\n", type.c_str(), name.c_str());
          for (const auto &f : fields) {
            std::printf("    %s = %s\n",
                f.first.c_str(),
                f.second.toString().c_str());
          }
        });
  }
}

static void makeEdits(core::Scene &scene, const std::string &prefix)
{
  const core::BlockId material{"material", prefix + "-paint"};
  const core::BlockId mesh{"mesh", prefix + "-cube"};
  const core::BlockId object{"object", prefix + "-Cube"};

  scene.beginEdit();
  scene.createBlock(material);
  scene.setField(material, "baseColor", core::FloatArray{0.8f, 0.1f, 0.1f});
  scene.createBlock(mesh);
  scene.setField(mesh, "vertexCount", 8);
  scene.setField(
      mesh, "material", core::Value::reference("material", material.name));
  scene.createBlock(object);
  scene.setField(object, "data", core::Value::reference("mesh", mesh.name));
  scene.setField(object, "location", core::FloatArray{0.f, 0.f, 1.f});
  scene.endEdit();
}

int main(int argc, const char *argv[])
{
  core::setLogToStdout();

  client::SyncSettings settings;
  try {
    settings.parseCommandLine(argc, argv);
  } catch (const core::SyncError &e) {
    core::logError("[Client] %s", e.what());
    std::printf("usage: %s [options]\n%s", argv[0], client::syncUsage());
    return 1;
  }

  if (settings.help) {
    std::printf("usage: %s [options]\n%s", argv[0], client::syncUsage());
    return 0;
  }

  core::setLogVerbose(settings.verbose);

  core::Scene scene({"object", "mesh", "material"});
  client::NetworkTransport transport(settings.host, settings.port);
  client::SyncClient sync(scene, transport, settings);

  sync.connect();

  bool edited = false;
  const auto start = std::chrono::steady_clock::now();
  const auto runFor = std::chrono::seconds(5);

  while (std::chrono::steady_clock::now() - start < runFor) {
    sync.poll();

    for (const auto &e : sync.takeEvents()) {
      if (e.type == client::SyncEvent::Type::STATE_CHANGED) {
        core::logStatus("[Client] now %s", client::toString(e.state));
      } else {
        core::logWarning("[Client] %s", e.message.c_str());
      }
    }

    if (!edited && sync.state() == client::SyncState::LIVE) {
      core::logStatus("[Client] Adding a cube...");
      makeEdits(scene, sync.clientId());
      sync.notifyLocalEdit();
      edited = true;
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }

  core::logStatus("[Client] Replicated scene (last sequence %llu):",
      static_cast<unsigned long long>(sync.lastAppliedSequence()));
  printScene(scene);

  sync.disconnect();

  return 0;
}
