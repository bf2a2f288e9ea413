// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#include "cosync/core/snapshot/SnapshotEncoder.hpp"
#include "cosync/core/Error.hpp"
#include "cosync/core/Logging.hpp"
// std
#include <algorithm>

namespace cosync::core {

SnapshotEncoder::SnapshotEncoder(std::vector<std::string> replicatedTypes)
{
  setReplicatedTypes(std::move(replicatedTypes));
}

void SnapshotEncoder::setReplicatedTypes(std::vector<std::string> types)
{
  std::sort(types.begin(), types.end());
  types.erase(std::unique(types.begin(), types.end()), types.end());
  m_types = std::move(types);
}

const std::vector<std::string> &SnapshotEncoder::replicatedTypes() const
{
  return m_types;
}

bool SnapshotEncoder::isReplicated(const std::string &type) const
{
  return m_types.empty()
      || std::binary_search(m_types.begin(), m_types.end(), type);
}

std::vector<std::string> SnapshotEncoder::typesToCapture(
    const HostScene &scene) const
{
  if (!m_types.empty())
    return m_types;
  auto types = scene.blockTypes();
  std::sort(types.begin(), types.end());
  return types;
}

Snapshot SnapshotEncoder::capture(const HostScene &scene) const
{
  if (!scene.isStable()) {
    throw SyncError(ErrorCode::SNAPSHOT_INCONSISTENT,
        "host scene is in the middle of an edit");
  }

  const auto versionBefore = scene.editVersion();

  Snapshot snapshot;
  for (const auto &type : typesToCapture(scene)) {
    scene.enumerateBlocks(
        type, [&](const std::string &name, const FieldMap &fields) {
          snapshot.setBlock({type, name}, fields);
        });
  }

  if (scene.editVersion() != versionBefore || !scene.isStable()) {
    throw SyncError(ErrorCode::SNAPSHOT_INCONSISTENT,
        "host scene changed while capturing a snapshot");
  }

  logDebug("[SnapshotEncoder] captured %zu blocks", snapshot.size());

  return snapshot;
}

} // namespace cosync::core
