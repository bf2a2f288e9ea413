// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "cosync/core/scene/HostScene.hpp"
#include "cosync/core/snapshot/Snapshot.hpp"

namespace cosync::core {

struct SnapshotEncoder
{
  SnapshotEncoder() = default;
  explicit SnapshotEncoder(std::vector<std::string> replicatedTypes);

  // An empty list replicates every type the host reports
  void setReplicatedTypes(std::vector<std::string> types);
  const std::vector<std::string> &replicatedTypes() const;
  bool isReplicated(const std::string &type) const;
  std::vector<std::string> typesToCapture(const HostScene &scene) const;

  // Throws SyncError{SNAPSHOT_INCONSISTENT} if the host is mid-edit or is
  // modified while the walk runs.
  Snapshot capture(const HostScene &scene) const;

 private:
  std::vector<std::string> m_types;
};

} // namespace cosync::core
