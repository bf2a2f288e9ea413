// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "cosync/core/DataBlock.hpp"
// std
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace cosync::core {

using BlockVisitor =
    std::function<void(const std::string &name, const FieldMap &fields)>;

// The editor side of synchronization: a graph of typed, named data-blocks
// which the synchronizer reads from (snapshots) and writes into (remote
// changes). Mutations are primitive: renaming or deleting a block never
// touches references held by other blocks, see relinkReferences().
struct HostScene
{
  virtual ~HostScene() = default;

  // Read access //

  virtual std::vector<std::string> blockTypes() const = 0;
  virtual void enumerateBlocks(
      const std::string &type, const BlockVisitor &visitor) const = 0;
  virtual std::optional<FieldMap> findBlock(const BlockId &id) const = 0;
  virtual bool hasBlock(const BlockId &id) const;

  // Mutation, all return false if the precondition does not hold //

  virtual bool createBlock(const BlockId &id) = 0; // must not exist yet
  virtual bool updateBlock(const BlockId &id,
      const std::string &field,
      const Value &value) = 0; // a NONE value removes the field
  virtual bool deleteBlock(const BlockId &id) = 0;
  virtual bool renameBlock(const BlockId &id, const std::string &newName) = 0;

  // Consistency //

  // False while the host is in the middle of an edit batch
  virtual bool isStable() const = 0;
  // Bumped on every mutation, lets readers detect edits racing a walk
  virtual uint64_t editVersion() const = 0;
};

// Inlined definitions ////////////////////////////////////////////////////////

inline bool HostScene::hasBlock(const BlockId &id) const
{
  return findBlock(id).has_value();
}

} // namespace cosync::core
