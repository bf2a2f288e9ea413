// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

// std
#include <cstdint>
#include <string>
#include <vector>
// cosync_core
#include "cosync/core/ChangeRecord.hpp"

namespace cosync::relay {

// Compacted per-block view of the change log: the net effect of every stamped
// record, from which a FullSnapshot for a joining client is built. Only block
// identity, operation and field names are interpreted.
struct RelayState
{
  RelayState() = default;

  // Folds 'record' in. Returns false if it had no effect on the state (update
  // or delete of a missing block, rename onto an existing name, ...).
  bool apply(const core::ChangeRecord &record);
  void clear();

  // One CREATE per block, in the order the blocks were first created
  std::vector<core::ChangeRecord> asCreates() const;

  const core::FieldMap *find(const core::BlockId &id) const;
  bool contains(const core::BlockId &id) const;
  size_t size() const;
  bool empty() const;

  // Follows renames for ids which no longer exist
  core::BlockId resolveAlias(const core::BlockId &id) const;

 private:
  struct Block
  {
    core::FieldMap fields;
    uint64_t createdAt{0};
  };

  core::FieldMap resolvedFields(const core::FieldMap &payload) const;
  void merge(Block &b, const core::FieldMap &payload);
  void relink(const core::BlockId &from, const std::string &toName);

  core::FlatMap<core::BlockId, Block> m_blocks;
  core::FlatMap<core::BlockId, std::string> m_aliases;
  uint64_t m_nextCreation{0};
};

} // namespace cosync::relay
