// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "cosync/core/ChangeRecord.hpp"
#include "cosync/core/DataStream.hpp"

namespace cosync::core {

using EncodedFieldMap = FlatMap<std::string, ByteBuffer>;

struct SnapshotEntry
{
  FieldMap fields;
  EncodedFieldMap encoded; // canonical bytes of each field, same keys
};

bool operator==(const SnapshotEntry &a, const SnapshotEntry &b);
bool operator!=(const SnapshotEntry &a, const SnapshotEntry &b);

// State of every replicated data-block at one point in time. Snapshots are
// built once (by SnapshotEncoder or by patching another snapshot) and are
// compared on the encoded bytes only.
struct Snapshot
{
  using EntryMap = FlatMap<BlockId, SnapshotEntry>;

  Snapshot() = default;

  // Construction //

  // Encodes 'fields'; fields without an encoding are logged and left out.
  void setBlock(const BlockId &id, const FieldMap &fields);
  bool removeBlock(const BlockId &id);

  // Returns a copy with 'record' applied the way the dependency scheduler
  // applies it to a host: renames and deletes also relink references.
  Snapshot patched(const ChangeRecord &record) const;
  Snapshot patched(const std::vector<ChangeRecord> &records) const;

  // Access //

  const SnapshotEntry *find(const BlockId &id) const;
  bool contains(const BlockId &id) const;
  size_t size() const;
  bool empty() const;

  EntryMap::const_iterator begin() const;
  EntryMap::const_iterator end() const;

 private:
  void apply(const ChangeRecord &record);
  void relink(const BlockId &from, const std::string &toName);

  EntryMap m_entries;
};

bool operator==(const Snapshot &a, const Snapshot &b);
bool operator!=(const Snapshot &a, const Snapshot &b);

} // namespace cosync::core
