// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

// std
#include <cstdint>
#include <deque>
#include <vector>
// cosync_core
#include "cosync/core/ChangeRecord.hpp"
#include "cosync/core/scene/HostScene.hpp"

namespace cosync::client {

enum class ApplyResult
{
  APPLIED,
  DEFERRED, // waiting for a referenced block to exist
  SKIPPED, // nothing to do (e.g. delete of a missing block)
  DISCARDED // invalid for the local graph
};

const char *toString(ApplyResult r);

// Applies change records to a HostScene so that references always resolve
// to existing blocks. Records which cannot be applied yet are parked, keyed
// by the first block they are waiting for, and retried in arrival order
// once that block is created or renamed into place.
struct DependencyScheduler
{
  explicit DependencyScheduler(core::HostScene &scene, uint32_t retryLimit = 8);

  // Application //

  ApplyResult apply(const core::ChangeRecord &record);
  std::vector<ApplyResult> applyBatch(
      const std::vector<core::ChangeRecord> &records); // ends with endPass()

  // Breaks reference cycles among deferred creates, then ages every deferred
  // record and discards those past the retry limit.
  void endPass();

  // Drops all deferred records and aliases
  void clear();

  // Renames //

  // Records addressing 'from' are redirected to {from.type, toName}
  void addAlias(const core::BlockId &from, const std::string &toName);
  core::BlockId resolveAlias(const core::BlockId &id) const;

  // Results //

  // Records as they were actually applied (aliases resolved, duplicate
  // creates turned into updates, placeholders split), oldest first
  std::vector<core::ChangeRecord> takeApplied();
  // Records given up on as UNRESOLVABLE_DEPENDENCY since the last call
  std::vector<core::ChangeRecord> takeDiscarded();

  size_t numberOfDeferred() const;
  bool isWaitingFor(const core::BlockId &id) const;

  void setRetryLimit(uint32_t limit);
  uint32_t retryLimit() const;

 private:
  struct Deferred
  {
    core::ChangeRecord record;
    uint32_t retries{0};
  };

  using DeferredQueue = std::deque<Deferred>;

  ApplyResult applyRecord(const core::ChangeRecord &record, uint32_t retries);
  ApplyResult applyCreate(core::ChangeRecord &r, uint32_t retries);
  ApplyResult applyUpdate(core::ChangeRecord &r, uint32_t retries);
  ApplyResult applyDelete(core::ChangeRecord &r);
  ApplyResult applyRename(core::ChangeRecord &r);

  core::ChangeRecord resolved(const core::ChangeRecord &record) const;
  std::vector<core::BlockId> missingReferences(
      const core::ChangeRecord &r) const;
  void writeFields(const core::BlockId &id, const core::FieldMap &fields);

  void defer(core::ChangeRecord r, const core::BlockId &key, uint32_t retries);
  void markAvailable(const core::BlockId &id);
  void drainAvailable();
  void supersedeDeferred(const core::ChangeRecord &applied);
  bool breakOneCycle();

  core::HostScene *m_scene{nullptr};
  uint32_t m_retryLimit{8};

  core::FlatMap<core::BlockId, DeferredQueue> m_deferred;
  std::deque<core::BlockId> m_available;
  core::FlatMap<core::BlockId, std::string> m_aliases;

  std::vector<core::ChangeRecord> m_applied;
  std::vector<core::ChangeRecord> m_discarded;
};

} // namespace cosync::client
