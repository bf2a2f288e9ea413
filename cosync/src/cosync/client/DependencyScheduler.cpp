// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#include "cosync/client/DependencyScheduler.hpp"
// cosync_core
#include "cosync/core/Error.hpp"
#include "cosync/core/Logging.hpp"
#include "cosync/core/algorithms/relinkReferences.hpp"
// std
#include <algorithm>
#include <iterator>
#include <set>

namespace cosync::client {

using namespace cosync::core;

const char *toString(ApplyResult r)
{
  switch (r) {
  case ApplyResult::APPLIED:
    return "applied";
  case ApplyResult::DEFERRED:
    return "deferred";
  case ApplyResult::SKIPPED:
    return "skipped";
  case ApplyResult::DISCARDED:
    return "discarded";
  }
  return "unknown";
}

// DependencyScheduler definitions ////////////////////////////////////////////

DependencyScheduler::DependencyScheduler(HostScene &scene, uint32_t retryLimit)
    : m_scene(&scene), m_retryLimit(retryLimit)
{}

ApplyResult DependencyScheduler::apply(const ChangeRecord &record)
{
  const auto result = applyRecord(record, 0);
  drainAvailable();
  return result;
}

std::vector<ApplyResult> DependencyScheduler::applyBatch(
    const std::vector<ChangeRecord> &records)
{
  std::vector<ApplyResult> results;
  results.reserve(records.size());
  for (const auto &r : records)
    results.push_back(apply(r));
  endPass();
  return results;
}

void DependencyScheduler::endPass()
{
  // Blocks may have appeared through other means than this scheduler
  for (const auto &d : m_deferred) {
    if (m_scene->hasBlock(resolveAlias(d.first)))
      m_available.push_back(d.first);
  }
  drainAvailable();

  while (breakOneCycle())
    drainAvailable();

  std::vector<BlockId> emptyKeys;
  for (auto &d : m_deferred) {
    auto &queue = d.second;
    for (auto it = queue.begin(); it != queue.end();) {
      if (++it->retries <= m_retryLimit) {
        ++it;
        continue;
      }
      logWarning("[DependencyScheduler] %s: giving up on %s %s after %u"
                 " passes waiting for '%s'",
          toString(ErrorCode::UNRESOLVABLE_DEPENDENCY),
          core::toString(it->record.operation),
          it->record.blockId().toString().c_str(),
          m_retryLimit,
          d.first.toString().c_str());
      m_discarded.push_back(std::move(it->record));
      it = queue.erase(it);
    }
    if (queue.empty())
      emptyKeys.push_back(d.first);
  }

  for (const auto &k : emptyKeys)
    m_deferred.erase(k);
}

void DependencyScheduler::clear()
{
  m_deferred.clear();
  m_available.clear();
  m_aliases.clear();
  m_applied.clear();
  m_discarded.clear();
}

void DependencyScheduler::addAlias(
    const BlockId &from, const std::string &toName)
{
  if (from.name == toName || toName.empty())
    return;
  m_aliases[from] = toName;
  m_aliases.erase({from.type, toName});
}

BlockId DependencyScheduler::resolveAlias(const BlockId &id) const
{
  BlockId current = id;
  for (size_t i = 0; i <= m_aliases.size(); i++) {
    if (m_scene->hasBlock(current))
      break;
    const auto *next = m_aliases.at(current);
    if (!next)
      break;
    current.name = *next;
  }
  return current;
}

std::vector<ChangeRecord> DependencyScheduler::takeApplied()
{
  std::vector<ChangeRecord> applied;
  applied.swap(m_applied);
  return applied;
}

std::vector<ChangeRecord> DependencyScheduler::takeDiscarded()
{
  std::vector<ChangeRecord> discarded;
  discarded.swap(m_discarded);
  return discarded;
}

size_t DependencyScheduler::numberOfDeferred() const
{
  size_t count = 0;
  for (const auto &d : m_deferred)
    count += d.second.size();
  return count;
}

bool DependencyScheduler::isWaitingFor(const BlockId &id) const
{
  return m_deferred.contains(id);
}

void DependencyScheduler::setRetryLimit(uint32_t limit)
{
  m_retryLimit = limit;
}

uint32_t DependencyScheduler::retryLimit() const
{
  return m_retryLimit;
}

// Record application /////////////////////////////////////////////////////////

ApplyResult DependencyScheduler::applyRecord(
    const ChangeRecord &record, uint32_t retries)
{
  if (record.blockType.empty() || record.blockName.empty()) {
    logWarning("[DependencyScheduler] discarding record without identity");
    return ApplyResult::DISCARDED;
  }

  auto r = resolved(record);

  switch (r.operation) {
  case Operation::CREATE:
    return applyCreate(r, retries);
  case Operation::UPDATE_FIELD:
    return applyUpdate(r, retries);
  case Operation::DELETE:
    return applyDelete(r);
  case Operation::RENAME:
    return applyRename(r);
  }

  return ApplyResult::DISCARDED;
}

ApplyResult DependencyScheduler::applyCreate(ChangeRecord &r, uint32_t retries)
{
  const auto id = r.blockId();

  if (auto missing = missingReferences(r); !missing.empty()) {
    defer(std::move(r), missing.front(), retries);
    return ApplyResult::DEFERRED;
  }

  if (m_scene->hasBlock(id)) {
    logWarning("[DependencyScheduler] %s: '%s' already exists,"
               " applying create as an update",
        toString(ErrorCode::DUPLICATE_CREATE),
        id.toString().c_str());
    r.operation = Operation::UPDATE_FIELD;
    writeFields(id, r.payload);
    supersedeDeferred(r);
    m_applied.push_back(std::move(r));
    return ApplyResult::APPLIED;
  }

  if (!m_scene->createBlock(id)) {
    logError("[DependencyScheduler] host refused to create '%s'",
        id.toString().c_str());
    return ApplyResult::DISCARDED;
  }

  m_aliases.erase(id);
  writeFields(id, r.payload);
  m_applied.push_back(std::move(r));
  markAvailable(id);
  return ApplyResult::APPLIED;
}

ApplyResult DependencyScheduler::applyUpdate(ChangeRecord &r, uint32_t retries)
{
  const auto id = r.blockId();

  if (!m_scene->hasBlock(id)) {
    defer(std::move(r), id, retries);
    return ApplyResult::DEFERRED;
  }

  if (auto missing = missingReferences(r); !missing.empty()) {
    defer(std::move(r), missing.front(), retries);
    return ApplyResult::DEFERRED;
  }

  if (r.payload.empty())
    return ApplyResult::SKIPPED;

  writeFields(id, r.payload);
  supersedeDeferred(r);
  m_applied.push_back(std::move(r));
  return ApplyResult::APPLIED;
}

ApplyResult DependencyScheduler::applyDelete(ChangeRecord &r)
{
  const auto id = r.blockId();

  if (!m_scene->hasBlock(id)) {
    logDebug("[DependencyScheduler] delete of missing '%s' skipped",
        id.toString().c_str());
    return ApplyResult::SKIPPED;
  }

  if (!m_scene->deleteBlock(id)) {
    logError("[DependencyScheduler] host refused to delete '%s'",
        id.toString().c_str());
    return ApplyResult::DISCARDED;
  }

  const auto nulled = relinkReferences(*m_scene, id, {});
  if (nulled > 0) {
    logDebug("[DependencyScheduler] nulled %zu references to '%s'",
        nulled,
        id.toString().c_str());
  }

  r.payload.clear();
  supersedeDeferred(r);
  m_applied.push_back(std::move(r));
  return ApplyResult::APPLIED;
}

ApplyResult DependencyScheduler::applyRename(ChangeRecord &r)
{
  const auto id = r.blockId();
  const auto target = r.renamedId();

  if (!m_scene->hasBlock(id)) {
    logDebug("[DependencyScheduler] rename of missing '%s' skipped",
        id.toString().c_str());
    return ApplyResult::SKIPPED;
  }

  if (r.newName.empty() || m_scene->hasBlock(target)) {
    logWarning("[DependencyScheduler] cannot rename '%s' to '%s'",
        id.toString().c_str(),
        r.newName.c_str());
    return ApplyResult::SKIPPED;
  }

  if (!m_scene->renameBlock(id, r.newName)) {
    logError("[DependencyScheduler] host refused to rename '%s'",
        id.toString().c_str());
    return ApplyResult::DISCARDED;
  }

  relinkReferences(*m_scene, id, r.newName);
  addAlias(id, r.newName);
  r.payload.clear();
  m_applied.push_back(std::move(r));
  markAvailable(target);
  return ApplyResult::APPLIED;
}

// Helper functions ///////////////////////////////////////////////////////////

ChangeRecord DependencyScheduler::resolved(const ChangeRecord &record) const
{
  ChangeRecord r = record;

  if (r.operation != Operation::CREATE)
    r.blockName = resolveAlias(r.blockId()).name;

  for (auto &f : r.payload) {
    if (!f.second.holdsReference())
      continue;
    const auto &ref = f.second.getReference();
    const auto target = resolveAlias({ref.type, ref.name});
    if (target.name != ref.name)
      f.second = Value::reference(target.type, target.name);
  }

  return r;
}

std::vector<BlockId> DependencyScheduler::missingReferences(
    const ChangeRecord &r) const
{
  const auto self = r.blockId();
  std::vector<BlockId> missing;
  for (const auto &ref : r.referencedBlocks()) {
    if (ref != self && !m_scene->hasBlock(ref))
      missing.push_back(ref);
  }
  return missing;
}

void DependencyScheduler::writeFields(
    const BlockId &id, const FieldMap &fields)
{
  for (const auto &f : fields) {
    if (!m_scene->updateBlock(id, f.first, f.second)) {
      logError("[DependencyScheduler] host refused field '%s' on '%s'",
          f.first.c_str(),
          id.toString().c_str());
    }
  }
}

void DependencyScheduler::defer(
    ChangeRecord r, const BlockId &key, uint32_t retries)
{
  logDebug("[DependencyScheduler] deferring %s %s until '%s' exists",
      core::toString(r.operation),
      r.blockId().toString().c_str(),
      key.toString().c_str());
  m_deferred[key].push_back({std::move(r), retries});
}

void DependencyScheduler::markAvailable(const BlockId &id)
{
  if (m_deferred.contains(id))
    m_available.push_back(id);
}

void DependencyScheduler::drainAvailable()
{
  while (!m_available.empty()) {
    const auto key = m_available.front();
    m_available.pop_front();

    auto *queue = m_deferred.at(key);
    if (!queue)
      continue;

    DeferredQueue entries = std::move(*queue);
    m_deferred.erase(key);

    for (auto &e : entries)
      applyRecord(e.record, e.retries);
  }
}

// Drops what a newer applied record made obsolete in older deferred updates
void DependencyScheduler::supersedeDeferred(const ChangeRecord &applied)
{
  if (applied.sequence == 0)
    return;

  const auto id = applied.blockId();
  std::vector<BlockId> emptyKeys;

  for (auto &d : m_deferred) {
    auto &queue = d.second;
    for (auto it = queue.begin(); it != queue.end();) {
      auto &rec = it->record;
      bool drop = false;
      if (rec.operation == Operation::UPDATE_FIELD && rec.sequence != 0
          && rec.sequence < applied.sequence && rec.blockId() == id) {
        if (applied.operation == Operation::DELETE) {
          drop = true;
        } else {
          for (const auto &f : applied.payload)
            rec.payload.erase(f.first);
          drop = rec.payload.empty();
        }
      }
      it = drop ? queue.erase(it) : std::next(it);
    }
    if (queue.empty())
      emptyKeys.push_back(d.first);
  }

  for (const auto &k : emptyKeys)
    m_deferred.erase(k);
}

// Creates one deferred block whose missing references are all pending
// creates themselves, writing the unresolved references as null and
// deferring an update which restores them.
bool DependencyScheduler::breakOneCycle()
{
  struct Candidate
  {
    BlockId id;
    BlockId key;
    size_t index;
  };

  std::set<BlockId> pendingCreates;
  std::vector<Candidate> candidates;
  for (const auto &d : m_deferred) {
    for (size_t i = 0; i < d.second.size(); i++) {
      const auto &rec = d.second[i].record;
      if (rec.operation != Operation::CREATE)
        continue;
      pendingCreates.insert(rec.blockId());
      candidates.push_back({rec.blockId(), d.first, i});
    }
  }

  std::sort(candidates.begin(),
      candidates.end(),
      [](const Candidate &a, const Candidate &b) { return a.id < b.id; });

  for (const auto &c : candidates) {
    auto &queue = *m_deferred.at(c.key);
    auto missing = missingReferences(resolved(queue[c.index].record));
    const bool onlyPendingCreates = !missing.empty()
        && std::all_of(missing.begin(), missing.end(), [&](const BlockId &m) {
             return pendingCreates.count(m) > 0;
           });
    if (!onlyPendingCreates)
      continue;

    Deferred entry = std::move(queue[c.index]);
    queue.erase(queue.begin() + c.index);
    if (queue.empty())
      m_deferred.erase(c.key);

    auto placeholder = resolved(entry.record);
    FieldMap heldBack;
    for (auto &f : placeholder.payload) {
      if (!f.second.holdsReference())
        continue;
      const auto ref = f.second.getReference();
      if (ref.type == c.id.type && ref.name == c.id.name)
        continue;
      if (m_scene->hasBlock({ref.type, ref.name}))
        continue;
      heldBack[f.first] = f.second;
      f.second = Value::nullReference(ref.type);
    }

    logDebug("[DependencyScheduler] breaking reference cycle at '%s'",
        c.id.toString().c_str());

    auto restore = makeUpdate(c.id, std::move(heldBack));
    restore.sequence = placeholder.sequence;
    restore.originClientId = placeholder.originClientId;

    applyCreate(placeholder, entry.retries);
    applyUpdate(restore, entry.retries);
    return true;
  }

  return false;
}

} // namespace cosync::client
