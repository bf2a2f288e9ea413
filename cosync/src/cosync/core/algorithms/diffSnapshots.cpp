// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#include "cosync/core/algorithms/diffSnapshots.hpp"
// std
#include <set>
#include <tuple>

namespace cosync::core {

// Helper functions ///////////////////////////////////////////////////////////

static bool nameThenTypeLess(const BlockId &a, const BlockId &b)
{
  return std::tie(a.name, a.type) < std::tie(b.name, b.type);
}

static FieldMap changedFields(
    const SnapshotEntry &oldEntry, const SnapshotEntry &newEntry)
{
  FieldMap changed;

  for (const auto &f : newEntry.fields) {
    const auto *oldBytes = oldEntry.encoded.at(f.first);
    const auto *newBytes = newEntry.encoded.at(f.first);
    if (!oldBytes || !newBytes || *oldBytes != *newBytes)
      changed[f.first] = f.second;
  }

  for (const auto &f : oldEntry.fields) {
    if (!newEntry.fields.contains(f.first))
      changed[f.first] = Value{};
  }

  return changed;
}

// Orders creates so in-batch references point backwards where possible
static std::vector<ChangeRecord> sortCreates(std::vector<ChangeRecord> creates)
{
  const size_t n = creates.size();

  std::vector<BlockId> ids(n);
  FlatMap<BlockId, size_t> index;
  index.reserve(n);
  for (size_t i = 0; i < n; i++) {
    ids[i] = creates[i].blockId();
    index[ids[i]] = i;
  }

  std::vector<std::vector<size_t>> dependents(n);
  std::vector<size_t> pending(n, 0);
  for (size_t i = 0; i < n; i++) {
    for (const auto &ref : creates[i].referencedBlocks()) {
      const auto *j = index.at(ref);
      if (!j || *j == i)
        continue;
      dependents[*j].push_back(i);
      pending[i]++;
    }
  }

  auto cmp = [&](size_t a, size_t b) {
    return nameThenTypeLess(ids[a], ids[b]);
  };
  std::set<size_t, decltype(cmp)> ready(cmp);
  std::set<size_t, decltype(cmp)> waiting(cmp);
  for (size_t i = 0; i < n; i++) {
    if (pending[i] == 0)
      ready.insert(i);
    else
      waiting.insert(i);
  }

  std::vector<ChangeRecord> sorted;
  sorted.reserve(n);

  while (sorted.size() < n) {
    size_t next = 0;
    if (!ready.empty()) {
      next = *ready.begin();
      ready.erase(ready.begin());
    } else {
      // Only cycles remain: break one at the lexicographically first block
      next = *waiting.begin();
      waiting.erase(waiting.begin());
    }

    for (size_t d : dependents[next]) {
      if (pending[d] > 0 && --pending[d] == 0 && waiting.erase(d) > 0)
        ready.insert(d);
    }

    sorted.push_back(std::move(creates[next]));
  }

  return sorted;
}

///////////////////////////////////////////////////////////////////////////////
// diffSnapshots() ////////////////////////////////////////////////////////////
///////////////////////////////////////////////////////////////////////////////

std::vector<ChangeRecord> diffSnapshots(const Snapshot &oldSnapshot,
    const Snapshot &newSnapshot,
    const std::string &originClientId)
{
  std::vector<BlockId> removed;
  std::vector<BlockId> added;
  std::vector<ChangeRecord> updates;

  for (const auto &o : oldSnapshot) {
    const auto *n = newSnapshot.find(o.first);
    if (!n)
      removed.push_back(o.first);
    else if (*n != o.second)
      updates.push_back(makeUpdate(o.first, changedFields(o.second, *n)));
  }

  for (const auto &n : newSnapshot) {
    if (!oldSnapshot.contains(n.first))
      added.push_back(n.first);
  }

  // Pair byte-identical delete/create candidates into renames //

  std::vector<ChangeRecord> renames;
  std::vector<ChangeRecord> deletes;
  std::vector<bool> addedTaken(added.size(), false);

  for (const auto &r : removed) {
    const auto &oldEntry = *oldSnapshot.find(r);
    bool matched = false;
    for (size_t i = 0; i < added.size() && !matched; i++) {
      if (addedTaken[i] || added[i].type != r.type)
        continue;
      if (newSnapshot.find(added[i])->encoded == oldEntry.encoded) {
        addedTaken[i] = true;
        renames.push_back(makeRename(r, added[i].name));
        matched = true;
      }
    }
    if (!matched)
      deletes.push_back(makeDelete(r));
  }

  std::vector<ChangeRecord> creates;
  for (size_t i = 0; i < added.size(); i++) {
    if (addedTaken[i])
      continue;
    const auto &fields = newSnapshot.find(added[i])->fields;
    creates.push_back(makeCreate(added[i], fields));
  }
  creates = sortCreates(std::move(creates));

  // Assemble //

  std::vector<ChangeRecord> records;
  records.reserve(
      renames.size() + creates.size() + updates.size() + deletes.size());

  auto append = [&](std::vector<ChangeRecord> &from) {
    for (auto &r : from) {
      r.originClientId = originClientId;
      records.push_back(std::move(r));
    }
  };

  append(renames);
  append(creates);
  append(updates);
  append(deletes);

  return records;
}

} // namespace cosync::core
