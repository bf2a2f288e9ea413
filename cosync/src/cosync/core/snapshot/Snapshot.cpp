// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#include "cosync/core/snapshot/Snapshot.hpp"
#include "cosync/core/Codec.hpp"
#include "cosync/core/Error.hpp"
#include "cosync/core/Logging.hpp"

namespace cosync::core {

bool operator==(const SnapshotEntry &a, const SnapshotEntry &b)
{
  return a.encoded == b.encoded;
}

bool operator!=(const SnapshotEntry &a, const SnapshotEntry &b)
{
  return !(a == b);
}

// Snapshot definitions ///////////////////////////////////////////////////////

void Snapshot::setBlock(const BlockId &id, const FieldMap &fields)
{
  SnapshotEntry entry;
  entry.fields.reserve(fields.size());
  entry.encoded.reserve(fields.size());

  for (const auto &f : fields) {
    if (!f.second.valid())
      continue;
    try {
      entry.encoded[f.first] = encodeValue(f.second);
      entry.fields[f.first] = f.second;
    } catch (const SyncError &e) {
      logWarning("[Snapshot] skipping field '%s' of '%s': %s",
          f.first.c_str(),
          id.toString().c_str(),
          e.what());
    }
  }

  m_entries[id] = std::move(entry);
}

bool Snapshot::removeBlock(const BlockId &id)
{
  return m_entries.erase(id);
}

Snapshot Snapshot::patched(const ChangeRecord &record) const
{
  Snapshot s = *this;
  s.apply(record);
  return s;
}

Snapshot Snapshot::patched(const std::vector<ChangeRecord> &records) const
{
  Snapshot s = *this;
  for (const auto &r : records)
    s.apply(r);
  return s;
}

const SnapshotEntry *Snapshot::find(const BlockId &id) const
{
  return m_entries.at(id);
}

bool Snapshot::contains(const BlockId &id) const
{
  return m_entries.contains(id);
}

size_t Snapshot::size() const
{
  return m_entries.size();
}

bool Snapshot::empty() const
{
  return m_entries.empty();
}

Snapshot::EntryMap::const_iterator Snapshot::begin() const
{
  return m_entries.begin();
}

Snapshot::EntryMap::const_iterator Snapshot::end() const
{
  return m_entries.end();
}

void Snapshot::apply(const ChangeRecord &record)
{
  const auto id = record.blockId();

  switch (record.operation) {
  case Operation::CREATE:
    setBlock(id, record.payload);
    break;
  case Operation::UPDATE_FIELD: {
    const auto *e = find(id);
    if (!e)
      break;
    FieldMap fields = e->fields;
    for (const auto &f : record.payload) {
      if (f.second.valid())
        fields[f.first] = f.second;
      else
        fields.erase(f.first);
    }
    setBlock(id, fields);
    break;
  }
  case Operation::DELETE:
    if (removeBlock(id))
      relink(id, {});
    break;
  case Operation::RENAME: {
    const auto *e = find(id);
    const auto target = record.renamedId();
    if (!e || contains(target))
      break;
    SnapshotEntry moved = *e;
    m_entries.erase(id);
    m_entries[target] = std::move(moved);
    relink(id, record.newName);
    break;
  }
  }
}

void Snapshot::relink(const BlockId &from, const std::string &toName)
{
  for (auto &e : m_entries) {
    for (auto &f : e.second.fields) {
      if (!f.second.holdsReference())
        continue;
      const auto &r = f.second.getReference();
      if (r.type != from.type || r.name != from.name)
        continue;
      f.second = Value::reference(from.type, toName);
      e.second.encoded[f.first] = encodeValue(f.second);
    }
  }
}

bool operator==(const Snapshot &a, const Snapshot &b)
{
  if (a.size() != b.size())
    return false;
  auto ia = a.begin();
  auto ib = b.begin();
  for (; ia != a.end(); ++ia, ++ib) {
    if (ia->first != ib->first || ia->second != ib->second)
      return false;
  }
  return true;
}

bool operator!=(const Snapshot &a, const Snapshot &b)
{
  return !(a == b);
}

} // namespace cosync::core
