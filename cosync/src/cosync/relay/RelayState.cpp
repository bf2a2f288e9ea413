// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#include "cosync/relay/RelayState.hpp"
// cosync_core
#include "cosync/core/Logging.hpp"
// std
#include <algorithm>

namespace cosync::relay {

using namespace cosync::core;

bool RelayState::apply(const ChangeRecord &record)
{
  switch (record.operation) {
  case Operation::CREATE: {
    const auto id = record.blockId();
    m_aliases.erase(id);
    auto *b = m_blocks.at(id);
    if (!b) {
      b = &m_blocks[id];
      b->createdAt = m_nextCreation++;
    }
    merge(*b, resolvedFields(record.payload));
    return true;
  }
  case Operation::UPDATE_FIELD: {
    const auto id = resolveAlias(record.blockId());
    auto *b = m_blocks.at(id);
    if (!b) {
      logDebug("[RelayState] ignoring update of missing block '%s'",
          id.toString().c_str());
      return false;
    }
    merge(*b, resolvedFields(record.payload));
    return true;
  }
  case Operation::DELETE: {
    const auto id = resolveAlias(record.blockId());
    if (!m_blocks.erase(id))
      return false;
    relink(id, {});
    return true;
  }
  case Operation::RENAME: {
    const auto id = resolveAlias(record.blockId());
    const BlockId target{id.type, record.newName};
    const auto *b = m_blocks.at(id);
    if (!b || record.newName.empty() || m_blocks.contains(target)) {
      logDebug("[RelayState] ignoring rename '%s' -> '%s'",
          id.toString().c_str(),
          record.newName.c_str());
      return false;
    }
    Block moved = *b;
    m_blocks.erase(id);
    m_blocks[target] = std::move(moved);
    m_aliases.erase(target);
    m_aliases[id] = record.newName;
    relink(id, record.newName);
    return true;
  }
  }

  return false;
}

void RelayState::clear()
{
  m_blocks.clear();
  m_aliases.clear();
  m_nextCreation = 0;
}

std::vector<ChangeRecord> RelayState::asCreates() const
{
  std::vector<const std::pair<BlockId, Block> *> ordered;
  ordered.reserve(m_blocks.size());
  for (const auto &b : m_blocks)
    ordered.push_back(&b);

  std::sort(ordered.begin(), ordered.end(), [](auto *a, auto *b) {
    return a->second.createdAt < b->second.createdAt;
  });

  std::vector<ChangeRecord> creates;
  creates.reserve(ordered.size());
  for (const auto *b : ordered)
    creates.push_back(makeCreate(b->first, b->second.fields));
  return creates;
}

const FieldMap *RelayState::find(const BlockId &id) const
{
  const auto *b = m_blocks.at(id);
  return b ? &b->fields : nullptr;
}

bool RelayState::contains(const BlockId &id) const
{
  return m_blocks.contains(id);
}

size_t RelayState::size() const
{
  return m_blocks.size();
}

bool RelayState::empty() const
{
  return m_blocks.empty();
}

BlockId RelayState::resolveAlias(const BlockId &id) const
{
  BlockId current = id;
  // bounded walk, a chain never holds more links than there are aliases
  for (size_t i = 0; i <= m_aliases.size(); i++) {
    if (m_blocks.contains(current))
      break;
    const auto *next = m_aliases.at(current);
    if (!next)
      break;
    current.name = *next;
  }
  return current;
}

FieldMap RelayState::resolvedFields(const FieldMap &payload) const
{
  FieldMap fields = payload;
  for (auto &f : fields) {
    if (!f.second.holdsReference())
      continue;
    const auto &ref = f.second.getReference();
    const auto target = resolveAlias({ref.type, ref.name});
    if (target.name != ref.name)
      f.second = Value::reference(target.type, target.name);
  }
  return fields;
}

void RelayState::merge(Block &b, const FieldMap &payload)
{
  for (const auto &f : payload) {
    if (f.second.valid())
      b.fields[f.first] = f.second;
    else
      b.fields.erase(f.first);
  }
}

void RelayState::relink(const BlockId &from, const std::string &toName)
{
  for (auto &b : m_blocks) {
    for (auto &f : b.second.fields) {
      if (!f.second.holdsReference())
        continue;
      const auto &ref = f.second.getReference();
      if (ref.type == from.type && ref.name == from.name)
        f.second = Value::reference(from.type, toName);
    }
  }
}

} // namespace cosync::relay
