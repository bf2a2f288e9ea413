// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#include "cosync/core/ChangeRecord.hpp"
// std
#include <algorithm>
#include <sstream>

namespace cosync::core {

BlockId ChangeRecord::blockId() const
{
  return {blockType, blockName};
}

BlockId ChangeRecord::renamedId() const
{
  return {blockType, newName};
}

std::vector<BlockId> ChangeRecord::referencedBlocks() const
{
  std::vector<BlockId> refs;
  for (const auto &f : payload) {
    if (!f.second.holdsReference())
      continue;
    const auto &r = f.second.getReference();
    BlockId id{r.type, r.name};
    if (std::find(refs.begin(), refs.end(), id) == refs.end())
      refs.push_back(std::move(id));
  }
  return refs;
}

std::string ChangeRecord::toString() const
{
  std::stringstream ss;
  ss << '#' << sequence << ' ' << core::toString(operation) << ' '
     << blockType << '/' << blockName;
  if (operation == Operation::RENAME)
    ss << " -> " << newName;
  if (!originClientId.empty())
    ss << " (from '" << originClientId << "')";
  for (const auto &f : payload)
    ss << "\n    " << f.first << " = " << f.second.toString();
  return ss.str();
}

bool operator==(const ChangeRecord &a, const ChangeRecord &b)
{
  return a.sequence == b.sequence && a.originClientId == b.originClientId
      && a.operation == b.operation && a.blockType == b.blockType
      && a.blockName == b.blockName && a.newName == b.newName
      && a.payload == b.payload;
}

bool operator!=(const ChangeRecord &a, const ChangeRecord &b)
{
  return !(a == b);
}

// Record factories ///////////////////////////////////////////////////////////

ChangeRecord makeCreate(const BlockId &id, FieldMap fields)
{
  ChangeRecord r;
  r.operation = Operation::CREATE;
  r.blockType = id.type;
  r.blockName = id.name;
  r.payload = std::move(fields);
  return r;
}

ChangeRecord makeUpdate(const BlockId &id, FieldMap changed)
{
  ChangeRecord r = makeCreate(id, std::move(changed));
  r.operation = Operation::UPDATE_FIELD;
  return r;
}

ChangeRecord makeDelete(const BlockId &id)
{
  ChangeRecord r;
  r.operation = Operation::DELETE;
  r.blockType = id.type;
  r.blockName = id.name;
  return r;
}

ChangeRecord makeRename(const BlockId &id, const std::string &newName)
{
  ChangeRecord r = makeDelete(id);
  r.operation = Operation::RENAME;
  r.newName = newName;
  return r;
}

const char *toString(Operation op)
{
  switch (op) {
  case Operation::CREATE:
    return "Create";
  case Operation::UPDATE_FIELD:
    return "UpdateField";
  case Operation::DELETE:
    return "Delete";
  case Operation::RENAME:
    return "Rename";
  }
  return "Unknown";
}

} // namespace cosync::core
