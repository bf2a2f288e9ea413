// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "cosync/core/DataBlock.hpp"
// std
#include <cstdint>
#include <string>
#include <vector>

namespace cosync::core {

enum class Operation : uint8_t
{
  CREATE = 0,
  UPDATE_FIELD = 1,
  DELETE = 2,
  RENAME = 3
};

struct ChangeRecord
{
  uint64_t sequence{0}; // relay assigned, 0 until stamped
  std::string originClientId;
  Operation operation{Operation::CREATE};
  std::string blockType;
  std::string blockName;
  std::string newName; // RENAME only
  FieldMap payload; // full field set for CREATE, changed fields for UPDATE

  BlockId blockId() const;
  BlockId renamedId() const; // {blockType, newName}

  // Non-null references held by the payload, in field order, deduplicated
  std::vector<BlockId> referencedBlocks() const;

  std::string toString() const;
};

bool operator==(const ChangeRecord &a, const ChangeRecord &b);
bool operator!=(const ChangeRecord &a, const ChangeRecord &b);

ChangeRecord makeCreate(const BlockId &id, FieldMap fields);
ChangeRecord makeUpdate(const BlockId &id, FieldMap changed);
ChangeRecord makeDelete(const BlockId &id);
ChangeRecord makeRename(const BlockId &id, const std::string &newName);

const char *toString(Operation op);

} // namespace cosync::core
