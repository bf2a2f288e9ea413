// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "cosync/core/FlatMap.hpp"
#include "cosync/core/Value.hpp"
// std
#include <string>
#include <tuple>

namespace cosync::core {

// Identity of a data-block: names are unique within a type
struct BlockId
{
  std::string type;
  std::string name;

  std::string toString() const; // "type/name"
};

bool operator==(const BlockId &a, const BlockId &b);
bool operator!=(const BlockId &a, const BlockId &b);
bool operator<(const BlockId &a, const BlockId &b);

using FieldMap = FlatMap<std::string, Value>;

struct DataBlock
{
  BlockId id;
  FieldMap fields;
};

// Inlined definitions ////////////////////////////////////////////////////////

inline std::string BlockId::toString() const
{
  return type + '/' + name;
}

inline bool operator==(const BlockId &a, const BlockId &b)
{
  return a.type == b.type && a.name == b.name;
}

inline bool operator!=(const BlockId &a, const BlockId &b)
{
  return !(a == b);
}

inline bool operator<(const BlockId &a, const BlockId &b)
{
  return std::tie(a.type, a.name) < std::tie(b.type, b.name);
}

} // namespace cosync::core
