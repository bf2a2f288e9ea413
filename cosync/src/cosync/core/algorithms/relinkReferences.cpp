// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#include "cosync/core/algorithms/relinkReferences.hpp"

namespace cosync::core {

size_t relinkReferences(
    HostScene &scene, const BlockId &from, const std::string &toName)
{
  struct Target
  {
    BlockId block;
    std::string field;
  };

  // Collect first, the host may not support mutation while enumerating
  std::vector<Target> targets;
  for (const auto &type : scene.blockTypes()) {
    scene.enumerateBlocks(
        type, [&](const std::string &name, const FieldMap &fields) {
          for (const auto &f : fields) {
            if (!f.second.holdsReference())
              continue;
            const auto &r = f.second.getReference();
            if (r.type == from.type && r.name == from.name)
              targets.push_back({{type, name}, f.first});
          }
        });
  }

  size_t rewritten = 0;
  for (const auto &t : targets) {
    if (scene.updateBlock(
            t.block, t.field, Value::reference(from.type, toName)))
      rewritten++;
  }

  return rewritten;
}

} // namespace cosync::core
