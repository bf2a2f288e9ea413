// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "cosync/core/snapshot/Snapshot.hpp"
// std
#include <vector>

namespace cosync::core {

// Computes the change records turning 'oldSnapshot' into 'newSnapshot',
// stamped with 'originClientId' and ordered so they can be applied in
// sequence:
//
//   1. Renames (a delete and a create of byte-identical blocks of one type)
//   2. Creates, referenced blocks first, otherwise ordered by (name, type)
//   3. UpdateFields, one per block, removed fields carried as NONE values
//   4. Deletes
//
// Blocks taking part in a reference cycle are created in (name, type) order.
std::vector<ChangeRecord> diffSnapshots(const Snapshot &oldSnapshot,
    const Snapshot &newSnapshot,
    const std::string &originClientId = {});

} // namespace cosync::core
