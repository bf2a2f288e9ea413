// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "cosync/core/scene/HostScene.hpp"

namespace cosync::core {

// Rewrites every reference to 'from' held by any block of 'scene' so that it
// points at {from.type, toName}. An empty 'toName' writes null references.
// Returns the number of fields rewritten.
size_t relinkReferences(
    HostScene &scene, const BlockId &from, const std::string &toName);

} // namespace cosync::core
