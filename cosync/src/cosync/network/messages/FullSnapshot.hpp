// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "cosync/network/Message.hpp"
// cosync_core
#include "cosync/core/ChangeRecord.hpp"

namespace cosync::network::messages {

struct FullSnapshotData
{
  uint64_t headSequence{0};
  std::vector<core::ChangeRecord> creates; // one per block, creation order
};

struct FullSnapshot : public StructuredMessage
{
  // Sender -- will serialize the data on construction
  FullSnapshot(const FullSnapshotData &data);

  // Receiver -- will deserialize into 'out' on execute()
  FullSnapshot(const Message &msg, FullSnapshotData *out);

  // Receiver behavior, throws SyncError{ENCODING_ERROR} if malformed
  void execute() override;

 private:
  FullSnapshotData *m_out{nullptr};
};

} // namespace cosync::network::messages
