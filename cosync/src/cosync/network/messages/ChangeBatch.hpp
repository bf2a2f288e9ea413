// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "cosync/network/Message.hpp"
// cosync_core
#include "cosync/core/ChangeRecord.hpp"

namespace cosync::network::messages {

struct ChangeBatch : public StructuredMessage
{
  // Sender -- will serialize the data on construction
  ChangeBatch(const std::vector<core::ChangeRecord> &records);

  // Receiver -- will deserialize into 'out' on execute()
  ChangeBatch(const Message &msg, std::vector<core::ChangeRecord> *out);

  // Receiver behavior, throws SyncError{ENCODING_ERROR} if malformed
  void execute() override;

 private:
  std::vector<core::ChangeRecord> *m_out{nullptr};
};

} // namespace cosync::network::messages
