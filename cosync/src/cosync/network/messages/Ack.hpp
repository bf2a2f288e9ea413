// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "cosync/network/Message.hpp"

namespace cosync::network::messages {

struct Ack : public StructuredMessage
{
  // Sender -- will serialize the data on construction
  Ack(uint64_t sequence);

  // Receiver -- will deserialize into 'out' on execute()
  Ack(const Message &msg, uint64_t *out);

  // Receiver behavior, throws SyncError{ENCODING_ERROR} if malformed
  void execute() override;

 private:
  uint64_t *m_out{nullptr};
};

} // namespace cosync::network::messages
