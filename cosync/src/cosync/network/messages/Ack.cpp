// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#include "Ack.hpp"
// cosync_core
#include "cosync/core/Error.hpp"
#include "cosync/core/Logging.hpp"

namespace cosync::network::messages {

Ack::Ack(uint64_t sequence)
{
  core::BufferWriter w;
  if (!core::writeU64(w, sequence)) {
    core::logError("[message::Ack] failed to serialize ack");
    return;
  }
  m_payload = w.take();
}

Ack::Ack(const Message &msg, uint64_t *out) : StructuredMessage(msg), m_out(out)
{}

void Ack::execute()
{
  if (!m_out) {
    core::logError("[message::Ack] No output provided for exec");
    return;
  }

  core::BufferReader r(m_payload);
  uint64_t sequence = 0;
  if (!core::readU64(r, sequence) || r.remaining() != 0)
    throw core::SyncError(core::ErrorCode::ENCODING_ERROR, "malformed ack");

  *m_out = sequence;
}

} // namespace cosync::network::messages
