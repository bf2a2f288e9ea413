// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#include "Hello.hpp"
// cosync_core
#include "cosync/core/Error.hpp"
#include "cosync/core/Logging.hpp"

namespace cosync::network::messages {

Hello::Hello(const HelloData &data)
{
  core::BufferWriter w;
  if (!core::writeString(w, data.clientId)
      || !core::writeU64(w, data.resumeFrom)) {
    core::logError("[message::Hello] failed to serialize hello");
    return;
  }
  m_payload = w.take();
}

Hello::Hello(const Message &msg, HelloData *out)
    : StructuredMessage(msg), m_out(out)
{
  core::logDebug("[message::Hello] Received hello (%u bytes)",
      msg.header.payload_length);
}

void Hello::execute()
{
  if (!m_out) {
    core::logError("[message::Hello] No output provided for exec");
    return;
  }

  core::BufferReader r(m_payload);
  HelloData data;
  if (!core::readString(r, data.clientId) || !core::readU64(r, data.resumeFrom)
      || r.remaining() != 0) {
    throw core::SyncError(core::ErrorCode::ENCODING_ERROR, "malformed hello");
  }

  *m_out = std::move(data);
}

} // namespace cosync::network::messages
