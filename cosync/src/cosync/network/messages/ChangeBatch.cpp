// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#include "ChangeBatch.hpp"
// cosync_core
#include "cosync/core/Codec.hpp"
#include "cosync/core/Error.hpp"
#include "cosync/core/Logging.hpp"

namespace cosync::network::messages {

ChangeBatch::ChangeBatch(const std::vector<core::ChangeRecord> &records)
{
  core::BufferWriter w;
  core::encodeRecords(w, records);
  m_payload = w.take();
}

ChangeBatch::ChangeBatch(
    const Message &msg, std::vector<core::ChangeRecord> *out)
    : StructuredMessage(msg), m_out(out)
{
  core::logDebug("[message::ChangeBatch] Received change batch (%u bytes)",
      msg.header.payload_length);
}

void ChangeBatch::execute()
{
  if (!m_out) {
    core::logError("[message::ChangeBatch] No output provided for exec");
    return;
  }

  core::BufferReader r(m_payload);
  auto records = core::decodeRecords(r);
  if (r.remaining() != 0) {
    throw core::SyncError(core::ErrorCode::ENCODING_ERROR,
        "trailing bytes after change batch");
  }

  *m_out = std::move(records);
}

} // namespace cosync::network::messages
