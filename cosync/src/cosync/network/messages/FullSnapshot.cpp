// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#include "FullSnapshot.hpp"
// cosync_core
#include "cosync/core/Codec.hpp"
#include "cosync/core/Error.hpp"
#include "cosync/core/Logging.hpp"

namespace cosync::network::messages {

FullSnapshot::FullSnapshot(const FullSnapshotData &data)
{
  core::BufferWriter w;
  if (!core::writeU64(w, data.headSequence)) {
    core::logError("[message::FullSnapshot] failed to serialize snapshot");
    return;
  }
  core::encodeRecords(w, data.creates);
  m_payload = w.take();
}

FullSnapshot::FullSnapshot(const Message &msg, FullSnapshotData *out)
    : StructuredMessage(msg), m_out(out)
{
  core::logDebug(
      "[message::FullSnapshot] Received full snapshot from relay"
      " (%u bytes)",
      msg.header.payload_length);
}

void FullSnapshot::execute()
{
  if (!m_out) {
    core::logError("[message::FullSnapshot] No output provided for exec");
    return;
  }

  core::BufferReader r(m_payload);
  FullSnapshotData data;
  if (!core::readU64(r, data.headSequence)) {
    throw core::SyncError(
        core::ErrorCode::ENCODING_ERROR, "malformed full snapshot");
  }
  data.creates = core::decodeRecords(r);
  if (r.remaining() != 0) {
    throw core::SyncError(core::ErrorCode::ENCODING_ERROR,
        "trailing bytes after full snapshot");
  }

  *m_out = std::move(data);
}

} // namespace cosync::network::messages
