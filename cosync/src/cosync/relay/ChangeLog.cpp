// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#include "cosync/relay/ChangeLog.hpp"
// cosync_core
#include "cosync/core/Codec.hpp"
#include "cosync/core/Error.hpp"
#include "cosync/core/Logging.hpp"
// std
#include <cinttypes>
#include <cstring>
#include <filesystem>

namespace cosync::relay {

using namespace cosync::core;

constexpr uint32_t MAX_RECORD_BYTES = 1u << 30;

///////////////////////////////////////////////////////////////////////////////
// readLogFile() //////////////////////////////////////////////////////////////
///////////////////////////////////////////////////////////////////////////////

LogContents readLogFile(const std::string &path)
{
  FileReader reader(path.c_str());
  if (!reader) {
    throw SyncError(
        ErrorCode::CONFIGURATION_ERROR, "cannot open log file '" + path + "'");
  }

  LogContents contents;

  char magic[sizeof(LOG_MAGIC)];
  const size_t magicBytes = reader.read(magic, 1, sizeof(magic));
  if (magicBytes == 0)
    return contents; // empty file, nothing written yet
  if (magicBytes != sizeof(magic)
      || std::memcmp(magic, LOG_MAGIC, sizeof(magic)) != 0) {
    throw SyncError(ErrorCode::CONFIGURATION_ERROR,
        "'" + path + "' is not a cosync change log");
  }

  contents.validBytes = sizeof(LOG_MAGIC);

  while (true) {
    uint8_t lengthBytes[4];
    const size_t n = reader.read(lengthBytes, 1, sizeof(lengthBytes));
    if (n == 0)
      break;
    if (n != sizeof(lengthBytes)) {
      contents.truncated = true;
      break;
    }

    uint32_t length = 0;
    for (size_t i = 0; i < sizeof(lengthBytes); i++)
      length |= uint32_t(lengthBytes[i]) << (8 * i);

    if (length > MAX_RECORD_BYTES) {
      contents.truncated = true;
      break;
    }

    ByteBuffer bytes(length);
    if (reader.read(bytes.data(), 1, length) != length) {
      contents.truncated = true;
      break;
    }

    try {
      contents.records.push_back(decodeRecord(bytes));
    } catch (const SyncError &e) {
      logWarning("[ChangeLog] unreadable record after #%" PRIu64 ": %s",
          contents.records.empty() ? uint64_t(0)
                                   : contents.records.back().sequence,
          e.what());
      contents.truncated = true;
      break;
    }

    contents.validBytes += sizeof(lengthBytes) + length;
  }

  return contents;
}

///////////////////////////////////////////////////////////////////////////////
// ChangeLog //////////////////////////////////////////////////////////////////
///////////////////////////////////////////////////////////////////////////////

ChangeLog::ChangeLog(size_t retain) : m_retainLimit(retain) {}

ChangeLog::~ChangeLog() = default;

std::vector<ChangeRecord> ChangeLog::open(const std::string &path)
{
  namespace fs = std::filesystem;

  std::error_code ec;
  const bool exists = fs::exists(path, ec);

  LogContents contents;
  if (exists)
    contents = readLogFile(path);

  if (contents.truncated) {
    logWarning(
        "[ChangeLog] ignoring incomplete record at the end of '%s'",
        path.c_str());
  }

  if (exists && (contents.truncated || contents.validBytes == 0)) {
    fs::resize_file(path, contents.validBytes, ec);
    if (ec) {
      throw SyncError(ErrorCode::CONFIGURATION_ERROR,
          "cannot repair log file '" + path + "': " + ec.message());
    }
  }

  m_file = std::make_unique<FileWriter>(path.c_str(), "ab");
  if (!m_file->valid()) {
    m_file.reset();
    throw SyncError(ErrorCode::CONFIGURATION_ERROR,
        "cannot open log file '" + path + "' for writing");
  }
  m_path = path;
  m_fileBytes = contents.validBytes;

  if (contents.validBytes == 0) {
    if (!writeBytes(*m_file, LOG_MAGIC, sizeof(LOG_MAGIC))
        || !m_file->flush()) {
      throw SyncError(ErrorCode::CONFIGURATION_ERROR,
          "cannot write log file '" + path + "'");
    }
    m_fileBytes = sizeof(LOG_MAGIC);
  }

  for (const auto &r : contents.records) {
    if (r.sequence <= m_headSequence) {
      logWarning("[ChangeLog] out of order record #%" PRIu64 " in '%s'",
          r.sequence,
          path.c_str());
      continue;
    }
    m_headSequence = r.sequence;
    retain(r);
  }

  logStatus("[ChangeLog] opened '%s': %zu records, head sequence %" PRIu64,
      path.c_str(),
      contents.records.size(),
      m_headSequence);

  return std::move(contents.records);
}

bool ChangeLog::persistent() const
{
  return !m_path.empty();
}

bool ChangeLog::append(const ChangeRecord &record)
{
  if (record.sequence <= m_headSequence) {
    logError("[ChangeLog] refusing record #%" PRIu64
             " at or below head sequence %" PRIu64,
        record.sequence,
        m_headSequence);
    return false;
  }

  if (persistent() && !persist(record))
    return false;

  m_headSequence = record.sequence;
  retain(record);
  return true;
}

uint64_t ChangeLog::headSequence() const
{
  return m_headSequence;
}

bool ChangeLog::covers(uint64_t sequence) const
{
  if (sequence >= m_headSequence)
    return true;
  if (m_retained.empty())
    return false;
  return m_retained.front().sequence <= sequence + 1;
}

std::vector<ChangeRecord> ChangeLog::recordsAfter(uint64_t sequence) const
{
  std::vector<ChangeRecord> records;
  for (const auto &r : m_retained) {
    if (r.sequence > sequence)
      records.push_back(r);
  }
  return records;
}

size_t ChangeLog::numberOfRetained() const
{
  return m_retained.size();
}

size_t ChangeLog::retainLimit() const
{
  return m_retainLimit;
}

bool ChangeLog::persist(const ChangeRecord &record)
{
  if (!m_file) {
    logError("[ChangeLog] '%s' is unusable, refusing record #%" PRIu64,
        m_path.c_str(),
        record.sequence);
    return false;
  }

  ByteBuffer bytes;
  try {
    bytes = encodeRecord(record);
  } catch (const SyncError &e) {
    logError("[ChangeLog] cannot persist record #%" PRIu64 ": %s",
        record.sequence,
        e.what());
    return false;
  }

  const bool ok = writeU32(*m_file, uint32_t(bytes.size()))
      && writeBytes(*m_file, bytes.data(), bytes.size()) && m_file->flush();
  if (ok) {
    m_fileBytes += sizeof(uint32_t) + bytes.size();
    return true;
  }

  logError("[ChangeLog] failed to persist record #%" PRIu64 " to '%s'",
      record.sequence,
      m_path.c_str());
  rollback();
  return false;
}

void ChangeLog::rollback()
{
  // Whatever part of the record reached the disk must go, records appended
  // after a torn one would be unreadable on restart.
  m_file.reset();

  std::error_code ec;
  std::filesystem::resize_file(m_path, m_fileBytes, ec);
  if (ec) {
    logError("[ChangeLog] cannot cut '%s' back to %zu bytes: %s",
        m_path.c_str(),
        m_fileBytes,
        ec.message().c_str());
    return;
  }

  m_file = std::make_unique<FileWriter>(m_path.c_str(), "ab");
  if (!m_file->valid()) {
    logError("[ChangeLog] cannot reopen '%s' for writing", m_path.c_str());
    m_file.reset();
  }
}

void ChangeLog::retain(const ChangeRecord &record)
{
  if (m_retainLimit == 0)
    return;
  m_retained.push_back(record);
  while (m_retained.size() > m_retainLimit)
    m_retained.pop_front();
}

} // namespace cosync::relay
