// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

// std
#include <deque>
#include <memory>
#include <string>
#include <vector>
// cosync_core
#include "cosync/core/ChangeRecord.hpp"
#include "cosync/core/DataStream.hpp"

namespace cosync::relay {

// File layout: LOG_MAGIC, then per record a u32 length + encoded record
constexpr char LOG_MAGIC[4] = {'C', 'S', 'L', '1'};

struct LogContents
{
  std::vector<core::ChangeRecord> records;
  size_t validBytes{0}; // file prefix holding complete records
  bool truncated{false}; // trailing bytes did not form a complete record
};

// Reads a persisted log; throws SyncError{CONFIGURATION_ERROR} if the file
// cannot be opened or is not a change log.
LogContents readLogFile(const std::string &path);

// Authoritative, append-only sequence of stamped change records. The most
// recent records are kept in memory so reconnecting clients can be caught up
// without a full snapshot; all of them go to the log file when one is open.
struct ChangeLog
{
  explicit ChangeLog(size_t retain = 10000);
  ~ChangeLog();

  ChangeLog(const ChangeLog &) = delete;
  ChangeLog &operator=(const ChangeLog &) = delete;

  // Loads (or creates) the log file and keeps appending to it. Returns the
  // records already in the file, in order. A truncated tail is dropped.
  std::vector<core::ChangeRecord> open(const std::string &path);
  bool persistent() const;

  // Record must be stamped with headSequence() + 1 or later. Returns false,
  // leaving the head and the file untouched, if the record is refused or
  // cannot be written to the log file.
  bool append(const core::ChangeRecord &record);

  uint64_t headSequence() const;

  // True if every record after 'sequence' is still held in memory
  bool covers(uint64_t sequence) const;
  std::vector<core::ChangeRecord> recordsAfter(uint64_t sequence) const;

  size_t numberOfRetained() const;
  size_t retainLimit() const;

 private:
  void retain(const core::ChangeRecord &record);
  bool persist(const core::ChangeRecord &record);
  void rollback();

  size_t m_retainLimit{10000};
  uint64_t m_headSequence{0};
  std::deque<core::ChangeRecord> m_retained;

  std::string m_path;
  std::unique_ptr<core::FileWriter> m_file; // null after an unrecoverable error
  size_t m_fileBytes{0}; // end of the last complete record
};

} // namespace cosync::relay
