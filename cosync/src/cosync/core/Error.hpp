// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

// std
#include <stdexcept>
#include <string>

namespace cosync::core {

enum class ErrorCode
{
  SNAPSHOT_INCONSISTENT, // host graph read mid-mutation, retry later
  ENCODING_ERROR, // unsupported or malformed value
  UNRESOLVABLE_DEPENDENCY, // deferred record ran out of retries
  TRANSPORT_ERROR, // connection lost
  DUPLICATE_CREATE, // create for an existing block, applied as update
  CONFIGURATION_ERROR // fatal at startup
};

struct SyncError : public std::runtime_error
{
  SyncError(ErrorCode code, const std::string &msg);

  ErrorCode code() const;

 private:
  ErrorCode m_code;
};

const char *toString(ErrorCode code);

// Inlined definitions ////////////////////////////////////////////////////////

inline SyncError::SyncError(ErrorCode code, const std::string &msg)
    : std::runtime_error(msg), m_code(code)
{}

inline ErrorCode SyncError::code() const
{
  return m_code;
}

inline const char *toString(ErrorCode code)
{
  switch (code) {
  case ErrorCode::SNAPSHOT_INCONSISTENT:
    return "SnapshotInconsistent";
  case ErrorCode::ENCODING_ERROR:
    return "EncodingError";
  case ErrorCode::UNRESOLVABLE_DEPENDENCY:
    return "UnresolvableDependency";
  case ErrorCode::TRANSPORT_ERROR:
    return "TransportError";
  case ErrorCode::DUPLICATE_CREATE:
    return "DuplicateCreate";
  case ErrorCode::CONFIGURATION_ERROR:
    return "ConfigurationError";
  }
  return "UnknownError";
}

} // namespace cosync::core
