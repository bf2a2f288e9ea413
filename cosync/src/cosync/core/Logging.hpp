// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

// std
#include <functional>
#include <string>

namespace cosync::core {

enum class LogLevel
{
  STATUS,
  INFO,
  WARNING,
  ERROR,
  DEBUG,
  UNKNOWN
};

// Receives every message which passes the verbosity filter, already formatted
using LogCallback = std::function<void(LogLevel, const std::string &)>;

void logStatus(const char *fmt, ...);
void logInfo(const char *fmt, ...);
void logWarning(const char *fmt, ...);
void logError(const char *fmt, ...);
void logDebug(const char *fmt, ...);

// Sinks //

void setLogToStdout();
void setLogCallback(LogCallback cb);
void clearLogCallback();

// Filtering //

void setLogVerbose(bool verbose); // enables logDebug() output
bool logVerbose();

const char *toString(LogLevel level);

} // namespace cosync::core
