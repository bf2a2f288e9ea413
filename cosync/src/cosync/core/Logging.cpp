// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#include "cosync/core/Logging.hpp"
// std
#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <vector>

namespace cosync::core {

static std::mutex g_logMutex;
static LogCallback g_logCallback;
static std::atomic<bool> g_logVerbose{false};

static void stdoutCallback(LogLevel level, const std::string &msg)
{
  auto *out = (level == LogLevel::ERROR || level == LogLevel::WARNING)
      ? stderr
      : stdout;
  if (level == LogLevel::STATUS)
    std::fprintf(out, "%s\n", msg.c_str());
  else
    std::fprintf(out, "[%s] %s\n", toString(level), msg.c_str());
  std::fflush(out);
}

static void logMessage(LogLevel level, const char *fmt, va_list args)
{
  if (level == LogLevel::DEBUG && !g_logVerbose)
    return;

  va_list argsCopy;
  va_copy(argsCopy, args);
  const int size = std::vsnprintf(nullptr, 0, fmt, argsCopy);
  va_end(argsCopy);
  if (size < 0)
    return;

  std::vector<char> buf(size_t(size) + 1);
  std::vsnprintf(buf.data(), buf.size(), fmt, args);

  std::lock_guard<std::mutex> lock(g_logMutex);
  if (g_logCallback)
    g_logCallback(level, std::string(buf.data(), size_t(size)));
}

void logStatus(const char *fmt, ...)
{
  va_list args;
  va_start(args, fmt);
  logMessage(LogLevel::STATUS, fmt, args);
  va_end(args);
}

void logInfo(const char *fmt, ...)
{
  va_list args;
  va_start(args, fmt);
  logMessage(LogLevel::INFO, fmt, args);
  va_end(args);
}

void logWarning(const char *fmt, ...)
{
  va_list args;
  va_start(args, fmt);
  logMessage(LogLevel::WARNING, fmt, args);
  va_end(args);
}

void logError(const char *fmt, ...)
{
  va_list args;
  va_start(args, fmt);
  logMessage(LogLevel::ERROR, fmt, args);
  va_end(args);
}

void logDebug(const char *fmt, ...)
{
  va_list args;
  va_start(args, fmt);
  logMessage(LogLevel::DEBUG, fmt, args);
  va_end(args);
}

void setLogToStdout()
{
  setLogCallback(stdoutCallback);
}

void setLogCallback(LogCallback cb)
{
  std::lock_guard<std::mutex> lock(g_logMutex);
  g_logCallback = std::move(cb);
}

void clearLogCallback()
{
  setLogCallback({});
}

void setLogVerbose(bool verbose)
{
  g_logVerbose = verbose;
}

bool logVerbose()
{
  return g_logVerbose;
}

const char *toString(LogLevel level)
{
  switch (level) {
  case LogLevel::STATUS:
    return "STATUS";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARNING:
    return "WARN";
  case LogLevel::ERROR:
    return "ERROR";
  case LogLevel::DEBUG:
    return "DEBUG";
  default:
    break;
  }
  return "UNKNOWN";
}

} // namespace cosync::core
