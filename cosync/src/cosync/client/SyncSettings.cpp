// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#include "cosync/client/SyncSettings.hpp"
// cosync_core
#include "cosync/core/CommandLine.hpp"
#include "cosync/core/Error.hpp"
// std
#include <cstdio>
#include <random>

namespace cosync::client {

using core::ErrorCode;
using core::SyncError;

void SyncSettings::parseCommandLine(int argc, const char **argv)
{
  for (int i = 1; argv != nullptr && i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "-v" || arg == "--verbose")
      this->verbose = true;
    else if (arg == "-h" || arg == "--help")
      this->help = true;
    else if (arg == "--host")
      this->host = core::nextArgument(argc, argv, i);
    else if (arg == "-p" || arg == "--port")
      this->port = core::parsePort(arg, core::nextArgument(argc, argv, i));
    else if (arg == "--client-id")
      this->clientId = core::nextArgument(argc, argv, i);
    else if (arg == "--backoff-initial") {
      this->backoffInitial = std::chrono::milliseconds(
          core::parseUnsigned(arg, core::nextArgument(argc, argv, i)));
    } else if (arg == "--backoff-max") {
      this->backoffMax = std::chrono::milliseconds(
          core::parseUnsigned(arg, core::nextArgument(argc, argv, i)));
    } else if (arg == "--retry-limit") {
      const auto limit =
          core::parseUnsigned(arg, core::nextArgument(argc, argv, i));
      if (limit > UINT32_MAX)
        throw SyncError(ErrorCode::CONFIGURATION_ERROR, "retry limit too big");
      this->retryLimit = uint32_t(limit);
    } else if (arg == "--types")
      this->types = core::parseList(core::nextArgument(argc, argv, i));
    else if (arg == "--resume")
      this->resume = true;
    else if (arg == "--poll-edits")
      this->pollEdits = true;
    else
      throw SyncError(ErrorCode::CONFIGURATION_ERROR,
          "unknown option '" + arg + "'");
  }

  if (this->host.empty())
    throw SyncError(ErrorCode::CONFIGURATION_ERROR, "missing relay host");

  if (this->backoffMax < this->backoffInitial) {
    throw SyncError(ErrorCode::CONFIGURATION_ERROR,
        "--backoff-max must not be smaller than --backoff-initial");
  }

  if (this->clientId.empty())
    this->clientId = generateClientId();
}

std::string generateClientId()
{
  std::random_device rd;
  std::uniform_int_distribution<uint32_t> dist;
  char buf[9];
  std::snprintf(buf, sizeof(buf), "%08x", dist(rd));
  return std::string("client-") + buf;
}

const char *syncUsage()
{
  return "options:\n"
         "      --host <address>        relay address (default 127.0.0.1)\n"
         "  -p, --port <port>           relay port (default 25600)\n"
         "      --client-id <id>        stable id of this client\n"
         "      --backoff-initial <ms>  first reconnect delay (default 500)\n"
         "      --backoff-max <ms>      longest reconnect delay "
         "(default 10000)\n"
         "      --retry-limit <n>       passes a record may wait for a "
         "dependency\n"
         "      --types a,b,c           replicate only these block types\n"
         "      --resume                catch up from the last applied "
         "record\n"
         "      --poll-edits            look for local edits on every poll\n"
         "  -v, --verbose               print debug messages\n"
         "  -h, --help                  print this message\n";
}

} // namespace cosync::client
