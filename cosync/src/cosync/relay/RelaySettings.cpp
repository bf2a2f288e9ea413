// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#include "cosync/relay/RelaySettings.hpp"
// cosync_core
#include "cosync/core/CommandLine.hpp"
#include "cosync/core/Error.hpp"

namespace cosync::relay {

void RelaySettings::parseCommandLine(int argc, const char **argv)
{
  if (argc < 2 || argv == nullptr)
    return;

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "-v" || arg == "--verbose")
      this->verbose = true;
    else if (arg == "-h" || arg == "--help")
      this->help = true;
    else if (arg == "-b" || arg == "--bind")
      this->bindAddress = core::nextArgument(argc, argv, i);
    else if (arg == "-p" || arg == "--port")
      this->port = core::parsePort(arg, core::nextArgument(argc, argv, i));
    else if (arg == "-l" || arg == "--log")
      this->logFile = core::nextArgument(argc, argv, i);
    else if (arg == "--retain") {
      this->retain =
          core::parseUnsigned(arg, core::nextArgument(argc, argv, i));
    } else {
      throw core::SyncError(
          core::ErrorCode::CONFIGURATION_ERROR, "unknown option '" + arg + "'");
    }
  }

  if (this->bindAddress.empty()) {
    throw core::SyncError(
        core::ErrorCode::CONFIGURATION_ERROR, "empty bind address");
  }
}

const char *relayUsage()
{
  return "usage: cosyncRelay [options]\n"
         "  -b, --bind <address>  address to listen on (default 0.0.0.0)\n"
         "  -p, --port <port>     port to listen on (default 25600)\n"
         "  -l, --log <file>      persist the change log to <file>\n"
         "      --retain <n>      records kept in memory for resuming "
         "clients\n"
         "  -v, --verbose         print debug messages\n"
         "  -h, --help            print this message\n";
}

} // namespace cosync::relay
