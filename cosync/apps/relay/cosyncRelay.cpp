// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

// std
#include <csignal>
#include <cstdio>
// cosync_core
#include "cosync/core/Error.hpp"
#include "cosync/core/Logging.hpp"
// cosync_relay
#include "cosync/relay/RelayServer.hpp"

static cosync::relay::RelayServer *g_server = nullptr;

extern "C" void handleSignal(int)
{
  if (g_server)
    g_server->requestShutdown();
}

int main(int argc, const char *argv[])
{
  try {
    cosync::relay::RelayServer server(argc, argv);
    if (server.settings().help) {
      std::printf("%s", cosync::relay::relayUsage());
      return 0;
    }

    g_server = &server;
    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    server.run();

    g_server = nullptr;
  } catch (const cosync::core::SyncError &e) {
    cosync::core::logError("[cosyncRelay] %s", e.what());
    std::printf("%s", cosync::relay::relayUsage());
    return 1;
  } catch (const boost::system::system_error &e) {
    cosync::core::logError("[cosyncRelay] cannot listen: %s", e.what());
    return 1;
  }

  return 0;
}
