// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

// std
#include <cstdio>
// cosync_core
#include "cosync/core/Error.hpp"
// cosync_relay
#include "cosync/relay/ChangeLog.hpp"

int main(int argc, const char *argv[])
{
  if (argc < 2) {
    printf("usage: ./%s <relay.log>\n", argv[0]);
    return 1;
  }

  cosync::relay::LogContents contents;
  try {
    contents = cosync::relay::readLogFile(argv[1]);
  } catch (const cosync::core::SyncError &e) {
    printf("error: %s\n", e.what());
    return 1;
  }

  for (const auto &r : contents.records)
    printf("%s\n", r.toString().c_str());

  printf("-- %zu records, %zu bytes", contents.records.size(),
      contents.validBytes);
  if (contents.truncated)
    printf(", incomplete record at the end");
  printf("\n");

  return 0;
}
