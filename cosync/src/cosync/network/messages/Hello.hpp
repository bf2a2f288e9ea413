// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "cosync/network/Message.hpp"

namespace cosync::network::messages {

struct HelloData
{
  std::string clientId;
  uint64_t resumeFrom{0}; // last sequence the client applied, 0 = none
};

struct Hello : public StructuredMessage
{
  // Sender -- will serialize the data on construction
  Hello(const HelloData &data);

  // Receiver -- will deserialize into 'out' on execute()
  Hello(const Message &msg, HelloData *out);

  // Receiver behavior, throws SyncError{ENCODING_ERROR} if malformed
  void execute() override;

 private:
  HelloData *m_out{nullptr};
};

} // namespace cosync::network::messages
