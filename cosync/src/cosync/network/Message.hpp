// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

// boost asio
#include <boost/asio.hpp>
// std
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>
// cosync_core
#include "cosync/core/DataStream.hpp"
#include "cosync/core/FlatMap.hpp"

namespace asio = boost::asio;

namespace cosync::network {

using asio::ip::tcp;

using MessageHandler = std::function<void(const struct Message &)>;
using HandlerMap = cosync::core::FlatMap<uint8_t, MessageHandler>;
using MessagePayload = cosync::core::ByteBuffer;

constexpr uint8_t MESSAGE_TYPE_INVALID = 254;
constexpr size_t MESSAGE_HEADER_SIZE = 5; // u8 type + u32 LE payload length
constexpr uint32_t MAX_PAYLOAD_LENGTH = 1u << 30;

struct Message
{
  struct Header
  {
    uint8_t type{MESSAGE_TYPE_INVALID}; // Type of message
    uint32_t payload_length{0}; // Length of payload in bytes
  } header;

  MessagePayload payload; // Actual payload data
};

// Wire form of the header, independent of struct padding and host byte order
void encodeHeader(
    const Message::Header &h, uint8_t (&bytes)[MESSAGE_HEADER_SIZE]);
Message::Header decodeHeader(const uint8_t (&bytes)[MESSAGE_HEADER_SIZE]);

struct StructuredMessage
{
  StructuredMessage() = default;
  StructuredMessage(const Message &msg); // parse received message
  virtual ~StructuredMessage() = default;

  void fromMessage(const Message &msg);
  Message toMessage(uint8_t type);

  const MessagePayload &payload() const;

  // Child classes override to associate behavior on receipt using payload
  virtual void execute() = 0;

 protected:
  MessagePayload m_payload;
};

// Helper functions ///////////////////////////////////////////////////////////

Message make_message(uint8_t type);
Message make_message(uint8_t type, const std::string &data);
Message make_message(uint8_t type, MessagePayload &&payload);

bool payloadRead(const Message &msg, std::string &str);

///////////////////////////////////////////////////////////////////////////////
// Inlined definitions ////////////////////////////////////////////////////////
///////////////////////////////////////////////////////////////////////////////

inline void encodeHeader(
    const Message::Header &h, uint8_t (&bytes)[MESSAGE_HEADER_SIZE])
{
  bytes[0] = h.type;
  for (size_t i = 0; i < 4; i++)
    bytes[1 + i] = uint8_t((h.payload_length >> (8 * i)) & 0xFF);
}

inline Message::Header decodeHeader(const uint8_t (&bytes)[MESSAGE_HEADER_SIZE])
{
  Message::Header h;
  h.type = bytes[0];
  h.payload_length = 0;
  for (size_t i = 0; i < 4; i++)
    h.payload_length |= uint32_t(bytes[1 + i]) << (8 * i);
  return h;
}

// StucturedMessage definitions //

inline StructuredMessage::StructuredMessage(const Message &msg)
{
  fromMessage(msg);
}

inline void StructuredMessage::fromMessage(const Message &msg)
{
  m_payload = msg.payload;
}

inline Message StructuredMessage::toMessage(uint8_t type)
{
  return make_message(type, std::move(m_payload));
}

inline const MessagePayload &StructuredMessage::payload() const
{
  return m_payload;
}

// Helper functions //

inline Message make_message(uint8_t type)
{
  Message msg;
  msg.header.type = type;
  return msg;
}

inline Message make_message(uint8_t type, const std::string &data)
{
  Message msg = make_message(type);
  const auto *bytes = reinterpret_cast<const std::byte *>(data.data());
  msg.payload.assign(bytes, bytes + data.size());
  msg.header.payload_length = uint32_t(msg.payload.size());
  return msg;
}

inline Message make_message(uint8_t type, MessagePayload &&payload)
{
  Message msg = make_message(type);
  msg.payload = std::move(payload);
  msg.header.payload_length = uint32_t(msg.payload.size());
  return msg;
}

inline bool payloadRead(const Message &msg, std::string &str)
{
  if (msg.payload.size() != msg.header.payload_length)
    return false;
  str.assign(reinterpret_cast<const char *>(msg.payload.data()),
      msg.payload.size());
  return true;
}

} // namespace cosync::network
