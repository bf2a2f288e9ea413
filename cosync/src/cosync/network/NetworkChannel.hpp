// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Message.hpp"
// std
#include <atomic>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace cosync::network {

using MessageFuture = std::future<boost::system::error_code>;
using ConnectionID = uint32_t;

///////////////////////////////////////////////////////////////////////////////
// Connection /////////////////////////////////////////////////////////////////
///////////////////////////////////////////////////////////////////////////////

// One framed TCP stream. Once started it reads messages continuously; sends
// are queued and written one at a time in the order send() was called. All
// socket work happens on the io_context the socket belongs to.
struct Connection : public std::enable_shared_from_this<Connection>
{
  using ReceiveCallback = std::function<void(Connection &, const Message &)>;
  using CloseCallback =
      std::function<void(Connection &, const boost::system::error_code &)>;

  Connection(tcp::socket socket, ConnectionID id);
  ~Connection();

  Connection(const Connection &) = delete;
  Connection &operator=(const Connection &) = delete;

  ConnectionID id() const;
  const std::string &remoteAddress() const;
  bool isConnected() const;

  void start(ReceiveCallback onReceive, CloseCallback onClose);
  MessageFuture send(Message &&msg);
  void close();

 private:
  struct PendingWrite
  {
    MessagePayload bytes; // header + payload
    std::promise<boost::system::error_code> promise;
  };

  void read_header();
  void read_payload(std::shared_ptr<Message> msg);
  void write_next();
  void shutdown(const boost::system::error_code &reason);

  tcp::socket m_socket;
  ConnectionID m_id{0};
  std::string m_remoteAddress;
  std::atomic<bool> m_open{false};

  uint8_t m_header[MESSAGE_HEADER_SIZE]{};
  std::deque<std::shared_ptr<PendingWrite>> m_writes;

  ReceiveCallback m_onReceive;
  CloseCallback m_onClose;
};

///////////////////////////////////////////////////////////////////////////////
// Channels ///////////////////////////////////////////////////////////////////
///////////////////////////////////////////////////////////////////////////////

// Owns the io_context and the thread running it
struct NetworkChannel
{
  NetworkChannel();
  virtual ~NetworkChannel();

  NetworkChannel(const NetworkChannel &) = delete;
  NetworkChannel &operator=(const NetworkChannel &) = delete;

 protected:
  void start_messaging();
  void stop_messaging();

  asio::io_context m_io_context;
  std::thread m_io_thread;

  using WorkGuard = asio::executor_work_guard<asio::io_context::executor_type>;
  std::optional<WorkGuard> m_work;
};

void log_asio_error(
    const boost::system::error_code &error, const char *context);

using ServerMessageHandler =
    std::function<void(ConnectionID, const struct Message &)>;
using ServerHandlerMap = cosync::core::FlatMap<uint8_t, ServerMessageHandler>;

struct NetworkServer : public NetworkChannel
{
  using ConnectionHandler = std::function<void(ConnectionID)>;

  // Binds immediately; throws boost::system::system_error on failure.
  // A 'port' of 0 picks an ephemeral port, see port().
  NetworkServer(const std::string &bindAddress, uint16_t port);
  ~NetworkServer() override;

  //// Receive messages ////

  // Handlers run on the IO thread
  void registerHandler(uint8_t messageType, ServerMessageHandler handler);
  void removeAllHandlers();
  void setConnectionHandlers(
      ConnectionHandler onConnect, ConnectionHandler onDisconnect);

  //// Send messages ////

  MessageFuture send(ConnectionID id, Message &&msg);
  MessageFuture send(ConnectionID id, uint8_t type, StructuredMessage &&msg);

  //// Lifetime ////

  void start();
  void stop();
  void disconnect(ConnectionID id);

  uint16_t port() const;
  size_t numberOfConnections() const;

 private:
  void start_accept();
  void on_message(Connection &c, const Message &msg);
  void on_close(Connection &c, const boost::system::error_code &reason);

  tcp::acceptor m_acceptor;
  uint16_t m_port{0};

  mutable std::mutex m_connectionsMutex;
  core::FlatMap<ConnectionID, std::shared_ptr<Connection>> m_connections;
  ConnectionID m_nextConnectionID{1};

  ServerHandlerMap m_handlers;
  ConnectionHandler m_onConnect;
  ConnectionHandler m_onDisconnect;
};

struct NetworkClient : public NetworkChannel
{
  using StatusHandler = std::function<void(const boost::system::error_code &)>;

  NetworkClient() = default;
  ~NetworkClient() override;

  //// Receive messages ////

  // Handlers run on the IO thread
  void registerHandler(uint8_t messageType, MessageHandler handler);
  void removeHandler(uint8_t messageType);
  void removeAllHandlers();

  // 'onConnect' receives the result of every connect() attempt,
  // 'onDisconnect' fires once when an established connection is lost
  void setConnectionHandlers(
      StatusHandler onConnect, StatusHandler onDisconnect);

  //// Send messages ////

  MessageFuture send(Message &&msg);
  MessageFuture send(uint8_t type, StructuredMessage &&msg);
  MessageFuture send(uint8_t type); // no payload

  //// Lifetime ////

  void connect(const std::string &host, uint16_t port); // asynchronous
  void disconnect();
  bool isConnected() const;

 private:
  void on_message(const Message &msg);

  mutable std::mutex m_connectionMutex;
  std::shared_ptr<Connection> m_connection;

  HandlerMap m_handlers;
  StatusHandler m_onConnect;
  StatusHandler m_onDisconnect;
};

// Inlined helper functions ///////////////////////////////////////////////////

template <typename R>
inline bool is_ready(const std::future<R> &f)
{
  return !f.valid()
      || f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

} // namespace cosync::network
