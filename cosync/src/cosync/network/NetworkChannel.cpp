// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#include "NetworkChannel.hpp"
// cosync_core
#include "cosync/core/Logging.hpp"

namespace cosync::network {

using cosync::core::logDebug;
using cosync::core::logError;
using cosync::core::logStatus;
using cosync::core::logWarning;

// Helper functions ///////////////////////////////////////////////////////////

template <typename FCN>
static void async_invoke(boost::asio::io_context &io_context, FCN &&f)
{
  boost::asio::post(io_context, [f = std::forward<FCN>(f)]() mutable { f(); });
}

static MessageFuture failed_send(const boost::system::error_code &error)
{
  std::promise<boost::system::error_code> promise;
  promise.set_value(error);
  return promise.get_future();
}

void log_asio_error(
    const boost::system::error_code &error, const char *context)
{
  if (!error || error == asio::error::operation_aborted)
    return;

  if (error == asio::error::eof) {
    logStatus("[NetworkChannel] %s: connection closed by peer", context);
  } else if (error == asio::error::connection_reset) {
    logStatus("[NetworkChannel] %s: connection reset by peer", context);
  } else if (error == asio::error::not_connected) {
    logWarning("[NetworkChannel] %s: not connected", context);
  } else {
    logError("[NetworkChannel] %s error: %s", context, error.message().c_str());
  }
}

// Connection definitions /////////////////////////////////////////////////////

Connection::Connection(tcp::socket socket, ConnectionID id)
    : m_socket(std::move(socket)), m_id(id)
{
  boost::system::error_code ec;
  auto endpoint = m_socket.remote_endpoint(ec);
  if (!ec) {
    m_remoteAddress =
        endpoint.address().to_string() + ':' + std::to_string(endpoint.port());
  }
  m_open = m_socket.is_open();
}

Connection::~Connection()
{
  boost::system::error_code ec;
  m_socket.close(ec);
}

ConnectionID Connection::id() const
{
  return m_id;
}

const std::string &Connection::remoteAddress() const
{
  return m_remoteAddress;
}

bool Connection::isConnected() const
{
  return m_open;
}

void Connection::start(ReceiveCallback onReceive, CloseCallback onClose)
{
  m_onReceive = std::move(onReceive);
  m_onClose = std::move(onClose);
  auto self = shared_from_this();
  asio::post(m_socket.get_executor(), [self]() { self->read_header(); });
}

MessageFuture Connection::send(Message &&msg)
{
  if (!isConnected()) {
    log_asio_error(asio::error::not_connected, "Send");
    return failed_send(asio::error::not_connected);
  }

  if (msg.payload.size() > MAX_PAYLOAD_LENGTH) {
    logError("[Connection] refusing to send %zu byte message",
        msg.payload.size());
    return failed_send(asio::error::message_size);
  }

  auto write = std::make_shared<PendingWrite>();
  auto future = write->promise.get_future();

  msg.header.payload_length = uint32_t(msg.payload.size());
  uint8_t header[MESSAGE_HEADER_SIZE];
  encodeHeader(msg.header, header);

  const auto *h = reinterpret_cast<const std::byte *>(header);
  write->bytes.reserve(MESSAGE_HEADER_SIZE + msg.payload.size());
  write->bytes.insert(write->bytes.end(), h, h + MESSAGE_HEADER_SIZE);
  write->bytes.insert(
      write->bytes.end(), msg.payload.begin(), msg.payload.end());

  auto self = shared_from_this();
  asio::post(m_socket.get_executor(), [self, write]() {
    if (!self->m_open) {
      write->promise.set_value(asio::error::not_connected);
      return;
    }
    self->m_writes.push_back(write);
    if (self->m_writes.size() == 1)
      self->write_next();
  });

  return future;
}

void Connection::close()
{
  auto self = shared_from_this();
  asio::post(m_socket.get_executor(),
      [self]() { self->shutdown(asio::error::operation_aborted); });
}

void Connection::read_header()
{
  if (!m_open)
    return;

  auto self = shared_from_this();
  asio::async_read(m_socket,
      asio::buffer(m_header, MESSAGE_HEADER_SIZE),
      [this, self](const boost::system::error_code &error, std::size_t) {
        if (error) {
          log_asio_error(error, "ReadHeader");
          shutdown(error);
          return;
        }

        auto msg = std::make_shared<Message>();
        msg->header = decodeHeader(m_header);
        if (msg->header.payload_length > MAX_PAYLOAD_LENGTH) {
          logError("[Connection] oversized message (%u bytes) from %s",
              msg->header.payload_length,
              m_remoteAddress.c_str());
          shutdown(asio::error::message_size);
          return;
        }
        read_payload(msg);
      });
}

void Connection::read_payload(std::shared_ptr<Message> msg)
{
  if (msg->header.payload_length == 0) {
    if (m_onReceive)
      m_onReceive(*this, *msg);
    read_header(); // Read next msg
    return;
  }

  msg->payload.resize(msg->header.payload_length);

  auto self = shared_from_this();
  asio::async_read(m_socket,
      asio::buffer(msg->payload.data(), msg->header.payload_length),
      [this, self, msg](const boost::system::error_code &error, std::size_t) {
        if (error) {
          log_asio_error(error, "ReadPayload");
          shutdown(error);
          return;
        }
        if (m_onReceive)
          m_onReceive(*this, *msg);
        read_header(); // Read next msg
      });
}

void Connection::write_next()
{
  auto self = shared_from_this();
  auto write = m_writes.front();
  asio::async_write(m_socket,
      asio::buffer(write->bytes),
      [this, self, write](const boost::system::error_code &error, std::size_t) {
        write->promise.set_value(error);
        if (!m_writes.empty())
          m_writes.pop_front();
        if (error) {
          log_asio_error(error, "Send");
          shutdown(error);
          return;
        }
        if (!m_writes.empty())
          write_next();
      });
}

void Connection::shutdown(const boost::system::error_code &reason)
{
  if (!m_open.exchange(false))
    return;

  boost::system::error_code ec{};
  m_socket.shutdown(tcp::socket::shutdown_both, ec);
  m_socket.close(ec);

  // The write in progress (if any) completes through its own handler
  const size_t inProgress = m_writes.empty() ? 0 : 1;
  while (m_writes.size() > inProgress) {
    m_writes.back()->promise.set_value(asio::error::operation_aborted);
    m_writes.pop_back();
  }

  auto onClose = std::move(m_onClose);
  m_onReceive = nullptr;
  if (onClose)
    onClose(*this, reason);
}

// NetworkChannel definitions /////////////////////////////////////////////////

NetworkChannel::NetworkChannel()
{
  m_io_context.stop();
}

NetworkChannel::~NetworkChannel()
{
  stop_messaging();
}

void NetworkChannel::start_messaging()
{
  logDebug("[NetworkChannel] starting channel");
  stop_messaging();
  m_work.emplace(asio::make_work_guard(m_io_context));
  m_io_context.restart();
  m_io_thread = std::thread([this]() {
    logDebug("[NetworkChannel] starting IO thread");
    try {
      m_io_context.run();
    } catch (const std::exception &e) {
      logError("[NetworkChannel] IO thread context error: %s", e.what());
    }
    logDebug("[NetworkChannel] IO thread stopped");
  });
}

void NetworkChannel::stop_messaging()
{
  try {
    if (!m_io_context.stopped()) {
      m_work.reset();
      m_io_context.stop();
      if (m_io_thread.joinable())
        m_io_thread.join();
      m_io_context.restart();
      m_io_context.poll(); // drain any remaining tasks
      m_io_context.stop();
    } else if (m_io_thread.joinable()) {
      m_io_thread.join();
    }
  } catch (const std::system_error &e) {
    logError("[NetworkChannel] System error during stop: %s", e.what());
  } catch (const std::exception &e) {
    logError("[NetworkChannel] Error during stop: %s", e.what());
  }
}

// NetworkServer definitions //////////////////////////////////////////////////

NetworkServer::NetworkServer(const std::string &bindAddress, uint16_t port)
    : m_acceptor(m_io_context,
          tcp::endpoint(asio::ip::make_address(bindAddress), port))
{
  m_port = m_acceptor.local_endpoint().port();
}

NetworkServer::~NetworkServer()
{
  stop();
}

void NetworkServer::registerHandler(uint8_t type, ServerMessageHandler handler)
{
  m_handlers[type] = handler;
}

void NetworkServer::removeAllHandlers()
{
  m_handlers.clear();
}

void NetworkServer::setConnectionHandlers(
    ConnectionHandler onConnect, ConnectionHandler onDisconnect)
{
  m_onConnect = std::move(onConnect);
  m_onDisconnect = std::move(onDisconnect);
}

MessageFuture NetworkServer::send(ConnectionID id, Message &&msg)
{
  std::shared_ptr<Connection> c;
  {
    std::lock_guard<std::mutex> lock(m_connectionsMutex);
    if (auto *found = m_connections.at(id); found != nullptr)
      c = *found;
  }

  if (!c)
    return failed_send(asio::error::not_connected);

  return c->send(std::move(msg));
}

MessageFuture NetworkServer::send(
    ConnectionID id, uint8_t type, StructuredMessage &&msg)
{
  return send(id, msg.toMessage(type));
}

void NetworkServer::start()
{
  start_messaging();
  async_invoke(m_io_context, [this]() { start_accept(); });
}

void NetworkServer::stop()
{
  boost::system::error_code ec;
  m_acceptor.cancel(ec);

  std::vector<std::shared_ptr<Connection>> connections;
  {
    std::lock_guard<std::mutex> lock(m_connectionsMutex);
    for (auto &c : m_connections)
      connections.push_back(c.second);
  }
  for (auto &c : connections)
    c->close();

  stop_messaging();

  std::lock_guard<std::mutex> lock(m_connectionsMutex);
  m_connections.clear();
}

void NetworkServer::disconnect(ConnectionID id)
{
  std::shared_ptr<Connection> c;
  {
    std::lock_guard<std::mutex> lock(m_connectionsMutex);
    if (auto *found = m_connections.at(id); found != nullptr)
      c = *found;
  }
  if (c)
    c->close();
}

uint16_t NetworkServer::port() const
{
  return m_port;
}

size_t NetworkServer::numberOfConnections() const
{
  std::lock_guard<std::mutex> lock(m_connectionsMutex);
  return m_connections.size();
}

void NetworkServer::start_accept()
{
  m_acceptor.async_accept(
      [this](const boost::system::error_code &error, tcp::socket socket) {
        if (error) {
          if (error != asio::error::operation_aborted) {
            log_asio_error(error, "Accept");
            start_accept();
          }
          return;
        }

        boost::system::error_code ec;
        socket.set_option(tcp::no_delay(true), ec);

        std::shared_ptr<Connection> c;
        {
          std::lock_guard<std::mutex> lock(m_connectionsMutex);
          const auto id = m_nextConnectionID++;
          c = std::make_shared<Connection>(std::move(socket), id);
          m_connections[id] = c;
        }

        logStatus("[NetworkServer] New connection #%u from %s",
            c->id(),
            c->remoteAddress().c_str());

        if (m_onConnect)
          m_onConnect(c->id());

        c->start(
            [this](Connection &conn, const Message &msg) {
              on_message(conn, msg);
            },
            [this](Connection &conn, const boost::system::error_code &e) {
              on_close(conn, e);
            });

        start_accept(); // Accept next connection
      });
}

void NetworkServer::on_message(Connection &c, const Message &msg)
{
  if (auto *handler = m_handlers.at(msg.header.type); handler != nullptr) {
    (*handler)(c.id(), msg);
  } else {
    logWarning("[NetworkServer] No handler registered for message type %d",
        static_cast<int>(msg.header.type));
  }
}

void NetworkServer::on_close(
    Connection &c, const boost::system::error_code &reason)
{
  logStatus("[NetworkServer] Connection #%u from %s closed",
      c.id(),
      c.remoteAddress().c_str());

  {
    std::lock_guard<std::mutex> lock(m_connectionsMutex);
    m_connections.erase(c.id());
  }

  if (m_onDisconnect)
    m_onDisconnect(c.id());
}

// NetworkClient definitions //////////////////////////////////////////////////

NetworkClient::~NetworkClient()
{
  disconnect();
}

void NetworkClient::registerHandler(uint8_t type, MessageHandler handler)
{
  m_handlers[type] = handler;
}

void NetworkClient::removeHandler(uint8_t messageType)
{
  m_handlers.erase(messageType);
}

void NetworkClient::removeAllHandlers()
{
  m_handlers.clear();
}

void NetworkClient::setConnectionHandlers(
    StatusHandler onConnect, StatusHandler onDisconnect)
{
  m_onConnect = std::move(onConnect);
  m_onDisconnect = std::move(onDisconnect);
}

MessageFuture NetworkClient::send(Message &&msg)
{
  std::shared_ptr<Connection> c;
  {
    std::lock_guard<std::mutex> lock(m_connectionMutex);
    c = m_connection;
  }

  if (!c) {
    log_asio_error(asio::error::not_connected, "Send");
    return failed_send(asio::error::not_connected);
  }

  return c->send(std::move(msg));
}

MessageFuture NetworkClient::send(uint8_t type, StructuredMessage &&msg)
{
  return send(msg.toMessage(type));
}

MessageFuture NetworkClient::send(uint8_t type)
{
  return send(make_message(type));
}

void NetworkClient::connect(const std::string &host, uint16_t port)
{
  disconnect();
  start_messaging();

  auto resolver = std::make_shared<tcp::resolver>(m_io_context);
  auto socket = std::make_shared<tcp::socket>(m_io_context);

  resolver->async_resolve(host,
      std::to_string(port),
      [this, resolver, socket](const boost::system::error_code &error,
          tcp::resolver::results_type endpoints) {
        if (error) {
          logError("[NetworkClient] Cannot resolve relay address: %s",
              error.message().c_str());
          if (m_onConnect)
            m_onConnect(error);
          return;
        }

        asio::async_connect(*socket,
            endpoints,
            [this, socket](
                const boost::system::error_code &error, const tcp::endpoint &) {
              if (error) {
                logError("[NetworkClient] Connection error: %s",
                    error.message().c_str());
                if (m_onConnect)
                  m_onConnect(error);
                return;
              }

              boost::system::error_code ec;
              socket->set_option(tcp::no_delay(true), ec);

              auto c = std::make_shared<Connection>(std::move(*socket), 0);
              {
                std::lock_guard<std::mutex> lock(m_connectionMutex);
                m_connection = c;
              }

              logStatus("[NetworkClient] Connected to relay at %s",
                  c->remoteAddress().c_str());

              c->start(
                  [this](Connection &, const Message &msg) {
                    on_message(msg);
                  },
                  [this](Connection &, const boost::system::error_code &e) {
                    {
                      std::lock_guard<std::mutex> lock(m_connectionMutex);
                      m_connection.reset();
                    }
                    if (m_onDisconnect)
                      m_onDisconnect(e);
                  });

              if (m_onConnect)
                m_onConnect({});
            });
      });
}

void NetworkClient::disconnect()
{
  std::shared_ptr<Connection> c;
  {
    std::lock_guard<std::mutex> lock(m_connectionMutex);
    c = std::move(m_connection);
  }

  if (c) {
    c->close();
    logStatus("[NetworkClient] Disconnected from relay");
  }

  stop_messaging();
}

bool NetworkClient::isConnected() const
{
  std::lock_guard<std::mutex> lock(m_connectionMutex);
  return m_connection && m_connection->isConnected();
}

void NetworkClient::on_message(const Message &msg)
{
  if (auto *handler = m_handlers.at(msg.header.type); handler != nullptr) {
    (*handler)(msg);
  } else {
    logWarning("[NetworkClient] No handler registered for message type %d",
        static_cast<int>(msg.header.type));
  }
}

} // namespace cosync::network
