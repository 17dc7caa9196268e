// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Ftpcore, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>

#include "ftpcore/core/cancellation.hpp"
#include "ftpcore/core/logger.hpp"
#include "ftpcore/network/socket.hpp"

namespace ftpcore
{
namespace server
{

/// \brief Failure to open or use a data connection.
class DataConnectionError : public std::runtime_error
{
public:
  explicit DataConnectionError(const std::string &what) : std::runtime_error(what) {}
};

/// \brief Transport for a single data transfer.
class DataConnection
{
public:
  explicit DataConnection(std::unique_ptr<network::TcpSocket> socket) : _socket(std::move(socket))
  {
    _peer = _socket->peerAddress();
  }

  DataConnection(const DataConnection &) = delete;
  DataConnection &operator=(const DataConnection &) = delete;

  const std::string &peerAddress() const { return _peer; }

  /// \throws DataConnectionError if the peer went away
  /// \throws core::OperationCancelled if \p token fires
  void write(const char *data, std::size_t len, const core::CancellationToken &token)
  {
    ensureOpen();
    auto r = _socket->sendAll(data, len, token);
    if (!r.ok)
    {
      throw DataConnectionError("Data connection write failed: " + r.message);
    }
    _bytesSent += len;
  }

  void write(const std::string &data, const core::CancellationToken &token)
  {
    write(data.data(), data.size(), token);
  }

  /// \return bytes read, 0 once the peer finished sending
  /// \throws DataConnectionError on socket failure
  /// \throws core::OperationCancelled if \p token fires
  std::size_t read(char *buf, std::size_t cap, const core::CancellationToken &token)
  {
    ensureOpen();
    std::size_t n = 0;
    auto r = _socket->receive(buf, cap, n, token);
    if (!r.ok)
    {
      throw DataConnectionError("Data connection read failed: " + r.message);
    }
    _bytesReceived += n;
    return n;
  }

  /// \brief Idempotent.
  void close() { _socket->close(); }

  bool isClosed() const { return _socket->isClosed(); }

  std::uint64_t bytesSent() const { return _bytesSent; }
  std::uint64_t bytesReceived() const { return _bytesReceived; }

private:
  std::unique_ptr<network::TcpSocket> _socket;
  std::string _peer;
  std::uint64_t _bytesSent{0};
  std::uint64_t _bytesReceived{0};

  void ensureOpen() const
  {
    if (_socket->isClosed())
    {
      throw DataConnectionError("Data connection is closed");
    }
  }
};

/// \brief Produces the data connection negotiated by PORT or PASV. An opener
/// serves exactly one open.
class DataConnectionOpener
{
public:
  virtual ~DataConnectionOpener() = default;

  /// \throws DataConnectionError when no connection could be established
  /// \throws core::OperationCancelled if \p token fires
  virtual std::shared_ptr<DataConnection> open(const core::CancellationToken &token) = 0;

  virtual std::string describe() const = 0;
};

/// \brief Active mode: the server connects back to the client.
class ActiveDataConnectionOpener : public DataConnectionOpener
{
public:
  ActiveDataConnectionOpener(std::string host, std::uint16_t port,
                             std::chrono::milliseconds timeout)
      : _host(std::move(host)), _port(port), _timeout(timeout)
  {
  }

  std::shared_ptr<DataConnection> open(const core::CancellationToken &token) override
  {
    try
    {
      auto socket = network::TcpSocket::connect(_host, _port, _timeout, token);
      FTPCORE_LOG_DEBUG("Active data connection to " << describe() << " established");
      return std::make_shared<DataConnection>(std::move(socket));
    }
    catch (const network::ListenerError &ex)
    {
      throw DataConnectionError(ex.what());
    }
  }

  std::string describe() const override { return _host + ":" + std::to_string(_port); }

private:
  std::string _host;
  std::uint16_t _port;
  std::chrono::milliseconds _timeout;
};

/// \brief Passive mode: the server listens and the client connects.
///
/// The listening socket is bound when the opener is created, on the local
/// address of the control connection, so that the 227 reply can be sent
/// before the transfer command arrives.
class PassiveDataConnectionOpener : public DataConnectionOpener
{
public:
  /// \param bindAddress local IPv4 address to listen on
  /// \param announceAddress address written into the 227 reply; defaults to
  /// \p bindAddress
  /// \param portRange inclusive range, OS chosen when unset
  /// \param expectedPeer numeric host allowed to connect, usually the control
  /// peer; any host when empty
  /// \throws DataConnectionError if no port could be bound
  PassiveDataConnectionOpener(const std::string &bindAddress, std::string announceAddress,
                              std::optional<std::pair<std::uint16_t, std::uint16_t>> portRange,
                              std::chrono::milliseconds timeout, std::string expectedPeer = {})
      : _announce(announceAddress.empty() ? bindAddress : std::move(announceAddress)),
        _timeout(timeout), _expectedPeer(std::move(expectedPeer))
  {
    sockaddr_storage ss{};
    auto &sa = reinterpret_cast<sockaddr_in &>(ss);
    sa.sin_family = AF_INET;
    if (::inet_pton(AF_INET, bindAddress.c_str(), &sa.sin_addr) != 1)
    {
      throw DataConnectionError("Passive mode requires an IPv4 address, got " + bindAddress);
    }
    in_addr announced{};
    if (::inet_pton(AF_INET, _announce.c_str(), &announced) != 1)
    {
      throw DataConnectionError("Invalid passive announce address " + _announce);
    }

    if (!portRange)
    {
      bindOn(ss, 0);
    }
    else
    {
      auto [low, high] = *portRange;
      if (low > high)
      {
        std::swap(low, high);
      }
      std::uint32_t span = static_cast<std::uint32_t>(high - low) + 1;
      std::mt19937 gen(std::random_device{}());
      std::uint32_t start = std::uniform_int_distribution<std::uint32_t>(0, span - 1)(gen);
      for (std::uint32_t i = 0; i < span && !_listener; ++i)
      {
        bindOn(ss, static_cast<std::uint16_t>(low + (start + i) % span), true);
      }
    }
    if (!_listener)
    {
      throw DataConnectionError("No passive port available");
    }
    _port = _listener->localPort();
  }

  std::uint16_t port() const { return _port; }

  /// \brief "h1,h2,h3,h4,p1,p2" for the 227 reply.
  std::string hostPortTuple() const
  {
    std::string out = _announce;
    for (auto &c : out)
    {
      if (c == '.')
      {
        c = ',';
      }
    }
    return out + "," + std::to_string(_port >> 8) + "," + std::to_string(_port & 0xFF);
  }

  std::shared_ptr<DataConnection> open(const core::CancellationToken &token) override
  {
    if (!_listener)
    {
      throw DataConnectionError("Passive listener already used");
    }
    std::unique_ptr<network::ListenSocket> listener = std::move(_listener);
    std::unique_ptr<network::TcpSocket> client;
    auto deadline = std::chrono::steady_clock::now() + _timeout;
    while (!client)
    {
      auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
      if (remaining.count() < 0)
      {
        remaining = std::chrono::milliseconds(0);
      }
      auto r = listener->accept(client, remaining, token);
      if (!r.ok)
      {
        throw DataConnectionError("Passive accept on port " + std::to_string(_port) +
                                  " failed: " + r.message);
      }
      if (client && !_expectedPeer.empty() && client->peerHost() != _expectedPeer)
      {
        FTPCORE_LOG_WARN("Rejected passive data connection from " << client->peerAddress()
                                                                  << " on port " << _port
                                                                  << ", expected "
                                                                  << _expectedPeer);
        client.reset();
      }
    }
    FTPCORE_LOG_DEBUG("Passive data connection from " << client->peerAddress() << " on port "
                                                      << _port);
    return std::make_shared<DataConnection>(std::move(client));
  }

  std::string describe() const override { return "passive port " + std::to_string(_port); }

private:
  std::string _announce;
  std::chrono::milliseconds _timeout;
  std::string _expectedPeer;
  std::unique_ptr<network::ListenSocket> _listener;
  std::uint16_t _port{0};

  void bindOn(sockaddr_storage ss, std::uint16_t port, bool tolerateInUse = false)
  {
    reinterpret_cast<sockaddr_in &>(ss).sin_port = htons(port);
    try
    {
      _listener = network::ListenSocket::bind(ss, 1);
    }
    catch (const network::ListenerError &ex)
    {
      if (tolerateInUse && ex.sysErrno() == EADDRINUSE)
      {
        return;
      }
      throw DataConnectionError(ex.what());
    }
  }
};

} // namespace server
} // namespace ftpcore
