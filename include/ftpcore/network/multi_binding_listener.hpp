// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Ftpcore, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "ftpcore/core/blocking_queue.hpp"
#include "ftpcore/core/cancellation.hpp"
#include "ftpcore/core/logger.hpp"
#include "ftpcore/network/socket.hpp"
#include "ftpcore/network/transport_types.hpp"

namespace ftpcore
{
namespace network
{

/// \brief Accepts control connections on every address a bind target
/// resolves to and presents them as a single stream of clients.
///
/// Each bound endpoint runs its own accept thread. An endpoint accepts one
/// client at a time and only after it has been armed: startAccepting() arms
/// all of them, and waitAnyClient() re-arms the endpoint a client came from.
/// Accepted clients are funnelled through one queue.
///
/// Bind targets:
///   - empty or "0.0.0.0": IPv4 any
///   - "::": IPv6 any
///   - "*": IPv4 any and IPv6 any
///   - anything else: every IPv4/IPv6 address the name resolves to
///
/// With port 0 the first endpoint gets an OS-chosen port and the remaining
/// endpoints are bound to that same port.
class MultiBindingListener
{
public:
  struct AcceptedClient
  {
    std::size_t endpointIndex{0};
    std::unique_ptr<TcpSocket> socket;
  };

  /// \throws std::out_of_range if \p port is not within 0..65535
  MultiBindingListener(std::string address, int port) : _address(std::move(address))
  {
    if (port < 0 || port > 65535)
    {
      throw std::out_of_range("Listener port out of range: " + std::to_string(port));
    }
    _requestedPort = static_cast<std::uint16_t>(port);
  }

  ~MultiBindingListener() { stop(); }

  MultiBindingListener(const MultiBindingListener &) = delete;
  MultiBindingListener &operator=(const MultiBindingListener &) = delete;

  /// \brief Resolve the bind target into wildcard or concrete addresses
  /// (port left at 0).
  /// \throws ListenerError if a host name does not resolve to any IPv4/IPv6
  /// address
  static std::vector<sockaddr_storage> resolveBindTarget(const std::string &address)
  {
    std::vector<sockaddr_storage> out;
    auto addV4Any = [&out]()
    {
      sockaddr_storage ss{};
      auto &sa = reinterpret_cast<sockaddr_in &>(ss);
      sa.sin_family = AF_INET;
      sa.sin_addr.s_addr = htonl(INADDR_ANY);
      out.push_back(ss);
    };
    auto addV6Any = [&out]()
    {
      sockaddr_storage ss{};
      auto &sa = reinterpret_cast<sockaddr_in6 &>(ss);
      sa.sin6_family = AF_INET6;
      sa.sin6_addr = in6addr_any;
      out.push_back(ss);
    };

    if (address.empty() || address == "0.0.0.0")
    {
      addV4Any();
      return out;
    }
    if (address == "::")
    {
      addV6Any();
      return out;
    }
    if (address == "*")
    {
      addV4Any();
      addV6Any();
      return out;
    }

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE;
    addrinfo *res = nullptr;
    int rc = ::getaddrinfo(address.c_str(), nullptr, &hints, &res);
    if (rc != 0)
    {
      throw ListenerError(TransportError::Resolve,
                          "getaddrinfo " + address + ": " + ::gai_strerror(rc));
    }
    std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> guard(res, &::freeaddrinfo);
    for (auto *ai = res; ai; ai = ai->ai_next)
    {
      if (ai->ai_family != AF_INET && ai->ai_family != AF_INET6)
      {
        continue;
      }
      sockaddr_storage ss{};
      std::memcpy(&ss, ai->ai_addr, ai->ai_addrlen);
      bool duplicate = false;
      for (const auto &existing : out)
      {
        if (endpointToString(existing) == endpointToString(ss))
        {
          duplicate = true;
          break;
        }
      }
      if (!duplicate)
      {
        out.push_back(ss);
      }
    }
    if (out.empty())
    {
      throw ListenerError(TransportError::Resolve,
                          "No IPv4/IPv6 address found for " + address);
    }
    return out;
  }

  /// \brief Bind every endpoint. Binding is serial; a failing bind closes
  /// the endpoints bound so far before the error is rethrown.
  /// \return the effective port
  /// \throws ListenerError on resolve/bind/listen failure
  std::uint16_t start()
  {
    std::lock_guard<std::mutex> lifecycle(_lifecycleMutex);
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_queue)
      {
        return _port;
      }
    }

    auto addresses = resolveBindTarget(_address);
    std::vector<std::unique_ptr<ListenSocket>> sockets;
    std::uint16_t port = _requestedPort;
    try
    {
      for (auto &addr : addresses)
      {
        setPort(addr, port);
        auto sock = ListenSocket::bind(addr);
        if (sockets.empty())
        {
          port = sock->localPort();
        }
        FTPCORE_LOG_INFO("Listener bound to " << sock->localEndpoint());
        sockets.push_back(std::move(sock));
      }
    }
    catch (const ListenerError &ex)
    {
      FTPCORE_LOG_ERROR("Listener start failed for '" << _address << "': " << ex.what()
                                                      << " (rolling back " << sockets.size()
                                                      << " endpoint(s))");
      for (auto &sock : sockets)
      {
        sock->close();
      }
      throw;
    }

    auto queue = std::make_shared<core::BlockingQueue<AcceptedClient>>(sockets.size());
    std::lock_guard<std::mutex> lock(_mutex);
    _queue = queue;
    _port = port;
    for (auto &sock : sockets)
    {
      auto ep = std::make_unique<Endpoint>();
      ep->socket = std::move(sock);
      std::size_t index = _endpoints.size();
      Endpoint *raw = ep.get();
      ep->thread = std::thread([raw, index, queue]() { acceptLoop(*raw, index, *queue); });
      _endpoints.push_back(std::move(ep));
    }
    return _port;
  }

  /// \brief Arm one outstanding accept per endpoint.
  void startAccepting()
  {
    std::lock_guard<std::mutex> lock(_mutex);
    for (auto &ep : _endpoints)
    {
      arm(*ep);
    }
  }

  /// \brief Block until any endpoint accepted a client, then re-arm that
  /// endpoint.
  /// \throws core::OperationCancelled if \p token is (or becomes) cancelled,
  /// or the listener is stopped while waiting
  AcceptedClient waitAnyClient(const core::CancellationToken &token)
  {
    token.throwIfCancellationRequested();
    std::shared_ptr<core::BlockingQueue<AcceptedClient>> queue;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      queue = _queue;
    }
    if (!queue)
    {
      throw core::OperationCancelled("Listener stopped");
    }

    while (true)
    {
      AcceptedClient client;
      if (!queue->dequeue(client, token))
      {
        throw core::OperationCancelled("Listener stopped");
      }
      {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_queue == queue && client.endpointIndex < _endpoints.size())
        {
          arm(*_endpoints[client.endpointIndex]);
        }
      }
      if (client.socket)
      {
        return client;
      }
      // endpoint stopped mid-accept
    }
  }

  /// \brief Stop a single endpoint. Others keep accepting.
  void stopEndpoint(std::size_t index)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (index >= _endpoints.size())
    {
      throw std::out_of_range("No listener endpoint " + std::to_string(index));
    }
    signalStop(*_endpoints[index]);
  }

  /// \brief Stop every endpoint and discard unclaimed clients. Idempotent.
  void stop()
  {
    std::lock_guard<std::mutex> lifecycle(_lifecycleMutex);
    std::vector<std::unique_ptr<Endpoint>> endpoints;
    std::shared_ptr<core::BlockingQueue<AcceptedClient>> queue;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      endpoints.swap(_endpoints);
      queue = std::move(_queue);
      _port = 0;
    }
    if (queue)
    {
      queue->close();
    }
    for (auto &ep : endpoints)
    {
      signalStop(*ep);
    }
    for (auto &ep : endpoints)
    {
      if (ep->thread.joinable())
      {
        ep->thread.join();
      }
    }
    if (queue)
    {
      queue->clear();
    }
    if (!endpoints.empty())
    {
      FTPCORE_LOG_INFO("Listener on '" << _address << "' stopped");
    }
  }

  /// \brief Effective port, 0 when not started.
  std::uint16_t port() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _port;
  }

  std::size_t endpointCount() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _endpoints.size();
  }

  std::vector<std::string> boundEndpoints() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    std::vector<std::string> out;
    for (const auto &ep : _endpoints)
    {
      out.push_back(ep->socket->localEndpoint());
    }
    return out;
  }

  const std::string &address() const { return _address; }

private:
  struct Endpoint
  {
    std::unique_ptr<ListenSocket> socket;
    std::thread thread;
    std::mutex mutex;
    std::condition_variable cv;
    bool armed{false};
    bool stopping{false};
  };

  std::string _address;
  std::uint16_t _requestedPort{0};
  std::mutex _lifecycleMutex;
  mutable std::mutex _mutex;
  std::uint16_t _port{0};
  std::vector<std::unique_ptr<Endpoint>> _endpoints;
  std::shared_ptr<core::BlockingQueue<AcceptedClient>> _queue;

  static void setPort(sockaddr_storage &ss, std::uint16_t port)
  {
    if (ss.ss_family == AF_INET6)
    {
      reinterpret_cast<sockaddr_in6 &>(ss).sin6_port = htons(port);
    }
    else
    {
      reinterpret_cast<sockaddr_in &>(ss).sin_port = htons(port);
    }
  }

  static void arm(Endpoint &ep)
  {
    {
      std::lock_guard<std::mutex> lock(ep.mutex);
      ep.armed = true;
    }
    ep.cv.notify_one();
  }

  static void signalStop(Endpoint &ep)
  {
    {
      std::lock_guard<std::mutex> lock(ep.mutex);
      ep.stopping = true;
    }
    ep.cv.notify_one();
    ep.socket->close();
  }

  static void acceptLoop(Endpoint &ep, std::size_t index, core::BlockingQueue<AcceptedClient> &queue)
  {
    while (true)
    {
      {
        std::unique_lock<std::mutex> lock(ep.mutex);
        ep.cv.wait(lock, [&ep]() { return ep.armed || ep.stopping; });
        if (ep.stopping)
        {
          return;
        }
        ep.armed = false;
      }

      AcceptedClient result;
      result.endpointIndex = index;
      while (!result.socket)
      {
        IoResult r = ep.socket->accept(result.socket, std::nullopt);
        if (r.ok)
        {
          continue;
        }
        if (r.code == TransportError::Cancelled)
        {
          // Surfaced as a null client so the waiter just loops.
          queue.tryQueue(AcceptedClient{index, nullptr});
          return;
        }
        FTPCORE_LOG_WARN("Accept failed on " << ep.socket->localEndpoint() << ": " << r.message);
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
      }
      FTPCORE_LOG_DEBUG("Accepted " << result.socket->peerAddress() << " on endpoint " << index);
      if (!queue.queue(std::move(result)))
      {
        return;
      }
    }
  }
};

} // namespace network
} // namespace ftpcore
