// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Ftpcore, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "ftpcore/core/cancellation.hpp"
#include "ftpcore/network/transport_types.hpp"

namespace ftpcore
{
namespace network
{

/// \brief Numeric "host:port" for a socket address ("[v6]:port" for IPv6).
inline std::string endpointToString(const sockaddr_storage &ss)
{
  char h[NI_MAXHOST]{}, s[NI_MAXSERV]{};
  socklen_t sl = (ss.ss_family == AF_INET) ? sizeof(sockaddr_in) : sizeof(sockaddr_in6);
  if (::getnameinfo(reinterpret_cast<const sockaddr *>(&ss), sl, h, sizeof(h), s, sizeof(s),
                    NI_NUMERICHOST | NI_NUMERICSERV) != 0)
  {
    return {};
  }
  if (ss.ss_family == AF_INET6)
  {
    return std::string("[") + h + "]:" + s;
  }
  return std::string(h) + ":" + s;
}

/// \brief Numeric host of \p ss without the port.
inline std::string endpointHost(const sockaddr_storage &ss)
{
  char h[NI_MAXHOST]{};
  socklen_t sl = (ss.ss_family == AF_INET) ? sizeof(sockaddr_in) : sizeof(sockaddr_in6);
  if (::getnameinfo(reinterpret_cast<const sockaddr *>(&ss), sl, h, sizeof(h), nullptr, 0,
                    NI_NUMERICHOST) != 0)
  {
    return {};
  }
  return h;
}

inline std::uint16_t portOf(const sockaddr_storage &ss)
{
  if (ss.ss_family == AF_INET6)
  {
    return ntohs(reinterpret_cast<const sockaddr_in6 &>(ss).sin6_port);
  }
  return ntohs(reinterpret_cast<const sockaddr_in &>(ss).sin_port);
}

namespace detail
{
  /// \brief Non-blocking eventfd used to interrupt a poll() from another
  /// thread.
  class WakeupFd
  {
  public:
    WakeupFd() : _fd(::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC))
    {
      if (_fd < 0)
      {
        throw ListenerError(TransportError::Config, "eventfd: " + lastErr(), errno);
      }
    }

    ~WakeupFd() { ::close(_fd); }

    WakeupFd(const WakeupFd &) = delete;
    WakeupFd &operator=(const WakeupFd &) = delete;

    int fd() const { return _fd; }

    void signal()
    {
      std::uint64_t one = 1;
      ssize_t n = ::write(_fd, &one, sizeof(one));
      (void)n; // a saturated counter is still readable
    }

  private:
    int _fd;
  };

  /// \brief poll() \p fd for \p events alongside a wakeup descriptor.
  /// \return 1 if fd is ready, 0 on timeout, -1 if woken, -2 on poll error
  inline int waitReadable(int fd, short events, int wakeFd,
                          std::optional<std::chrono::milliseconds> timeout)
  {
    pollfd fds[2];
    fds[0] = {fd, events, 0};
    fds[1] = {wakeFd, POLLIN, 0};
    auto deadline = timeout ? MonoClock::now() + *timeout : MonoTime::max();
    while (true)
    {
      int waitMs = -1;
      if (timeout)
      {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - MonoClock::now());
        waitMs = left.count() > 0 ? static_cast<int>(left.count()) : 0;
      }
      int rc = ::poll(fds, 2, waitMs);
      if (rc < 0)
      {
        if (errno == EINTR)
        {
          continue;
        }
        return -2;
      }
      if (rc == 0)
      {
        return 0;
      }
      if (fds[1].revents != 0)
      {
        return -1;
      }
      return 1;
    }
  }
} // namespace detail

/// \brief Connected, blocking TCP stream owning its descriptor.
///
/// Blocking reads and writes honour a CancellationToken: cancellation shuts
/// the socket down, which releases the blocked call, and the call then
/// throws core::OperationCancelled. close() may be called from any thread;
/// the descriptor itself is released by the destructor.
class TcpSocket
{
public:
  explicit TcpSocket(int fd) : _fd(fd)
  {
    int one = 1;
    ::setsockopt(_fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
  }

  ~TcpSocket()
  {
    if (_fd >= 0)
    {
      ::close(_fd);
    }
  }

  TcpSocket(const TcpSocket &) = delete;
  TcpSocket &operator=(const TcpSocket &) = delete;

  /// \brief Connect to \p host:\p port, resolving by DNS when needed.
  /// \throws ListenerError on resolve/connect failure or timeout
  /// \throws core::OperationCancelled when \p token fires first
  static std::unique_ptr<TcpSocket> connect(const std::string &host, std::uint16_t port,
                                            std::chrono::milliseconds timeout,
                                            const core::CancellationToken &token = {})
  {
    token.throwIfCancellationRequested();
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_NUMERICSERV;
    addrinfo *res = nullptr;
    std::string ps = std::to_string(port);
    int rc = ::getaddrinfo(host.c_str(), ps.c_str(), &hints, &res);
    if (rc != 0 || !res)
    {
      throw ListenerError(TransportError::Resolve,
                          "getaddrinfo " + host + ": " + ::gai_strerror(rc));
    }
    std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> guard(res, &::freeaddrinfo);

    int fd = ::socket(res->ai_family, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0)
    {
      throw ListenerError(TransportError::Socket, "socket: " + lastErr(), errno);
    }
    auto sock = std::make_unique<TcpSocket>(fd);

    if (::connect(fd, res->ai_addr, res->ai_addrlen) < 0 && errno != EINPROGRESS)
    {
      throw ListenerError(TransportError::Connect,
                          "connect " + host + ":" + ps + ": " + lastErr(), errno);
    }

    detail::WakeupFd wake;
    auto registration = token.registerCallback([&wake]() { wake.signal(); });
    int ready = detail::waitReadable(fd, POLLOUT, wake.fd(), timeout);
    registration.unregister();
    if (ready == -1)
    {
      throw core::OperationCancelled("Connect cancelled");
    }
    if (ready == 0)
    {
      throw ListenerError(TransportError::Timeout, "connect " + host + ":" + ps + ": timed out");
    }
    int soError = 0;
    socklen_t len = sizeof(soError);
    if (ready < 0 || ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &len) < 0 || soError != 0)
    {
      int e = soError != 0 ? soError : errno;
      throw ListenerError(TransportError::Connect,
                          "connect " + host + ":" + ps + ": " + std::strerror(e), e);
    }
    int flags = ::fcntl(fd, F_GETFL, 0);
    ::fcntl(fd, F_SETFL, flags & ~O_NONBLOCK);
    return sock;
  }

  int fd() const { return _fd; }

  bool isClosed() const { return _closed.load(std::memory_order_acquire); }

  /// \brief Shut both directions down. Idempotent, callable from any thread.
  void close()
  {
    if (!_closed.exchange(true, std::memory_order_acq_rel))
    {
      ::shutdown(_fd, SHUT_RDWR);
    }
  }

  std::string peerAddress() const
  {
    sockaddr_storage ss{};
    socklen_t sl = sizeof(ss);
    if (::getpeername(_fd, reinterpret_cast<sockaddr *>(&ss), &sl) != 0)
    {
      return {};
    }
    return endpointToString(ss);
  }

  std::string peerHost() const
  {
    sockaddr_storage ss{};
    socklen_t sl = sizeof(ss);
    if (::getpeername(_fd, reinterpret_cast<sockaddr *>(&ss), &sl) != 0)
    {
      return {};
    }
    return endpointHost(ss);
  }

  /// \brief Local address of the connection.
  /// \return false if the descriptor is no longer valid
  bool localAddress(sockaddr_storage &out) const
  {
    socklen_t sl = sizeof(out);
    return ::getsockname(_fd, reinterpret_cast<sockaddr *>(&out), &sl) == 0;
  }

  /// \brief Write every byte of \p data.
  /// \throws core::OperationCancelled if \p token fires
  IoResult sendAll(const char *data, std::size_t len, const core::CancellationToken &token = {})
  {
    auto registration = token.registerCallback([this]() { ::shutdown(_fd, SHUT_RDWR); });
    std::size_t sent = 0;
    while (sent < len)
    {
      ssize_t n = ::send(_fd, data + sent, len - sent, MSG_NOSIGNAL);
      if (n < 0)
      {
        if (errno == EINTR)
        {
          continue;
        }
        token.throwIfCancellationRequested();
        return IoResult::failure(TransportError::Socket, "send: " + lastErr(), errno);
      }
      sent += static_cast<std::size_t>(n);
    }
    return IoResult::success();
  }

  IoResult sendAll(const std::string &data, const core::CancellationToken &token = {})
  {
    return sendAll(data.data(), data.size(), token);
  }

  /// \brief Read up to \p cap bytes. \p received is 0 at end of stream.
  /// \throws core::OperationCancelled if \p token fires
  IoResult receive(char *buf, std::size_t cap, std::size_t &received,
                   const core::CancellationToken &token = {})
  {
    received = 0;
    if (!_readBuffer.empty())
    {
      received = std::min(cap, _readBuffer.size());
      std::memcpy(buf, _readBuffer.data(), received);
      _readBuffer.erase(0, received);
      return IoResult::success();
    }
    auto registration = token.registerCallback([this]() { ::shutdown(_fd, SHUT_RDWR); });
    while (true)
    {
      ssize_t n = ::recv(_fd, buf, cap, 0);
      if (n < 0 && errno == EINTR)
      {
        continue;
      }
      token.throwIfCancellationRequested();
      if (n < 0)
      {
        return IoResult::failure(TransportError::Socket, "recv: " + lastErr(), errno);
      }
      received = static_cast<std::size_t>(n);
      return IoResult::success();
    }
  }

  /// \brief Read one line terminated by LF; a trailing CR is stripped.
  /// \return PeerClosed failure at end of stream, Socket failure for an
  /// over-long line
  /// \throws core::OperationCancelled if \p token fires
  IoResult readLine(std::string &line, const core::CancellationToken &token = {},
                    std::size_t maxLength = 8192)
  {
    while (true)
    {
      auto pos = _readBuffer.find('\n');
      if (pos != std::string::npos)
      {
        line.assign(_readBuffer, 0, pos);
        _readBuffer.erase(0, pos + 1);
        if (!line.empty() && line.back() == '\r')
        {
          line.pop_back();
        }
        return IoResult::success();
      }
      if (_readBuffer.size() > maxLength)
      {
        return IoResult::failure(TransportError::Socket, "line too long");
      }
      char chunk[1024];
      std::size_t n = 0;
      auto registration = token.registerCallback([this]() { ::shutdown(_fd, SHUT_RDWR); });
      ssize_t rc;
      do
      {
        rc = ::recv(_fd, chunk, sizeof(chunk), 0);
      } while (rc < 0 && errno == EINTR);
      registration.unregister();
      token.throwIfCancellationRequested();
      if (rc < 0)
      {
        return IoResult::failure(TransportError::Socket, "recv: " + lastErr(), errno);
      }
      n = static_cast<std::size_t>(rc);
      if (n == 0)
      {
        return IoResult::failure(TransportError::PeerClosed, "connection closed by peer");
      }
      _readBuffer.append(chunk, n);
    }
  }

private:
  int _fd;
  std::atomic<bool> _closed{false};
  std::string _readBuffer;
};

/// \brief Listening TCP socket with an interruptible accept.
class ListenSocket
{
public:
  /// \brief Create, bind and listen on \p addr.
  /// \throws ListenerError on any failure
  static std::unique_ptr<ListenSocket> bind(const sockaddr_storage &addr, int backlog = 128)
  {
    int family = addr.ss_family;
    int fd = ::socket(family, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0)
    {
      throw ListenerError(TransportError::Socket, "socket: " + lastErr(), errno);
    }
    std::unique_ptr<ListenSocket> sock;
    try
    {
      sock.reset(new ListenSocket(fd));
    }
    catch (const ListenerError &)
    {
      // the wakeup eventfd failed; the socket is not owned yet
      ::close(fd);
      throw;
    }
    int one = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    if (family == AF_INET6)
    {
      ::setsockopt(fd, IPPROTO_IPV6, IPV6_V6ONLY, &one, sizeof(one));
    }
    socklen_t sl = (family == AF_INET) ? sizeof(sockaddr_in) : sizeof(sockaddr_in6);
    if (::bind(fd, reinterpret_cast<const sockaddr *>(&addr), sl) < 0)
    {
      throw ListenerError(TransportError::Bind,
                          "bind " + endpointToString(addr) + ": " + lastErr(), errno);
    }
    if (::listen(fd, backlog) < 0)
    {
      throw ListenerError(TransportError::Listen, "listen: " + lastErr(), errno);
    }
    return sock;
  }

  ~ListenSocket() { ::close(_fd); }

  ListenSocket(const ListenSocket &) = delete;
  ListenSocket &operator=(const ListenSocket &) = delete;

  int fd() const { return _fd; }

  std::uint16_t localPort() const
  {
    sockaddr_storage ss{};
    socklen_t sl = sizeof(ss);
    if (::getsockname(_fd, reinterpret_cast<sockaddr *>(&ss), &sl) != 0)
    {
      return 0;
    }
    return portOf(ss);
  }

  std::string localEndpoint() const
  {
    sockaddr_storage ss{};
    socklen_t sl = sizeof(ss);
    if (::getsockname(_fd, reinterpret_cast<sockaddr *>(&ss), &sl) != 0)
    {
      return {};
    }
    return endpointToString(ss);
  }

  /// \brief Wake any pending accept and refuse further ones. Idempotent.
  void close()
  {
    if (!_closed.exchange(true, std::memory_order_acq_rel))
    {
      _wake.signal();
    }
  }

  bool isClosed() const { return _closed.load(std::memory_order_acquire); }

  /// \brief Wait for one client.
  ///
  /// \p out stays null with a successful result when the accept was
  /// transiently aborted (ECONNABORTED, EINTR, EAGAIN). A closed listener
  /// reports Cancelled, an expired \p timeout reports Timeout.
  /// \throws core::OperationCancelled if \p token fires
  IoResult accept(std::unique_ptr<TcpSocket> &out, std::optional<std::chrono::milliseconds> timeout,
                  const core::CancellationToken &token = {})
  {
    out.reset();
    if (isClosed())
    {
      return IoResult::failure(TransportError::Cancelled, "listener closed");
    }
    auto registration = token.registerCallback([this]() { _wake.signal(); });
    int ready = detail::waitReadable(_fd, POLLIN, _wake.fd(), timeout);
    registration.unregister();
    token.throwIfCancellationRequested();
    if (ready == -1 || isClosed())
    {
      return IoResult::failure(TransportError::Cancelled, "listener closed");
    }
    if (ready == 0)
    {
      return IoResult::failure(TransportError::Timeout, "accept timed out");
    }
    if (ready < 0)
    {
      return IoResult::failure(TransportError::Accept, "poll: " + lastErr(), errno);
    }
    int cfd = ::accept4(_fd, nullptr, nullptr, SOCK_CLOEXEC);
    if (cfd < 0)
    {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == ECONNABORTED || errno == EINTR)
      {
        return IoResult::success();
      }
      return IoResult::failure(TransportError::Accept, "accept4: " + lastErr(), errno);
    }
    out = std::make_unique<TcpSocket>(cfd);
    return IoResult::success();
  }

private:
  explicit ListenSocket(int fd) : _fd(fd) {}

  int _fd;
  std::atomic<bool> _closed{false};
  detail::WakeupFd _wake;
};

} // namespace network
} // namespace ftpcore
