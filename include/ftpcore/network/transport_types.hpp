// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Ftpcore, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
#ifndef __linux__
#error "Linux-only (poll/eventfd)"
#endif

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>

namespace ftpcore
{
namespace network
{

using MonoClock = std::chrono::steady_clock;
using MonoTime = std::chrono::time_point<MonoClock>;

enum class TransportError
{
  None = 0,
  Socket,
  Resolve,
  Bind,
  Listen,
  Accept,
  Connect,
  PeerClosed,
  Config,
  Cancelled,
  Timeout,
  Unknown
};

inline const char *toString(TransportError code)
{
  switch (code)
  {
  case TransportError::None:
    return "None";
  case TransportError::Socket:
    return "Socket";
  case TransportError::Resolve:
    return "Resolve";
  case TransportError::Bind:
    return "Bind";
  case TransportError::Listen:
    return "Listen";
  case TransportError::Accept:
    return "Accept";
  case TransportError::Connect:
    return "Connect";
  case TransportError::PeerClosed:
    return "PeerClosed";
  case TransportError::Config:
    return "Config";
  case TransportError::Cancelled:
    return "Cancelled";
  case TransportError::Timeout:
    return "Timeout";
  case TransportError::Unknown:
    break;
  }
  return "Unknown";
}

/// \brief Result of a non-throwing socket operation.
struct IoResult
{
  bool ok{true};
  TransportError code{TransportError::None};
  std::string message;
  int sysErrno{0};

  static IoResult success() { return {true, TransportError::None, "", 0}; }

  static IoResult failure(TransportError c, const std::string &m, int se = 0)
  {
    return {false, c, m, se};
  }
};

/// \brief Raised by listeners and connectors when a socket operation fails
/// in a way the caller has to handle (bind at start-up, connect for active
/// data connections).
class ListenerError : public std::runtime_error
{
public:
  ListenerError(TransportError code, const std::string &message, int sysErrno = 0)
      : std::runtime_error(message), _code(code), _sysErrno(sysErrno)
  {
  }

  explicit ListenerError(const IoResult &result)
      : ListenerError(result.code, result.message, result.sysErrno)
  {
  }

  TransportError code() const { return _code; }
  int sysErrno() const { return _sysErrno; }

private:
  TransportError _code;
  int _sysErrno;
};

/// \brief strerror_r of the current errno.
inline std::string lastErr()
{
  int e = errno;
  char buf[128];
#if defined(__GLIBC__) && defined(_GNU_SOURCE)
  return std::string(::strerror_r(e, buf, sizeof(buf)));
#else
  if (::strerror_r(e, buf, sizeof(buf)) != 0)
  {
    return "errno " + std::to_string(e);
  }
  return std::string(buf);
#endif
}

} // namespace network
} // namespace ftpcore
