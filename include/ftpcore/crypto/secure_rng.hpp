// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Ftpcore, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include <openssl/err.h>
#include <openssl/rand.h>

namespace ftpcore
{
namespace crypto
{

/// \brief Cryptographically secure random bytes from OpenSSL RAND_bytes().
/// Used for connection and transfer identifiers.
class SecureRng
{
public:
  /// \throws std::runtime_error if RAND_bytes fails
  static void fill(std::uint8_t *dst, std::size_t len)
  {
    if (len == 0)
    {
      return;
    }
    if (RAND_bytes(dst, static_cast<int>(len)) != 1)
    {
      throw std::runtime_error("SecureRng: RAND_bytes failed: " + lastError());
    }
  }

  template <typename Container> static void fill(Container &c)
  {
    static_assert(sizeof(typename Container::value_type) == 1, "byte container required");
    fill(reinterpret_cast<std::uint8_t *>(c.data()), c.size());
  }

private:
  static std::string lastError()
  {
    unsigned long code = ERR_peek_last_error(); // NOLINT(google-runtime-int)
    if (code == 0UL)
    {
      return "no OpenSSL error available";
    }
    char buf[256] = {0};
    ERR_error_string_n(code, buf, sizeof(buf));
    return std::string(buf);
  }
};

} // namespace crypto
} // namespace ftpcore
