// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Ftpcore, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <array>
#include <cstdint>
#include <string>

#include "ftpcore/crypto/secure_rng.hpp"

namespace ftpcore
{
namespace ids
{

  /// \brief Random (version 4) RFC 4122 identifiers.
  ///
  /// Connections are identified by the hyphenated form
  /// ("550e8400-e29b-41d4-a716-446655440000"); data transfers use the compact
  /// 32-digit form without hyphens.
  class Uuid
  {
  public:
    static std::string v4() { return format(generate(), true); }

    static std::string v4Compact() { return format(generate(), false); }

  private:
    using Bytes = std::array<std::uint8_t, 16>;

    static Bytes generate()
    {
      Bytes b{};
      crypto::SecureRng::fill(b);
      b[6] = static_cast<std::uint8_t>((b[6] & 0x0F) | 0x40);
      b[8] = static_cast<std::uint8_t>((b[8] & 0x3F) | 0x80);
      return b;
    }

    static std::string format(const Bytes &b, bool hyphens)
    {
      static constexpr char kHex[] = "0123456789abcdef";
      std::string s;
      s.reserve(36);
      for (std::size_t i = 0; i < b.size(); ++i)
      {
        if (hyphens && (i == 4 || i == 6 || i == 8 || i == 10))
        {
          s.push_back('-');
        }
        s.push_back(kHex[b[i] >> 4]);
        s.push_back(kHex[b[i] & 0x0F]);
      }
      return s;
    }
  };

} // namespace ids
} // namespace ftpcore
