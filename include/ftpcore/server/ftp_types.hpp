// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Ftpcore, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include <vector>

namespace ftpcore
{
namespace server
{

/// \brief One protocol command as received on the control channel.
struct FtpCommand
{
  std::string name;
  std::string argument;

  /// \brief Split "VERB argument" at the first space; the verb is
  /// upper-cased.
  static FtpCommand parse(const std::string &line)
  {
    FtpCommand cmd;
    auto space = line.find(' ');
    cmd.name = line.substr(0, space);
    if (space != std::string::npos)
    {
      cmd.argument = line.substr(space + 1);
    }
    std::transform(cmd.name.begin(), cmd.name.end(), cmd.name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return cmd;
  }

  /// \brief Text suitable for logs. PASS arguments are masked.
  std::string toString() const
  {
    if (argument.empty())
    {
      return name;
    }
    return name + " " + (name == "PASS" ? std::string("********") : argument);
  }
};

/// \brief A reply with a three digit code and one or more text lines.
struct FtpResponse
{
  int code{0};
  std::vector<std::string> lines;

  FtpResponse() = default;

  FtpResponse(int c, std::string message) : code(c), lines{std::move(message)} {}

  FtpResponse(int c, std::vector<std::string> messageLines) : code(c), lines(std::move(messageLines))
  {
  }

  /// \brief Wire form. Single line: "NNN text\r\n". Multi-line:
  /// "NNN-first\r\n", continuation lines indented by one space, and a final
  /// "NNN last\r\n".
  std::string toWire() const
  {
    if (code < 100 || code > 999)
    {
      throw std::invalid_argument("Invalid FTP response code " + std::to_string(code));
    }
    std::string codeText = std::to_string(code);
    if (lines.size() <= 1)
    {
      return codeText + " " + (lines.empty() ? std::string() : lines.front()) + "\r\n";
    }
    std::string out = codeText + "-" + lines.front() + "\r\n";
    for (std::size_t i = 1; i + 1 < lines.size(); ++i)
    {
      out += " " + lines[i] + "\r\n";
    }
    out += codeText + " " + lines.back() + "\r\n";
    return out;
  }

  std::string message() const { return lines.empty() ? std::string() : lines.front(); }
};

} // namespace server
} // namespace ftpcore
