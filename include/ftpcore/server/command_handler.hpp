// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Ftpcore, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "ftpcore/core/cancellation.hpp"
#include "ftpcore/server/ftp_types.hpp"

namespace ftpcore
{
namespace server
{

class FtpConnection;

/// \brief Implementation of one protocol verb.
///
/// Abortable handlers run as the connection's tracked background task so
/// that ABOR (or a connection abort) can cancel them while later commands
/// keep being read.
class CommandHandler
{
public:
  virtual ~CommandHandler() = default;

  virtual const std::string &name() const = 0;

  virtual bool isAbortable() const { return false; }

  /// \return the reply to send, or nullopt if the handler queued its own
  virtual std::optional<FtpResponse> execute(FtpConnection &connection, const FtpCommand &command,
                                             const core::CancellationToken &token) = 0;
};

/// \brief CommandHandler backed by a callable.
class FunctionCommandHandler : public CommandHandler
{
public:
  using Function = std::function<std::optional<FtpResponse>(
    FtpConnection &, const FtpCommand &, const core::CancellationToken &)>;

  FunctionCommandHandler(std::string name, bool abortable, Function fn)
      : _name(std::move(name)), _abortable(abortable), _fn(std::move(fn))
  {
  }

  const std::string &name() const override { return _name; }

  bool isAbortable() const override { return _abortable; }

  std::optional<FtpResponse> execute(FtpConnection &connection, const FtpCommand &command,
                                     const core::CancellationToken &token) override
  {
    return _fn(connection, command, token);
  }

private:
  std::string _name;
  bool _abortable;
  Function _fn;
};

/// \brief Verb to handler lookup shared by all connections of a server.
class CommandRegistry
{
public:
  void add(std::shared_ptr<CommandHandler> handler)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _handlers[handler->name()] = std::move(handler);
  }

  void add(const std::string &name, bool abortable, FunctionCommandHandler::Function fn)
  {
    add(std::make_shared<FunctionCommandHandler>(name, abortable, std::move(fn)));
  }

  std::shared_ptr<CommandHandler> find(const std::string &name) const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _handlers.find(name);
    return it == _handlers.end() ? nullptr : it->second;
  }

  std::vector<std::string> names() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    std::vector<std::string> out;
    for (const auto &entry : _handlers)
    {
      out.push_back(entry.first);
    }
    return out;
  }

private:
  mutable std::mutex _mutex;
  std::map<std::string, std::shared_ptr<CommandHandler>> _handlers;
};

} // namespace server
} // namespace ftpcore
