// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Ftpcore, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <chrono>
#include <future>
#include <memory>
#include <optional>

#include "ftpcore/core/cancellation.hpp"
#include "ftpcore/core/thread_pool.hpp"
#include "ftpcore/server/command_handler.hpp"
#include "ftpcore/server/ftp_types.hpp"
#include "ftpcore/server/server_commands.hpp"

namespace ftpcore
{
namespace server
{

/// \brief A command execution running off the command-reading thread.
///
/// abort() only requests cancellation; the task stops at its next
/// cancellation point. Completion is observed through task().
class BackgroundTaskLifetime
{
public:
  using Result = std::optional<FtpResponse>;

  BackgroundTaskLifetime(FtpCommand command, std::shared_ptr<CommandHandler> handler,
                         core::CancellationSource source, std::shared_future<Result> task)
      : _command(std::move(command)), _handler(std::move(handler)), _source(std::move(source)),
        _task(std::move(task))
  {
  }

  /// \brief Run \p operation on \p pool with a cancellation scope linked to
  /// \p connectionToken.
  /// \throws std::runtime_error if the pool rejects the task
  static std::shared_ptr<BackgroundTaskLifetime>
  start(core::ThreadPool &pool, FtpCommand command, std::shared_ptr<CommandHandler> handler,
        const core::CancellationToken &connectionToken, CommandOperation operation)
  {
    auto source = core::CancellationSource::createLinked(connectionToken);
    auto token = source.token();
    auto future = pool.enqueueWithResult([operation = std::move(operation), token]()
                                         { return operation(token); });
    return std::make_shared<BackgroundTaskLifetime>(std::move(command), std::move(handler),
                                                    std::move(source), future.share());
  }

  BackgroundTaskLifetime(const BackgroundTaskLifetime &) = delete;
  BackgroundTaskLifetime &operator=(const BackgroundTaskLifetime &) = delete;

  const FtpCommand &command() const { return _command; }

  const std::shared_ptr<CommandHandler> &handler() const { return _handler; }

  const std::shared_future<Result> &task() const { return _task; }

  core::CancellationToken token() const { return _source.token(); }

  void abort() { _source.cancel(); }

  bool isAbortRequested() const { return _source.isCancellationRequested(); }

  bool isCompleted() const
  {
    return _task.valid() &&
           _task.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
  }

private:
  FtpCommand _command;
  std::shared_ptr<CommandHandler> _handler;
  core::CancellationSource _source;
  std::shared_future<Result> _task;
};

} // namespace server
} // namespace ftpcore
