// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Ftpcore, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>

#include "ftpcore/core/cancellation.hpp"
#include "ftpcore/core/logger.hpp"
#include "ftpcore/core/thread_pool.hpp"
#include "ftpcore/fs/file_system.hpp"
#include "ftpcore/ids/uuid.hpp"
#include "ftpcore/network/socket.hpp"
#include "ftpcore/server/background_task.hpp"
#include "ftpcore/server/command_handler.hpp"
#include "ftpcore/server/connection_events.hpp"
#include "ftpcore/server/data_connection.hpp"
#include "ftpcore/server/idle_check.hpp"
#include "ftpcore/server/server_command_executor.hpp"
#include "ftpcore/server/server_command_pipeline.hpp"
#include "ftpcore/server/server_commands.hpp"

namespace ftpcore
{
namespace server
{

struct FtpConnectionOptions
{
  /// nullopt: never idle out
  std::optional<std::chrono::milliseconds> inactivityTimeout{std::chrono::minutes(5)};
  std::chrono::milliseconds dataConnectionTimeout{std::chrono::seconds(30)};
  std::size_t serverCommandQueueSize{1024};
  std::string banner{"FTP Server Ready"};
  /// Address announced in 227 replies; the control connection's local
  /// address when empty.
  std::string passiveAddress;
  std::optional<std::pair<std::uint16_t, std::uint16_t>> passivePortRange;
};

/// \brief One FTP control session.
///
/// A connection runs two threads. The reader parses commands from the
/// control socket, publishes CommandReceivedEvent and executes the handler:
/// inline for ordinary verbs, as the tracked background task on the shared
/// thread pool for abortable ones. The pipeline thread executes the server
/// commands the handlers queue. Aborting the connection cancels its
/// cancellation scope, which shuts the control socket down, stops both
/// threads and cancels any background task.
///
/// Instances must be owned by a std::shared_ptr.
class FtpConnection : public ServerCommandContext,
                      public std::enable_shared_from_this<FtpConnection>
{
public:
  FtpConnection(std::unique_ptr<network::TcpSocket> socket,
                std::shared_ptr<CommandRegistry> registry, core::ThreadPool &pool,
                std::shared_ptr<fs::UnixFileSystem> fileSystem, FtpConnectionOptions options = {},
                FtpConnectionIdleCheck::ClockFunction clock = {})
      : _id(ids::Uuid::v4()), _options(std::move(options)), _socket(std::move(socket)),
        _registry(std::move(registry)), _pool(pool), _fileSystem(std::move(fileSystem)),
        _eventBus(std::make_shared<ConnectionEventBus>(_id)),
        _idleCheck(EventCapable{_eventBus}, _options.inactivityTimeout, std::move(clock)),
        _pipeline(*this, _options.serverCommandQueueSize)
  {
    _remoteAddress = _socket->peerAddress();
    _remoteHost = _socket->peerHost();
    _socketShutdown = _source.token().registerCallback([this]() { _socket->close(); });
  }

  ~FtpConnection() override { stop(); }

  FtpConnection(const FtpConnection &) = delete;
  FtpConnection &operator=(const FtpConnection &) = delete;

  /// \brief Queue the greeting and start the reader and pipeline threads.
  void start()
  {
    if (_started.exchange(true))
    {
      return;
    }
    FTPCORE_LOG_INFO("Connection " << _id << " from " << _remoteAddress << " started");
    _pipeline.enqueue(SendResponse{FtpResponse(220, _options.banner)});
    _pipelineThread = std::thread([this]() { pipelineLoop(); });
    _readerThread = std::thread([this]() { readLoop(); });
  }

  /// \brief Abort and wait for both threads and the background task.
  /// Must not be called from the connection's own threads.
  void stop()
  {
    abort();
    for (auto *t : {&_readerThread, &_pipelineThread})
    {
      if (!t->joinable())
      {
        continue;
      }
      if (t->get_id() == std::this_thread::get_id())
      {
        t->detach();
      }
      else
      {
        t->join();
      }
    }
    std::shared_ptr<BackgroundTaskLifetime> task;
    {
      std::lock_guard<std::mutex> lock(_taskMutex);
      task = _backgroundTask;
    }
    if (task && task->task().valid())
    {
      task->task().wait();
    }
    std::lock_guard<std::mutex> lock(_dataMutex);
    if (_keptDataConnection)
    {
      _keptDataConnection->close();
      _keptDataConnection.reset();
    }
    _opener.reset();
  }

  /// \brief Both threads have exited.
  bool isFinished() const
  {
    return _readerDone.load() && _pipelineDone.load();
  }

  bool isAborted() const { return _aborted.load(); }

  /// \brief Idle-check verdict.
  bool checkAlive() { return _idleCheck.check(); }

  std::shared_ptr<ConnectionEventBus> eventBus() const { return _eventBus; }

  ConnectionEventBus::Subscription subscribe(ConnectionEventBus::Observer observer)
  {
    return _eventBus->subscribe(std::move(observer));
  }

  FtpConnectionIdleCheck &idleCheck() { return _idleCheck; }

  /// \brief Replace the tracked background task. The previous one keeps
  /// running.
  void trackBackgroundTask(std::shared_ptr<BackgroundTaskLifetime> task)
  {
    std::lock_guard<std::mutex> lock(_taskMutex);
    _backgroundTask = std::move(task);
  }

  std::shared_ptr<BackgroundTaskLifetime> backgroundTask() const
  {
    std::lock_guard<std::mutex> lock(_taskMutex);
    return _backgroundTask;
  }

  /// \brief Request cancellation of the tracked background task.
  /// \return the task if one was still running, nullptr otherwise
  std::shared_ptr<BackgroundTaskLifetime> abortBackgroundTask()
  {
    auto task = backgroundTask();
    if (!task || task->isCompleted())
    {
      return nullptr;
    }
    FTPCORE_LOG_DEBUG("Connection " << _id << ": aborting " << task->command().name);
    task->abort();
    return task;
  }

  /// \brief Negotiated by PORT/PASV. Closes a data connection left open by a
  /// previous transfer.
  void setDataConnectionOpener(std::unique_ptr<DataConnectionOpener> opener)
  {
    std::lock_guard<std::mutex> lock(_dataMutex);
    _opener = std::move(opener);
    if (_keptDataConnection)
    {
      _keptDataConnection->close();
      _keptDataConnection.reset();
    }
  }

  const FtpConnectionOptions &options() const { return _options; }

  const std::string &remoteAddress() const { return _remoteAddress; }

  /// \brief Numeric host of the control peer, without the port.
  const std::string &remoteHost() const { return _remoteHost; }

  bool localAddress(sockaddr_storage &out) const { return _socket->localAddress(out); }

  fs::UnixFileSystem &fileSystem() { return *_fileSystem; }

  std::string currentPath() const
  {
    std::lock_guard<std::mutex> lock(_sessionMutex);
    return _currentPath;
  }

  void setCurrentPath(std::string path)
  {
    std::lock_guard<std::mutex> lock(_sessionMutex);
    _currentPath = std::move(path);
  }

  std::string userName() const
  {
    std::lock_guard<std::mutex> lock(_sessionMutex);
    return _userName;
  }

  void setUserName(std::string name)
  {
    std::lock_guard<std::mutex> lock(_sessionMutex);
    _userName = std::move(name);
  }

  char transferType() const { return _transferType.load(); }

  void setTransferType(char type) { _transferType.store(type); }

  // ServerCommandContext

  const std::string &connectionId() const override { return _id; }

  core::CancellationToken connectionToken() const override { return _source.token(); }

  void publishEvent(const ConnectionEvent &event) override { _eventBus->publish(event); }

  std::shared_ptr<DataConnection> openDataConnection(const core::CancellationToken &token) override
  {
    std::unique_ptr<DataConnectionOpener> opener;
    {
      std::lock_guard<std::mutex> lock(_dataMutex);
      if (_keptDataConnection && !_keptDataConnection->isClosed())
      {
        return _keptDataConnection;
      }
      _keptDataConnection.reset();
      opener = std::move(_opener);
    }
    if (!opener)
    {
      throw DataConnectionError("No data connection negotiated, use PORT or PASV first");
    }
    FTPCORE_LOG_DEBUG("Connection " << _id << ": opening data connection via "
                                    << opener->describe());
    return opener->open(token);
  }

  void keepDataConnectionOpen(std::shared_ptr<DataConnection> connection) override
  {
    std::lock_guard<std::mutex> lock(_dataMutex);
    _keptDataConnection = std::move(connection);
  }

  void closeDataConnection(const std::shared_ptr<DataConnection> &connection) override
  {
    connection->close();
    std::lock_guard<std::mutex> lock(_dataMutex);
    if (_keptDataConnection == connection)
    {
      _keptDataConnection.reset();
    }
  }

  std::optional<FtpResponse> executeCommand(const FtpCommand &command,
                                            const CommandOperation &operation,
                                            const core::CancellationToken &token) override
  {
    return runCommandOperation(_id, command, operation, token);
  }

  bool enqueueServerCommand(ServerCommand command) override
  {
    return _pipeline.enqueue(std::move(command));
  }

  void writeResponse(const FtpResponse &response, const core::CancellationToken &token) override
  {
    std::string wire;
    try
    {
      wire = response.toWire();
    }
    catch (const std::invalid_argument &ex)
    {
      throw ResponseTransmissionError(ex.what());
    }
    std::lock_guard<std::mutex> lock(_writeMutex);
    auto result = _socket->sendAll(wire, token);
    if (!result.ok)
    {
      throw ResponseTransmissionError("Connection " + _id + ": cannot send response " +
                                      std::to_string(response.code) + ": " + result.message);
    }
    FTPCORE_LOG_DEBUG("Connection " << _id << " > " << response.code << " " << response.message());
  }

  void abort() override
  {
    if (_aborted.exchange(true))
    {
      return;
    }
    FTPCORE_LOG_INFO("Connection " << _id << " from " << _remoteAddress << " closing");
    _source.cancel();
    _pipeline.close();
    publishEvent(ConnectionClosedEvent{});
  }

private:
  std::string _id;
  FtpConnectionOptions _options;
  std::unique_ptr<network::TcpSocket> _socket;
  std::string _remoteAddress;
  std::string _remoteHost;
  std::shared_ptr<CommandRegistry> _registry;
  core::ThreadPool &_pool;
  std::shared_ptr<fs::UnixFileSystem> _fileSystem;

  core::CancellationSource _source;
  core::CancellationRegistration _socketShutdown;
  std::shared_ptr<ConnectionEventBus> _eventBus;
  FtpConnectionIdleCheck _idleCheck;
  ServerCommandPipeline _pipeline;

  std::mutex _writeMutex;
  mutable std::mutex _dataMutex;
  std::unique_ptr<DataConnectionOpener> _opener;
  std::shared_ptr<DataConnection> _keptDataConnection;

  mutable std::mutex _taskMutex;
  std::shared_ptr<BackgroundTaskLifetime> _backgroundTask;

  mutable std::mutex _sessionMutex;
  std::string _currentPath{"/"};
  std::string _userName;
  std::atomic<char> _transferType{'A'};

  std::atomic<bool> _started{false};
  std::atomic<bool> _aborted{false};
  std::atomic<bool> _readerDone{false};
  std::atomic<bool> _pipelineDone{false};
  std::thread _readerThread;
  std::thread _pipelineThread;

  void readLoop()
  {
    auto token = _source.token();
    try
    {
      std::string line;
      while (!token.isCancellationRequested())
      {
        auto result = _socket->readLine(line, token);
        if (!result.ok)
        {
          FTPCORE_LOG_DEBUG("Connection " << _id << ": " << result.message);
          break;
        }
        if (line.empty())
        {
          continue;
        }
        auto command = FtpCommand::parse(line);
        FTPCORE_LOG_DEBUG("Connection " << _id << " < " << command.toString());
        publishEvent(CommandReceivedEvent{command});
        dispatch(command, token);
      }
    }
    catch (const core::OperationCancelled &)
    {
      FTPCORE_LOG_TRACE("Connection " << _id << ": reader cancelled");
    }
    catch (const std::exception &ex)
    {
      FTPCORE_LOG_ERROR("Connection " << _id << ": reader failed: " << ex.what());
    }
    abort();
    _readerDone.store(true);
  }

  void dispatch(const FtpCommand &command, const core::CancellationToken &token)
  {
    auto handler = _registry->find(command.name);
    if (!handler)
    {
      enqueueServerCommand(SendResponse{FtpResponse(502, "Command not implemented.")});
      return;
    }

    if (!handler->isAbortable())
    {
      auto response = executeCommand(
        command,
        [this, &handler, &command](const core::CancellationToken &ct)
        { return handler->execute(*this, command, ct); },
        token);
      if (response)
      {
        enqueueServerCommand(SendResponse{std::move(*response)});
      }
      return;
    }

    auto self = shared_from_this();
    try
    {
      auto task = BackgroundTaskLifetime::start(
        _pool, command, handler, token,
        [self, handler, command](const core::CancellationToken &ct)
        {
          auto response = self->executeCommand(
            command, [&](const core::CancellationToken &t)
            { return handler->execute(*self, command, t); },
            ct);
          if (response)
          {
            self->enqueueServerCommand(SendResponse{*response});
          }
          return response;
        });
      trackBackgroundTask(std::move(task));
    }
    catch (const std::runtime_error &ex)
    {
      FTPCORE_LOG_ERROR("Connection " << _id << ": cannot schedule " << command.name << ": "
                                      << ex.what());
      enqueueServerCommand(SendResponse{responses::localError()});
    }
  }

  void pipelineLoop()
  {
    try
    {
      _pipeline.run(_source.token());
    }
    catch (const core::OperationCancelled &)
    {
      FTPCORE_LOG_TRACE("Connection " << _id << ": pipeline cancelled");
    }
    catch (const ResponseTransmissionError &ex)
    {
      FTPCORE_LOG_ERROR(ex.what());
    }
    catch (const std::exception &ex)
    {
      FTPCORE_LOG_ERROR("Connection " << _id << ": server command failed: " << ex.what());
    }
    abort();
    _pipelineDone.store(true);
  }
};

} // namespace server
} // namespace ftpcore
