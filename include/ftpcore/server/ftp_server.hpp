// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Ftpcore, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "ftpcore/core/cancellation.hpp"
#include "ftpcore/core/json.hpp"
#include "ftpcore/core/logger.hpp"
#include "ftpcore/core/thread_pool.hpp"
#include "ftpcore/fs/local_file_system.hpp"
#include "ftpcore/network/multi_binding_listener.hpp"
#include "ftpcore/server/command_handler.hpp"
#include "ftpcore/server/ftp_connection.hpp"
#include "ftpcore/server/server_options.hpp"

namespace ftpcore
{
namespace server
{

struct FtpConnectionStatus
{
  std::string id;
  bool isAlive{false};
};

/// \brief Accepts control connections and owns their lifetime.
///
/// Clients are accepted from a MultiBindingListener by one accept thread. A
/// sweeper thread runs every idleCheckInterval: it silently aborts
/// connections whose idle check failed and reaps connections whose threads
/// have finished. Background commands of all connections share one thread
/// pool.
///
/// Per-connection operations look the connection up by id and throw
/// std::out_of_range for ids that are not (or no longer) registered.
class FtpServer
{
public:
  /// \param fileSystem storage backend; a LocalFileSystem on
  /// options.fileSystemRoot when null
  FtpServer(FtpServerOptions options, std::shared_ptr<CommandRegistry> registry,
            std::shared_ptr<fs::UnixFileSystem> fileSystem = nullptr)
      : _options(std::move(options)), _registry(std::move(registry)),
        _fileSystem(std::move(fileSystem)),
        _pool(_options.threadPoolSize, _options.threadPoolSize * 4, _options.threadPoolQueueSize,
              [](std::exception_ptr eptr)
              {
                try
                {
                  std::rethrow_exception(eptr);
                }
                catch (const std::exception &ex)
                {
                  FTPCORE_LOG_ERROR("Background command failed: " << ex.what());
                }
              })
  {
    if (!_registry)
    {
      throw std::invalid_argument("FtpServer requires a command registry");
    }
    if (!_fileSystem)
    {
      _fileSystem = std::make_shared<fs::LocalFileSystem>(
        _options.fileSystemRoot, _options.allowNonEmptyDirectoryDelete,
        fs::LocalFileSystem::DefaultBufferSize, _options.flushAfterWrite);
    }
  }

  ~FtpServer() { stop(); }

  FtpServer(const FtpServer &) = delete;
  FtpServer &operator=(const FtpServer &) = delete;

  /// \brief Bind the control port and start accepting.
  /// \return the effective port
  /// \throws network::ListenerError if binding fails
  std::uint16_t start()
  {
    std::lock_guard<std::mutex> lifecycle(_lifecycleMutex);
    if (_running)
    {
      return _port;
    }
    startListening(_options.port);
    _running = true;
    _stopSweeper = false;
    _sweeperThread = std::thread([this]() { sweepLoop(); });
    FTPCORE_LOG_INFO("FTP server listening on '" << _options.address << "' port " << _port);
    return _port;
  }

  /// \brief Stop accepting new clients. Existing connections are kept.
  void pause()
  {
    std::lock_guard<std::mutex> lifecycle(_lifecycleMutex);
    if (!_running || _paused)
    {
      return;
    }
    stopListening();
    _paused = true;
    FTPCORE_LOG_INFO("FTP server paused");
  }

  /// \brief Accept again on the port used before pause().
  /// \throws network::ListenerError if the port cannot be bound again
  void resume()
  {
    std::lock_guard<std::mutex> lifecycle(_lifecycleMutex);
    if (!_running || !_paused)
    {
      return;
    }
    startListening(_port);
    _paused = false;
    FTPCORE_LOG_INFO("FTP server resumed on port " << _port);
  }

  /// \brief Stop accepting and close every connection. Idempotent.
  void stop()
  {
    std::lock_guard<std::mutex> lifecycle(_lifecycleMutex);
    if (!_running)
    {
      return;
    }
    stopListening();
    {
      std::lock_guard<std::mutex> lock(_sweepMutex);
      _stopSweeper = true;
    }
    _sweepCv.notify_all();
    if (_sweeperThread.joinable())
    {
      _sweeperThread.join();
    }

    std::map<std::string, std::shared_ptr<FtpConnection>> connections;
    {
      std::lock_guard<std::mutex> lock(_connectionsMutex);
      connections.swap(_connections);
    }
    for (auto &entry : connections)
    {
      entry.second->stop();
    }
    _pool.shutdown();
    _running = false;
    _paused = false;
    FTPCORE_LOG_INFO("FTP server stopped, " << connections.size() << " connection(s) closed");
  }

  bool isRunning() const { return _running.load(); }

  bool isPaused() const { return _paused.load(); }

  /// \brief Effective control port, also while paused.
  std::uint16_t port() const { return _port.load(); }

  const FtpServerOptions &options() const { return _options; }

  fs::UnixFileSystem &fileSystem() { return *_fileSystem; }

  std::size_t connectionCount() const
  {
    std::lock_guard<std::mutex> lock(_connectionsMutex);
    return _connections.size();
  }

  std::vector<FtpConnectionStatus> connectionStatus() const
  {
    std::vector<FtpConnectionStatus> out;
    for (auto &connection : snapshot())
    {
      out.push_back({connection->connectionId(),
                     !connection->isAborted() && connection->checkAlive()});
    }
    return out;
  }

  core::Json statusJson() const
  {
    core::Json connections = core::Json::array();
    for (const auto &status : connectionStatus())
    {
      connections.push_back({{"id", status.id}, {"alive", status.isAlive}});
    }
    return core::Json{{"port", port()},
                      {"running", isRunning()},
                      {"paused", isPaused()},
                      {"connectionCount", connections.size()},
                      {"connections", connections}};
  }

  /// \throws std::out_of_range for an unknown id
  std::shared_ptr<FtpConnection> connection(const std::string &connectionId) const
  {
    std::lock_guard<std::mutex> lock(_connectionsMutex);
    auto it = _connections.find(connectionId);
    if (it == _connections.end())
    {
      throw std::out_of_range("Unknown connection " + connectionId);
    }
    return it->second;
  }

  void publish(const std::string &connectionId, const ConnectionEvent &event)
  {
    connection(connectionId)->publishEvent(event);
  }

  ConnectionEventBus::Subscription subscribe(const std::string &connectionId,
                                             ConnectionEventBus::Observer observer)
  {
    return connection(connectionId)->subscribe(std::move(observer));
  }

  bool checkAlive(const std::string &connectionId)
  {
    return connection(connectionId)->checkAlive();
  }

  bool enqueueServerCommand(const std::string &connectionId, ServerCommand command)
  {
    return connection(connectionId)->enqueueServerCommand(std::move(command));
  }

  void trackBackgroundTask(const std::string &connectionId,
                           std::shared_ptr<BackgroundTaskLifetime> task)
  {
    connection(connectionId)->trackBackgroundTask(std::move(task));
  }

  /// \return the aborted task, nullptr if none was running
  std::shared_ptr<BackgroundTaskLifetime> abortBackgroundTask(const std::string &connectionId)
  {
    return connection(connectionId)->abortBackgroundTask();
  }

private:
  FtpServerOptions _options;
  std::shared_ptr<CommandRegistry> _registry;
  std::shared_ptr<fs::UnixFileSystem> _fileSystem;
  core::ThreadPool _pool;

  std::mutex _lifecycleMutex;
  std::atomic<bool> _running{false};
  std::atomic<bool> _paused{false};
  std::atomic<std::uint16_t> _port{0};

  std::unique_ptr<network::MultiBindingListener> _listener;
  std::unique_ptr<core::CancellationSource> _acceptSource;
  std::thread _acceptThread;

  mutable std::mutex _connectionsMutex;
  std::map<std::string, std::shared_ptr<FtpConnection>> _connections;

  std::mutex _sweepMutex;
  std::condition_variable _sweepCv;
  bool _stopSweeper{false};
  std::thread _sweeperThread;

  void startListening(int port)
  {
    auto listener = std::make_unique<network::MultiBindingListener>(_options.address, port);
    _port = listener->start();
    listener->startAccepting();
    _listener = std::move(listener);
    _acceptSource = std::make_unique<core::CancellationSource>();
    _acceptThread = std::thread([this, token = _acceptSource->token()]() { acceptLoop(token); });
  }

  void stopListening()
  {
    if (_acceptSource)
    {
      _acceptSource->cancel();
    }
    if (_listener)
    {
      _listener->stop();
    }
    if (_acceptThread.joinable())
    {
      _acceptThread.join();
    }
    _listener.reset();
    _acceptSource.reset();
  }

  void acceptLoop(core::CancellationToken token)
  {
    while (true)
    {
      network::MultiBindingListener::AcceptedClient client;
      try
      {
        client = _listener->waitAnyClient(token);
      }
      catch (const core::OperationCancelled &ex)
      {
        FTPCORE_LOG_DEBUG("Accept loop finished: " << ex.what());
        return;
      }
      try
      {
        admit(std::move(client.socket));
      }
      catch (const std::exception &ex)
      {
        FTPCORE_LOG_ERROR("Cannot set up connection: " << ex.what());
      }
    }
  }

  void admit(std::unique_ptr<network::TcpSocket> socket)
  {
    if (_options.maxConnections > 0 && connectionCount() >= _options.maxConnections)
    {
      FTPCORE_LOG_WARN("Rejecting " << socket->peerAddress() << ": connection limit "
                                    << _options.maxConnections << " reached");
      auto result = socket->sendAll(FtpResponse(421, "Too many connections.").toWire(),
                                    core::CancellationToken::none());
      if (!result.ok)
      {
        FTPCORE_LOG_DEBUG("421 not delivered: " << result.message);
      }
      socket->close();
      return;
    }
    auto connection = std::make_shared<FtpConnection>(std::move(socket), _registry, _pool,
                                                      _fileSystem, _options.connection);
    {
      std::lock_guard<std::mutex> lock(_connectionsMutex);
      _connections[connection->connectionId()] = connection;
    }
    connection->start();
  }

  std::vector<std::shared_ptr<FtpConnection>> snapshot() const
  {
    std::lock_guard<std::mutex> lock(_connectionsMutex);
    std::vector<std::shared_ptr<FtpConnection>> out;
    out.reserve(_connections.size());
    for (const auto &entry : _connections)
    {
      out.push_back(entry.second);
    }
    return out;
  }

  void sweepLoop()
  {
    std::unique_lock<std::mutex> lock(_sweepMutex);
    while (!_stopSweeper)
    {
      _sweepCv.wait_for(lock, _options.idleCheckInterval, [this]() { return _stopSweeper; });
      if (_stopSweeper)
      {
        break;
      }
      lock.unlock();
      sweep();
      lock.lock();
    }
  }

  void sweep()
  {
    std::vector<std::shared_ptr<FtpConnection>> finished;
    for (auto &connection : snapshot())
    {
      if (!connection->isAborted() && !connection->checkAlive())
      {
        FTPCORE_LOG_INFO("Connection " << connection->connectionId() << " from "
                                       << connection->remoteAddress()
                                       << " evicted after inactivity");
        connection->abort();
      }
      if (connection->isFinished())
      {
        finished.push_back(connection);
      }
    }
    if (finished.empty())
    {
      return;
    }
    {
      std::lock_guard<std::mutex> lock(_connectionsMutex);
      for (auto &connection : finished)
      {
        _connections.erase(connection->connectionId());
      }
    }
    for (auto &connection : finished)
    {
      connection->stop();
      FTPCORE_LOG_DEBUG("Connection " << connection->connectionId() << " reaped");
    }
  }
};

} // namespace server
} // namespace ftpcore
