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
#include <ctime>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <queue>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace ftpcore
{
namespace core
{

namespace detail
{
  /// \brief Strip the directory part of a __FILE__ path at compile time.
  constexpr const char *basename(const char *path)
  {
    const char *file = path;
    while (*path)
    {
      if (*path == '/' || *path == '\\')
      {
        file = path + 1;
      }
      ++path;
    }
    return file;
  }
} // namespace detail

class LoggerStream;

/// \brief Process-wide logger with levels, optional async writer thread,
/// daily file rotation with retention, and an external handler hook.
class Logger
{
public:
  enum class Level
  {
    Trace,
    Debug,
    Info,
    Warning,
    Error,
    Fatal
  };

  /// \brief External sink. Receives the level, the fully formatted line and
  /// the raw message.
  using ExternalHandler = std::function<void(Level level, const std::string &formattedMessage,
                                             const std::string &rawMessage)>;

  struct Endl
  {
  };
  static inline constexpr Endl endl{};

  /// \brief Configure the logger. An empty \p filePath logs to stdout.
  static void init(Level level = Level::Info, const std::string &filePath = "", bool async = false,
                   int retentionDays = 7, const std::string &timeFormat = "%Y-%m-%d %H:%M:%S")
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);

    data.minLevel = level;
    data.asyncMode = async;
    data.exit = false;
    data.logBasePath = filePath;
    data.retentionDays = retentionDays;
    data.timestampFormat = timeFormat;
    data.fileStream.reset();
    data.currentLogDate.clear();
    rotateLogFileIfNeeded();

    if (data.asyncMode && !data.workerThread.joinable())
    {
      data.workerThread = std::thread(runWorker);
    }
  }

  static void flush()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    drainLocked(data);
    if (data.fileStream)
    {
      data.fileStream->flush();
    }
    else
    {
      std::cout.flush();
    }
  }

  static void shutdown()
  {
    flush();
    auto &data = getData();
    {
      std::lock_guard<std::mutex> lock(data.mutex);
      data.exit = true;
    }
    data.cv.notify_one();
    if (data.workerThread.joinable())
    {
      data.workerThread.join();
    }
  }

  static void setLevel(Level level)
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.minLevel = level;
  }

  static Level getLevel()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    return data.minLevel;
  }

  /// \brief Route all output to \p handler instead of file/console.
  static void setExternalHandler(ExternalHandler handler)
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.externalHandler = std::move(handler);
    if (data.fileStream && data.fileStream->is_open())
    {
      data.fileStream->close();
    }
    data.fileStream.reset();
  }

  static void clearExternalHandler()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.externalHandler = nullptr;
    data.currentLogDate.clear();
  }

  /// \brief Set the line format.
  /// Placeholders: %T timestamp, %t thread id, %L level, %m message,
  /// %F source file, %l source line, %f function, %% literal percent.
  /// Source placeholders stay empty unless the FTPCORE_LOG_* macros are used.
  static void setLogFormat(const std::string &format)
  {
    if (format.empty())
    {
      return;
    }
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.logFormat = format;
    compileFormat(format, data.compiledFormat);
  }

  static std::string getLogFormat()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    return data.logFormat;
  }

  static void trace(const std::string &message) { log(Level::Trace, message); }
  static void debug(const std::string &message) { log(Level::Debug, message); }
  static void info(const std::string &message) { log(Level::Info, message); }
  static void warning(const std::string &message) { log(Level::Warning, message); }
  static void error(const std::string &message) { log(Level::Error, message); }
  static void fatal(const std::string &message) { log(Level::Fatal, message); }

  static LoggerStream stream(Level level);

  static void log(Level level, const std::string &message)
  {
    log(level, message, nullptr, 0, nullptr);
  }

  /// \brief Log with source location (used by the FTPCORE_LOG_* macros).
  static void log(Level level, const std::string &message, const char *file, int line,
                  const char *function)
  {
    auto &data = getData();
    std::unique_lock<std::mutex> lock(data.mutex);
    if (level < data.minLevel)
    {
      return;
    }
    if (data.compiledFormat.empty())
    {
      compileFormat(data.logFormat, data.compiledFormat);
    }
    std::string output = format(level, message, file, line, function, data.compiledFormat,
                                data.timestampFormat);

    if (data.externalHandler)
    {
      auto handler = data.externalHandler;
      lock.unlock();
      handler(level, output, message);
      return;
    }

    if (data.asyncMode)
    {
      data.queue.push(std::move(output));
      lock.unlock();
      data.cv.notify_one();
      return;
    }
    write(data, output);
  }

  static const char *levelToString(Level level)
  {
    switch (level)
    {
    case Level::Trace:
      return "TRACE";
    case Level::Debug:
      return "DEBUG";
    case Level::Info:
      return "INFO";
    case Level::Warning:
      return "WARN";
    case Level::Error:
      return "ERROR";
    case Level::Fatal:
      return "FATAL";
    }
    return "UNKNOWN";
  }

  /// \brief Parse a level name as used in configuration files. Unknown names
  /// map to Info.
  static Level levelFromString(const std::string &name)
  {
    std::string v;
    v.reserve(name.size());
    for (char c : name)
    {
      v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (v == "trace")
    {
      return Level::Trace;
    }
    if (v == "debug")
    {
      return Level::Debug;
    }
    if (v == "warn" || v == "warning")
    {
      return Level::Warning;
    }
    if (v == "error")
    {
      return Level::Error;
    }
    if (v == "fatal")
    {
      return Level::Fatal;
    }
    return Level::Info;
  }

private:
  enum class FormatToken
  {
    Literal,
    Timestamp,
    ThreadId,
    Level,
    Message,
    File,
    Line,
    Function
  };

  struct FormatSegment
  {
    FormatToken token;
    std::string literal;
  };

  struct LoggerData
  {
    std::mutex mutex;
    std::condition_variable cv;
    std::queue<std::string> queue;
    std::thread workerThread;
    std::atomic<bool> exit{false};
    bool asyncMode = false;
    Level minLevel = Level::Info;
    std::unique_ptr<std::ofstream> fileStream;
    std::string logBasePath;
    std::string currentLogDate;
    int retentionDays = 7;
    std::string timestampFormat = "%Y-%m-%d %H:%M:%S";
    ExternalHandler externalHandler;
    std::string logFormat = "[%T] [%L] %m";
    std::vector<FormatSegment> compiledFormat;

    ~LoggerData()
    {
      exit = true;
      cv.notify_all();
      if (workerThread.joinable())
      {
        workerThread.join();
      }
    }
  };

  static LoggerData &getData()
  {
    static LoggerData data;
    return data;
  }

  static void runWorker()
  {
    auto &data = getData();
    std::unique_lock<std::mutex> lock(data.mutex);
    while (true)
    {
      data.cv.wait(lock, [&data] { return !data.queue.empty() || data.exit; });
      drainLocked(data);
      if (data.exit)
      {
        break;
      }
    }
  }

  static void drainLocked(LoggerData &data)
  {
    while (!data.queue.empty())
    {
      write(data, data.queue.front());
      data.queue.pop();
    }
  }

  static void write(LoggerData &data, const std::string &entry)
  {
    rotateLogFileIfNeeded();
    if (data.fileStream)
    {
      (*data.fileStream) << entry;
      data.fileStream->flush();
    }
    else
    {
      std::cout << entry;
    }
  }

  static std::string currentDate()
  {
    auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    ::localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d");
    return oss.str();
  }

  // Caller holds data.mutex.
  static void rotateLogFileIfNeeded()
  {
    auto &data = getData();
    if (data.logBasePath.empty() || data.externalHandler)
    {
      return;
    }

    namespace fs = std::filesystem;
    fs::path logPath(data.logBasePath);
    fs::path logDir = logPath.parent_path();
    if (logDir.empty())
    {
      logDir = fs::current_path();
    }
    std::error_code ec;
    if (!fs::exists(logDir, ec))
    {
      fs::create_directories(logDir, ec);
      if (ec)
      {
        std::cerr << "[Logger] Failed to create log directory: " << logDir << " - "
                  << ec.message() << std::endl;
        return;
      }
    }

    std::string today = currentDate();
    if (today == data.currentLogDate && data.fileStream)
    {
      return;
    }
    data.currentLogDate = today;
    std::string rotatedPath = (logDir / (logPath.filename().string() + "." + today + ".log")).string();
    data.fileStream = std::make_unique<std::ofstream>(rotatedPath, std::ios::app);
    if (!data.fileStream->is_open())
    {
      std::cerr << "[Logger] Failed to open log file: " << rotatedPath << std::endl;
      data.fileStream.reset();
      return;
    }
    deleteOldLogFiles(logDir, logPath.filename().string() + ".", data.retentionDays);
  }

  static void deleteOldLogFiles(const std::filesystem::path &logDir, const std::string &prefix,
                                int retentionDays)
  {
    if (retentionDays <= 0)
    {
      return;
    }
    namespace fs = std::filesystem;
    auto now = std::chrono::system_clock::now();
    std::error_code ec;
    for (const auto &entry : fs::directory_iterator(logDir, ec))
    {
      std::string fname = entry.path().filename().string();
      if (fname.rfind(prefix, 0) != 0 || fname.size() < prefix.size() + 10)
      {
        continue;
      }
      std::tm tm{};
      std::istringstream ss(fname.substr(prefix.size(), 10));
      ss >> std::get_time(&tm, "%Y-%m-%d");
      if (ss.fail())
      {
        continue;
      }
      auto fileTime = std::chrono::system_clock::from_time_t(std::mktime(&tm));
      auto ageDays = std::chrono::duration_cast<std::chrono::hours>(now - fileTime).count() / 24;
      if (ageDays >= retentionDays)
      {
        std::error_code removeEc;
        fs::remove(entry.path(), removeEc);
        if (removeEc)
        {
          std::cerr << "[Logger] Failed to delete old log file: " << entry.path() << " - "
                    << removeEc.message() << std::endl;
        }
      }
    }
  }

  static void compileFormat(const std::string &fmt, std::vector<FormatSegment> &segments)
  {
    segments.clear();
    std::string literal;
    auto flushLiteral = [&]()
    {
      if (!literal.empty())
      {
        segments.push_back({FormatToken::Literal, std::move(literal)});
        literal.clear();
      }
    };

    for (std::size_t i = 0; i < fmt.size(); ++i)
    {
      if (fmt[i] != '%' || i + 1 >= fmt.size())
      {
        literal += fmt[i];
        continue;
      }
      FormatToken token;
      switch (fmt[i + 1])
      {
      case 'T':
        token = FormatToken::Timestamp;
        break;
      case 't':
        token = FormatToken::ThreadId;
        break;
      case 'L':
        token = FormatToken::Level;
        break;
      case 'm':
        token = FormatToken::Message;
        break;
      case 'F':
        token = FormatToken::File;
        break;
      case 'l':
        token = FormatToken::Line;
        break;
      case 'f':
        token = FormatToken::Function;
        break;
      case '%':
        literal += '%';
        ++i;
        continue;
      default:
        literal += fmt[i];
        continue;
      }
      flushLiteral();
      segments.push_back({token, ""});
      ++i;
    }
    flushLiteral();
  }

  static std::string format(Level level, const std::string &message, const char *file, int line,
                            const char *function, const std::vector<FormatSegment> &segments,
                            const std::string &timestampFmt)
  {
    std::ostringstream oss;
    for (const auto &seg : segments)
    {
      switch (seg.token)
      {
      case FormatToken::Literal:
        oss << seg.literal;
        break;
      case FormatToken::Timestamp:
      {
        auto now = std::chrono::system_clock::now();
        auto t = std::chrono::system_clock::to_time_t(now);
        auto ms =
          std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
        std::tm tm{};
        ::localtime_r(&t, &tm);
        oss << std::put_time(&tm, timestampFmt.c_str());
        if (timestampFmt.find("%S") != std::string::npos)
        {
          oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << std::setfill(' ');
        }
        break;
      }
      case FormatToken::ThreadId:
        oss << std::hex << std::setfill('0') << std::setw(sizeof(std::size_t) * 2)
            << std::hash<std::thread::id>{}(std::this_thread::get_id()) << std::dec
            << std::setfill(' ');
        break;
      case FormatToken::Level:
        oss << levelToString(level);
        break;
      case FormatToken::Message:
        oss << message;
        break;
      case FormatToken::File:
        if (file)
        {
          oss << detail::basename(file);
        }
        break;
      case FormatToken::Line:
        if (file)
        {
          oss << line;
        }
        break;
      case FormatToken::Function:
        if (function)
        {
          oss << function;
        }
        break;
      }
    }
    oss << '\n';
    return oss.str();
  }
};

/// \brief Accumulates streamed values and emits them as one log line.
class LoggerStream
{
public:
  explicit LoggerStream(Logger::Level level) : _level(level) {}

  template <typename T> LoggerStream &operator<<(const T &value)
  {
    _stream << value;
    return *this;
  }

  LoggerStream &operator<<(Logger::Endl)
  {
    flush();
    return *this;
  }

  ~LoggerStream()
  {
    if (!_flushed && !_stream.str().empty())
    {
      flush();
    }
  }

private:
  Logger::Level _level;
  std::ostringstream _stream;
  bool _flushed{false};

  void flush()
  {
    Logger::log(_level, _stream.str());
    _flushed = true;
  }
};

inline LoggerStream Logger::stream(Logger::Level level) { return LoggerStream(level); }

} // namespace core
} // namespace ftpcore

/// \brief Stream-style logging macro carrying source location.
#define FTPCORE_LOG_WITH_LEVEL(level, msg)                                                         \
  do                                                                                               \
  {                                                                                                \
    std::ostringstream _oss;                                                                       \
    _oss << msg;                                                                                   \
    ftpcore::core::Logger::log(ftpcore::core::Logger::Level::level, _oss.str(), __FILE__,         \
                               __LINE__, __func__);                                                \
  } while (0)

#define FTPCORE_LOG_TRACE(msg) FTPCORE_LOG_WITH_LEVEL(Trace, msg)
#define FTPCORE_LOG_DEBUG(msg) FTPCORE_LOG_WITH_LEVEL(Debug, msg)
#define FTPCORE_LOG_INFO(msg) FTPCORE_LOG_WITH_LEVEL(Info, msg)
#define FTPCORE_LOG_WARN(msg) FTPCORE_LOG_WITH_LEVEL(Warning, msg)
#define FTPCORE_LOG_ERROR(msg) FTPCORE_LOG_WITH_LEVEL(Error, msg)
#define FTPCORE_LOG_FATAL(msg) FTPCORE_LOG_WITH_LEVEL(Fatal, msg)
