// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vesper, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <cstdio>
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
#include <vector>

namespace vesper
{
namespace core
{

namespace detail
{
  /// \brief Strip the directory part of a __FILE__ path at compile time.
  constexpr const char* basename(const char* path)
  {
    const char* file = path;
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

/// \brief Process-wide, thread-safe logger with levels, optional async
/// writer thread, daily file rotation with retention and an external sink.
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

  /// \brief External sink. Receives the level, the formatted line and the raw
  /// message text.
  using ExternalHandler = std::function<void(Level level, const std::string& formattedMessage,
                                             const std::string& rawMessage)>;

  struct Endl
  {
  };
  static inline constexpr Endl endl{};

  /// \brief Configure the logger.
  /// \param level Minimum level written.
  /// \param filePath Base path of the log file; empty logs to stdout.
  /// \param async Write from a background thread.
  /// \param retentionDays Rotated files older than this are deleted.
  /// \param timeFormat strftime pattern used for %T.
  static void init(Level level = Level::Info, const std::string& filePath = "",
                   bool async = false, int retentionDays = 7,
                   const std::string& timeFormat = "%Y-%m-%d %H:%M:%S")
  {
    auto& data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);

    data.minLevel = level;
    data.asyncMode = async;
    data.exit = false;
    data.logBasePath = filePath;
    data.retentionDays = retentionDays;
    data.timestampFormat = timeFormat;
    data.currentLogDate.clear();
    data.fileStream.reset();
    rotateLogFileIfNeeded();

    if (data.asyncMode && !data.workerThread.joinable())
    {
      data.workerThread = std::thread(runWorker);
    }
  }

  /// \brief Write out everything queued so far.
  static void flush()
  {
    auto& data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    drainQueue();
    if (data.fileStream)
    {
      data.fileStream->flush();
    }
  }

  /// \brief Flush and stop the async writer, if any.
  static void shutdown()
  {
    flush();
    auto& data = getData();
    {
      std::lock_guard<std::mutex> lock(data.mutex);
      data.exit = true;
    }
    data.cv.notify_one();

    if (data.workerThread.joinable())
    {
      data.workerThread.join();
    }

    // Anything logged after shutdown is written synchronously
    std::lock_guard<std::mutex> lock(data.mutex);
    data.asyncMode = false;
    data.exit = false;
  }

  static void setLevel(Level level)
  {
    auto& data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.minLevel = level;
  }

  static Level getLevel()
  {
    auto& data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    return data.minLevel;
  }

  /// \brief Route every log line to \p handler instead of file or stdout.
  static void setExternalHandler(ExternalHandler handler)
  {
    auto& data = getData();
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
    auto& data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.externalHandler = nullptr;
    data.currentLogDate.clear();
  }

  /// \brief Set the line layout.
  /// Placeholders: %T timestamp, %t thread id, %L level, %m message,
  /// %F source file, %l source line, %f function, %% literal percent.
  /// Source placeholders are only filled by the VESPER_LOG_* macros.
  static void setLogFormat(const std::string& format)
  {
    if (format.empty())
    {
      return;
    }
    auto& data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.logFormat = format;
    data.compiledFormat = compileFormat(format);
  }

  static std::string getLogFormat()
  {
    auto& data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    return data.logFormat;
  }

  static void trace(const std::string& message) { log(Level::Trace, message); }
  static void debug(const std::string& message) { log(Level::Debug, message); }
  static void info(const std::string& message) { log(Level::Info, message); }
  static void warning(const std::string& message) { log(Level::Warning, message); }
  static void error(const std::string& message) { log(Level::Error, message); }
  static void fatal(const std::string& message) { log(Level::Fatal, message); }

  static LoggerStream stream(Level level);

  static void log(Level level, const std::string& message)
  {
    log(level, message, nullptr, 0, nullptr);
  }

  static void log(Level level, const std::string& message, const char* file, int line,
                  const char* function)
  {
    auto& data = getData();
    std::unique_lock<std::mutex> lock(data.mutex);
    if (level < data.minLevel)
    {
      return;
    }

    std::string output = formatLine(level, message, file, line, function, data.compiledFormat,
                                    data.timestampFormat);

    if (data.externalHandler)
    {
      auto handler = data.externalHandler;
      lock.unlock();
      handler(level, output, message);
      return;
    }

    data.queue.push(std::move(output));
    if (data.asyncMode)
    {
      lock.unlock();
      data.cv.notify_one();
      return;
    }
    drainQueue();
  }

  static std::string currentDate()
  {
    auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d");
    return oss.str();
  }

  static const char* levelToString(Level level)
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

  /// \brief Parse a level name ("trace", "debug", "info", "warn", "warning",
  /// "error", "fatal"), case-insensitively. Unknown names map to Info.
  static Level levelFromString(const std::string& name)
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
  friend class LoggerStream;

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
    std::vector<FormatSegment> compiledFormat = compileFormat("[%T] [%L] %m");

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

  static LoggerData& getData()
  {
    static LoggerData data;
    return data;
  }

  static void runWorker()
  {
    auto& data = getData();
    std::unique_lock<std::mutex> lock(data.mutex);
    while (true)
    {
      data.cv.wait(lock, [&data] { return !data.queue.empty() || data.exit; });
      drainQueue();
      if (data.exit)
      {
        break;
      }
    }
  }

  /// \note Caller holds data.mutex.
  static void drainQueue()
  {
    auto& data = getData();
    while (!data.queue.empty())
    {
      rotateLogFileIfNeeded();
      const std::string& entry = data.queue.front();
      if (data.fileStream)
      {
        (*data.fileStream) << entry;
        data.fileStream->flush();
      }
      else
      {
        std::cout << entry;
      }
      data.queue.pop();
    }
  }

  /// \note Caller holds data.mutex.
  static void rotateLogFileIfNeeded()
  {
    auto& data = getData();
    if (data.logBasePath.empty() || data.externalHandler)
    {
      return;
    }

    namespace fs = std::filesystem;
    auto logPath = fs::path(data.logBasePath);
    auto logDir = logPath.parent_path();
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
    std::string rotatedPath =
      (logDir / (logPath.filename().string() + "." + today + ".log")).string();

    data.fileStream = std::make_unique<std::ofstream>(rotatedPath, std::ios::app);
    if (!data.fileStream->is_open())
    {
      std::cerr << "[Logger] Failed to open log file: " << rotatedPath << std::endl;
      data.fileStream.reset();
    }

    deleteOldLogFiles(logDir, logPath.filename().string() + ".");
  }

  static void deleteOldLogFiles(const std::filesystem::path& logDir, const std::string& prefix)
  {
    auto& data = getData();
    if (data.retentionDays <= 0)
    {
      return;
    }

    namespace fs = std::filesystem;
    auto now = std::chrono::system_clock::now();
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(logDir, ec))
    {
      std::string fname = entry.path().filename().string();
      if (fname.rfind(prefix, 0) != 0 || fname.size() < prefix.size() + 10)
      {
        continue;
      }

      // baseName.YYYY-MM-DD.log
      std::tm tm = {};
      std::istringstream ss(fname.substr(prefix.size(), 10));
      ss >> std::get_time(&tm, "%Y-%m-%d");
      if (ss.fail())
      {
        continue;
      }
      auto fileTime = std::chrono::system_clock::from_time_t(std::mktime(&tm));
      auto ageDays = std::chrono::duration_cast<std::chrono::hours>(now - fileTime).count() / 24;
      if (ageDays >= data.retentionDays)
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

  static std::vector<FormatSegment> compileFormat(const std::string& format)
  {
    std::vector<FormatSegment> segments;
    std::string literal;

    auto flushLiteral = [&]()
    {
      if (!literal.empty())
      {
        segments.push_back({FormatToken::Literal, literal});
        literal.clear();
      }
    };

    for (std::size_t i = 0; i < format.size(); ++i)
    {
      if (format[i] != '%' || i + 1 >= format.size())
      {
        literal += format[i];
        continue;
      }

      FormatToken token = FormatToken::Literal;
      switch (format[i + 1])
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
        // Unknown placeholder, keep the '%' as text
        literal += format[i];
        continue;
      }

      flushLiteral();
      segments.push_back({token, ""});
      ++i;
    }
    flushLiteral();
    return segments;
  }

  static std::string formatTimestamp(const std::string& timestampFmt)
  {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::tm tm{};
    localtime_r(&t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, timestampFmt.c_str());
    if (timestampFmt.find("%S") != std::string::npos)
    {
      oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    }
    return oss.str();
  }

  static std::string formatLine(Level level, const std::string& message, const char* file,
                                int line, const char* function,
                                const std::vector<FormatSegment>& segments,
                                const std::string& timestampFmt)
  {
    std::ostringstream oss;
    for (const auto& seg : segments)
    {
      switch (seg.token)
      {
      case FormatToken::Literal:
        oss << seg.literal;
        break;
      case FormatToken::Timestamp:
        oss << formatTimestamp(timestampFmt);
        break;
      case FormatToken::ThreadId:
        oss << std::hex << std::setfill('0') << std::setw(sizeof(std::size_t) * 2)
            << std::hash<std::thread::id>{}(std::this_thread::get_id()) << std::dec;
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

/// \brief Accumulates a message with operator<< and logs it on Logger::endl
/// or destruction.
class LoggerStream
{
public:
  explicit LoggerStream(Logger::Level level) : _level(level) {}

  LoggerStream(LoggerStream&& other) noexcept
    : _level(other._level), _stream(std::move(other._stream)), _flushed(other._flushed)
  {
    other._flushed = true;
  }

  template <typename T> LoggerStream& operator<<(const T& value)
  {
    _stream << value;
    return *this;
  }

  LoggerStream& operator<<(Logger::Endl)
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
    _stream.str("");
    _flushed = true;
  }
};

inline LoggerStream Logger::stream(Logger::Level level) { return LoggerStream(level); }

#define VESPER_LOG_WITH_LEVEL(level, msg)                                                          \
  do                                                                                               \
  {                                                                                                \
    std::ostringstream _vesperOss;                                                                 \
    _vesperOss << msg;                                                                             \
    vesper::core::Logger::log(vesper::core::Logger::Level::level, _vesperOss.str(), __FILE__,     \
                              __LINE__, __func__);                                                 \
  } while (0)

#define VESPER_LOG_TRACE(msg) VESPER_LOG_WITH_LEVEL(Trace, msg)
#define VESPER_LOG_DEBUG(msg) VESPER_LOG_WITH_LEVEL(Debug, msg)
#define VESPER_LOG_INFO(msg) VESPER_LOG_WITH_LEVEL(Info, msg)
#define VESPER_LOG_WARN(msg) VESPER_LOG_WITH_LEVEL(Warning, msg)
#define VESPER_LOG_ERROR(msg) VESPER_LOG_WITH_LEVEL(Error, msg)
#define VESPER_LOG_FATAL(msg) VESPER_LOG_WITH_LEVEL(Fatal, msg)

} // namespace core
} // namespace vesper
