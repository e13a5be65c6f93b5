#pragma once
/// @file Logger.hpp
/// @brief Process-wide synchronous logger and BT_LOG_* macros

#include <iosfwd>
#include <mutex>
#include <sstream>
#include <string>
#include <system_error>

namespace BookTracker {

enum class LogLevel { Debug = 0, Info, Warn, Error, Off };

const char* toString(LogLevel level) noexcept;

/// @brief Accepts debug, info, warn, error, off (case-insensitive)
bool parseLogLevel(const std::string& text, LogLevel& out, std::error_code& ec);

/// @brief Singleton logger writing one line per message to a single sink
///
/// Line format: `2026-10-18 09:15:02.123 [INFO] [store] message (BookStore.cpp:87)`
class Logger {
  public:
    static Logger& instance();

    void setMinimumLevel(LogLevel level);
    LogLevel minimumLevel() const;

    /// @brief Redirects output; nullptr restores std::cerr
    void setSink(std::ostream* sink);

    bool enabled(LogLevel level) const;

    void log(LogLevel level, const char* module, const std::string& message, const char* file,
             int line);

  private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex mutex_;
    LogLevel minimum_ = LogLevel::Info;
    std::ostream* sink_ = nullptr;
};

} // namespace BookTracker

/// @brief Logs a streamed message, e.g. `BT_LOG_INFO("store", "added " << id)`
#define BT_LOG(level, module, message)                                                             \
    do {                                                                                           \
        ::BookTracker::Logger& btLogger_ = ::BookTracker::Logger::instance();                      \
        if (btLogger_.enabled(level)) {                                                            \
            std::ostringstream btLogStream_;                                                       \
            btLogStream_ << message;                                                               \
            btLogger_.log(level, module, btLogStream_.str(), __FILE__, __LINE__);                  \
        }                                                                                          \
    } while (0)

#define BT_LOG_DEBUG(module, message) BT_LOG(::BookTracker::LogLevel::Debug, module, message)
#define BT_LOG_INFO(module, message) BT_LOG(::BookTracker::LogLevel::Info, module, message)
#define BT_LOG_WARN(module, message) BT_LOG(::BookTracker::LogLevel::Warn, module, message)
#define BT_LOG_ERROR(module, message) BT_LOG(::BookTracker::LogLevel::Error, module, message)
