#include <booktracker/util/Logger.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace BookTracker {

namespace {

const char* baseName(const char* path) {
    const char* base = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/')
            base = p + 1;
    }
    return base;
}

} // namespace

const char* toString(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Off:
        return "OFF";
    }
    return "UNKNOWN";
}

bool parseLogLevel(const std::string& text, LogLevel& out, std::error_code& ec) {
    ec.clear();
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug")
        out = LogLevel::Debug;
    else if (lower == "info")
        out = LogLevel::Info;
    else if (lower == "warn" || lower == "warning")
        out = LogLevel::Warn;
    else if (lower == "error")
        out = LogLevel::Error;
    else if (lower == "off")
        out = LogLevel::Off;
    else {
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }
    return true;
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::setMinimumLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    minimum_ = level;
}

LogLevel Logger::minimumLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return minimum_;
}

void Logger::setSink(std::ostream* sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = sink;
}

bool Logger::enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level != LogLevel::Off && level >= minimum_;
}

void Logger::log(LogLevel level, const char* module, const std::string& message,
                 const char* file, int line) {
    auto now = std::chrono::system_clock::now();
    std::time_t secs = std::chrono::system_clock::to_time_t(now);
    auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() %
        1000;
    std::tm tm{};
    ::localtime_r(&secs, &tm);

    std::lock_guard<std::mutex> lock(mutex_);
    std::ostream& out = sink_ ? *sink_ : std::cerr;
    out << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis << std::setfill(' ') << " [" << toString(level) << "] [" << module << "] "
        << message << " (" << baseName(file) << ':' << line << ")\n";
    out.flush();
}

} // namespace BookTracker
