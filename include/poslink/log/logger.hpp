#pragma once

#include <mutex>
#include <cstdint>
#include <ctime>
#include <cstdio>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <chrono>

namespace poslink {
namespace log {

// ---------------------------------------------------------
// Log level
// ---------------------------------------------------------
enum class Level : uint8_t {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

// Accepts "trace", "debug", "info", "warn", "error", "fatal".
// Unknown names resolve to Info.
[[nodiscard]]
inline Level level_from_string(std::string_view name) noexcept {
    if (name == "trace") return Level::Trace;
    if (name == "debug") return Level::Debug;
    if (name == "warn")  return Level::Warn;
    if (name == "error") return Level::Error;
    if (name == "fatal") return Level::Fatal;
    return Level::Info;
}

// ---------------------------------------------------------
// Thread-safe global logger
// ---------------------------------------------------------
class Logger {
public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    void set_level(Level lvl) noexcept { level_ = lvl; }

    Level level() const noexcept { return level_; }

    [[nodiscard]]
    bool enabled(Level lvl) const noexcept { return lvl >= level_; }

    void enable_color(bool on) noexcept { color_enabled_ = on; }

    // Thread-safe sink setter (stdout by default)
    void set_output(std::ostream* os) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = os ? os : &std::cout;
    }

    void log(Level lvl, const std::string& msg) {
        if (lvl < level_) return;
        std::lock_guard<std::mutex> lock(mutex_);
        auto& os = *out_;
        if (color_enabled_) os << color_code(lvl);
        os << timestamp() << " [" << level_name(lvl) << "] " << msg;
        if (color_enabled_) os << "\033[0m";
        os << std::endl;
    }

private:
    Logger()
        : out_(&std::cout),
          level_(Level::Info),
          color_enabled_(true)
    {}

    static const char* level_name(Level lvl) {
        switch (lvl) {
            case Level::Trace: return "TRACE";
            case Level::Debug: return "DEBUG";
            case Level::Info:  return "INFO";
            case Level::Warn:  return "WARN";
            case Level::Error: return "ERROR";
            case Level::Fatal: return "FATAL";
        }
        return "?????";
    }

    static constexpr const char* color_code(Level lvl) {
        switch (lvl) {
            case Level::Trace: return "\033[37m";
            case Level::Debug: return "\033[36m";
            case Level::Info:  return "\033[32m";
            case Level::Warn:  return "\033[33m";
            case Level::Error: return "\033[31m";
            case Level::Fatal: return "\033[1;31m";
        }
        return "\033[0m";
    }

    // Local time with millisecond resolution
    static std::string timestamp() {
        using namespace std::chrono;
        auto now = system_clock::now();
        auto t = system_clock::to_time_t(now);
        auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
        std::tm tm{};
        localtime_r(&t, &tm);
        char buf[64];
        auto n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
        std::snprintf(buf + n, sizeof(buf) - n, ".%03d", static_cast<int>(ms));
        return buf;
    }

private:
    std::ostream* out_;
    Level level_;
    bool color_enabled_;
    std::mutex mutex_;
};

// ---------------------------------------------------------
// Streaming log wrapper (collects << into a string)
// ---------------------------------------------------------
class LogStream {
public:
    explicit LogStream(Level lvl) : lvl_(lvl) {}

    template<typename T>
    LogStream& operator<<(const T& v) {
        ss_ << v;
        return *this;
    }

    ~LogStream() {
        Logger::instance().log(lvl_, ss_.str());
    }

private:
    Level lvl_;
    std::ostringstream ss_;
};

} // namespace log
} // namespace poslink


// ---------------------------------------------------------
// Macros for easy logging
// The level check happens before the message is formatted.
// ---------------------------------------------------------
#define PL_LOG_LEVEL(lvl) \
    if (!::poslink::log::Logger::instance().enabled((lvl))) {} else ::poslink::log::LogStream((lvl))

#define PL_TRACE(msg)  PL_LOG_LEVEL(::poslink::log::Level::Trace) << msg
#define PL_DEBUG(msg)  PL_LOG_LEVEL(::poslink::log::Level::Debug) << msg
#define PL_INFO(msg)   PL_LOG_LEVEL(::poslink::log::Level::Info)  << msg
#define PL_WARN(msg)   PL_LOG_LEVEL(::poslink::log::Level::Warn)  << msg
#define PL_ERROR(msg)  PL_LOG_LEVEL(::poslink::log::Level::Error) << msg
#define PL_FATAL(msg)  PL_LOG_LEVEL(::poslink::log::Level::Fatal) << msg
