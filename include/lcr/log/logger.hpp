#pragma once

#include <mutex>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <chrono>

namespace lcr {
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
    Fatal,
    Off
};

// Accepts: trace | debug | info | warn | error | fatal | off
// Unknown strings map to Info.
[[nodiscard]] inline Level parse_level(std::string_view s) noexcept {
    if (s == "trace") return Level::Trace;
    if (s == "debug") return Level::Debug;
    if (s == "warn")  return Level::Warn;
    if (s == "error") return Level::Error;
    if (s == "fatal") return Level::Fatal;
    if (s == "off")   return Level::Off;
    return Level::Info;
}

// ---------------------------------------------------------
// Thread-safe global logger
// ---------------------------------------------------------
// Ingestion workers log from their own threads; every line is
// written under the mutex so lines never interleave.
class Logger {
public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    void set_level(Level lvl) noexcept { level_ = lvl; }

    Level level() const noexcept { return level_; }

    [[nodiscard]] bool enabled(Level lvl) const noexcept { return lvl >= level_ && lvl != Level::Off; }

    void enable_color(bool on) noexcept { color_enabled_ = on; }

    // stderr by default; tests redirect to a std::ostringstream
    void set_output(std::ostream* os) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = os;
    }

    void log(Level lvl, const std::string& msg) {
        if (!enabled(lvl)) return;
        std::lock_guard<std::mutex> lock(mutex_);
        auto& os = *out_;
        if (color_enabled_) os << color_code(lvl);
        os << timestamp() << " [" << level_name(lvl) << "] " << msg;
        if (color_enabled_) os << "\033[0m";
        os << '\n';
        os.flush();
    }

private:
    Logger()
        : out_(&std::cerr),
          level_(Level::Info),
          color_enabled_(false)
    {}

    static const char* level_name(Level lvl) {
        switch (lvl) {
            case Level::Trace: return "TRACE";
            case Level::Debug: return "DEBUG";
            case Level::Info:  return "INFO";
            case Level::Warn:  return "WARN";
            case Level::Error: return "ERROR";
            case Level::Fatal: return "FATAL";
            case Level::Off:   break;
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
            case Level::Off:   break;
        }
        return "\033[0m";
    }

    // Local wall-clock time with millisecond resolution
    static std::string timestamp() {
        using namespace std::chrono;
        auto now = system_clock::now();
        auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
        auto t = system_clock::to_time_t(now);
        std::tm tm{};
        localtime_r(&t, &tm);
        char buf[64];
        std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
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
} // namespace lcr


// ---------------------------------------------------------
// Macros for easy logging
// ---------------------------------------------------------
// The level check happens before the message is formatted.
#define TDB_LOG_LEVEL(lvl) \
    if (!::lcr::log::Logger::instance().enabled((lvl))) {} else ::lcr::log::LogStream((lvl))

#define TDB_TRACE(msg)  TDB_LOG_LEVEL(::lcr::log::Level::Trace) << msg
#define TDB_DEBUG(msg)  TDB_LOG_LEVEL(::lcr::log::Level::Debug) << msg
#define TDB_INFO(msg)   TDB_LOG_LEVEL(::lcr::log::Level::Info)  << msg
#define TDB_WARN(msg)   TDB_LOG_LEVEL(::lcr::log::Level::Warn)  << msg
#define TDB_ERROR(msg)  TDB_LOG_LEVEL(::lcr::log::Level::Error) << msg
#define TDB_FATAL(msg)  TDB_LOG_LEVEL(::lcr::log::Level::Fatal) << msg
