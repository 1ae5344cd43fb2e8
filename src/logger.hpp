#pragma once

#include <fstream>
#include <mutex>
#include <sstream>
#include <string>

namespace securewallet {

enum class LogLevel {
    Debug = 0,
    Info,
    Warn,
    Error,
    Off
};

// Process-wide log sink: every line goes to std::cerr and, when a log file is
// open, to the file as well
class Log {
public:
    static void set_level(LogLevel level);
    static LogLevel level();
    static bool enabled(LogLevel level);

    // Opens (appends to) a log file in addition to std::cerr.
    // Throws WalletError(ConfigError) if the file can't be opened
    static void open_file(const std::string& path);
    static void close_file();

    // Silences std::cerr output (file output continues); used by tests
    static void set_console(bool enabled);

    // "debug", "info", "warn", "error", "off"; throws WalletError(ConfigError)
    static LogLevel parse_level(const std::string& name);
    static const char* level_name(LogLevel level);

    static void write(LogLevel level, const std::string& message);

private:
    Log() = delete;

    static std::mutex mu_;
    static LogLevel level_;
    static bool console_;
    static std::ofstream file_;
};

// Collects one log line and hands it to Log::write when it goes out of scope
class LogLine {
public:
    explicit LogLine(LogLevel level) : level_(level) {}
    ~LogLine() { Log::write(level_, stream_.str()); }

    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;

    template <typename T>
    LogLine& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    LogLevel level_;
    std::ostringstream stream_;
};

} // namespace securewallet

#define SECUREWALLET_LOG(lvl) \
    if (!::securewallet::Log::enabled(lvl)) {} \
    else ::securewallet::LogLine(lvl)

#define LOG_DEBUG SECUREWALLET_LOG(::securewallet::LogLevel::Debug)
#define LOG_INFO  SECUREWALLET_LOG(::securewallet::LogLevel::Info)
#define LOG_WARN  SECUREWALLET_LOG(::securewallet::LogLevel::Warn)
#define LOG_ERROR SECUREWALLET_LOG(::securewallet::LogLevel::Error)
