#include "logger.hpp"
#include "error.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace securewallet {

std::mutex Log::mu_;
LogLevel Log::level_ = LogLevel::Info;
bool Log::console_ = true;
std::ofstream Log::file_;

namespace {

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm tm{};
    localtime_r(&seconds, &tm);

    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis;
    return out.str();
}

} // anonymous namespace

void Log::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mu_);
    level_ = level;
}

LogLevel Log::level() {
    std::lock_guard<std::mutex> lock(mu_);
    return level_;
}

bool Log::enabled(LogLevel level) {
    return level != LogLevel::Off && level >= Log::level();
}

void Log::open_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(mu_);
    if (file_.is_open()) {
        file_.close();
    }
    file_.open(path, std::ios::app);
    if (!file_.is_open()) {
        throw WalletError(WalletError::ErrorType::ConfigError, "Cannot open log file: " + path);
    }
}

void Log::close_file() {
    std::lock_guard<std::mutex> lock(mu_);
    if (file_.is_open()) {
        file_.close();
    }
}

void Log::set_console(bool enabled) {
    std::lock_guard<std::mutex> lock(mu_);
    console_ = enabled;
}

LogLevel Log::parse_level(const std::string& name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warn") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "off") return LogLevel::Off;
    throw WalletError(WalletError::ErrorType::ConfigError, "Unknown log level: '" + name + "'");
}

const char* Log::level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off: return "OFF";
    }
    return "?";
}

void Log::write(LogLevel level, const std::string& message) {
    std::string line = timestamp() + " [" + level_name(level) + "] " + message + "\n";

    std::lock_guard<std::mutex> lock(mu_);
    if (console_) {
        std::cerr << line;
    }
    if (file_.is_open()) {
        file_ << line;
        file_.flush();
    }
}

} // namespace securewallet
