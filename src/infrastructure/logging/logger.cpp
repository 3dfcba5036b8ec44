// EN: NDJSON logger implementation
// FR: Implémentation du logger NDJSON

#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>
#include <thread>

#include <nlohmann/json.hpp>

namespace MLC {

namespace {

std::string isoTimestamp(const std::chrono::system_clock::time_point& tp) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << "." << std::setfill('0') << std::setw(3) << millis << "Z";
    return oss.str();
}

std::string currentThreadId() {
    std::ostringstream oss;
    oss << std::this_thread::get_id();
    return oss.str();
}

} // namespace

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    flush();
}

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::getLogLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

bool Logger::isEnabled(LogLevel level) const {
    return level >= getLogLevel();
}

bool Logger::setOutputFile(const std::string& filename) {
    auto file = std::make_unique<std::ofstream>(filename, std::ios::app);
    if (!file->is_open()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    file_ = std::move(file);
    console_ = false;
    return true;
}

void Logger::setConsoleOutput(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_ = enabled;
}

void Logger::setCorrelationId(const std::string& correlation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    correlation_id_ = correlation_id;
}

// EN: 128 random bits printed as 8-4-4-4-12 hex groups
// FR: 128 bits aléatoires affichés en groupes hexadécimaux 8-4-4-4-12
std::string Logger::generateCorrelationId() {
    static thread_local std::mt19937_64 engine{std::random_device{}()};
    uint64_t high = engine();
    uint64_t low = engine();
    
    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(8) << (high >> 32) << "-"
        << std::setw(4) << ((high >> 16) & 0xffff) << "-"
        << std::setw(4) << (high & 0xffff) << "-"
        << std::setw(4) << (low >> 48) << "-"
        << std::setw(12) << (low & 0xffffffffffffULL);
    return oss.str();
}

void Logger::log(LogLevel level, const std::string& module, const std::string& message,
                 const LogMetadata& metadata) {
    LogEntry entry;
    entry.timestamp = std::chrono::system_clock::now();
    entry.level = level;
    entry.module = module;
    entry.message = message;
    entry.thread_id = currentThreadId();
    entry.metadata = metadata;
    
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < level_) {
        return;
    }
    entry.correlation_id = correlation_id_;
    std::string line = formatAsNDJSON(entry);
    if (file_) {
        *file_ << line << '\n';
    }
    if (console_) {
        std::cerr << line << '\n';
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_) {
        file_->flush();
    }
    std::cerr.flush();
}

LogLevel Logger::levelFromString(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

std::string Logger::formatAsNDJSON(const LogEntry& entry) {
    nlohmann::ordered_json line = {
        {"timestamp", isoTimestamp(entry.timestamp)},
        {"level", levelToString(entry.level)},
        {"module", entry.module},
        {"message", entry.message},
        {"thread_id", entry.thread_id}
    };
    if (!entry.correlation_id.empty()) {
        line["correlation_id"] = entry.correlation_id;
    }
    for (const auto& [key, value] : entry.metadata) {
        line[key] = value;
    }
    return line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace MLC
