#pragma once

#include <chrono>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace MLC {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

using LogMetadata = std::unordered_map<std::string, std::string>;

// EN: Process-wide NDJSON logger. Entries go to stderr and/or a file; stdout stays free for records.
// FR: Logger NDJSON global au processus. Les entrées vont sur stderr et/ou un fichier ; stdout reste libre pour les enregistrements.
class Logger {
public:
    struct LogEntry {
        std::chrono::system_clock::time_point timestamp;
        LogLevel level{LogLevel::INFO};
        std::string module;
        std::string message;
        std::string correlation_id;
        std::string thread_id;
        LogMetadata metadata;
    };

    static Logger& getInstance();
    
    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;
    bool isEnabled(LogLevel level) const;
    
    // EN: Appends to `filename` and turns console output off. False if the file cannot be opened.
    // FR: Ajoute à `filename` et coupe la sortie console. False si le fichier ne peut être ouvert.
    bool setOutputFile(const std::string& filename);
    void setConsoleOutput(bool enabled);
    
    // EN: Tags every following entry, e.g. one id per mlcctl invocation
    // FR: Marque toutes les entrées suivantes, par ex. un id par invocation de mlcctl
    void setCorrelationId(const std::string& correlation_id);
    std::string generateCorrelationId();
    
    void log(LogLevel level, const std::string& module, const std::string& message,
             const LogMetadata& metadata = {});
    
    void flush();
    
    static LogLevel levelFromString(const std::string& name);
    static std::string levelToString(LogLevel level);
    
    // EN: One JSON object per line: timestamp, level, module, message, thread, correlation id, then metadata
    // FR: Un objet JSON par ligne : horodatage, niveau, module, message, thread, id de corrélation, puis métadonnées
    static std::string formatAsNDJSON(const LogEntry& entry);

private:
    Logger() = default;
    ~Logger();
    
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    
    LogLevel level_ = LogLevel::INFO;
    std::string correlation_id_;
    std::unique_ptr<std::ofstream> file_;
    bool console_ = true;
    mutable std::mutex mutex_;
};

} // namespace MLC

#define LOG_DEBUG(module, message) MLC::Logger::getInstance().log(MLC::LogLevel::DEBUG, module, message)
#define LOG_INFO(module, message) MLC::Logger::getInstance().log(MLC::LogLevel::INFO, module, message)
#define LOG_WARN(module, message) MLC::Logger::getInstance().log(MLC::LogLevel::WARN, module, message)
#define LOG_ERROR(module, message) MLC::Logger::getInstance().log(MLC::LogLevel::ERROR, module, message)

#define LOG_DEBUG_META(module, message, metadata) \
    MLC::Logger::getInstance().log(MLC::LogLevel::DEBUG, module, message, metadata)
#define LOG_INFO_META(module, message, metadata) \
    MLC::Logger::getInstance().log(MLC::LogLevel::INFO, module, message, metadata)
#define LOG_WARN_META(module, message, metadata) \
    MLC::Logger::getInstance().log(MLC::LogLevel::WARN, module, message, metadata)
#define LOG_ERROR_META(module, message, metadata) \
    MLC::Logger::getInstance().log(MLC::LogLevel::ERROR, module, message, metadata)
