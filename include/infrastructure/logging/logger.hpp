// EN: Structured logger for DR-Executor - NDJSON lines with correlation IDs
// FR: Logger structuré pour DR-Executor - Lignes NDJSON avec IDs de corrélation

#pragma once

#include <chrono>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace DRX {

// EN: Log levels enumeration.
// FR: Énumération des niveaux de log.
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// EN: Thread-safe singleton logger. Console output goes to stderr so stdout stays
//     available for the result document.
// FR: Logger singleton thread-safe. La sortie console va sur stderr pour laisser
//     stdout au document de résultat.
class Logger {
public:
    struct LogEntry {
        std::chrono::system_clock::time_point timestamp;
        LogLevel level;
        std::string message;
        std::string correlation_id;
        std::string module;
        std::string thread_id;
        std::unordered_map<std::string, std::string> metadata;
    };

    static Logger& getInstance();

    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;

    // EN: Append to a file instead of the console. Returns false if the file cannot be opened.
    // FR: Écrit dans un fichier au lieu de la console. Retourne false si le fichier ne s'ouvre pas.
    bool setOutputFile(const std::string& filename);

    // EN: Go back to console output and close any log file.
    // FR: Revient à la sortie console et ferme le fichier de log.
    void resetOutput();

    void setCorrelationId(const std::string& correlation_id);
    void addGlobalMetadata(const std::string& key, const std::string& value);
    void clearGlobalMetadata();

    using Metadata = std::unordered_map<std::string, std::string>;

    // EN: Entry metadata wins over global metadata on key clashes.
    // FR: Les métadonnées de l'entrée priment sur les globales en cas de conflit.
    void log(LogLevel level, const std::string& module, const std::string& message,
             const Metadata& metadata = {});

    void debug(const std::string& module, const std::string& message, const Metadata& metadata = {}) {
        log(LogLevel::DEBUG, module, message, metadata);
    }
    void info(const std::string& module, const std::string& message, const Metadata& metadata = {}) {
        log(LogLevel::INFO, module, message, metadata);
    }
    void warn(const std::string& module, const std::string& message, const Metadata& metadata = {}) {
        log(LogLevel::WARN, module, message, metadata);
    }
    void error(const std::string& module, const std::string& message, const Metadata& metadata = {}) {
        log(LogLevel::ERROR, module, message, metadata);
    }

    void flush();

    // EN: Random 128-bit id rendered as 8-4-4-4-12 hex groups, one per drxctl run.
    // FR: Id aléatoire de 128 bits en groupes hex 8-4-4-4-12, un par exécution de drxctl.
    std::string generateCorrelationId();

    // EN: Format an entry as a single NDJSON line (exposed for tests).
    // FR: Formate une entrée en une ligne NDJSON (exposé pour les tests).
    static std::string formatAsNDJSON(const LogEntry& entry);

    static std::string levelToString(LogLevel level);
    static std::string timestampToISO8601(const std::chrono::system_clock::time_point& tp);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void writeLine(const std::string& line);

    LogLevel current_level_ = LogLevel::INFO;
    std::string correlation_id_;
    Metadata global_metadata_;
    std::unique_ptr<std::ofstream> log_file_;
    mutable std::mutex mutex_;
    bool console_output_ = true;
};

#define LOG_DEBUG(module, message) DRX::Logger::getInstance().debug(module, message)
#define LOG_INFO(module, message) DRX::Logger::getInstance().info(module, message)
#define LOG_WARN(module, message) DRX::Logger::getInstance().warn(module, message)
#define LOG_ERROR(module, message) DRX::Logger::getInstance().error(module, message)

#define LOG_DEBUG_META(module, message, metadata) DRX::Logger::getInstance().debug(module, message, metadata)
#define LOG_INFO_META(module, message, metadata) DRX::Logger::getInstance().info(module, message, metadata)
#define LOG_WARN_META(module, message, metadata) DRX::Logger::getInstance().warn(module, message, metadata)
#define LOG_ERROR_META(module, message, metadata) DRX::Logger::getInstance().error(module, message, metadata)

} // namespace DRX
