// EN: Implementation of the Logger class. NDJSON lines are built with nlohmann::json so any
//     captured process text in a message is escaped correctly.
// FR: Implémentation de la classe Logger. Les lignes NDJSON sont construites avec nlohmann::json
//     pour que tout texte de processus capturé soit correctement échappé.

#include "infrastructure/logging/logger.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <random>
#include <sstream>
#include <thread>

namespace DRX {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

// EN: Pending lines reach the file or stderr before static teardown.
// FR: Les lignes en attente atteignent le fichier ou stderr avant la destruction statique.
Logger::~Logger() {
    flush();
}

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_level_ = level;
}

LogLevel Logger::getLogLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_level_;
}

bool Logger::setOutputFile(const std::string& filename) {
    auto file = std::make_unique<std::ofstream>(filename, std::ios::app);
    std::lock_guard<std::mutex> lock(mutex_);
    if (!file->is_open()) {
        std::cerr << "drx: cannot open log file " << filename << ", logging to stderr" << std::endl;
        log_file_.reset();
        console_output_ = true;
        return false;
    }
    log_file_ = std::move(file);
    console_output_ = false;
    return true;
}

void Logger::resetOutput() {
    std::lock_guard<std::mutex> lock(mutex_);
    log_file_.reset();
    console_output_ = true;
}

void Logger::setCorrelationId(const std::string& correlation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    correlation_id_ = correlation_id;
}

void Logger::addGlobalMetadata(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    global_metadata_[key] = value;
}

void Logger::clearGlobalMetadata() {
    std::lock_guard<std::mutex> lock(mutex_);
    global_metadata_.clear();
}

void Logger::log(LogLevel level, const std::string& module, const std::string& message,
                 const Metadata& metadata) {
    LogEntry entry{std::chrono::system_clock::now(), level, message, {}, module, {}, metadata};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < current_level_) {
            return;
        }
        entry.correlation_id = correlation_id_;
        for (const auto& [key, value] : global_metadata_) {
            entry.metadata.emplace(key, value);
        }
    }

    std::ostringstream thread_id;
    thread_id << std::this_thread::get_id();
    entry.thread_id = thread_id.str();

    writeLine(formatAsNDJSON(entry));
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_) {
        log_file_->flush();
    } else {
        std::cerr.flush();
    }
}

std::string Logger::generateCorrelationId() {
    std::random_device seed;
    std::mt19937_64 engine(seed());
    std::uniform_int_distribution<std::uint64_t> half;
    const std::uint64_t high = half(engine);
    const std::uint64_t low = half(engine);

    char buffer[37];
    std::snprintf(buffer, sizeof(buffer), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(high >> 32),
                  static_cast<unsigned>((high >> 16) & 0xffff),
                  static_cast<unsigned>(high & 0xffff),
                  static_cast<unsigned>(low >> 48),
                  static_cast<unsigned long long>(low & 0xffffffffffffULL));
    return buffer;
}

void Logger::writeLine(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_) {
        *log_file_ << line << '\n';
    }
    if (console_output_) {
        std::cerr << line << '\n';
    }
}

std::string Logger::formatAsNDJSON(const LogEntry& entry) {
    // EN: ordered_json keeps the fixed fields first, in a stable order.
    // FR: ordered_json garde les champs fixes en premier, dans un ordre stable.
    nlohmann::ordered_json json = {
        {"timestamp", timestampToISO8601(entry.timestamp)},
        {"level", levelToString(entry.level)},
        {"message", entry.message},
        {"module", entry.module},
        {"thread_id", entry.thread_id},
    };
    if (!entry.correlation_id.empty()) {
        json["correlation_id"] = entry.correlation_id;
    }
    for (const auto& [key, value] : entry.metadata) {
        if (!json.contains(key)) {
            json[key] = value;
        }
    }
    // EN: Replace invalid UTF-8 instead of throwing on raw process output.
    // FR: Remplace l'UTF-8 invalide au lieu de lever une exception.
    return json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
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

std::string Logger::timestampToISO8601(const std::chrono::system_clock::time_point& tp) {
    using namespace std::chrono;
    const auto since_epoch = duration_cast<milliseconds>(tp.time_since_epoch());
    const std::time_t whole_seconds = static_cast<std::time_t>(duration_cast<std::chrono::seconds>(since_epoch).count());
    const long millis = static_cast<long>(since_epoch.count() % 1000);

    std::tm utc{};
    gmtime_r(&whole_seconds, &utc);

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03ldZ",
                  utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                  utc.tm_hour, utc.tm_min, utc.tm_sec, millis);
    return buffer;
}

} // namespace DRX
