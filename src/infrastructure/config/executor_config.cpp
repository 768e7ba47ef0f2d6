// EN: Implementation of ExecutorConfig. YAML parsing with yaml-cpp and environment overrides.
// FR: Implémentation d'ExecutorConfig. Parsing YAML avec yaml-cpp et surcharges d'environnement.

#include "infrastructure/config/executor_config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace DRX {

namespace {

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

} // namespace

bool ExecutorConfig::loadFromFile(const std::string& filename) {
    try {
        YAML::Node root = YAML::LoadFile(filename);
        if (!applyNode(root)) {
            return false;
        }
        LOG_INFO("config", "Configuration loaded from file: " + filename);
        return true;
    } catch (const YAML::Exception& e) {
        LOG_ERROR("config", "Failed to load config file " + filename + ": " + e.what());
        return false;
    }
}

bool ExecutorConfig::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node root = YAML::Load(yaml_content);
        return applyNode(root);
    } catch (const YAML::Exception& e) {
        LOG_ERROR("config", "Failed to parse YAML content: " + std::string(e.what()));
        return false;
    }
}

bool ExecutorConfig::applyNode(const YAML::Node& root) {
    if (!root || root.IsNull()) {
        return true;
    }
    if (!root.IsMap()) {
        LOG_ERROR("config", "Configuration root must be a mapping");
        return false;
    }

    YAML::Node section = root["executor"];
    if (!section) {
        return true;
    }
    if (!section.IsMap()) {
        LOG_ERROR("config", "Section 'executor' must be a mapping");
        return false;
    }

    // EN: Values are read into a copy so a type error leaves the configuration untouched.
    // FR: Les valeurs sont lues dans une copie : une erreur de type laisse la configuration intacte.
    ExecutorConfig updated = *this;
    try {
        if (section["engine_binary"]) updated.engine_binary_ = section["engine_binary"].as<std::string>();
        if (section["volume_name"]) updated.volume_name_ = section["volume_name"].as<std::string>();
        if (section["output_dir_name"]) updated.output_dir_name_ = section["output_dir_name"].as<std::string>();
        if (section["container_output_path"]) {
            updated.container_output_path_ = section["container_output_path"].as<std::string>();
        }
        if (section["command_timeout_seconds"]) {
            updated.command_timeout_seconds_ = section["command_timeout_seconds"].as<int>();
        }
        if (section["log_level"]) updated.log_level_ = section["log_level"].as<std::string>();
        if (section["log_file"]) updated.log_file_ = section["log_file"].as<std::string>();
    } catch (const YAML::BadConversion& e) {
        LOG_ERROR("config", "Invalid value in section 'executor': " + std::string(e.what()));
        return false;
    }

    *this = updated;
    return true;
}

bool ExecutorConfig::loadEnvironmentOverrides(const std::string& prefix) {
    LOG_DEBUG("config", "Loading environment overrides with prefix: " + prefix);

    auto apply = [&prefix](const char* name, std::string& target) {
        const char* value = std::getenv((prefix + name).c_str());
        if (value) {
            target = value;
            LOG_INFO("config", "Environment override applied: " + prefix + name);
        }
    };

    apply("ENGINE_BINARY", engine_binary_);
    apply("VOLUME_NAME", volume_name_);
    apply("OUTPUT_DIR_NAME", output_dir_name_);
    apply("CONTAINER_OUTPUT_PATH", container_output_path_);
    apply("LOG_LEVEL", log_level_);
    apply("LOG_FILE", log_file_);

    const char* timeout = std::getenv((prefix + "COMMAND_TIMEOUT_SECONDS").c_str());
    if (timeout) {
        try {
            size_t consumed = 0;
            int seconds = std::stoi(timeout, &consumed);
            if (consumed != std::string(timeout).size()) {
                throw std::invalid_argument(timeout);
            }
            command_timeout_seconds_ = seconds;
            LOG_INFO("config", "Environment override applied: " + prefix + "COMMAND_TIMEOUT_SECONDS");
        } catch (const std::logic_error&) {
            LOG_ERROR("config", "Invalid integer in " + prefix + "COMMAND_TIMEOUT_SECONDS: " + timeout);
            return false;
        }
    }
    return true;
}

bool ExecutorConfig::validate(std::vector<std::string>& errors) const {
    errors.clear();

    if (engine_binary_.empty()) {
        errors.push_back("executor.engine_binary must not be empty");
    }
    if (volume_name_.empty()) {
        errors.push_back("executor.volume_name must not be empty");
    }
    if (output_dir_name_.empty() || output_dir_name_.find('/') != std::string::npos ||
        output_dir_name_ == "." || output_dir_name_ == "..") {
        errors.push_back("executor.output_dir_name must be a single directory name");
    }
    if (container_output_path_.empty() || container_output_path_[0] != '/') {
        errors.push_back("executor.container_output_path must be an absolute path");
    }
    if (command_timeout_seconds_ < 0) {
        errors.push_back("executor.command_timeout_seconds must be >= 0");
    }
    LogLevel level;
    if (!parseLogLevel(log_level_, level)) {
        errors.push_back("executor.log_level must be one of DEBUG, INFO, WARN, ERROR");
    }

    return errors.empty();
}

bool ExecutorConfig::parseLogLevel(const std::string& text, LogLevel& level) {
    std::string upper = toUpper(text);
    if (upper == "DEBUG") {
        level = LogLevel::DEBUG;
    } else if (upper == "INFO") {
        level = LogLevel::INFO;
    } else if (upper == "WARN" || upper == "WARNING") {
        level = LogLevel::WARN;
    } else if (upper == "ERROR") {
        level = LogLevel::ERROR;
    } else {
        return false;
    }
    return true;
}

LogLevel ExecutorConfig::parseLogLevel() const {
    LogLevel level;
    if (!parseLogLevel(log_level_, level)) {
        throw std::invalid_argument("unknown log level: " + log_level_);
    }
    return level;
}

} // namespace DRX
