#pragma once

#include <string>
#include <vector>

#include "infrastructure/logging/logger.hpp"

// Forward declaration
namespace YAML { class Node; }

namespace DRX {

// EN: Executor settings loaded from the `executor` section of a YAML file, with
//     environment variable overrides.
// FR: Paramètres de l'exécuteur chargés depuis la section `executor` d'un fichier YAML,
//     avec surcharges par variables d'environnement.
class ExecutorConfig {
public:
    ExecutorConfig() = default;

    // EN: Load configuration from YAML file. Keys absent from the file keep their value.
    // FR: Charge la configuration depuis un fichier YAML. Les clés absentes gardent leur valeur.
    bool loadFromFile(const std::string& filename);

    // EN: Load configuration from YAML string.
    // FR: Charge la configuration depuis une chaîne YAML.
    bool loadFromString(const std::string& yaml_content);

    // EN: Apply <prefix>ENGINE_BINARY, <prefix>VOLUME_NAME, <prefix>OUTPUT_DIR_NAME,
    //     <prefix>CONTAINER_OUTPUT_PATH, <prefix>COMMAND_TIMEOUT_SECONDS, <prefix>LOG_LEVEL
    //     and <prefix>LOG_FILE. Returns false if a value could not be parsed.
    // FR: Applique les variables <prefix>ENGINE_BINARY, etc. Retourne faux si une valeur
    //     est invalide.
    bool loadEnvironmentOverrides(const std::string& prefix = "DRX_");

    // EN: Validate current values.
    // FR: Valide les valeurs actuelles.
    bool validate(std::vector<std::string>& errors) const;

    // EN: Log level named by log_level (case-insensitive). Throws std::invalid_argument.
    // FR: Niveau de log désigné par log_level (insensible à la casse). Lève std::invalid_argument.
    LogLevel parseLogLevel() const;

    static bool parseLogLevel(const std::string& text, LogLevel& level);

    const std::string& getEngineBinary() const { return engine_binary_; }
    const std::string& getVolumeName() const { return volume_name_; }
    const std::string& getOutputDirName() const { return output_dir_name_; }
    const std::string& getContainerOutputPath() const { return container_output_path_; }
    int getCommandTimeoutSeconds() const { return command_timeout_seconds_; }
    const std::string& getLogLevel() const { return log_level_; }
    const std::string& getLogFile() const { return log_file_; }

    void setEngineBinary(const std::string& value) { engine_binary_ = value; }
    void setVolumeName(const std::string& value) { volume_name_ = value; }
    void setOutputDirName(const std::string& value) { output_dir_name_ = value; }
    void setContainerOutputPath(const std::string& value) { container_output_path_ = value; }
    void setCommandTimeoutSeconds(int value) { command_timeout_seconds_ = value; }
    void setLogLevel(const std::string& value) { log_level_ = value; }
    void setLogFile(const std::string& value) { log_file_ = value; }

private:
    bool applyNode(const YAML::Node& root);

    std::string engine_binary_ = "docker";
    std::string volume_name_ = "dadosjusbr";
    std::string output_dir_name_ = "output";
    std::string container_output_path_ = "/output";
    int command_timeout_seconds_ = 0;
    std::string log_level_ = "INFO";
    std::string log_file_;
};

} // namespace DRX
