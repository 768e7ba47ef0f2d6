// EN: Resource lifecycle manager - shared output directory and named volume for a pipeline run
// FR: Gestionnaire du cycle de vie des ressources - répertoire de sortie et volume nommé partagés

#pragma once

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "executor/container_executor.hpp"
#include "infrastructure/system/process_runner.hpp"

namespace DRX {
namespace Executor {

// EN: Fatal setup or teardown failure. No partial-state cleanup is attempted.
// FR: Échec fatal de mise en place ou de nettoyage. Aucun nettoyage partiel n'est tenté.
class ResourceError : public std::runtime_error {
public:
    explicit ResourceError(const std::string& message) : std::runtime_error(message) {}
};

struct ResourceLifecycleConfig {
    std::string engine_binary = "docker";
    std::string output_dir_name = "output";
    std::filesystem::perms output_permissions = std::filesystem::perms::all;
};

class ResourceLifecycleManager {
public:
    explicit ResourceLifecycleManager(std::shared_ptr<CommandRunner> runner,
                                      ResourceLifecycleConfig config = {});

    // EN: Recreate <base_dir>/<output> and bind a named local volume to it.
    // FR: Recrée <base_dir>/<output> et y lie un volume local nommé.
    SharedVolume setup(const std::string& base_dir,
                       const std::string& volume_name,
                       const ExecutionOptions& options = {}) const;

    // EN: Remove the named volume. The host directory is left in place for the caller.
    // FR: Supprime le volume nommé. Le répertoire hôte est laissé en place pour l'appelant.
    void teardown(const SharedVolume& volume, const ExecutionOptions& options = {}) const;

    std::vector<std::string> volumeCreateArguments(const SharedVolume& volume) const;
    std::vector<std::string> volumeRemoveArguments(const SharedVolume& volume) const;

    const ResourceLifecycleConfig& getConfig() const { return config_; }

private:
    void runVolumeCommand(const std::vector<std::string>& argv,
                          const std::string& what,
                          const ExecutionOptions& options) const;

    std::shared_ptr<CommandRunner> runner_;
    ResourceLifecycleConfig config_;
};

} // namespace Executor
} // namespace DRX
