// EN: Resource lifecycle manager implementation
// FR: Implémentation du gestionnaire du cycle de vie des ressources

#include "executor/resource_lifecycle.hpp"
#include "infrastructure/logging/logger.hpp"

#include <system_error>

namespace DRX {
namespace Executor {

ResourceLifecycleManager::ResourceLifecycleManager(std::shared_ptr<CommandRunner> runner,
                                                   ResourceLifecycleConfig config)
    : runner_(std::move(runner)), config_(std::move(config)) {
    if (!runner_) {
        throw std::invalid_argument("ResourceLifecycleManager requires a command runner");
    }
}

std::vector<std::string> ResourceLifecycleManager::volumeCreateArguments(const SharedVolume& volume) const {
    return {
        config_.engine_binary, "volume", "create",
        "--driver", "local",
        "--opt", "type=none",
        "--opt", "device=" + volume.host_path,
        "--opt", "o=bind",
        "--name=" + volume.name
    };
}

std::vector<std::string> ResourceLifecycleManager::volumeRemoveArguments(const SharedVolume& volume) const {
    return {config_.engine_binary, "volume", "rm", "-f", volume.name};
}

SharedVolume ResourceLifecycleManager::setup(const std::string& base_dir,
                                             const std::string& volume_name,
                                             const ExecutionOptions& options) const {
    if (volume_name.empty()) {
        throw ResourceError("volume name is empty");
    }
    // EN: An empty base would turn the output folder into /output on the host root.
    // FR: Une base vide ferait du dossier de sortie /output à la racine de l'hôte.
    if (base_dir.empty()) {
        throw ResourceError("base directory for the output folder is empty");
    }

    SharedVolume volume;
    volume.name = volume_name;
    volume.host_path = base_dir + "/" + config_.output_dir_name;

    std::error_code ec;
    std::filesystem::remove_all(volume.host_path, ec);
    if (ec) {
        throw ResourceError("error removing existing output folder " + volume.host_path + ": " + ec.message());
    }

    // EN: create_directory, not create_directories: a missing base directory is a setup error.
    // FR: create_directory et non create_directories : un répertoire de base absent est une erreur.
    if (!std::filesystem::create_directory(volume.host_path, ec) || ec) {
        throw ResourceError("error creating output folder " + volume.host_path + ": " +
                            (ec ? ec.message() : std::string("already exists")));
    }
    std::filesystem::permissions(volume.host_path, config_.output_permissions,
                                 std::filesystem::perm_options::replace, ec);
    if (ec) {
        throw ResourceError("error setting permissions on " + volume.host_path + ": " + ec.message());
    }

    runVolumeCommand(volumeCreateArguments(volume), "error creating volume " + volume.name, options);

    LOG_INFO("resources", "Shared volume " + volume.name + " bound to " + volume.host_path);
    return volume;
}

void ResourceLifecycleManager::teardown(const SharedVolume& volume, const ExecutionOptions& options) const {
    runVolumeCommand(volumeRemoveArguments(volume), "error removing existing volume " + volume.name, options);
    LOG_INFO("resources", "Shared volume " + volume.name + " removed");
}

void ResourceLifecycleManager::runVolumeCommand(const std::vector<std::string>& argv,
                                                const std::string& what,
                                                const ExecutionOptions& options) const {
    CommandSpec spec;
    spec.argv = argv;

    LOG_DEBUG("resources", "$ " + joinCommandLine(argv));
    ProcessResult process = runner_->run(spec, options);

    if (!process.started) {
        throw ResourceError(what + ": " + process.error);
    }
    if (process.timed_out) {
        throw ResourceError(what + ": timed out");
    }
    if (process.cancelled) {
        throw ResourceError(what + ": cancelled");
    }
    if (!process.exited || process.exit_code != 0) {
        std::string detail;
        if (process.exited) {
            detail = "exit status " + std::to_string(process.exit_code);
        } else if (process.signaled) {
            detail = "terminated by signal " + std::to_string(process.term_signal);
        } else {
            detail = process.error;
        }
        if (!process.stderr_data.empty()) {
            detail += ": " + process.stderr_data;
        }
        throw ResourceError(what + ": " + detail);
    }
}

} // namespace Executor
} // namespace DRX
