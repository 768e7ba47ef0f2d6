// EN: Container build and run executors - the CLI contract with the container engine
// FR: Exécuteurs de build et de run de conteneurs - le contrat CLI avec le moteur de conteneurs

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "executor/pipeline_types.hpp"
#include "infrastructure/system/process_runner.hpp"

namespace DRX {
namespace Executor {

// EN: Container engine invocation settings.
// FR: Paramètres d'invocation du moteur de conteneurs.
struct ContainerEngineConfig {
    std::string binary = "docker";                  // EN: Engine CLI (docker, podman...) / FR: CLI du moteur (docker, podman...)
    std::string container_output_path = "/output";  // EN: Mount point of the shared volume / FR: Point de montage du volume partagé
};

// EN: Handle on the shared, host-backed volume mounted into every stage run.
// FR: Référence vers le volume partagé, adossé à l'hôte, monté dans chaque exécution d'étape.
struct SharedVolume {
    std::string name;
    std::string host_path;
};

// EN: Result of one build or run. error is set only when the process could not be started
//     or did not finish (timeout, cancellation); a non-zero exit leaves it empty.
// FR: Résultat d'un build ou d'un run. error n'est renseigné que si le processus n'a pas pu
//     démarrer ou n'a pas terminé (timeout, annulation) ; un code non nul le laisse vide.
struct CommandOutcome {
    CmdResult result;
    std::optional<std::string> error;

    bool hasError() const { return error.has_value(); }
};

class ContainerExecutor {
public:
    explicit ContainerExecutor(std::shared_ptr<CommandRunner> runner,
                               ContainerEngineConfig config = {});

    // EN: <engine> build [--build-arg K=V]... -t <tag> . in directory.
    // FR: <engine> build [--build-arg K=V]... -t <tag> . dans directory.
    CommandOutcome build(const std::string& id,
                         const std::string& directory,
                         const EnvMap& build_env,
                         const ExecutionOptions& options = {}) const;

    // EN: <engine> run -i -v <volume>:/output --rm [--env K=V]... <tag>, stdin = previous_stdout.
    // FR: <engine> run -i -v <volume>:/output --rm [--env K=V]... <tag>, stdin = previous_stdout.
    CommandOutcome run(const std::string& id,
                       const std::string& directory,
                       const std::string& previous_stdout,
                       const EnvMap& run_env,
                       const SharedVolume& volume,
                       const ExecutionOptions& options = {}) const;

    std::vector<std::string> buildArguments(const std::string& directory, const EnvMap& build_env) const;
    std::vector<std::string> runArguments(const std::string& directory, const EnvMap& run_env,
                                          const SharedVolume& volume) const;

    const ContainerEngineConfig& getConfig() const { return config_; }
    const std::shared_ptr<CommandRunner>& getRunner() const { return runner_; }

private:
    CommandOutcome execute(const CommandSpec& spec, const ExecutionOptions& options) const;

    std::shared_ptr<CommandRunner> runner_;
    ContainerEngineConfig config_;
};

} // namespace Executor
} // namespace DRX
