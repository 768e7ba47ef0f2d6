// EN: Container build/run executors implementation
// FR: Implémentation des exécuteurs de build/run de conteneurs

#include "executor/container_executor.hpp"
#include "executor/environment_resolver.hpp"
#include "executor/status.hpp"
#include "infrastructure/logging/logger.hpp"

#include <stdexcept>

namespace DRX {
namespace Executor {

ContainerExecutor::ContainerExecutor(std::shared_ptr<CommandRunner> runner, ContainerEngineConfig config)
    : runner_(std::move(runner)), config_(std::move(config)) {
    if (!runner_) {
        throw std::invalid_argument("ContainerExecutor requires a command runner");
    }
}

std::vector<std::string> ContainerExecutor::buildArguments(const std::string& directory,
                                                           const EnvMap& build_env) const {
    std::vector<std::string> argv{config_.binary, "build"};
    auto flags = EnvironmentResolver::toFlags("--build-arg", build_env);
    argv.insert(argv.end(), flags.begin(), flags.end());
    argv.push_back("-t");
    argv.push_back(imageTagFor(directory));
    argv.push_back(".");
    return argv;
}

std::vector<std::string> ContainerExecutor::runArguments(const std::string& directory,
                                                         const EnvMap& run_env,
                                                         const SharedVolume& volume) const {
    std::vector<std::string> argv{
        config_.binary, "run", "-i",
        "-v", volume.name + ":" + config_.container_output_path,
        "--rm"
    };
    auto flags = EnvironmentResolver::toFlags("--env", run_env);
    argv.insert(argv.end(), flags.begin(), flags.end());
    argv.push_back(imageTagFor(directory));
    return argv;
}

CommandOutcome ContainerExecutor::build(const std::string& id,
                                        const std::string& directory,
                                        const EnvMap& build_env,
                                        const ExecutionOptions& options) const {
    LOG_INFO("executor", "Building image for " + id);

    CommandSpec spec;
    spec.argv = buildArguments(directory, build_env);
    spec.working_directory = directory;

    return execute(spec, options);
}

CommandOutcome ContainerExecutor::run(const std::string& id,
                                      const std::string& directory,
                                      const std::string& previous_stdout,
                                      const EnvMap& run_env,
                                      const SharedVolume& volume,
                                      const ExecutionOptions& options) const {
    LOG_INFO("executor", "Running image for " + id);

    CommandSpec spec;
    spec.argv = runArguments(directory, run_env, volume);
    spec.working_directory = directory;
    spec.stdin_data = previous_stdout;

    return execute(spec, options);
}

CommandOutcome ContainerExecutor::execute(const CommandSpec& spec, const ExecutionOptions& options) const {
    CommandOutcome outcome;
    const std::string command_line = joinCommandLine(spec.argv);
    LOG_INFO("executor", "$ " + command_line);

    ProcessResult process = runner_->run(spec, options);

    // EN: Could not start: only the sentinel and the command line are recorded.
    // FR: Démarrage impossible : seuls la sentinelle et la commande sont enregistrées.
    if (!process.started) {
        outcome.result.cmd = command_line;
        outcome.result.exit_status = kNotStartedExitStatus;
        outcome.error = "command was not executed correctly: " + process.error;
        LOG_ERROR("executor", *outcome.error);
        return outcome;
    }

    CmdResult& result = outcome.result;
    result.stdin_data = spec.stdin_data;
    result.stdout_data = std::move(process.stdout_data);
    result.stderr_data = std::move(process.stderr_data);
    result.cmd = command_line;
    result.cmd_dir = spec.working_directory;
    result.exit_status = process.exited ? process.exit_code : kSignaledExitStatus;
    result.env = environmentSnapshot();

    if (process.timed_out) {
        outcome.error = "command timed out after " + std::to_string(options.timeout.count()) + "ms";
    } else if (process.cancelled) {
        outcome.error = "command was cancelled";
    } else if (!process.error.empty()) {
        outcome.error = "command did not complete: " + process.error;
    }
    if (outcome.error) {
        LOG_ERROR("executor", *outcome.error + ": " + command_line);
    }

    return outcome;
}

} // namespace Executor
} // namespace DRX
