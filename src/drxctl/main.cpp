// EN: drxctl - runs or validates a containerized pipeline definition
// FR: drxctl - exécute ou valide une définition de pipeline conteneurisé

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "executor/result_codec.hpp"
#include "infrastructure/config/executor_config.hpp"
#include "infrastructure/logging/logger.hpp"
#include "infrastructure/system/process_runner.hpp"
#include "infrastructure/system/signal_handler.hpp"
#include "orchestrator/pipeline_loader.hpp"
#include "orchestrator/stage_orchestrator.hpp"

namespace {

constexpr const char* kVersion = "1.0.0";

constexpr int kExitOk = 0;
constexpr int kExitPipelineFailure = 1;
constexpr int kExitUsage = 2;
constexpr int kExitOutputError = 3;

struct CommandLine {
    std::string command;
    std::string pipeline_file;
    std::string config_file;
    std::string output_file;
    std::string log_level;
    int timeout_seconds = -1;   // EN: -1 keeps the configured value / FR: -1 garde la valeur configurée
};

void printUsage(std::ostream& out) {
    out << "Usage: drxctl COMMAND [OPTIONS]" << std::endl;
    out << std::endl;
    out << "Commands:" << std::endl;
    out << "  run         Build and run every stage of the pipeline" << std::endl;
    out << "  validate    Check a pipeline definition without running it" << std::endl;
    out << std::endl;
    out << "Options:" << std::endl;
    out << "  --pipeline FILE     Pipeline definition (.yaml, .yml or .json)" << std::endl;
    out << "  --config FILE       Executor configuration (YAML)" << std::endl;
    out << "  --output FILE       Write the result document to FILE instead of stdout" << std::endl;
    out << "  --timeout SEC       Timeout of each container command, 0 for none" << std::endl;
    out << "  --log-level LEVEL   DEBUG, INFO, WARN or ERROR" << std::endl;
    out << "  --help, -h          Show this help" << std::endl;
    out << "  --version, -v       Show the version" << std::endl;
    out << std::endl;
    out << "Exit status: 0 OK, 1 pipeline failure, 2 usage or configuration error," << std::endl;
    out << "             3 result document could not be written" << std::endl;
}

bool parseCommandLine(int argc, char* argv[], CommandLine& cli, std::string& error) {
    std::vector<std::string> args(argv + 1, argv + argc);
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        auto value = [&](std::string& target) {
            if (i + 1 >= args.size()) {
                error = "missing value for " + arg;
                return false;
            }
            target = args[++i];
            return true;
        };

        if (arg == "--pipeline") {
            if (!value(cli.pipeline_file)) return false;
        } else if (arg == "--config") {
            if (!value(cli.config_file)) return false;
        } else if (arg == "--output") {
            if (!value(cli.output_file)) return false;
        } else if (arg == "--log-level") {
            if (!value(cli.log_level)) return false;
        } else if (arg == "--timeout") {
            std::string text;
            if (!value(text)) return false;
            try {
                size_t consumed = 0;
                cli.timeout_seconds = std::stoi(text, &consumed);
                if (consumed != text.size() || cli.timeout_seconds < 0) {
                    error = "invalid timeout: " + text;
                    return false;
                }
            } catch (const std::logic_error&) {
                error = "invalid timeout: " + text;
                return false;
            }
        } else if (!arg.empty() && arg[0] == '-') {
            error = "unknown option: " + arg;
            return false;
        } else if (cli.command.empty()) {
            cli.command = arg;
        } else {
            error = "unexpected argument: " + arg;
            return false;
        }
    }

    if (cli.command != "run" && cli.command != "validate") {
        error = cli.command.empty() ? "missing command" : "unknown command: " + cli.command;
        return false;
    }
    if (cli.pipeline_file.empty()) {
        error = "--pipeline is required";
        return false;
    }
    return true;
}

bool loadConfiguration(const CommandLine& cli, DRX::ExecutorConfig& config) {
    if (!cli.config_file.empty() && !config.loadFromFile(cli.config_file)) {
        std::cerr << "drxctl: cannot load configuration " << cli.config_file << std::endl;
        return false;
    }
    if (!config.loadEnvironmentOverrides("DRX_")) {
        std::cerr << "drxctl: invalid DRX_ environment override" << std::endl;
        return false;
    }
    if (!cli.log_level.empty()) {
        config.setLogLevel(cli.log_level);
    }
    if (cli.timeout_seconds >= 0) {
        config.setCommandTimeoutSeconds(cli.timeout_seconds);
    }

    std::vector<std::string> errors;
    if (!config.validate(errors)) {
        for (const auto& error : errors) {
            std::cerr << "drxctl: " << error << std::endl;
        }
        return false;
    }

    auto& logger = DRX::Logger::getInstance();
    logger.setLogLevel(config.parseLogLevel());
    // EN: setOutputFile reports the failure itself.
    // FR: setOutputFile signale lui-même l'échec.
    if (!config.getLogFile().empty() && !logger.setOutputFile(config.getLogFile())) {
        return false;
    }
    return true;
}

int validateCommand(const DRX::Executor::Pipeline& pipeline) {
    std::vector<std::string> problems = DRX::Executor::validatePipeline(pipeline);
    if (!problems.empty()) {
        for (const auto& problem : problems) {
            std::cerr << "drxctl: " << problem << std::endl;
        }
        return kExitUsage;
    }
    std::cout << "Pipeline " << pipeline.name << " is valid (" << pipeline.stages.size() << " stages"
              << (pipeline.hasErrorHandler() ? ", error handler " + pipeline.error_handler->name : std::string())
              << ")" << std::endl;
    return kExitOk;
}

int runCommand(const CommandLine& cli, const DRX::ExecutorConfig& config,
               const DRX::Executor::Pipeline& pipeline) {
    std::vector<std::string> problems = DRX::Executor::validatePipeline(pipeline);
    if (!problems.empty()) {
        for (const auto& problem : problems) {
            std::cerr << "drxctl: " << problem << std::endl;
        }
        return kExitUsage;
    }

    auto& logger = DRX::Logger::getInstance();
    logger.setCorrelationId(logger.generateCorrelationId());

    DRX::CancellationToken cancellation;
    auto& signals = DRX::SignalHandler::getInstance();
    signals.registerCancellationToken(&cancellation);
    signals.initialize();

    auto orchestrator = DRX::Orchestrator::StageOrchestrator::create(
        std::make_shared<DRX::PosixCommandRunner>(), config);
    DRX::Executor::PipelineOutcome outcome = orchestrator->run(pipeline, &cancellation);

    signals.registerCancellationToken(nullptr);
    signals.restore();

    std::string document = DRX::Executor::serializePipelineResult(outcome.result);
    if (cli.output_file.empty()) {
        std::cout << document << std::endl;
    } else if (!DRX::Executor::writePipelineResultFile(outcome.result, cli.output_file)) {
        std::cerr << "drxctl: cannot write result document to " << cli.output_file << std::endl;
        return kExitOutputError;
    }

    if (!outcome.succeeded()) {
        std::cerr << "drxctl: " << outcome.result.status << ": " << outcome.error->what() << std::endl;
        return kExitPipelineFailure;
    }
    return kExitOk;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc > 1) {
        std::string arg = argv[1];
        if (arg == "--version" || arg == "-v") {
            std::cout << "drxctl version " << kVersion << std::endl;
            std::cout << "Build: " << __DATE__ << " " << __TIME__ << std::endl;
            return kExitOk;
        }
        if (arg == "--help" || arg == "-h") {
            printUsage(std::cout);
            return kExitOk;
        }
    }

    CommandLine cli;
    std::string error;
    if (!parseCommandLine(argc, argv, cli, error)) {
        std::cerr << "drxctl: " << error << std::endl << std::endl;
        printUsage(std::cerr);
        return kExitUsage;
    }

    DRX::ExecutorConfig config;
    if (!loadConfiguration(cli, config)) {
        return kExitUsage;
    }

    DRX::Executor::Pipeline pipeline;
    try {
        pipeline = DRX::Orchestrator::loadPipelineFromFile(cli.pipeline_file);
    } catch (const DRX::Orchestrator::PipelineDefinitionError& e) {
        std::cerr << "drxctl: " << e.what() << std::endl;
        return kExitUsage;
    }

    if (cli.command == "validate") {
        return validateCommand(pipeline);
    }
    return runCommand(cli, config, pipeline);
}
