// EN: Stage orchestrator implementation. Sequential build/run of every stage on a shared volume.
// FR: Implémentation de l'orchestrateur d'étapes. Build/run séquentiel de chaque étape sur un volume partagé.

#include "orchestrator/stage_orchestrator.hpp"
#include "executor/environment_resolver.hpp"
#include "infrastructure/logging/logger.hpp"

#include <stdexcept>

namespace DRX {
namespace Orchestrator {

using namespace Executor;

std::string orchestratorStateToString(OrchestratorState state) {
    switch (state) {
        case OrchestratorState::IDLE: return "IDLE";
        case OrchestratorState::SETUP: return "SETUP";
        case OrchestratorState::BUILD: return "BUILD";
        case OrchestratorState::RUN: return "RUN";
        case OrchestratorState::TEARDOWN: return "TEARDOWN";
        case OrchestratorState::ERROR_HANDLING: return "ERROR_HANDLING";
        case OrchestratorState::DONE: return "DONE";
        case OrchestratorState::FAILED: return "FAILED";
    }
    return "UNKNOWN";
}

StageOrchestrator::StageOrchestrator(std::shared_ptr<const ContainerExecutor> executor,
                                     std::shared_ptr<const ResourceLifecycleManager> resources,
                                     std::shared_ptr<const StatusClassifier> classifier,
                                     StageOrchestratorConfig config)
    : executor_(executor),
      resources_(std::move(resources)),
      classifier_(classifier),
      escalation_(executor, classifier),
      config_(std::move(config)) {
    if (!resources_) {
        throw std::invalid_argument("StageOrchestrator requires a resource lifecycle manager");
    }
}

std::unique_ptr<StageOrchestrator> StageOrchestrator::create(std::shared_ptr<CommandRunner> runner,
                                                             const ExecutorConfig& config) {
    ContainerEngineConfig engine;
    engine.binary = config.getEngineBinary();
    engine.container_output_path = config.getContainerOutputPath();

    ResourceLifecycleConfig lifecycle;
    lifecycle.engine_binary = config.getEngineBinary();
    lifecycle.output_dir_name = config.getOutputDirName();

    StageOrchestratorConfig orchestrator;
    orchestrator.volume_name = config.getVolumeName();
    orchestrator.command_timeout = std::chrono::seconds(config.getCommandTimeoutSeconds());

    return std::make_unique<StageOrchestrator>(
        std::make_shared<ContainerExecutor>(runner, engine),
        std::make_shared<ResourceLifecycleManager>(runner, lifecycle),
        defaultStatusClassifier(),
        orchestrator);
}

void StageOrchestrator::transition(OrchestratorState state, const std::string& stage) {
    state_ = state;
    LOG_DEBUG("orchestrator", "State " + orchestratorStateToString(state) +
                              (stage.empty() ? std::string() : " (" + stage + ")"));
    if (state_callback_) {
        state_callback_(state, stage);
    }
}

PipelineOutcome StageOrchestrator::fail(PipelineResult result,
                                        StageExecutionResult failed_stage,
                                        StatusCode code,
                                        const std::string& message,
                                        const Pipeline& pipeline,
                                        const SharedVolume& volume,
                                        const ExecutionOptions& options) {
    transition(OrchestratorState::ERROR_HANDLING, failed_stage.stage);
    PipelineOutcome outcome = escalation_.escalate(std::move(result), std::move(failed_stage), code, message,
                                                   pipeline.error_handler, volume, options);
    transition(OrchestratorState::FAILED);
    return outcome;
}

PipelineOutcome StageOrchestrator::run(const Pipeline& pipeline, const CancellationToken* cancellation) {
    ExecutionOptions options;
    options.timeout = config_.command_timeout;
    options.cancellation = cancellation;

    PipelineResult result;
    result.name = pipeline.name;
    result.start_time = std::chrono::system_clock::now();

    transition(OrchestratorState::SETUP);
    SharedVolume volume;
    try {
        volume = resources_->setup(pipeline.default_base_dir, config_.volume_name, options);
    } catch (const ResourceError& e) {
        std::string message = std::string("error in initial setup: ") + e.what();
        LOG_ERROR("orchestrator", message);
        result.status = classifier_->text(StatusCode::SetupError);
        result.final_time = std::chrono::system_clock::now();
        transition(OrchestratorState::FAILED);
        return PipelineOutcome{std::move(result), PipelineError(StatusCode::SetupError, message)};
    }

    const size_t total = pipeline.stages.size();
    for (size_t index = 0; index < total; ++index) {
        const Stage& stage = pipeline.stages[index];
        const std::string base_dir = stage.base_dir.empty() ? pipeline.default_base_dir : stage.base_dir;
        const std::string directory = joinStageDirectory(base_dir, stage.dir);
        const std::string id = pipeline.name + "/" + stage.name;

        StageExecutionResult stage_result;
        stage_result.stage = stage.name;
        stage_result.start_time = std::chrono::system_clock::now();

        LOG_INFO("orchestrator", "Executing pipeline " + id + " [" + std::to_string(index + 1) + "/" +
                                 std::to_string(total) + "]");

        if (options.isCancelled()) {
            return fail(std::move(result), std::move(stage_result), StatusCode::BuildError,
                        "error when building image: pipeline cancelled before " + id,
                        pipeline, volume, options);
        }

        // EN: Build
        // FR: Construction
        transition(OrchestratorState::BUILD, stage.name);
        EnvMap build_env = EnvironmentResolver::merge(pipeline.default_build_env, stage.build_env);
        CommandOutcome build = executor_->build(id, directory, build_env, options);
        stage_result.build_result = build.result;
        if (build.error) {
            return fail(std::move(result), std::move(stage_result), StatusCode::BuildError,
                        "error when building image: " + *build.error, pipeline, volume, options);
        }
        StatusCode build_status = classifier_->classify(build.result.exit_status);
        if (build_status != StatusCode::OK) {
            return fail(std::move(result), std::move(stage_result), StatusCode::BuildError,
                        "error when building image: status code " + std::to_string(build.result.exit_status) +
                        "(" + classifier_->text(build_status) + ") when building image for " + id,
                        pipeline, volume, options);
        }
        LOG_INFO("orchestrator", "Image built successfully for " + id);

        // EN: Run, fed with the previous stage's stdout
        // FR: Exécution, alimentée par la sortie standard de l'étape précédente
        transition(OrchestratorState::RUN, stage.name);
        const std::string previous_stdout =
            result.stage_results.empty() ? std::string() : result.stage_results.back().run_result.stdout_data;
        EnvMap run_env = EnvironmentResolver::merge(pipeline.default_run_env, stage.run_env);
        CommandOutcome run = executor_->run(id, directory, previous_stdout, run_env, volume, options);
        stage_result.run_result = run.result;
        if (run.error) {
            return fail(std::move(result), std::move(stage_result), StatusCode::RunError,
                        "error when running image: " + *run.error, pipeline, volume, options);
        }
        StatusCode run_status = classifier_->classify(run.result.exit_status);
        if (run_status != StatusCode::OK) {
            return fail(std::move(result), std::move(stage_result), StatusCode::RunError,
                        "error when running image: status code " + std::to_string(run.result.exit_status) +
                        "(" + classifier_->text(run_status) + ") when running image for " + id,
                        pipeline, volume, options);
        }
        LOG_INFO("orchestrator", "Image executed successfully for " + id);

        stage_result.final_time = std::chrono::system_clock::now();
        result.stage_results.push_back(std::move(stage_result));
    }

    transition(OrchestratorState::TEARDOWN);
    try {
        resources_->teardown(volume, options);
    } catch (const ResourceError& e) {
        std::string message = std::string("error in tear down: ") + e.what();
        LOG_ERROR("orchestrator", message);
        result.status = classifier_->text(StatusCode::SetupError);
        result.final_time = std::chrono::system_clock::now();
        transition(OrchestratorState::FAILED);
        return PipelineOutcome{std::move(result), PipelineError(StatusCode::SetupError, message)};
    }

    result.status = classifier_->text(StatusCode::OK);
    result.final_time = std::chrono::system_clock::now();
    LOG_INFO("orchestrator", "Pipeline " + pipeline.name + " completed with " +
                             std::to_string(result.stage_results.size()) + " stages");
    transition(OrchestratorState::DONE);
    return PipelineOutcome{std::move(result), std::nullopt};
}

} // namespace Orchestrator
} // namespace DRX
