// EN: Error escalation handler implementation
// FR: Implémentation du gestionnaire d'escalade d'erreur

#include "executor/error_escalation.hpp"
#include "executor/result_codec.hpp"
#include "infrastructure/logging/logger.hpp"

#include <stdexcept>

namespace DRX {
namespace Executor {

ErrorEscalationHandler::ErrorEscalationHandler(std::shared_ptr<const ContainerExecutor> executor,
                                               std::shared_ptr<const StatusClassifier> classifier)
    : executor_(std::move(executor)), classifier_(std::move(classifier)) {
    if (!executor_ || !classifier_) {
        throw std::invalid_argument("ErrorEscalationHandler requires an executor and a classifier");
    }
}

std::string ErrorEscalationHandler::handlerDirectory(const Stage& handler) {
    return joinStageDirectory(handler.base_dir, handler.dir);
}

PipelineOutcome ErrorEscalationHandler::finalize(PipelineResult result, StatusCode status,
                                                 PipelineError error) const {
    result.status = classifier_->text(status);
    result.final_time = std::chrono::system_clock::now();
    return PipelineOutcome{std::move(result), std::move(error)};
}

PipelineOutcome ErrorEscalationHandler::escalate(PipelineResult result,
                                                 StageExecutionResult failed_stage,
                                                 StatusCode failure_code,
                                                 const std::string& message,
                                                 const std::optional<Stage>& handler,
                                                 const SharedVolume& volume,
                                                 const ExecutionOptions& options) const {
    failed_stage.final_time = std::chrono::system_clock::now();
    result.stage_results.push_back(failed_stage);

    PipelineError original(failure_code, message);
    LOG_ERROR("escalation", message);

    if (!handler || handler->dir.empty()) {
        return finalize(std::move(result), failure_code, original);
    }
    if (options.isCancelled()) {
        LOG_WARN("escalation", "Run cancelled, error handler " + handler->name + " skipped");
        return finalize(std::move(result), failure_code, original);
    }

    const std::string directory = handlerDirectory(*handler);
    const std::string id = result.name + "/" + failed_stage.stage + " calls Error Handler";

    StageExecutionResult handler_stage;
    handler_stage.stage = handler->name;
    handler_stage.start_time = std::chrono::system_clock::now();

    // EN: Any handler failure from here on overrides the original error.
    // FR: Tout échec du gestionnaire à partir d'ici remplace l'erreur d'origine.
    auto handlerFailure = [&](const std::string& handler_message) {
        handler_stage.final_time = std::chrono::system_clock::now();
        result.stage_results.push_back(handler_stage);
        LOG_ERROR("escalation", handler_message);
        return finalize(std::move(result), StatusCode::ErrorHandlerError,
                        PipelineError(StatusCode::ErrorHandlerError, handler_message));
    };

    CommandOutcome build = executor_->build(id, directory, handler->build_env, options);
    handler_stage.build_result = build.result;
    if (build.error) {
        return handlerFailure("error when building image for error handler: " + *build.error);
    }
    StatusCode build_status = classifier_->classify(build.result.exit_status);
    if (build_status != StatusCode::OK) {
        return handlerFailure("error when building image for error handler: status code " +
                              std::to_string(build.result.exit_status) + "(" +
                              classifier_->text(build_status) + ") when building image for " + id);
    }

    std::string handler_input;
    try {
        handler_input = serializeStageResult(failed_stage);
    } catch (const nlohmann::json::exception& e) {
        return handlerFailure(std::string("error serializing stage result for error handler: ") + e.what());
    }

    CommandOutcome run = executor_->run(id, directory, handler_input, handler->run_env, volume, options);
    handler_stage.run_result = run.result;
    if (run.error) {
        return handlerFailure("error when running image for error handler: " + *run.error);
    }
    StatusCode run_status = classifier_->classify(run.result.exit_status);
    if (run_status != StatusCode::OK) {
        return handlerFailure("error when running image for error handler: status code " +
                              std::to_string(run.result.exit_status) + "(" +
                              classifier_->text(run_status) + ") when running image for " + id);
    }

    handler_stage.final_time = std::chrono::system_clock::now();
    result.stage_results.push_back(handler_stage);
    LOG_INFO("escalation", "Error handler " + handler->name + " processed the failure of " + failed_stage.stage);

    return finalize(std::move(result), failure_code, original);
}

} // namespace Executor
} // namespace DRX
