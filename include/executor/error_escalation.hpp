// EN: Error escalation handler - hands a failed stage to the configured containerized handler
// FR: Gestionnaire d'escalade d'erreur - transmet une étape en échec au gestionnaire conteneurisé configuré

#pragma once

#include <memory>
#include <optional>
#include <string>

#include "executor/container_executor.hpp"
#include "executor/pipeline_types.hpp"
#include "executor/status.hpp"

namespace DRX {
namespace Executor {

// EN: Finalized pipeline result paired with the error that ended the run, if any.
// FR: Résultat de pipeline finalisé, accompagné de l'erreur qui a terminé l'exécution le cas échéant.
struct PipelineOutcome {
    PipelineResult result;
    std::optional<PipelineError> error;

    bool succeeded() const { return !error.has_value(); }
};

class ErrorEscalationHandler {
public:
    ErrorEscalationHandler(std::shared_ptr<const ContainerExecutor> executor,
                           std::shared_ptr<const StatusClassifier> classifier);

    // EN: Record the failed stage, then build and run the handler with the failed stage's
    //     JSON on stdin. The original failure decides the final status unless the handler
    //     itself fails, in which case the status is ErrorHandlerError and the handler's error
    //     is returned. The shared volume is never torn down here.
    // FR: Enregistre l'étape en échec, puis construit et exécute le gestionnaire avec le JSON
    //     de l'étape sur stdin. L'échec d'origine fixe le statut final sauf si le gestionnaire
    //     échoue lui-même : statut ErrorHandlerError et erreur du gestionnaire. Le volume
    //     partagé n'est jamais supprimé ici.
    PipelineOutcome escalate(PipelineResult result,
                             StageExecutionResult failed_stage,
                             StatusCode failure_code,
                             const std::string& message,
                             const std::optional<Stage>& handler,
                             const SharedVolume& volume,
                             const ExecutionOptions& options = {}) const;

    // EN: <base_dir>/<dir> when the handler has a base directory, dir otherwise.
    // FR: <base_dir>/<dir> si le gestionnaire a un répertoire de base, dir sinon.
    static std::string handlerDirectory(const Stage& handler);

private:
    PipelineOutcome finalize(PipelineResult result, StatusCode status, PipelineError error) const;

    std::shared_ptr<const ContainerExecutor> executor_;
    std::shared_ptr<const StatusClassifier> classifier_;
};

} // namespace Executor
} // namespace DRX
