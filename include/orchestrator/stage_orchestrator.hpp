#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "executor/container_executor.hpp"
#include "executor/error_escalation.hpp"
#include "executor/pipeline_types.hpp"
#include "executor/resource_lifecycle.hpp"
#include "executor/status.hpp"
#include "infrastructure/config/executor_config.hpp"
#include "infrastructure/system/process_runner.hpp"

namespace DRX {
namespace Orchestrator {

// EN: States walked by a pipeline run
// FR: États parcourus par une exécution de pipeline
enum class OrchestratorState {
    IDLE = 0,
    SETUP = 1,
    BUILD = 2,
    RUN = 3,
    TEARDOWN = 4,
    ERROR_HANDLING = 5,
    DONE = 6,           // EN: Terminal, status OK / FR: Terminal, statut OK
    FAILED = 7          // EN: Terminal, any error status / FR: Terminal, tout statut d'erreur
};

std::string orchestratorStateToString(OrchestratorState state);

// EN: Invoked on every state transition with the stage name (empty outside stages)
// FR: Appelé à chaque transition d'état avec le nom de l'étape (vide hors étapes)
using OrchestratorStateCallback = std::function<void(OrchestratorState state, const std::string& stage)>;

struct StageOrchestratorConfig {
    std::string volume_name = "dadosjusbr";
    std::chrono::milliseconds command_timeout{0};  // EN: 0 = unbounded / FR: 0 = illimité
};

// EN: Runs the stages of a pipeline in declaration order, chaining each stage's stdout into
//     the next stage's stdin, and hands failures to the error escalation handler.
// FR: Exécute les étapes d'un pipeline dans l'ordre de déclaration, en chaînant la sortie
//     standard de chaque étape vers l'entrée de la suivante, et confie les échecs au
//     gestionnaire d'escalade.
class StageOrchestrator {
public:
    StageOrchestrator(std::shared_ptr<const Executor::ContainerExecutor> executor,
                      std::shared_ptr<const Executor::ResourceLifecycleManager> resources,
                      std::shared_ptr<const Executor::StatusClassifier> classifier,
                      StageOrchestratorConfig config = {});

    // EN: Wire every component on one runner from the loaded executor configuration.
    // FR: Assemble tous les composants sur un même lanceur à partir de la configuration chargée.
    static std::unique_ptr<StageOrchestrator> create(std::shared_ptr<CommandRunner> runner,
                                                     const ExecutorConfig& config);

    // EN: Execute the pipeline. Failures are reported in the outcome, never thrown.
    // FR: Exécute le pipeline. Les échecs sont rapportés dans le résultat, jamais levés.
    Executor::PipelineOutcome run(const Executor::Pipeline& pipeline,
                                  const CancellationToken* cancellation = nullptr);

    void setStateCallback(OrchestratorStateCallback callback) { state_callback_ = std::move(callback); }

    OrchestratorState getState() const { return state_; }
    const StageOrchestratorConfig& getConfig() const { return config_; }

private:
    void transition(OrchestratorState state, const std::string& stage = "");

    Executor::PipelineOutcome fail(Executor::PipelineResult result,
                                   Executor::StageExecutionResult failed_stage,
                                   Executor::StatusCode code,
                                   const std::string& message,
                                   const Executor::Pipeline& pipeline,
                                   const Executor::SharedVolume& volume,
                                   const ExecutionOptions& options);

    std::shared_ptr<const Executor::ContainerExecutor> executor_;
    std::shared_ptr<const Executor::ResourceLifecycleManager> resources_;
    std::shared_ptr<const Executor::StatusClassifier> classifier_;
    Executor::ErrorEscalationHandler escalation_;
    StageOrchestratorConfig config_;
    OrchestratorState state_ = OrchestratorState::IDLE;
    OrchestratorStateCallback state_callback_;
};

} // namespace Orchestrator
} // namespace DRX
