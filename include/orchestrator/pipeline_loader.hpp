#pragma once

#include <stdexcept>
#include <string>

#include "executor/pipeline_types.hpp"

namespace DRX {
namespace Orchestrator {

// EN: Raised when a pipeline definition cannot be read or has the wrong shape.
// FR: Levée quand une définition de pipeline est illisible ou mal formée.
class PipelineDefinitionError : public std::runtime_error {
public:
    explicit PipelineDefinitionError(const std::string& message) : std::runtime_error(message) {}
};

// EN: Pipeline definitions in YAML or JSON. Both formats share the same keys:
//     name, default_base_dir, default_build_env, default_run_env,
//     stages[] {name, dir, base_dir, build_env, run_env} and error_handler {same as a stage}.
//     Only the document shape is checked here; use validatePipeline() for semantic checks.
// FR: Définitions de pipeline en YAML ou JSON, avec les mêmes clés dans les deux formats.
//     Seule la forme du document est vérifiée ici ; validatePipeline() fait le reste.
Executor::Pipeline loadPipelineFromYAML(const std::string& path);
Executor::Pipeline loadPipelineFromYAMLString(const std::string& text);
Executor::Pipeline loadPipelineFromJSON(const std::string& path);
Executor::Pipeline loadPipelineFromJSONString(const std::string& text);

// EN: Picks JSON for a .json extension, YAML otherwise.
// FR: Choisit JSON pour l'extension .json, YAML sinon.
Executor::Pipeline loadPipelineFromFile(const std::string& path);

} // namespace Orchestrator
} // namespace DRX
