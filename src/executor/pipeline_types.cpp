// EN: Pipeline data model helpers
// FR: Utilitaires du modèle de données du pipeline

#include "executor/pipeline_types.hpp"

#include <filesystem>
#include <set>

namespace DRX {
namespace Executor {

namespace {

void validateStage(const Stage& stage, const std::string& label, std::vector<std::string>& errors) {
    if (stage.name.empty()) {
        errors.push_back(label + ": name is empty");
    }
    if (stage.dir.empty()) {
        errors.push_back(label + ": dir is empty");
    }
}

} // namespace

std::vector<std::string> validatePipeline(const Pipeline& pipeline) {
    std::vector<std::string> errors;

    if (pipeline.name.empty()) {
        errors.push_back("pipeline name is empty");
    }
    // EN: The shared output folder always lives under the pipeline default, whatever the stages use.
    // FR: Le dossier de sortie partagé est toujours sous le répertoire par défaut du pipeline.
    if (pipeline.default_base_dir.empty()) {
        errors.push_back("pipeline default_base_dir is empty");
    }

    std::set<std::string> seen;
    for (size_t i = 0; i < pipeline.stages.size(); ++i) {
        const Stage& stage = pipeline.stages[i];
        validateStage(stage, "stage #" + std::to_string(i + 1), errors);
        if (!stage.name.empty() && !seen.insert(stage.name).second) {
            errors.push_back("duplicate stage name: " + stage.name);
        }
    }

    if (pipeline.error_handler) {
        validateStage(*pipeline.error_handler, "error_handler", errors);
    }

    return errors;
}

std::string imageTagFor(const std::string& directory) {
    std::filesystem::path path(directory);
    // EN: "a/b/" has an empty filename; use the parent's last segment like filepath.Base does.
    // FR: "a/b/" a un nom de fichier vide ; on prend le dernier segment du parent.
    while (!path.empty() && path.filename().empty() && path != path.root_path()) {
        path = path.parent_path();
    }
    std::string tag = path.filename().string();
    return tag.empty() ? std::string(".") : tag;
}

std::string joinStageDirectory(const std::string& base_dir, const std::string& dir) {
    if (base_dir.empty()) {
        return dir;
    }
    return base_dir + "/" + dir;
}

} // namespace Executor
} // namespace DRX
