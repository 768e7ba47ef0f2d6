// EN: Pipeline data model - stages, pipelines and the records produced while running them
// FR: Modèle de données du pipeline - étapes, pipelines et enregistrements produits à l'exécution

#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace DRX {
namespace Executor {

// EN: Ordered key/value mapping. Ordered so flags built from it are emitted in sorted key order.
// FR: Table clé/valeur ordonnée. Ordonnée pour que les options générées soient triées par clé.
using EnvMap = std::map<std::string, std::string>;

using TimePoint = std::chrono::system_clock::time_point;

// EN: One unit of pipeline work, backed by a container image built from a directory.
// FR: Une unité de travail du pipeline, adossée à une image construite depuis un répertoire.
struct Stage {
    std::string name;           // EN: Stage name / FR: Nom de l'étape
    std::string dir;            // EN: Directory relative to the base directory; its last segment is the image tag / FR: Répertoire relatif au répertoire de base ; son dernier segment est le tag de l'image
    std::string base_dir;       // EN: Overrides the pipeline default base directory when set / FR: Remplace le répertoire de base par défaut si renseigné
    EnvMap build_env;           // EN: Build-time variable overrides / FR: Surcharges des variables de build
    EnvMap run_env;             // EN: Run-time variable overrides / FR: Surcharges des variables d'exécution
};

// EN: Ordered sequence of stages plus shared defaults and an optional error handler.
// FR: Séquence ordonnée d'étapes avec valeurs par défaut partagées et gestionnaire d'erreur optionnel.
struct Pipeline {
    std::string name;
    std::string default_base_dir;
    EnvMap default_build_env;
    EnvMap default_run_env;
    std::vector<Stage> stages;
    std::optional<Stage> error_handler;

    // EN: True when a handler is configured with a non-empty directory.
    // FR: Vrai si un gestionnaire est configuré avec un répertoire non vide.
    bool hasErrorHandler() const {
        return error_handler.has_value() && !error_handler->dir.empty();
    }
};

// EN: Captured record of one external build or run invocation.
// FR: Enregistrement capturé d'une invocation externe de build ou de run.
struct CmdResult {
    std::string stdin_data;             // EN: Input fed to the process / FR: Entrée fournie au processus
    std::string stdout_data;            // EN: Captured standard output / FR: Sortie standard capturée
    std::string stderr_data;            // EN: Captured standard error / FR: Erreur standard capturée
    std::string cmd;                    // EN: Literal command line / FR: Ligne de commande littérale
    std::string cmd_dir;                // EN: Working directory / FR: Répertoire de travail
    int exit_status = 0;
    std::vector<std::string> env;       // EN: KEY=VALUE snapshot visible to the process / FR: Instantané KEY=VALUE visible par le processus

    bool operator==(const CmdResult& other) const {
        return stdin_data == other.stdin_data && stdout_data == other.stdout_data &&
               stderr_data == other.stderr_data && cmd == other.cmd &&
               cmd_dir == other.cmd_dir && exit_status == other.exit_status &&
               env == other.env;
    }
    bool operator!=(const CmdResult& other) const { return !(*this == other); }
};

// EN: Build and run outcome pair for one stage.
// FR: Paire de résultats build/run pour une étape.
struct StageExecutionResult {
    std::string stage;
    TimePoint start_time{};
    TimePoint final_time{};
    CmdResult build_result;
    CmdResult run_result;

    bool operator==(const StageExecutionResult& other) const {
        return stage == other.stage && start_time == other.start_time &&
               final_time == other.final_time && build_result == other.build_result &&
               run_result == other.run_result;
    }
    bool operator!=(const StageExecutionResult& other) const { return !(*this == other); }
};

// EN: Accumulated outcome of a whole pipeline run; the sole externally consumable output.
// FR: Résultat cumulé d'une exécution complète ; seule sortie consommable à l'extérieur.
struct PipelineResult {
    std::string name;
    std::vector<StageExecutionResult> stage_results;
    TimePoint start_time{};
    TimePoint final_time{};
    std::string status;

    bool operator==(const PipelineResult& other) const {
        return name == other.name && stage_results == other.stage_results &&
               start_time == other.start_time && final_time == other.final_time &&
               status == other.status;
    }
    bool operator!=(const PipelineResult& other) const { return !(*this == other); }
};

// EN: Structural checks on a pipeline definition. Returns one message per problem.
// FR: Contrôles structurels d'une définition de pipeline. Un message par problème.
std::vector<std::string> validatePipeline(const Pipeline& pipeline);

// EN: Final path segment of a stage directory, used as the image tag.
// FR: Dernier segment du chemin d'une étape, utilisé comme tag d'image.
std::string imageTagFor(const std::string& directory);

// EN: "<base>/<dir>", or dir alone when base is empty.
// FR: "<base>/<dir>", ou dir seul si base est vide.
std::string joinStageDirectory(const std::string& base_dir, const std::string& dir);

} // namespace Executor
} // namespace DRX
