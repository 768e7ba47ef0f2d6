// EN: Status taxonomy for pipeline execution and exit-code classification
// FR: Taxonomie des statuts d'exécution du pipeline et classification des codes de sortie

#pragma once

#include <memory>
#include <stdexcept>
#include <string>

namespace DRX {
namespace Executor {

// EN: Exhaustive outcome of a pipeline run or of a single process exit code.
//     The integer values are also the exit codes the default classifier recognises.
// FR: Issue exhaustive d'une exécution de pipeline ou d'un code de sortie.
//     Les valeurs entières sont aussi les codes reconnus par le classificateur par défaut.
enum class StatusCode {
    OK = 0,
    SetupError = 1,
    BuildError = 2,
    RunError = 3,
    ErrorHandlerError = 4
};

// EN: Exit status recorded when the process could not be started at all.
// FR: Code de sortie enregistré quand le processus n'a pas pu démarrer.
constexpr int kNotStartedExitStatus = -2;

// EN: Exit status recorded when the process was terminated by a signal (timeout, cancellation).
// FR: Code de sortie enregistré quand le processus a été tué par un signal (timeout, annulation).
constexpr int kSignaledExitStatus = -1;

// EN: Human text for a status ("OK", "SetupError", ...).
// FR: Texte lisible d'un statut ("OK", "SetupError", ...).
std::string statusText(StatusCode code);

// EN: Inverse of statusText. Returns false for unknown text.
// FR: Inverse de statusText. Retourne false pour un texte inconnu.
bool statusFromText(const std::string& text, StatusCode& code);

// EN: Lookup from process exit status to classification. Replaceable so deployments
//     can plug their own table.
// FR: Table de correspondance code de sortie -> classification. Remplaçable pour que
//     chaque déploiement puisse fournir sa propre table.
class StatusClassifier {
public:
    virtual ~StatusClassifier() = default;

    virtual StatusCode classify(int exit_status) const = 0;

    virtual std::string text(StatusCode code) const { return statusText(code); }
};

// EN: Default table: 0 is OK, 1..4 map to the enum value of the same number,
//     anything else (including the negative sentinels) is a RunError.
// FR: Table par défaut : 0 vaut OK, 1..4 correspondent à l'énumération de même valeur,
//     tout le reste (sentinelles négatives incluses) est un RunError.
class DefaultStatusClassifier : public StatusClassifier {
public:
    StatusCode classify(int exit_status) const override;
};

// EN: Shared default classifier instance.
// FR: Instance partagée du classificateur par défaut.
std::shared_ptr<const StatusClassifier> defaultStatusClassifier();

// EN: Error carried out of the executor, tagged with its classification.
// FR: Erreur remontée par l'exécuteur, étiquetée avec sa classification.
class PipelineError : public std::runtime_error {
public:
    PipelineError(StatusCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    StatusCode code() const { return code_; }

private:
    StatusCode code_;
};

} // namespace Executor
} // namespace DRX
