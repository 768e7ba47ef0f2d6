// EN: Result codec - canonical JSON form of execution records
// FR: Codec de résultats - forme JSON canonique des enregistrements d'exécution

#pragma once

#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "executor/pipeline_types.hpp"

namespace DRX {
namespace Executor {

// EN: Raised when a JSON document does not describe a valid record.
// FR: Levée quand un document JSON ne décrit pas un enregistrement valide.
class ResultCodecError : public std::runtime_error {
public:
    explicit ResultCodecError(const std::string& message) : std::runtime_error(message) {}
};

// EN: RFC3339 UTC with nine fractional digits, e.g. 2024-01-02T03:04:05.000000001Z.
// FR: RFC3339 UTC avec neuf décimales, ex. 2024-01-02T03:04:05.000000001Z.
std::string formatTimestamp(TimePoint timestamp);

// EN: Parses RFC3339 with optional fraction and Z or +hh:mm offset. Throws ResultCodecError.
// FR: Analyse RFC3339 avec fraction optionnelle et Z ou décalage +hh:mm. Lève ResultCodecError.
TimePoint parseTimestamp(const std::string& text);

nlohmann::json cmdResultToJson(const CmdResult& result);
nlohmann::json stageResultToJson(const StageExecutionResult& result);
nlohmann::json pipelineResultToJson(const PipelineResult& result);

CmdResult cmdResultFromJson(const nlohmann::json& json);
StageExecutionResult stageResultFromJson(const nlohmann::json& json);
PipelineResult pipelineResultFromJson(const nlohmann::json& json);

// EN: Compact text handed to the error handler on stdin. Invalid UTF-8 in captured output
//     is replaced by U+FFFD.
// FR: Texte compact fourni au gestionnaire d'erreur sur stdin. L'UTF-8 invalide dans la
//     sortie capturée est remplacé par U+FFFD.
std::string serializeStageResult(const StageExecutionResult& result);

std::string serializePipelineResult(const PipelineResult& result, int indent = 2);

// EN: Writes the indented document and a trailing newline to path, truncating it.
//     Returns false if the file cannot be opened or written.
// FR: Écrit le document indenté suivi d'un saut de ligne dans path, en le tronquant.
//     Retourne false si le fichier ne peut être ouvert ou écrit.
bool writePipelineResultFile(const PipelineResult& result, const std::string& path);

PipelineResult parsePipelineResult(const std::string& text);
StageExecutionResult parseStageResult(const std::string& text);

} // namespace Executor
} // namespace DRX
