// EN: Status taxonomy implementation
// FR: Implémentation de la taxonomie des statuts

#include "executor/status.hpp"

namespace DRX {
namespace Executor {

std::string statusText(StatusCode code) {
    switch (code) {
        case StatusCode::OK: return "OK";
        case StatusCode::SetupError: return "SetupError";
        case StatusCode::BuildError: return "BuildError";
        case StatusCode::RunError: return "RunError";
        case StatusCode::ErrorHandlerError: return "ErrorHandlerError";
    }
    return "Unknown";
}

bool statusFromText(const std::string& text, StatusCode& code) {
    static const StatusCode all[] = {
        StatusCode::OK, StatusCode::SetupError, StatusCode::BuildError,
        StatusCode::RunError, StatusCode::ErrorHandlerError
    };
    for (StatusCode candidate : all) {
        if (statusText(candidate) == text) {
            code = candidate;
            return true;
        }
    }
    return false;
}

StatusCode DefaultStatusClassifier::classify(int exit_status) const {
    switch (exit_status) {
        case 0: return StatusCode::OK;
        case 1: return StatusCode::SetupError;
        case 2: return StatusCode::BuildError;
        case 3: return StatusCode::RunError;
        case 4: return StatusCode::ErrorHandlerError;
        default: return StatusCode::RunError;
    }
}

std::shared_ptr<const StatusClassifier> defaultStatusClassifier() {
    static const std::shared_ptr<const StatusClassifier> instance =
        std::make_shared<DefaultStatusClassifier>();
    return instance;
}

} // namespace Executor
} // namespace DRX
