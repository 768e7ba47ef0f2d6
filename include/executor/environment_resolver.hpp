// EN: Environment resolver - merges pipeline defaults with stage overrides
// FR: Résolveur d'environnement - fusionne les valeurs par défaut et les surcharges d'étape

#pragma once

#include <string>
#include <vector>

#include "executor/pipeline_types.hpp"

namespace DRX {
namespace Executor {

namespace EnvironmentResolver {

    // EN: Copy of defaults with every override applied on top. Inputs are left untouched.
    // FR: Copie des valeurs par défaut avec chaque surcharge appliquée. Les entrées restent intactes.
    EnvMap merge(const EnvMap& defaults, const EnvMap& overrides);

    // EN: One "<flag> KEY=VALUE" pair per entry, in sorted key order.
    // FR: Une paire "<flag> KEY=VALUE" par entrée, triée par clé.
    std::vector<std::string> toFlags(const std::string& flag, const EnvMap& env);

} // namespace EnvironmentResolver

} // namespace Executor
} // namespace DRX
