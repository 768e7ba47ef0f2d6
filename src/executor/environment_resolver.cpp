#include "executor/environment_resolver.hpp"

namespace DRX {
namespace Executor {

EnvMap EnvironmentResolver::merge(const EnvMap& defaults, const EnvMap& overrides) {
    EnvMap merged = defaults;
    for (const auto& [key, value] : overrides) {
        merged[key] = value;
    }
    return merged;
}

std::vector<std::string> EnvironmentResolver::toFlags(const std::string& flag, const EnvMap& env) {
    std::vector<std::string> flags;
    flags.reserve(env.size() * 2);
    for (const auto& [key, value] : env) {
        flags.push_back(flag);
        flags.push_back(key + "=" + value);
    }
    return flags;
}

} // namespace Executor
} // namespace DRX
