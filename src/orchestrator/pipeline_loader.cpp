// EN: Pipeline definition loader. YAML through yaml-cpp, JSON through nlohmann::json.
// FR: Chargeur de définitions de pipeline. YAML via yaml-cpp, JSON via nlohmann::json.

#include "orchestrator/pipeline_loader.hpp"
#include "infrastructure/logging/logger.hpp"

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace DRX {
namespace Orchestrator {

using Executor::EnvMap;
using Executor::Pipeline;
using Executor::Stage;

namespace {

// EN: YAML
// FR: YAML

std::string yamlString(const YAML::Node& node, const std::string& key, const std::string& where) {
    YAML::Node value = node[key];
    if (!value || value.IsNull()) {
        return {};
    }
    if (!value.IsScalar()) {
        throw PipelineDefinitionError(where + "." + key + " must be a string");
    }
    return value.as<std::string>();
}

EnvMap yamlEnv(const YAML::Node& node, const std::string& key, const std::string& where) {
    EnvMap env;
    YAML::Node value = node[key];
    if (!value || value.IsNull()) {
        return env;
    }
    if (!value.IsMap()) {
        throw PipelineDefinitionError(where + "." + key + " must be a mapping of variables");
    }
    for (const auto& entry : value) {
        if (!entry.second.IsScalar()) {
            throw PipelineDefinitionError(where + "." + key + "." + entry.first.as<std::string>() +
                                          " must be a scalar");
        }
        env[entry.first.as<std::string>()] = entry.second.as<std::string>();
    }
    return env;
}

Stage yamlStage(const YAML::Node& node, const std::string& where) {
    if (!node.IsMap()) {
        throw PipelineDefinitionError(where + " must be a mapping");
    }
    Stage stage;
    stage.name = yamlString(node, "name", where);
    stage.dir = yamlString(node, "dir", where);
    stage.base_dir = yamlString(node, "base_dir", where);
    stage.build_env = yamlEnv(node, "build_env", where);
    stage.run_env = yamlEnv(node, "run_env", where);
    return stage;
}

Pipeline pipelineFromYAML(const YAML::Node& root) {
    if (!root.IsMap()) {
        throw PipelineDefinitionError("pipeline definition must be a mapping");
    }

    Pipeline pipeline;
    pipeline.name = yamlString(root, "name", "pipeline");
    pipeline.default_base_dir = yamlString(root, "default_base_dir", "pipeline");
    pipeline.default_build_env = yamlEnv(root, "default_build_env", "pipeline");
    pipeline.default_run_env = yamlEnv(root, "default_run_env", "pipeline");

    YAML::Node stages = root["stages"];
    if (stages && !stages.IsNull()) {
        if (!stages.IsSequence()) {
            throw PipelineDefinitionError("pipeline.stages must be a list");
        }
        for (size_t i = 0; i < stages.size(); ++i) {
            pipeline.stages.push_back(yamlStage(stages[i], "stages[" + std::to_string(i) + "]"));
        }
    }

    YAML::Node handler = root["error_handler"];
    if (handler && !handler.IsNull()) {
        pipeline.error_handler = yamlStage(handler, "error_handler");
    }
    return pipeline;
}

// EN: JSON
// FR: JSON

std::string jsonString(const nlohmann::json& node, const char* key, const std::string& where) {
    auto it = node.find(key);
    if (it == node.end() || it->is_null()) {
        return {};
    }
    if (!it->is_string()) {
        throw PipelineDefinitionError(where + "." + key + " must be a string");
    }
    return it->get<std::string>();
}

EnvMap jsonEnv(const nlohmann::json& node, const char* key, const std::string& where) {
    EnvMap env;
    auto it = node.find(key);
    if (it == node.end() || it->is_null()) {
        return env;
    }
    if (!it->is_object()) {
        throw PipelineDefinitionError(where + "." + key + " must be an object of variables");
    }
    for (const auto& [name, value] : it->items()) {
        if (value.is_string()) {
            env[name] = value.get<std::string>();
        } else if (value.is_number() || value.is_boolean()) {
            env[name] = value.dump();
        } else {
            throw PipelineDefinitionError(where + "." + key + "." + name + " must be a scalar");
        }
    }
    return env;
}

Stage jsonStage(const nlohmann::json& node, const std::string& where) {
    if (!node.is_object()) {
        throw PipelineDefinitionError(where + " must be an object");
    }
    Stage stage;
    stage.name = jsonString(node, "name", where);
    stage.dir = jsonString(node, "dir", where);
    stage.base_dir = jsonString(node, "base_dir", where);
    stage.build_env = jsonEnv(node, "build_env", where);
    stage.run_env = jsonEnv(node, "run_env", where);
    return stage;
}

Pipeline pipelineFromJSON(const nlohmann::json& root) {
    if (!root.is_object()) {
        throw PipelineDefinitionError("pipeline definition must be an object");
    }

    Pipeline pipeline;
    pipeline.name = jsonString(root, "name", "pipeline");
    pipeline.default_base_dir = jsonString(root, "default_base_dir", "pipeline");
    pipeline.default_build_env = jsonEnv(root, "default_build_env", "pipeline");
    pipeline.default_run_env = jsonEnv(root, "default_run_env", "pipeline");

    auto stages = root.find("stages");
    if (stages != root.end() && !stages->is_null()) {
        if (!stages->is_array()) {
            throw PipelineDefinitionError("pipeline.stages must be an array");
        }
        for (size_t i = 0; i < stages->size(); ++i) {
            pipeline.stages.push_back(jsonStage((*stages)[i], "stages[" + std::to_string(i) + "]"));
        }
    }

    auto handler = root.find("error_handler");
    if (handler != root.end() && !handler->is_null()) {
        pipeline.error_handler = jsonStage(*handler, "error_handler");
    }
    return pipeline;
}

std::string readFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw PipelineDefinitionError("cannot open pipeline definition: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // namespace

Pipeline loadPipelineFromYAMLString(const std::string& text) {
    try {
        return pipelineFromYAML(YAML::Load(text));
    } catch (const YAML::Exception& e) {
        throw PipelineDefinitionError(std::string("invalid YAML pipeline definition: ") + e.what());
    }
}

Pipeline loadPipelineFromYAML(const std::string& path) {
    Pipeline pipeline = loadPipelineFromYAMLString(readFile(path));
    LOG_DEBUG("loader", "Pipeline " + pipeline.name + " loaded from " + path);
    return pipeline;
}

Pipeline loadPipelineFromJSONString(const std::string& text) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw PipelineDefinitionError(std::string("invalid JSON pipeline definition: ") + e.what());
    }
    return pipelineFromJSON(root);
}

Pipeline loadPipelineFromJSON(const std::string& path) {
    Pipeline pipeline = loadPipelineFromJSONString(readFile(path));
    LOG_DEBUG("loader", "Pipeline " + pipeline.name + " loaded from " + path);
    return pipeline;
}

Pipeline loadPipelineFromFile(const std::string& path) {
    if (std::filesystem::path(path).extension() == ".json") {
        return loadPipelineFromJSON(path);
    }
    return loadPipelineFromYAML(path);
}

} // namespace Orchestrator
} // namespace DRX
