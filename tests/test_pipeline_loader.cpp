// EN: Unit tests for pipeline definition loading (YAML and JSON)
// FR: Tests unitaires pour le chargement des définitions de pipeline (YAML et JSON)

#include <gtest/gtest.h>
#include "../include/orchestrator/pipeline_loader.hpp"

#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace DRX::Executor;
using namespace DRX::Orchestrator;

namespace {

const std::string kYamlPipeline = R"(
name: trt13
default_base_dir: /home/dadosjus/trt13
default_build_env:
  YEAR: 2021
  MONTH: "01"
default_run_env:
  OUTPUT_FOLDER: /output
stages:
  - name: collect
    dir: coletor
    build_env:
      MONTH: "02"
  - name: parse
    dir: parser
    base_dir: /opt/parsers
    run_env:
      GIT_COMMIT: abc123
error_handler:
  name: notify
  dir: error-handler
  base_dir: /opt/handlers
  run_env:
    CHANNEL: ops
)";

const std::string kJsonPipeline = R"({
  "name": "trt13",
  "default_base_dir": "/home/dadosjus/trt13",
  "default_build_env": {"YEAR": 2021, "MONTH": "01"},
  "default_run_env": {"OUTPUT_FOLDER": "/output"},
  "stages": [
    {"name": "collect", "dir": "coletor", "build_env": {"MONTH": "02"}},
    {"name": "parse", "dir": "parser", "base_dir": "/opt/parsers", "run_env": {"GIT_COMMIT": "abc123"}}
  ],
  "error_handler": {"name": "notify", "dir": "error-handler", "base_dir": "/opt/handlers",
                    "run_env": {"CHANNEL": "ops"}}
})";

void expectSamplePipeline(const Pipeline& pipeline) {
    EXPECT_EQ(pipeline.name, "trt13");
    EXPECT_EQ(pipeline.default_base_dir, "/home/dadosjus/trt13");
    EXPECT_EQ(pipeline.default_build_env, (EnvMap{{"YEAR", "2021"}, {"MONTH", "01"}}));
    EXPECT_EQ(pipeline.default_run_env, (EnvMap{{"OUTPUT_FOLDER", "/output"}}));

    ASSERT_EQ(pipeline.stages.size(), 2u);
    EXPECT_EQ(pipeline.stages[0].name, "collect");
    EXPECT_EQ(pipeline.stages[0].dir, "coletor");
    EXPECT_TRUE(pipeline.stages[0].base_dir.empty());
    EXPECT_EQ(pipeline.stages[0].build_env, (EnvMap{{"MONTH", "02"}}));
    EXPECT_EQ(pipeline.stages[1].base_dir, "/opt/parsers");
    EXPECT_EQ(pipeline.stages[1].run_env, (EnvMap{{"GIT_COMMIT", "abc123"}}));

    ASSERT_TRUE(pipeline.hasErrorHandler());
    EXPECT_EQ(pipeline.error_handler->name, "notify");
    EXPECT_EQ(pipeline.error_handler->base_dir, "/opt/handlers");
    EXPECT_EQ(pipeline.error_handler->run_env, (EnvMap{{"CHANNEL", "ops"}}));
}

} // namespace

TEST(PipelineLoaderTest, LoadsYamlDefinition) {
    expectSamplePipeline(loadPipelineFromYAMLString(kYamlPipeline));
}

TEST(PipelineLoaderTest, LoadsJsonDefinition) {
    expectSamplePipeline(loadPipelineFromJSONString(kJsonPipeline));
}

TEST(PipelineLoaderTest, HandlerIsOptional) {
    Pipeline pipeline = loadPipelineFromYAMLString("name: p\nstages:\n  - name: a\n    dir: a\n");
    EXPECT_FALSE(pipeline.error_handler.has_value());
    EXPECT_FALSE(pipeline.hasErrorHandler());
}

TEST(PipelineLoaderTest, RejectsMalformedYaml) {
    EXPECT_THROW(loadPipelineFromYAMLString("name: [unclosed"), PipelineDefinitionError);
    EXPECT_THROW(loadPipelineFromYAMLString(""), PipelineDefinitionError);
    EXPECT_THROW(loadPipelineFromYAMLString("- a\n- b\n"), PipelineDefinitionError);
    EXPECT_THROW(loadPipelineFromYAMLString("name: p\nstages: nope\n"), PipelineDefinitionError);
    EXPECT_THROW(loadPipelineFromYAMLString("name: p\nstages:\n  - name: a\n    build_env: [1, 2]\n"),
                 PipelineDefinitionError);
}

TEST(PipelineLoaderTest, RejectsMalformedJson) {
    EXPECT_THROW(loadPipelineFromJSONString("{"), PipelineDefinitionError);
    EXPECT_THROW(loadPipelineFromJSONString("[]"), PipelineDefinitionError);
    EXPECT_THROW(loadPipelineFromJSONString(R"({"name": 3})"), PipelineDefinitionError);
    EXPECT_THROW(loadPipelineFromJSONString(R"({"stages": {}})"), PipelineDefinitionError);
    EXPECT_THROW(loadPipelineFromJSONString(R"({"default_run_env": {"A": {"nested": 1}}})"),
                 PipelineDefinitionError);
}

TEST(PipelineLoaderTest, ErrorNamesTheOffendingStage) {
    try {
        loadPipelineFromJSONString(R"({"stages": [{"name": "a", "dir": "a"}, {"name": 1}]})");
        FAIL() << "Expected PipelineDefinitionError";
    } catch (const PipelineDefinitionError& e) {
        EXPECT_NE(std::string(e.what()).find("stages[1].name"), std::string::npos);
    }
}

TEST(PipelineLoaderTest, LoadsFilesByExtension) {
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / ("drx_loader_" + std::to_string(::getpid()));
    fs::create_directories(dir);
    std::ofstream(dir / "pipeline.yaml") << kYamlPipeline;
    std::ofstream(dir / "pipeline.json") << kJsonPipeline;

    expectSamplePipeline(loadPipelineFromFile((dir / "pipeline.yaml").string()));
    expectSamplePipeline(loadPipelineFromFile((dir / "pipeline.json").string()));
    EXPECT_THROW(loadPipelineFromFile((dir / "missing.yaml").string()), PipelineDefinitionError);

    fs::remove_all(dir);
}
