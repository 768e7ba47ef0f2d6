// EN: Unit tests for the result codec (JSON form of execution records)
// FR: Tests unitaires pour le codec de résultats (forme JSON des enregistrements d'exécution)

#include <gtest/gtest.h>
#include "../include/executor/result_codec.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <unistd.h>

using namespace DRX::Executor;

namespace {

TimePoint makeTime(long long seconds, long long nanos) {
    auto since_epoch = std::chrono::seconds(seconds) + std::chrono::nanoseconds(nanos);
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(since_epoch));
}

StageExecutionResult sampleStage() {
    StageExecutionResult stage;
    stage.stage = "collect";
    stage.start_time = makeTime(1704164645, 0);
    stage.final_time = makeTime(1704164700, 500000000);
    stage.build_result.cmd = "docker build -t coletor .";
    stage.build_result.cmd_dir = "/base/coletor";
    stage.build_result.env = {"PATH=/usr/bin", "HOME=/root"};
    stage.run_result.stdin_data = "";
    stage.run_result.stdout_data = "{\"files\":[\"a.json\"]}";
    stage.run_result.stderr_data = "warning";
    stage.run_result.cmd = "docker run -i -v dadosjusbr:/output --rm coletor";
    stage.run_result.exit_status = 3;
    return stage;
}

} // namespace

TEST(ResultCodecTest, FormatsRfc3339WithNanoseconds) {
    EXPECT_EQ(formatTimestamp(makeTime(1704164645, 0)), "2024-01-02T03:04:05.000000000Z");
    EXPECT_EQ(formatTimestamp(makeTime(0, 0)), "1970-01-01T00:00:00.000000000Z");
}

TEST(ResultCodecTest, ParsesTimestampVariants) {
    EXPECT_EQ(parseTimestamp("2024-01-02T03:04:05Z"), makeTime(1704164645, 0));
    EXPECT_EQ(parseTimestamp("2024-01-02T03:04:05.5Z"), makeTime(1704164645, 500000000));
    EXPECT_EQ(parseTimestamp("2024-01-02T05:04:05+02:00"), makeTime(1704164645, 0));
    EXPECT_EQ(parseTimestamp("2024-01-02T00:04:05-03:00"), makeTime(1704164645, 0));
}

TEST(ResultCodecTest, RejectsMalformedTimestamps) {
    EXPECT_THROW(parseTimestamp("yesterday"), ResultCodecError);
    EXPECT_THROW(parseTimestamp("2024-01-02T03:04:05"), ResultCodecError);
    EXPECT_THROW(parseTimestamp("2024-13-02T03:04:05Z"), ResultCodecError);
    EXPECT_THROW(parseTimestamp("2024-01-02T03:04:05.Z"), ResultCodecError);
    EXPECT_THROW(parseTimestamp("2024-01-02T03:04:05Zjunk"), ResultCodecError);
}

TEST(ResultCodecTest, CmdResultUsesRecordTags) {
    CmdResult result;
    result.stdin_data = "in";
    result.stdout_data = "out";
    result.stderr_data = "err";
    result.cmd = "docker run x";
    result.cmd_dir = "/x";
    result.exit_status = -2;
    result.env = {"A=1"};

    nlohmann::json json = cmdResultToJson(result);

    EXPECT_EQ(json["stdin"], "in");
    EXPECT_EQ(json["stdout"], "out");
    EXPECT_EQ(json["stderr"], "err");
    EXPECT_EQ(json["cmd"], "docker run x");
    EXPECT_EQ(json["cmdDir"], "/x");
    EXPECT_EQ(json["status"], -2);
    EXPECT_EQ(json["env"], nlohmann::json::array({"A=1"}));
}

TEST(ResultCodecTest, StageResultUsesRecordTags) {
    nlohmann::json json = stageResultToJson(sampleStage());

    EXPECT_EQ(json["stage"], "collect");
    EXPECT_EQ(json["start"], "2024-01-02T03:04:05.000000000Z");
    EXPECT_EQ(json["end"], "2024-01-02T03:05:00.500000000Z");
    EXPECT_EQ(json["buildResult"]["cmdDir"], "/base/coletor");
    EXPECT_EQ(json["runResult"]["status"], 3);
}

TEST(ResultCodecTest, PipelineResultSurvivesTextRoundTrip) {
    PipelineResult result;
    result.name = "trt13";
    result.start_time = makeTime(1704164640, 123456789);
    result.final_time = makeTime(1704164760, 987654321);
    result.status = "RunError";
    result.stage_results.push_back(sampleStage());
    StageExecutionResult second = sampleStage();
    second.stage = "parse";
    second.run_result.stdin_data = sampleStage().run_result.stdout_data;
    result.stage_results.push_back(second);

    std::string text = serializePipelineResult(result);
    PipelineResult decoded = parsePipelineResult(text);

    EXPECT_EQ(decoded, result);

    nlohmann::json json = nlohmann::json::parse(text);
    EXPECT_EQ(json["stageResult"].size(), 2u);
    EXPECT_EQ(json["final"], "2024-01-02T03:06:00.987654321Z");
}

TEST(ResultCodecTest, ResultFileIsWrittenAndReadable) {
    PipelineResult result;
    result.name = "trt13";
    result.status = "OK";
    result.start_time = makeTime(1704164645, 0);
    result.final_time = makeTime(1704164646, 0);

    std::filesystem::path path = std::filesystem::temp_directory_path() /
                                 ("drx_result_" + std::to_string(::getpid()) + ".json");
    ASSERT_TRUE(writePipelineResultFile(result, path.string()));

    std::ifstream in(path);
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    std::filesystem::remove(path);

    EXPECT_EQ(text, serializePipelineResult(result) + "\n");
}

TEST(ResultCodecTest, UnwritableResultFileIsReported) {
    PipelineResult result;
    result.name = "trt13";
    EXPECT_FALSE(writePipelineResultFile(result, "/nonexistent/drx/result.json"));
}

TEST(ResultCodecTest, HandlerInputIsCompactStageJson) {
    std::string text = serializeStageResult(sampleStage());

    EXPECT_EQ(text.find('\n'), std::string::npos);
    EXPECT_EQ(parseStageResult(text), sampleStage());
}

TEST(ResultCodecTest, InvalidUtf8IsReplaced) {
    StageExecutionResult stage = sampleStage();
    stage.run_result.stdout_data = std::string("ok\xff", 3);

    std::string text = serializeStageResult(stage);

    EXPECT_NE(text.find("ok\xEF\xBF\xBD"), std::string::npos);
}

TEST(ResultCodecTest, MissingAndNullFieldsDecodeAsEmpty) {
    PipelineResult decoded = parsePipelineResult(R"({"name":"trt13","stageResult":null,"status":"OK"})");

    EXPECT_EQ(decoded.name, "trt13");
    EXPECT_TRUE(decoded.stage_results.empty());
    EXPECT_EQ(decoded.start_time, TimePoint{});
    EXPECT_EQ(decoded.status, "OK");

    StageExecutionResult stage = parseStageResult(R"({"stage":"collect","buildResult":{"cmd":"x","env":null}})");
    EXPECT_EQ(stage.build_result.cmd, "x");
    EXPECT_TRUE(stage.build_result.env.empty());
    EXPECT_EQ(stage.run_result, CmdResult{});
}

TEST(ResultCodecTest, WrongTypesAreRejected) {
    EXPECT_THROW(parsePipelineResult("not json"), ResultCodecError);
    EXPECT_THROW(parsePipelineResult("[]"), ResultCodecError);
    EXPECT_THROW(parsePipelineResult(R"({"name":5})"), ResultCodecError);
    EXPECT_THROW(parsePipelineResult(R"({"stageResult":{}})"), ResultCodecError);
    EXPECT_THROW(parseStageResult(R"({"runResult":{"status":"0"}})"), ResultCodecError);
    EXPECT_THROW(parseStageResult(R"({"start":"noon"})"), ResultCodecError);
}
