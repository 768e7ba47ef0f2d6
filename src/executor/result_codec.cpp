// EN: Result codec implementation. Field tags match the records consumed by existing handlers.
// FR: Implémentation du codec de résultats. Les noms de champs correspondent aux enregistrements
//     consommés par les gestionnaires existants.

#include "executor/result_codec.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>
#include <fstream>

namespace DRX {
namespace Executor {

namespace {

constexpr long long kNanosPerSecond = 1000000000LL;

std::string dumpJson(const nlohmann::json& json, int indent) {
    return json.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json parseJson(const std::string& text) {
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw ResultCodecError(std::string("invalid JSON: ") + e.what());
    }
}

// EN: Reads a string member; a null member reads as empty like an absent optional field.
// FR: Lit un membre chaîne ; un membre null se lit comme vide.
std::string stringField(const nlohmann::json& json, const char* key) {
    auto it = json.find(key);
    if (it == json.end() || it->is_null()) {
        return {};
    }
    if (!it->is_string()) {
        throw ResultCodecError(std::string("field '") + key + "' is not a string");
    }
    return it->get<std::string>();
}

TimePoint timeField(const nlohmann::json& json, const char* key) {
    std::string text = stringField(json, key);
    if (text.empty()) {
        return TimePoint{};
    }
    return parseTimestamp(text);
}

void requireObject(const nlohmann::json& json, const char* what) {
    if (!json.is_object()) {
        throw ResultCodecError(std::string(what) + " must be a JSON object");
    }
}

} // namespace

std::string formatTimestamp(TimePoint timestamp) {
    long long nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(
        timestamp.time_since_epoch()).count();
    long long seconds = nanos / kNanosPerSecond;
    long long fraction = nanos % kNanosPerSecond;
    if (fraction < 0) {
        fraction += kNanosPerSecond;
        --seconds;
    }

    std::time_t as_time_t = static_cast<std::time_t>(seconds);
    std::tm tm_utc{};
    gmtime_r(&as_time_t, &tm_utc);

    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%09lldZ",
                  tm_utc.tm_year + 1900, tm_utc.tm_mon + 1, tm_utc.tm_mday,
                  tm_utc.tm_hour, tm_utc.tm_min, tm_utc.tm_sec, fraction);
    return buffer;
}

TimePoint parseTimestamp(const std::string& text) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &year, &month, &day, &hour, &minute, &second, &consumed) != 6 ||
        consumed != 19) {
        throw ResultCodecError("invalid timestamp: '" + text + "'");
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        throw ResultCodecError("timestamp out of range: '" + text + "'");
    }

    size_t pos = static_cast<size_t>(consumed);
    long long nanos = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        int kept = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (kept < 9) {
                nanos = nanos * 10 + (text[pos] - '0');
                ++kept;
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            throw ResultCodecError("invalid timestamp fraction: '" + text + "'");
        }
        for (; kept < 9; ++kept) {
            nanos *= 10;
        }
    }

    long long offset_seconds = 0;
    if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
        ++pos;
    } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        int sign = text[pos] == '-' ? -1 : 1;
        int offset_hours = 0, offset_minutes = 0, offset_consumed = 0;
        if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d%n",
                        &offset_hours, &offset_minutes, &offset_consumed) != 2 ||
            offset_consumed != 5) {
            throw ResultCodecError("invalid timestamp offset: '" + text + "'");
        }
        offset_seconds = sign * (offset_hours * 3600LL + offset_minutes * 60LL);
        pos += 6;
    } else {
        throw ResultCodecError("timestamp without zone: '" + text + "'");
    }
    if (pos != text.size()) {
        throw ResultCodecError("trailing characters in timestamp: '" + text + "'");
    }

    std::tm tm_utc{};
    tm_utc.tm_year = year - 1900;
    tm_utc.tm_mon = month - 1;
    tm_utc.tm_mday = day;
    tm_utc.tm_hour = hour;
    tm_utc.tm_min = minute;
    tm_utc.tm_sec = second;
    long long seconds = static_cast<long long>(timegm(&tm_utc)) - offset_seconds;

    auto since_epoch = std::chrono::seconds(seconds) + std::chrono::nanoseconds(nanos);
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(since_epoch));
}

nlohmann::json cmdResultToJson(const CmdResult& result) {
    nlohmann::json j;
    j["stdin"] = result.stdin_data;
    j["stdout"] = result.stdout_data;
    j["stderr"] = result.stderr_data;
    j["cmd"] = result.cmd;
    j["cmdDir"] = result.cmd_dir;
    j["status"] = result.exit_status;
    j["env"] = result.env;
    return j;
}

nlohmann::json stageResultToJson(const StageExecutionResult& result) {
    nlohmann::json j;
    j["stage"] = result.stage;
    j["start"] = formatTimestamp(result.start_time);
    j["end"] = formatTimestamp(result.final_time);
    j["buildResult"] = cmdResultToJson(result.build_result);
    j["runResult"] = cmdResultToJson(result.run_result);
    return j;
}

nlohmann::json pipelineResultToJson(const PipelineResult& result) {
    nlohmann::json j;
    j["name"] = result.name;
    j["stageResult"] = nlohmann::json::array();
    for (const auto& stage : result.stage_results) {
        j["stageResult"].push_back(stageResultToJson(stage));
    }
    j["start"] = formatTimestamp(result.start_time);
    j["final"] = formatTimestamp(result.final_time);
    j["status"] = result.status;
    return j;
}

CmdResult cmdResultFromJson(const nlohmann::json& json) {
    requireObject(json, "command result");

    CmdResult result;
    result.stdin_data = stringField(json, "stdin");
    result.stdout_data = stringField(json, "stdout");
    result.stderr_data = stringField(json, "stderr");
    result.cmd = stringField(json, "cmd");
    result.cmd_dir = stringField(json, "cmdDir");

    auto status = json.find("status");
    if (status != json.end() && !status->is_null()) {
        if (!status->is_number_integer()) {
            throw ResultCodecError("field 'status' is not an integer");
        }
        result.exit_status = status->get<int>();
    }

    auto env = json.find("env");
    if (env != json.end() && !env->is_null()) {
        if (!env->is_array()) {
            throw ResultCodecError("field 'env' is not an array");
        }
        for (const auto& item : *env) {
            if (!item.is_string()) {
                throw ResultCodecError("field 'env' holds a non-string entry");
            }
            result.env.push_back(item.get<std::string>());
        }
    }
    return result;
}

StageExecutionResult stageResultFromJson(const nlohmann::json& json) {
    requireObject(json, "stage result");

    StageExecutionResult result;
    result.stage = stringField(json, "stage");
    result.start_time = timeField(json, "start");
    result.final_time = timeField(json, "end");
    if (json.contains("buildResult") && !json["buildResult"].is_null()) {
        result.build_result = cmdResultFromJson(json["buildResult"]);
    }
    if (json.contains("runResult") && !json["runResult"].is_null()) {
        result.run_result = cmdResultFromJson(json["runResult"]);
    }
    return result;
}

PipelineResult pipelineResultFromJson(const nlohmann::json& json) {
    requireObject(json, "pipeline result");

    PipelineResult result;
    result.name = stringField(json, "name");
    result.start_time = timeField(json, "start");
    result.final_time = timeField(json, "final");
    result.status = stringField(json, "status");

    auto stages = json.find("stageResult");
    if (stages != json.end() && !stages->is_null()) {
        if (!stages->is_array()) {
            throw ResultCodecError("field 'stageResult' is not an array");
        }
        for (const auto& item : *stages) {
            result.stage_results.push_back(stageResultFromJson(item));
        }
    }
    return result;
}

std::string serializeStageResult(const StageExecutionResult& result) {
    return dumpJson(stageResultToJson(result), -1);
}

std::string serializePipelineResult(const PipelineResult& result, int indent) {
    return dumpJson(pipelineResultToJson(result), indent);
}

bool writePipelineResultFile(const PipelineResult& result, const std::string& path) {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        return false;
    }
    out << serializePipelineResult(result) << '\n';
    out.flush();
    return static_cast<bool>(out);
}

PipelineResult parsePipelineResult(const std::string& text) {
    return pipelineResultFromJson(parseJson(text));
}

StageExecutionResult parseStageResult(const std::string& text) {
    return stageResultFromJson(parseJson(text));
}

} // namespace Executor
} // namespace DRX
