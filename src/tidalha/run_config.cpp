// filename: run_config.cpp
// part of Tidal Harmonic Analysis Driver
// MIT License

#include "tidalha/run_config.hpp"

#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace tidalha {
namespace {

std::string requireNonEmpty(const std::string& field, const std::string& value) {
    if (value.empty()) {
        throw std::runtime_error(field + " must be a non-empty string");
    }
    return value;
}

std::string readString(const nlohmann::json& json, const char* key, const std::string& fallback) {
    if (!json.contains(key)) {
        return fallback;
    }
    const auto& node = json.at(key);
    if (!node.is_string()) {
        throw std::runtime_error(std::string(key) + " must be a string");
    }
    return node.get<std::string>();
}

double readNumber(const nlohmann::json& json, const char* key, double fallback) {
    if (!json.contains(key)) {
        return fallback;
    }
    const auto& node = json.at(key);
    if (!node.is_number()) {
        throw std::runtime_error(std::string(key) + " must be a number");
    }
    return node.get<double>();
}

std::vector<std::string> readStringArray(const nlohmann::json& json, const char* key,
                                         const std::vector<std::string>& fallback) {
    if (!json.contains(key)) {
        return fallback;
    }
    const auto& node = json.at(key);
    if (!node.is_array()) {
        throw std::runtime_error(std::string(key) + " must be an array of strings");
    }
    std::vector<std::string> items;
    for (const auto& item : node) {
        if (!item.is_string()) {
            throw std::runtime_error(std::string(key) + " must be an array of strings");
        }
        items.push_back(requireNonEmpty(std::string(key) + " entry", item.get<std::string>()));
    }
    return items;
}

}  // namespace

void applyRunConfigJson(const std::string& path, RunConfig& config) {
    std::ifstream input(path);
    if (!input) {
        throw std::runtime_error("Failed to open run configuration JSON: " + path);
    }

    nlohmann::json json;
    try {
        input >> json;
    } catch (const nlohmann::json::parse_error& ex) {
        throw std::runtime_error("Failed to parse run configuration JSON " + path + ": " + ex.what());
    }
    if (!json.is_object()) {
        throw std::runtime_error("Run configuration JSON must be an object: " + path);
    }

    const std::string version = readString(json, "version", std::string{});
    if (version.empty()) {
        throw std::runtime_error("Run configuration JSON missing required field: version");
    }
    if (version != "0.1") {
        throw std::runtime_error("Unsupported run configuration version: " + version);
    }
    config.version = version;

    config.workDir = readString(json, "work_dir", config.workDir);
    config.meshFile = readString(json, "mesh_file", config.meshFile);
    config.maskFile = readString(json, "mask_file", config.maskFile);
    config.inclusionThreshold = readNumber(json, "inclusion_threshold", config.inclusionThreshold);
    config.constituents = readStringArray(json, "constituents", config.constituents);

    config.pollIntervalSec = readNumber(json, "poll_interval_sec", config.pollIntervalSec);
    config.maxWaitSec = readNumber(json, "max_wait_sec", config.maxWaitSec);
    config.completionMarker = readString(json, "completion_marker", config.completionMarker);

    config.workerScript = readString(json, "worker_script", config.workerScript);
    config.logRedirect = readString(json, "log_redirect", config.logRedirect);
    config.submitCommand = readString(json, "submit_command", config.submitCommand);
    config.cancelCommand = readString(json, "cancel_command", config.cancelCommand);
    config.jobNamePrefix = readString(json, "job_name_prefix", config.jobNamePrefix);
    config.markers.jobNameDirective = readString(json, "job_name_directive", config.markers.jobNameDirective);
    config.markers.jobNameFlag = readString(json, "job_name_flag", config.markers.jobNameFlag);
    config.markers.entrypoint = readStringArray(json, "entrypoint_markers", config.markers.entrypoint);
}

RunConfig loadRunConfigFromJson(const std::string& path) {
    RunConfig config{};
    applyRunConfigJson(path, config);
    return config;
}

void validateRunConfig(const RunConfig& config) {
    if (config.taskCount < 1) {
        throw std::runtime_error("task count must be at least 1");
    }
    if (!(config.pollIntervalSec > 0.0)) {
        throw std::runtime_error("poll_interval_sec must be positive");
    }
    if (config.maxWaitSec < 0.0) {
        throw std::runtime_error("max_wait_sec must not be negative");
    }
    if (config.constituents.empty()) {
        throw std::runtime_error("constituents must name at least one constituent");
    }
    if (config.markers.entrypoint.empty()) {
        throw std::runtime_error("entrypoint_markers must not be empty");
    }
    requireNonEmpty("work_dir", config.workDir);
    requireNonEmpty("mesh_file", config.meshFile);
    requireNonEmpty("mask_file", config.maskFile);
    requireNonEmpty("completion_marker", config.completionMarker);
    requireNonEmpty("worker_script", config.workerScript);
    requireNonEmpty("submit_command", config.submitCommand);
    requireNonEmpty("job_name_directive", config.markers.jobNameDirective);
    requireNonEmpty("job_name_flag", config.markers.jobNameFlag);
    if (!config.assembleOnly) {
        requireNonEmpty("extraction executable", config.extractExecutable);
        requireNonEmpty("analysis executable", config.analysisExecutable);
        requireNonEmpty("job template", config.jobTemplatePath);
        requireNonEmpty("tidal constants file", config.constantsFile);
    }
}

}  // namespace tidalha
