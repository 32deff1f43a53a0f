#include "config/dictation_config.hpp"
#include "core/errors.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

using json = nlohmann::json;

namespace {

std::string homeDir() {
    const char* home = std::getenv("HOME");
    return home && *home ? std::string(home) : std::string(".");
}

TrailingSilence parseTrailingSilence(const std::string& s) {
    if (s == "keep") return TrailingSilence::Keep;
    if (s == "trim") return TrailingSilence::Trim;
    throw ConfigError("trailing_silence must be \"keep\" or \"trim\", got \"" + s + "\"");
}

DictationConfig fromJson(const json& j) {
    if (!j.is_object()) throw ConfigError("config root must be a JSON object");

    DictationConfig c;
    c.model = j.value("model", c.model);
    c.language = j.value("language", c.language);
    c.whisperPrompt = j.value("whisper_prompt", c.whisperPrompt);
    c.inferenceWorkers = j.value("inference_workers", c.inferenceWorkers);
    c.inferenceThreads = j.value("inference_threads", c.inferenceThreads);
    c.gracePeriod = j.value("grace_period", c.gracePeriod);

    c.activationKey = j.value("activation_key", c.activationKey);
    c.doubleTapWindow = j.value("double_tap_window", c.doubleTapWindow);

    c.frameDurationMs = j.value("frame_duration_ms", c.frameDurationMs);
    c.inputDevice = j.value("input_device", c.inputDevice);
    c.frameQueueCapacity = j.value("frame_queue_capacity", c.frameQueueCapacity);
    c.segmentQueueCapacity = j.value("segment_queue_capacity", c.segmentQueueCapacity);
    c.silenceThreshold = j.value("silence_threshold", c.silenceThreshold);
    c.silenceDuration = j.value("silence_duration", c.silenceDuration);
    c.minChunkDuration = j.value("min_chunk_duration", c.minChunkDuration);
    if (j.contains("trailing_silence")) {
        c.trailingSilence = parseTrailingSilence(j.at("trailing_silence").get<std::string>());
    }

    c.autoSubmit = j.value("auto_submit", c.autoSubmit);
    c.spokenPunctuation = j.value("spoken_punctuation", c.spokenPunctuation);
    if (j.contains("word_overrides")) {
        c.wordOverrides = j.at("word_overrides").get<std::map<std::string, std::string>>();
    }

    c.validate();
    return c;
}

} // namespace

void DictationConfig::validate() const {
    if (silenceThreshold < 0.0f || silenceThreshold > 1.0f)
        throw ConfigError("silence_threshold must be within [0, 1]");
    if (silenceDuration <= 0.0)
        throw ConfigError("silence_duration must be positive");
    if (minChunkDuration < 0.0)
        throw ConfigError("min_chunk_duration must not be negative");
    if (doubleTapWindow <= 0.0)
        throw ConfigError("double_tap_window must be positive");
    if (gracePeriod < 0.0)
        throw ConfigError("grace_period must not be negative");
    if (frameDurationMs <= 0 || frameDurationMs > 1000 || frameSamples() <= 0)
        throw ConfigError("frame_duration_ms must be within (0, 1000]");
    if (inferenceWorkers < 1 || inferenceThreads < 1)
        throw ConfigError("inference_workers and inference_threads must be at least 1");
    if (frameQueueCapacity < 1 || segmentQueueCapacity < 1)
        throw ConfigError("queue capacities must be at least 1");
    if (activationKey != "shift" && activationKey != "ctrl" &&
        activationKey != "alt" && activationKey != "meta")
        throw ConfigError("activation_key must be one of shift, ctrl, alt, meta");
}

DictationConfig DictationConfig::loadFromString(const std::string& text) {
    try {
        return fromJson(json::parse(text));
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid config: ") + e.what());
    }
}

DictationConfig DictationConfig::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cout << "[Config] [INFO] No config at " << path << ", using defaults" << std::endl;
        return DictationConfig{};
    }

    std::stringstream ss;
    ss << file.rdbuf();
    try {
        DictationConfig c = loadFromString(ss.str());
        std::cout << "[Config] [INFO] Loaded " << path << std::endl;
        return c;
    } catch (const ConfigError& e) {
        throw ConfigError(path + ": " + e.what());
    }
}

std::string defaultConfigPath() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/tapscribe/config.json";
    return homeDir() + "/.config/tapscribe/config.json";
}

std::vector<std::string> modelSearchDirs() {
    std::vector<std::string> dirs;
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg && *xdg) dirs.push_back(std::string(xdg) + "/tapscribe/models");
    dirs.push_back(homeDir() + "/.local/share/tapscribe/models");
    dirs.push_back(homeDir() + "/.local/share/pywhispercpp/models");
    return dirs;
}

std::string resolveModelPath(const std::string& model) {
    const bool isPath = model.find('/') != std::string::npos ||
                        (model.size() > 4 && model.compare(model.size() - 4, 4, ".bin") == 0);
    if (isPath) return model;

    const std::string file = "ggml-" + model + ".bin";
    const auto dirs = modelSearchDirs();
    for (const auto& dir : dirs) {
        std::error_code ec;
        const auto candidate = std::filesystem::path(dir) / file;
        if (std::filesystem::exists(candidate, ec)) return candidate.string();
    }
    return (std::filesystem::path(dirs.front()) / file).string();
}
