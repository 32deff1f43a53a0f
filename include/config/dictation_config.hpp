#ifndef DICTATION_CONFIG_HPP
#define DICTATION_CONFIG_HPP

#include <cstdint>
#include <map>
#include <string>
#include <vector>

enum class TrailingSilence { Keep, Trim };

// Read once at startup; every session gets its own copy.
struct DictationConfig {
    // inference
    std::string model = "base.en";
    std::string language = "auto";
    std::string whisperPrompt = "Transcribe with proper capitalization.";
    int inferenceWorkers = 2;
    int inferenceThreads = 4;
    double gracePeriod = 5.0;               // seconds

    // activation
    std::string activationKey = "shift";
    double doubleTapWindow = 0.4;           // seconds

    // capture + segmentation
    int sampleRate = 16000;
    int frameDurationMs = 64;
    int inputDevice = -1;                   // -1 = system default
    int frameQueueCapacity = 256;
    int segmentQueueCapacity = 16;
    float silenceThreshold = 0.01f;         // RMS, samples normalised to [0,1]
    double silenceDuration = 0.7;           // seconds
    double minChunkDuration = 0.3;          // seconds
    TrailingSilence trailingSilence = TrailingSilence::Keep;

    // output
    bool autoSubmit = false;
    bool spokenPunctuation = true;
    std::map<std::string, std::string> wordOverrides;

    int frameSamples() const { return (int)((int64_t)sampleRate * frameDurationMs / 1000); }

    // Throws ConfigError on out-of-range values.
    void validate() const;

    // Missing file -> defaults. Malformed JSON or bad values -> ConfigError.
    static DictationConfig loadFromFile(const std::string& path);
    static DictationConfig loadFromString(const std::string& json);
};

// $XDG_CONFIG_HOME/tapscribe/config.json or ~/.config/tapscribe/config.json
std::string defaultConfigPath();

// Turns the `model` selector into a model file path. Returns the first
// existing candidate, or the first candidate if none exists yet.
std::string resolveModelPath(const std::string& model);

std::vector<std::string> modelSearchDirs();

#endif
