#ifndef WHISPER_STT_HPP
#define WHISPER_STT_HPP

#include "stt/inference_engine.hpp"

#include <string>
#include <vector>
#include <atomic>

struct whisper_context;

// whisper.cpp backend. The model is loaded once; each transcribe() call
// runs on its own whisper_state so workers can share the context.
class WhisperSTT : public InferenceEngine {
public:
    struct Options {
        std::string language = "auto";      // "auto" lets whisper detect it
        std::string initialPrompt;
        int threads = 4;
    };

    // Throws InferenceError if the model cannot be loaded.
    WhisperSTT(const std::string& modelPath, Options options);
    ~WhisperSTT() override;

    WhisperSTT(const WhisperSTT&) = delete;
    WhisperSTT& operator=(const WhisperSTT&) = delete;

    std::string transcribe(const std::vector<int16_t>& pcm, int sampleRate,
                           const std::atomic<bool>* cancel = nullptr) override;

private:
    whisper_context* context_ = nullptr;
    Options options_;
};

#endif
