#include "stt/whisper_stt.hpp"
#include "stt/transcript_filter.hpp"
#include "core/errors.hpp"

#include <whisper.h>

#include <cmath>
#include <iostream>
#include <memory>
#include <utility>

static constexpr int kWhisperSampleRate = 16000;

// Returning true aborts whisper_full_with_state
static bool abort_requested(void* userData) {
    const auto* cancel = static_cast<const std::atomic<bool>*>(userData);
    return cancel && cancel->load();
}

// Constructor
WhisperSTT::WhisperSTT(const std::string& modelPath, Options options) : options_(std::move(options)) {
    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = false;
    cparams.flash_attn = false;

    context_ = whisper_init_from_file_with_params(modelPath.c_str(), cparams);
    if (!context_) throw InferenceError("whisper_init_from_file_with_params failed: " + modelPath);

    std::cout << "[Whisper STT] [INFO] Loaded model " << modelPath << std::endl;
}

// Destructor
WhisperSTT::~WhisperSTT() {
    if (context_) whisper_free(context_);
}

// Converts 16 kHz mono pcm into text (std::string)
std::string WhisperSTT::transcribe(const std::vector<int16_t>& pcm, int sampleRate,
                                   const std::atomic<bool>* cancel) {
    if (sampleRate != kWhisperSampleRate) {
        throw InferenceError("unsupported sample rate " + std::to_string(sampleRate) + ", need 16000");
    }
    if (pcm.empty()) return {};

    std::vector<float> samples(pcm.size());
    double acc = 0.0;
    for (std::size_t i = 0; i < pcm.size(); ++i) {
        samples[i] = (float)pcm[i] / 32768.0f;
        acc += (double)samples[i] * samples[i];
    }
    if (std::sqrt(acc / (double)samples.size()) < 1e-6) return {};

    std::unique_ptr<whisper_state, decltype(&whisper_free_state)> state(
        whisper_init_state(context_), &whisper_free_state);
    if (!state) throw InferenceError("whisper_init_state failed");

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);

    params.n_threads = options_.threads;
    params.language = options_.language.empty() ? "auto" : options_.language.c_str();
    params.translate = false;
    if (!options_.initialPrompt.empty()) params.initial_prompt = options_.initialPrompt.c_str();

    params.print_progress = false;
    params.print_realtime = false;
    params.print_timestamps = false;
    params.print_special = false;

    params.no_speech_thold = 0.6f;

    params.abort_callback = &abort_requested;
    params.abort_callback_user_data = const_cast<std::atomic<bool>*>(cancel);

    const int rc = whisper_full_with_state(context_, state.get(), params,
                                           samples.data(), (int)samples.size());
    if (cancel && cancel->load()) return {};
    if (rc != 0) throw InferenceError("whisper_full_with_state failed (" + std::to_string(rc) + ")");

    std::string out;
    const int n_segments = whisper_full_n_segments_from_state(state.get());
    for (int i = 0; i < n_segments; ++i) {
        out += whisper_full_get_segment_text_from_state(state.get(), i);
    }

    std::string text = filterTranscript(out);
    if (text.empty() && !out.empty()) {
        std::cout << "[Whisper STT] [INFO] Filtered non-speech output: " << out << std::endl;
    }
    return text;
}
