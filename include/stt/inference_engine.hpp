#ifndef INFERENCE_ENGINE_HPP
#define INFERENCE_ENGINE_HPP

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

// Speech-to-text backend shared by all inference workers.
// transcribe() may be called from several threads at once.
class InferenceEngine {
public:
    virtual ~InferenceEngine() = default;

    // Returns the recognised text, possibly empty. Throws InferenceError.
    // When cancel is set the call may return early with partial or no text.
    virtual std::string transcribe(const std::vector<int16_t>& pcm, int sampleRate,
                                   const std::atomic<bool>* cancel = nullptr) = 0;
};

#endif
