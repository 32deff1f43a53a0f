#ifndef TEST_FAKES_HPP
#define TEST_FAKES_HPP

#include "audio/capture_device.hpp"
#include "core/errors.hpp"
#include "core/types.hpp"
#include "output/keystroke_sink.hpp"
#include "stt/inference_engine.hpp"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

// Capture device driven by the test thread.
class FakeCaptureDevice : public CaptureDevice {
public:
    bool failOnStart = false;

    void start(int sampleRate, int framesPerBuffer, SampleCallback callback) override {
        if (failOnStart) throw MicrophoneError("device busy", "close the other recorder");
        sampleRate_ = sampleRate;
        framesPerBuffer_ = framesPerBuffer;
        std::lock_guard<std::mutex> lock(mutex_);
        callback_ = std::move(callback);
        started_ = true;
    }

    void stop() override {
        std::lock_guard<std::mutex> lock(mutex_);
        callback_ = nullptr;
        ++stopCalls_;
    }

    void emit(const std::vector<int16_t>& samples, bool overflowed = false) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (callback_) callback_(samples.data(), samples.size(), overflowed);
    }

    // Constant-amplitude audio in callback-sized pieces
    void emitTone(int16_t amplitude, double seconds, int sampleRate = 16000) {
        const std::size_t total = (std::size_t)(seconds * sampleRate + 0.5);
        const std::size_t chunk = 512;
        for (std::size_t done = 0; done < total; done += chunk) {
            emit(std::vector<int16_t>(std::min(chunk, total - done), amplitude));
        }
    }

    bool started() const { return started_; }
    int stopCalls() const { return stopCalls_; }
    int sampleRate() const { return sampleRate_; }
    int framesPerBuffer() const { return framesPerBuffer_; }

private:
    std::mutex mutex_;
    SampleCallback callback_;
    bool started_ = false;
    int stopCalls_ = 0;
    int sampleRate_ = 0;
    int framesPerBuffer_ = 0;
};

// Engine whose behaviour each test supplies.
class FunctionEngine : public InferenceEngine {
public:
    using Fn = std::function<std::string(const std::vector<int16_t>&, const std::atomic<bool>*)>;

    explicit FunctionEngine(Fn fn) : fn_(std::move(fn)) {}

    std::string transcribe(const std::vector<int16_t>& pcm, int /*sampleRate*/,
                           const std::atomic<bool>* cancel) override {
        ++calls;
        return fn_(pcm, cancel);
    }

    std::atomic<int> calls{0};

private:
    Fn fn_;
};

// Records everything typed; can be told to fail.
class RecordingSink : public KeystrokeSink {
public:
    int failAfter = -1;     // throw on this keystroke (0-based), -1 = never

    void typeCharacter(char32_t codePoint) override {
        std::lock_guard<std::mutex> lock(mutex_);
        check();
        typed_.push_back(codePoint);
    }

    void pressKey(NamedKey key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        check();
        keys_.push_back(key);
    }

    std::u32string typed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return typed_;
    }

    std::vector<NamedKey> keys() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return keys_;
    }

private:
    void check() {
        if (failAfter >= 0 && strokes_++ == failAfter) throw InjectionError("no focused window");
    }

    mutable std::mutex mutex_;
    std::u32string typed_;
    std::vector<NamedKey> keys_;
    int strokes_ = 0;
};

inline PcmFrame makeFrame(int16_t amplitude, double seconds, uint64_t index = 0,
                          int sampleRate = 16000) {
    PcmFrame f;
    f.samples.assign((std::size_t)(seconds * sampleRate + 0.5), amplitude);
    f.frameIndex = index;
    f.capturedAt = Clock::time_point(std::chrono::milliseconds(100 * (int64_t)index));
    return f;
}

inline SpeechSegment makeSegment(uint64_t index, int16_t tag, std::size_t samples = 1600) {
    SpeechSegment s;
    s.segmentIndex = index;
    s.samples.assign(samples, tag);
    return s;
}

#endif
