#ifndef TYPES_HPP
#define TYPES_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

using Clock = std::chrono::steady_clock;

enum class KeyTransition { Down, Up };

struct KeyEvent {
    uint32_t key = 0;                      // evdev key code
    KeyTransition transition = KeyTransition::Down;
    Clock::time_point timestamp{};
};

enum class ActivationToggle { Start, Stop };

// One fixed-size block of mono 16-bit audio.
// droppedBefore > 0 means that many frames were lost to a capture overrun
// immediately before this one.
struct PcmFrame {
    std::vector<int16_t> samples;
    uint64_t frameIndex = 0;
    Clock::time_point capturedAt{};
    uint64_t droppedBefore = 0;
};

struct SpeechSegment {
    std::vector<int16_t> samples;
    uint64_t segmentIndex = 0;
    Clock::time_point startedAt{};
    Clock::time_point endedAt{};
    int sampleRate = 16000;

    double durationSeconds() const {
        return sampleRate > 0 ? (double)samples.size() / sampleRate : 0.0;
    }
};

enum class TranscriptionStatus { Ok, Failed };

struct TranscriptionResult {
    uint64_t segmentIndex = 0;
    std::string text;
    TranscriptionStatus status = TranscriptionStatus::Ok;
    std::string reason;

    bool ok() const { return status == TranscriptionStatus::Ok; }

    static TranscriptionResult success(uint64_t index, std::string text) {
        TranscriptionResult r;
        r.segmentIndex = index;
        r.text = std::move(text);
        return r;
    }

    static TranscriptionResult failure(uint64_t index, std::string reason) {
        TranscriptionResult r;
        r.segmentIndex = index;
        r.status = TranscriptionStatus::Failed;
        r.reason = std::move(reason);
        return r;
    }
};

enum class SessionState { Idle, Recording };

struct DictationSession {
    SessionState state = SessionState::Idle;
    Clock::time_point startedAt{};
};

#endif
