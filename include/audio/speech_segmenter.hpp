#ifndef SPEECH_SEGMENTER_HPP
#define SPEECH_SEGMENTER_HPP

#include "config/dictation_config.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <vector>

// Energy-threshold VAD that cuts the frame stream into speech segments.
//
// Leading silence is never buffered. Once speech starts every frame is
// kept until a run of silence reaches silenceDuration; the buffer is then
// emitted if it is at least minChunkDuration long and dropped otherwise.
// Durations are counted in samples. Under TrailingSilence::Keep at most
// silenceDuration of trailing silence is kept, even when frame boundaries
// make the closing run slightly longer.
class SpeechSegmenter {
public:
    struct Config {
        int sampleRate = 16000;
        float silenceThreshold = 0.01f;
        double silenceDuration = 0.7;
        double minChunkDuration = 0.3;
        TrailingSilence trailingSilence = TrailingSilence::Keep;
    };

    enum class State { Silent, Accumulating };

    explicit SpeechSegmenter(Config config);

    // Returns true when at least one segment is ready to be taken.
    bool feed(const PcmFrame& frame);

    // End of stream: emits whatever is buffered if it is long enough.
    bool flush();

    bool hasSegment() const { return !ready_.empty(); }

    // Hands the oldest ready segment to the caller.
    SpeechSegment takeSegment();

    State state() const { return state_; }
    uint64_t emittedCount() const { return nextSegmentIndex_; }
    uint64_t discardedCount() const { return discarded_; }

    void reset();

    // RMS of the samples normalised to [0,1].
    static float rms(const int16_t* samples, std::size_t n);

private:
    void beginSegment(const PcmFrame& frame);
    void closeSegment();
    void dropBuffer();

    Config config_;
    std::size_t silenceSamplesNeeded_ = 0;
    std::size_t minChunkSamples_ = 0;

    State state_ = State::Silent;
    std::vector<int16_t> buffer_;
    std::size_t silenceRunSamples_ = 0;
    std::size_t speechEnd_ = 0;           // buffer offset just past the last speech frame
    Clock::time_point startedAt_{};
    Clock::time_point lastFrameAt_{};
    Clock::time_point lastSpeechAt_{};

    std::deque<SpeechSegment> ready_;
    uint64_t nextSegmentIndex_ = 0;
    uint64_t discarded_ = 0;
};

#endif
