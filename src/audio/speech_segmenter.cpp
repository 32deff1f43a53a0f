#include "audio/speech_segmenter.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

// Constructor
SpeechSegmenter::SpeechSegmenter(Config config) : config_(config) {
    silenceSamplesNeeded_ = (std::size_t)std::max<long long>(1, std::llround(config_.silenceDuration * config_.sampleRate));
    minChunkSamples_ = (std::size_t)std::max<long long>(0, std::llround(config_.minChunkDuration * config_.sampleRate));
}

// Resets segmentation state; emitted indices keep counting
void SpeechSegmenter::reset() {
    state_ = State::Silent;
    buffer_.clear();
    silenceRunSamples_ = 0;
    speechEnd_ = 0;
    ready_.clear();
}

float SpeechSegmenter::rms(const int16_t* samples, std::size_t n) {
    if (!samples || n == 0) return 0.0f;
    double acc = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const double s = (double)samples[i] / 32768.0;
        acc += s * s;
    }
    return (float)std::sqrt(acc / (double)n);
}

void SpeechSegmenter::beginSegment(const PcmFrame& frame) {
    state_ = State::Accumulating;
    buffer_.assign(frame.samples.begin(), frame.samples.end());
    speechEnd_ = buffer_.size();
    silenceRunSamples_ = 0;
    startedAt_ = frame.capturedAt;
    lastFrameAt_ = frame.capturedAt;
    lastSpeechAt_ = frame.capturedAt;
}

void SpeechSegmenter::dropBuffer() {
    ++discarded_;
    state_ = State::Silent;
    buffer_.clear();
    silenceRunSamples_ = 0;
    speechEnd_ = 0;
}

// Emits the buffer, or drops it when shorter than the minimum chunk.
// Under Keep the tail after the last speech frame is capped at silenceDuration.
void SpeechSegmenter::closeSegment() {
    const bool trim = config_.trailingSilence == TrailingSilence::Trim;
    const std::size_t keep = trim ? speechEnd_
                                  : std::min(buffer_.size(), speechEnd_ + silenceSamplesNeeded_);

    if (keep == 0 || keep < minChunkSamples_) {
        dropBuffer();
        return;
    }

    SpeechSegment segment;
    buffer_.resize(keep);
    segment.samples = std::move(buffer_);
    segment.segmentIndex = nextSegmentIndex_++;
    segment.startedAt = startedAt_;
    segment.endedAt = trim ? lastSpeechAt_ : lastFrameAt_;
    segment.sampleRate = config_.sampleRate;
    ready_.push_back(std::move(segment));

    state_ = State::Silent;
    buffer_.clear();
    silenceRunSamples_ = 0;
    speechEnd_ = 0;
}

bool SpeechSegmenter::feed(const PcmFrame& frame) {
    if (frame.samples.empty()) return hasSegment();

    if (frame.droppedBefore > 0 && state_ == State::Accumulating) {
        std::cerr << "[Segmenter] [WARN] " << frame.droppedBefore
                  << " frame(s) lost before frame " << frame.frameIndex
                  << ", dropping the segment in progress" << std::endl;
        dropBuffer();
    }

    const bool speech = rms(frame.samples.data(), frame.samples.size()) >= config_.silenceThreshold;

    if (state_ == State::Silent) {
        if (speech) beginSegment(frame);
        return hasSegment();
    }

    buffer_.insert(buffer_.end(), frame.samples.begin(), frame.samples.end());
    lastFrameAt_ = frame.capturedAt;

    if (speech) {
        silenceRunSamples_ = 0;
        speechEnd_ = buffer_.size();
        lastSpeechAt_ = frame.capturedAt;
        return hasSegment();
    }

    silenceRunSamples_ += frame.samples.size();
    if (silenceRunSamples_ >= silenceSamplesNeeded_) {
        closeSegment();
    }
    return hasSegment();
}

bool SpeechSegmenter::flush() {
    if (state_ == State::Accumulating) {
        closeSegment();
    }
    return hasSegment();
}

SpeechSegment SpeechSegmenter::takeSegment() {
    if (ready_.empty()) return SpeechSegment{};
    SpeechSegment segment = std::move(ready_.front());
    ready_.pop_front();
    return segment;
}
