#include "audio/audio_source.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

// Constructor
AudioSource::AudioSource(CaptureDevice& device, Config config)
    : device_(device), config_(config), queue_((std::size_t)std::max(1, config.queueCapacity)) {
    if (config_.frameSamples <= 0) config_.frameSamples = 1;
    pending_.reserve(config_.frameSamples);
}

// Destructor
AudioSource::~AudioSource() { stop(); }

void AudioSource::start() {
    if (running_.exchange(true)) return;

    try {
        device_.start(config_.sampleRate, config_.frameSamples,
            [this](const int16_t* samples, std::size_t count, bool overflowed) {
                pushSamples(samples, count, overflowed);
            });
    } catch (...) {
        running_ = false;
        queue_.close();
        throw;
    }
}

void AudioSource::stop() {
    if (!running_.exchange(false)) {
        queue_.close();
        return;
    }

    device_.stop();

    if (!pending_.empty()) {
        emitFrame(std::move(pending_), Clock::now());
        pending_.clear();
    }
    queue_.close();

    const uint64_t lost = overrunFrames_.load();
    if (lost > 0) {
        std::cerr << "[Audio Source] [WARN] " << lost << " frame(s) lost to capture overrun this session" << std::endl;
    }
}

bool AudioSource::next(PcmFrame& out) {
    return queue_.pop(out);
}

void AudioSource::pushSamples(const int16_t* samples, std::size_t count, bool overflowed) {
    if (!running_.load()) return;

    if (overflowed) {
        // the driver already lost input before this buffer
        ++droppedSinceLast_;
        ++overrunFrames_;
    }

    const auto now = Clock::now();
    std::size_t offset = 0;
    while (offset < count) {
        const std::size_t want = (std::size_t)config_.frameSamples - pending_.size();
        const std::size_t take = std::min(want, count - offset);
        pending_.insert(pending_.end(), samples + offset, samples + offset + take);
        offset += take;

        if ((int)pending_.size() == config_.frameSamples) {
            std::vector<int16_t> frame;
            frame.reserve(config_.frameSamples);
            frame.swap(pending_);
            emitFrame(std::move(frame), now);
        }
    }
}

void AudioSource::emitFrame(std::vector<int16_t> samples, Clock::time_point capturedAt) {
    PcmFrame frame;
    frame.samples = std::move(samples);
    frame.frameIndex = nextFrameIndex_++;
    frame.capturedAt = capturedAt;
    frame.droppedBefore = droppedSinceLast_;

    if (queue_.tryPush(std::move(frame))) {
        droppedSinceLast_ = 0;
    } else {
        ++droppedSinceLast_;
        ++overrunFrames_;
    }
}
