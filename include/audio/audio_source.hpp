#ifndef AUDIO_SOURCE_HPP
#define AUDIO_SOURCE_HPP

#include "audio/capture_device.hpp"
#include "core/bounded_queue.hpp"
#include "core/types.hpp"

#include <atomic>
#include <cstdint>
#include <vector>

// Turns the device's sample callbacks into a stream of fixed-size PcmFrames
// for one session. Frames that do not fit in the queue are counted, and the
// next queued frame reports them through droppedBefore.
class AudioSource {
public:
    struct Config {
        int sampleRate = 16000;
        int frameSamples = 1024;
        int queueCapacity = 256;
    };

    AudioSource(CaptureDevice& device, Config config);
    ~AudioSource();

    AudioSource(const AudioSource&) = delete;
    AudioSource& operator=(const AudioSource&) = delete;

    void start();

    // Stops the device, queues any partial frame, then signals end-of-stream.
    void stop();

    // Blocks for the next frame. Returns false once stopped and drained.
    bool next(PcmFrame& out);

    // Device thread entry point.
    void pushSamples(const int16_t* samples, std::size_t count, bool overflowed = false);

    uint64_t overrunFrames() const { return overrunFrames_.load(); }
    bool isRunning() const { return running_.load(); }
    int sampleRate() const { return config_.sampleRate; }

private:
    void emitFrame(std::vector<int16_t> samples, Clock::time_point capturedAt);

    CaptureDevice& device_;
    Config config_;
    BoundedQueue<PcmFrame> queue_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> overrunFrames_{0};

    // device thread only
    std::vector<int16_t> pending_;
    uint64_t nextFrameIndex_ = 0;
    uint64_t droppedSinceLast_ = 0;
};

#endif
