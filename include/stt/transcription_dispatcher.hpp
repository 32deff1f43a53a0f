#ifndef TRANSCRIPTION_DISPATCHER_HPP
#define TRANSCRIPTION_DISPATCHER_HPP

#include "core/bounded_queue.hpp"
#include "core/types.hpp"
#include "stt/inference_engine.hpp"
#include "stt/reorder_buffer.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

// Runs inference for one session's segments on a worker pool and hands the
// results to a single delivery thread in submission order. Every submitted
// segment yields exactly one result (Ok or Failed) unless the session is
// abandoned at the end of the grace period.
class TranscriptionDispatcher {
public:
    using ResultCallback = std::function<void(const TranscriptionResult&)>;

    struct Config {
        int workers = 2;
        int queueCapacity = 16;
    };

    TranscriptionDispatcher(InferenceEngine& engine, Config config, ResultCallback onResult);
    ~TranscriptionDispatcher();

    TranscriptionDispatcher(const TranscriptionDispatcher&) = delete;
    TranscriptionDispatcher& operator=(const TranscriptionDispatcher&) = delete;

    void start();

    // Queues a segment, blocking while the intake queue is full.
    // Returns false once finish() has been called.
    bool submit(SpeechSegment segment);

    // Closes intake and waits up to `grace` for every submitted segment to be
    // delivered. On timeout the remaining work is abandoned: queued segments
    // are skipped, running inference is asked to cancel and late results are
    // dropped. Returns true if nothing was abandoned.
    bool finish(std::chrono::milliseconds grace);

    uint64_t submittedCount() const;
    uint64_t deliveredCount() const;
    uint64_t droppedCount() const;

private:
    struct Job {
        uint64_t sequence = 0;
        SpeechSegment segment;
    };

    void workerLoop();
    void deliveryLoop();
    void complete(uint64_t sequence, TranscriptionResult result);

    InferenceEngine& engine_;
    Config config_;
    ResultCallback onResult_;

    BoundedQueue<Job> jobs_;
    std::vector<std::thread> workers_;
    std::thread delivery_;

    mutable std::mutex mutex_;
    std::condition_variable deliverableCv_;
    std::condition_variable doneCv_;
    ReorderBuffer reorder_;
    std::deque<TranscriptionResult> deliverable_;
    uint64_t submitted_ = 0;
    uint64_t delivered_ = 0;
    uint64_t dropped_ = 0;
    bool deliveryClosed_ = false;

    std::atomic<bool> started_{false};
    std::atomic<bool> finished_{false};
    std::atomic<bool> abandoned_{false};
    std::atomic<bool> cancel_{false};
};

#endif
