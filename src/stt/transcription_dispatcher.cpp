#include "stt/transcription_dispatcher.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <utility>

// Constructor
TranscriptionDispatcher::TranscriptionDispatcher(InferenceEngine& engine, Config config, ResultCallback onResult)
    : engine_(engine),
      config_(config),
      onResult_(std::move(onResult)),
      jobs_((std::size_t)std::max(1, config.queueCapacity)) {
    if (config_.workers < 1) config_.workers = 1;
}

// Destructor
TranscriptionDispatcher::~TranscriptionDispatcher() {
    if (started_.load() && !finished_.load()) finish(std::chrono::milliseconds(0));
}

void TranscriptionDispatcher::start() {
    if (started_.exchange(true)) return;

    delivery_ = std::thread(&TranscriptionDispatcher::deliveryLoop, this);
    for (int i = 0; i < config_.workers; ++i) {
        workers_.emplace_back(&TranscriptionDispatcher::workerLoop, this);
    }
}

bool TranscriptionDispatcher::submit(SpeechSegment segment) {
    if (finished_.load()) return false;

    Job job;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        job.sequence = submitted_++;
    }
    job.segment = std::move(segment);

    if (!jobs_.push(std::move(job))) {
        std::lock_guard<std::mutex> lock(mutex_);
        --submitted_;
        return false;
    }
    return true;
}

bool TranscriptionDispatcher::finish(std::chrono::milliseconds grace) {
    if (finished_.exchange(true)) return !abandoned_.load();
    jobs_.close();

    if (!started_.load()) return true;

    bool complete = false;
    uint64_t outstanding = 0;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        complete = doneCv_.wait_for(lock, grace, [this] { return delivered_ + dropped_ >= submitted_; });
        if (!complete) {
            outstanding = submitted_ - delivered_;
            abandoned_ = true;
            dropped_ += deliverable_.size() + reorder_.clear();
            deliverable_.clear();
        }
    }

    if (!complete) {
        cancel_ = true;
        const std::size_t skipped = jobs_.clear();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            dropped_ += skipped;
        }
        std::cerr << "[Dispatcher] [WARN] Grace period of " << grace.count()
                  << " ms expired, abandoning " << outstanding << " segment(s)" << std::endl;
    }

    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
    workers_.clear();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        deliveryClosed_ = true;
    }
    deliverableCv_.notify_all();
    if (delivery_.joinable()) delivery_.join();

    return complete;
}

void TranscriptionDispatcher::workerLoop() {
    Job job;
    while (jobs_.pop(job)) {
        if (abandoned_.load()) {
            std::lock_guard<std::mutex> lock(mutex_);
            ++dropped_;
            continue;
        }

        TranscriptionResult result;
        try {
            std::string text = engine_.transcribe(job.segment.samples, job.segment.sampleRate, &cancel_);
            result = TranscriptionResult::success(job.segment.segmentIndex, std::move(text));
        } catch (const std::exception& e) {
            std::cerr << "[Dispatcher] [WARN] Inference failed for segment "
                      << job.segment.segmentIndex << ": " << e.what() << std::endl;
            result = TranscriptionResult::failure(job.segment.segmentIndex, e.what());
        }
        complete(job.sequence, std::move(result));
    }
}

// Released results are queued under the same lock that orders them
void TranscriptionDispatcher::complete(uint64_t sequence, TranscriptionResult result) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (abandoned_.load()) {
            ++dropped_;
            return;
        }
        for (auto& r : reorder_.insert(sequence, std::move(result))) {
            deliverable_.push_back(std::move(r));
        }
    }
    deliverableCv_.notify_one();
}

void TranscriptionDispatcher::deliveryLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        deliverableCv_.wait(lock, [this] { return deliveryClosed_ || !deliverable_.empty(); });
        if (deliverable_.empty()) break;

        TranscriptionResult result = std::move(deliverable_.front());
        deliverable_.pop_front();
        lock.unlock();

        try {
            if (onResult_) onResult_(result);
        } catch (const std::exception& e) {
            std::cerr << "[Dispatcher] [ERROR] Result callback threw for segment "
                      << result.segmentIndex << ": " << e.what() << std::endl;
        }

        lock.lock();
        ++delivered_;
        doneCv_.notify_all();
    }
}

uint64_t TranscriptionDispatcher::submittedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return submitted_;
}

uint64_t TranscriptionDispatcher::deliveredCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return delivered_;
}

uint64_t TranscriptionDispatcher::droppedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}
