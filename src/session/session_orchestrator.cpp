#include "session/session_orchestrator.hpp"
#include "core/errors.hpp"

#include <chrono>
#include <cmath>
#include <exception>
#include <iostream>
#include <utility>

// Constructor
SessionOrchestrator::SessionOrchestrator(DictationConfig config, DeviceFactory deviceFactory,
                                         InferenceEngine& engine, TextInjector& injector,
                                         PipelineHooks hooks)
    : config_(std::move(config)),
      deviceFactory_(std::move(deviceFactory)),
      engine_(engine),
      injector_(injector),
      hooks_(std::move(hooks)) {}

// Destructor
SessionOrchestrator::~SessionOrchestrator() { stopSession(); }

void SessionOrchestrator::onToggle(ActivationToggle toggle) {
    if (toggle == ActivationToggle::Start) {
        startSession();
    } else {
        stopSession();
    }
}

bool SessionOrchestrator::startSession() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (session_.state == SessionState::Recording) {
        std::cout << "[Session] [INFO] Start ignored, already recording" << std::endl;
        return false;
    }

    auto active = std::make_unique<ActiveSession>();
    try {
        active->device = deviceFactory_();
        if (!active->device) throw MicrophoneError("no capture device", "Check the input_device setting.");

        AudioSource::Config sourceCfg;
        sourceCfg.sampleRate = config_.sampleRate;
        sourceCfg.frameSamples = config_.frameSamples();
        sourceCfg.queueCapacity = config_.frameQueueCapacity;
        active->source = std::make_unique<AudioSource>(*active->device, sourceCfg);

        SpeechSegmenter::Config segCfg;
        segCfg.sampleRate = config_.sampleRate;
        segCfg.silenceThreshold = config_.silenceThreshold;
        segCfg.silenceDuration = config_.silenceDuration;
        segCfg.minChunkDuration = config_.minChunkDuration;
        segCfg.trailingSilence = config_.trailingSilence;
        active->segmenter = std::make_unique<SpeechSegmenter>(segCfg);

        TranscriptionDispatcher::Config dispCfg;
        dispCfg.workers = config_.inferenceWorkers;
        dispCfg.queueCapacity = config_.segmentQueueCapacity;
        active->dispatcher = std::make_unique<TranscriptionDispatcher>(
            engine_, dispCfg, [this](const TranscriptionResult& r) { deliver(r); });

        active->dispatcher->start();
        active->source->start();
    } catch (const MicrophoneError& e) {
        std::cerr << "[Session] [ERROR] Could not start recording: " << e.what() << "\n  hint: " << e.hint() << std::endl;
        if (active->dispatcher) active->dispatcher->finish(std::chrono::milliseconds(0));
        return false;
    } catch (const std::exception& e) {
        std::cerr << "[Session] [ERROR] Could not start recording: " << e.what() << std::endl;
        if (active->dispatcher) active->dispatcher->finish(std::chrono::milliseconds(0));
        return false;
    }

    ActiveSession& ref = *active;
    active->pipeline = std::thread([this, &ref] { runPipeline(ref); });

    active_ = std::move(active);
    session_.state = SessionState::Recording;
    session_.startedAt = Clock::now();
    recording_ = true;

    std::cout << "[Session] [INFO] Recording" << std::endl;
    return true;
}

bool SessionOrchestrator::stopSession() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (session_.state == SessionState::Idle || !active_) {
        return false;
    }

    // end of capture: the pipeline thread flushes the segmenter and exits
    active_->source->stop();
    if (active_->pipeline.joinable()) active_->pipeline.join();

    const auto grace = std::chrono::milliseconds((long long)std::llround(config_.gracePeriod * 1000.0));
    const bool complete = active_->dispatcher->finish(grace);

    SessionStats stats;
    stats.segments = active_->segmenter->emittedCount();
    stats.discarded = active_->segmenter->discardedCount();
    stats.delivered = active_->dispatcher->deliveredCount();
    stats.abandoned = active_->dispatcher->droppedCount();
    stats.overrunFrames = active_->source->overrunFrames();
    lastStats_ = stats;

    const double seconds = std::chrono::duration<double>(Clock::now() - session_.startedAt).count();
    active_.reset();
    session_.state = SessionState::Idle;
    recording_ = false;

    std::cout << "[Session] [INFO] Stopped after " << seconds << " s: "
              << stats.segments << " segment(s), " << stats.delivered << " delivered";
    if (!complete) std::cout << ", " << stats.abandoned << " abandoned";
    std::cout << std::endl;
    return true;
}

DictationSession SessionOrchestrator::session() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_;
}

SessionStats SessionOrchestrator::lastSessionStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastStats_;
}

void SessionOrchestrator::runPipeline(ActiveSession& active) {
    try {
        PcmFrame frame;
        while (active.source->next(frame)) {
            if (active.segmenter->feed(frame)) submitReady(active);
        }
        if (active.segmenter->flush()) submitReady(active);
    } catch (const std::exception& e) {
        std::cerr << "[Session] [ERROR] Pipeline stopped: " << e.what() << std::endl;
    }
}

void SessionOrchestrator::submitReady(ActiveSession& active) {
    while (active.segmenter->hasSegment()) {
        SpeechSegment segment = active.segmenter->takeSegment();
        if (hooks_.onSegment) hooks_.onSegment(segment);

        const uint64_t index = segment.segmentIndex;
        if (!active.dispatcher->submit(std::move(segment))) {
            std::cerr << "[Session] [WARN] Dispatcher closed, segment " << index << " dropped" << std::endl;
        }
    }
}

// Delivery thread: results arrive here already in segment order
void SessionOrchestrator::deliver(const TranscriptionResult& result) {
    if (hooks_.onResult) hooks_.onResult(result);
    if (!result.ok() || result.text.empty()) return;
    injector_.inject(result.text);
}
