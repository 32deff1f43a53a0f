#ifndef SESSION_ORCHESTRATOR_HPP
#define SESSION_ORCHESTRATOR_HPP

#include "audio/audio_source.hpp"
#include "audio/capture_device.hpp"
#include "audio/speech_segmenter.hpp"
#include "config/dictation_config.hpp"
#include "core/types.hpp"
#include "output/text_injector.hpp"
#include "stt/inference_engine.hpp"
#include "stt/transcription_dispatcher.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

// Observers for foreground mode. Both run on pipeline threads.
struct PipelineHooks {
    std::function<void(const SpeechSegment&)> onSegment;
    std::function<void(const TranscriptionResult&)> onResult;
};

// Per-session totals, reported when a session stops.
struct SessionStats {
    uint64_t segments = 0;
    uint64_t discarded = 0;
    uint64_t delivered = 0;
    uint64_t abandoned = 0;
    uint64_t overrunFrames = 0;
};

// Owns the Idle/Recording state machine and, while recording, the
// capture -> segmenter -> dispatcher -> injector pipeline of one session.
class SessionOrchestrator {
public:
    using DeviceFactory = std::function<std::unique_ptr<CaptureDevice>()>;

    SessionOrchestrator(DictationConfig config, DeviceFactory deviceFactory,
                        InferenceEngine& engine, TextInjector& injector,
                        PipelineHooks hooks = {});
    ~SessionOrchestrator();

    SessionOrchestrator(const SessionOrchestrator&) = delete;
    SessionOrchestrator& operator=(const SessionOrchestrator&) = delete;

    // Start while recording and Stop while idle are ignored.
    void onToggle(ActivationToggle toggle);

    // Returns false if the session could not start or one was already active.
    bool startSession();

    // Stops capture, flushes the segmenter, waits out the grace period for
    // in-flight transcriptions and tears the session down.
    // Returns false if no session was active.
    bool stopSession();

    bool isRecording() const { return recording_.load(); }
    DictationSession session() const;
    SessionStats lastSessionStats() const;

private:
    struct ActiveSession {
        std::unique_ptr<CaptureDevice> device;
        std::unique_ptr<AudioSource> source;
        std::unique_ptr<SpeechSegmenter> segmenter;
        std::unique_ptr<TranscriptionDispatcher> dispatcher;
        std::thread pipeline;
    };

    void runPipeline(ActiveSession& active);
    void submitReady(ActiveSession& active);
    void deliver(const TranscriptionResult& result);

    const DictationConfig config_;
    DeviceFactory deviceFactory_;
    InferenceEngine& engine_;
    TextInjector& injector_;
    PipelineHooks hooks_;

    mutable std::mutex mutex_;
    DictationSession session_;
    std::unique_ptr<ActiveSession> active_;
    SessionStats lastStats_;
    std::atomic<bool> recording_{false};
};

#endif
