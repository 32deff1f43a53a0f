#include "session/session_orchestrator.hpp"
#include "test_fakes.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace std::chrono_literals;

constexpr int16_t kHello = 3000;
constexpr int16_t kWorld = 4000;

DictationConfig testConfig() {
    DictationConfig c;
    c.frameDurationMs = 100;
    c.silenceDuration = 0.3;
    c.minChunkDuration = 0.2;
    c.inferenceWorkers = 2;
    c.gracePeriod = 5.0;
    c.spokenPunctuation = false;
    return c;
}

std::string wordFor(const std::vector<int16_t>& pcm) {
    if (pcm.empty()) return {};
    if (pcm[0] == kHello) return "hello";
    if (pcm[0] == kWorld) return "world";
    return "?";
}

class SessionOrchestratorTest : public ::testing::Test {
protected:
    void build(FunctionEngine::Fn fn, DictationConfig config = testConfig()) {
        engine_ = std::make_unique<FunctionEngine>(std::move(fn));
        TextInjector::Config ic;
        ic.format.spokenPunctuation = false;
        injector_ = std::make_unique<TextInjector>(sink_, ic);

        PipelineHooks hooks;
        hooks.onSegment = [this](const SpeechSegment& s) {
            std::lock_guard<std::mutex> lock(mutex_);
            segments_.push_back(s.segmentIndex);
        };
        hooks.onResult = [this](const TranscriptionResult& r) {
            std::lock_guard<std::mutex> lock(mutex_);
            results_.push_back(r);
        };

        orchestrator_ = std::make_unique<SessionOrchestrator>(
            config,
            [this]() -> std::unique_ptr<CaptureDevice> {
                ++devicesCreated_;
                auto device = std::make_unique<FakeCaptureDevice>();
                device->failOnStart = failDevices_;
                device_ = device.get();
                return device;
            },
            *engine_, *injector_, hooks);
    }

    void speak(int16_t word, double seconds = 0.5) {
        device_->emitTone(word, seconds);
        device_->emitTone(0, 0.4);
    }

    std::vector<TranscriptionResult> results() {
        std::lock_guard<std::mutex> lock(mutex_);
        return results_;
    }

    RecordingSink sink_;
    std::unique_ptr<FunctionEngine> engine_;
    std::unique_ptr<TextInjector> injector_;
    std::unique_ptr<SessionOrchestrator> orchestrator_;
    FakeCaptureDevice* device_ = nullptr;
    int devicesCreated_ = 0;
    bool failDevices_ = false;

    std::mutex mutex_;
    std::vector<uint64_t> segments_;
    std::vector<TranscriptionResult> results_;
};

TEST_F(SessionOrchestratorTest, StartsIdle) {
    build([](const std::vector<int16_t>& pcm, const std::atomic<bool>*) { return wordFor(pcm); });
    EXPECT_FALSE(orchestrator_->isRecording());
    EXPECT_EQ(orchestrator_->session().state, SessionState::Idle);
}

TEST_F(SessionOrchestratorTest, DictatesSegmentsInOrder) {
    build([](const std::vector<int16_t>& pcm, const std::atomic<bool>*) { return wordFor(pcm); });

    orchestrator_->onToggle(ActivationToggle::Start);
    ASSERT_TRUE(orchestrator_->isRecording());
    EXPECT_EQ(orchestrator_->session().state, SessionState::Recording);

    speak(kHello);
    speak(kWorld);
    orchestrator_->onToggle(ActivationToggle::Stop);

    EXPECT_FALSE(orchestrator_->isRecording());
    EXPECT_EQ(sink_.typed(), U"hello world ");
    EXPECT_EQ(orchestrator_->lastSessionStats().segments, 2u);
    EXPECT_EQ(orchestrator_->lastSessionStats().delivered, 2u);
}

TEST_F(SessionOrchestratorTest, SlowFirstSegmentStillTypedFirst) {
    build([](const std::vector<int16_t>& pcm, const std::atomic<bool>*) {
        if (pcm[0] == kHello) std::this_thread::sleep_for(200ms);
        return wordFor(pcm);
    });

    orchestrator_->startSession();
    speak(kHello);
    speak(kWorld);
    orchestrator_->stopSession();

    EXPECT_EQ(sink_.typed(), U"hello world ");
}

TEST_F(SessionOrchestratorTest, FailedSegmentContributesNothing) {
    build([](const std::vector<int16_t>& pcm, const std::atomic<bool>*) -> std::string {
        if (pcm[0] == kHello) throw InferenceError("model crashed");
        return wordFor(pcm);
    });

    orchestrator_->startSession();
    speak(kHello);
    speak(kWorld);
    speak(kWorld);
    orchestrator_->stopSession();

    EXPECT_EQ(sink_.typed(), U"world world ");
    const auto r = results();
    ASSERT_EQ(r.size(), 3u);
    EXPECT_FALSE(r[0].ok());
    EXPECT_TRUE(r[1].ok());
}

TEST_F(SessionOrchestratorTest, StopFlushesSpeechInProgress) {
    build([](const std::vector<int16_t>& pcm, const std::atomic<bool>*) { return wordFor(pcm); });

    orchestrator_->startSession();
    device_->emitTone(kWorld, 0.6);
    orchestrator_->stopSession();

    EXPECT_EQ(sink_.typed(), U"world ");
}

TEST_F(SessionOrchestratorTest, ShortBlipAtStopIsDiscarded) {
    build([](const std::vector<int16_t>& pcm, const std::atomic<bool>*) { return wordFor(pcm); });

    orchestrator_->startSession();
    device_->emitTone(kWorld, 0.1);
    orchestrator_->stopSession();

    EXPECT_TRUE(sink_.typed().empty());
    EXPECT_EQ(engine_->calls.load(), 0);
    EXPECT_EQ(orchestrator_->lastSessionStats().discarded, 1u);
}

TEST_F(SessionOrchestratorTest, OutOfStateTogglesAreIgnored) {
    build([](const std::vector<int16_t>& pcm, const std::atomic<bool>*) { return wordFor(pcm); });

    orchestrator_->onToggle(ActivationToggle::Stop);
    EXPECT_FALSE(orchestrator_->isRecording());
    EXPECT_EQ(devicesCreated_, 0);

    orchestrator_->onToggle(ActivationToggle::Start);
    FakeCaptureDevice* first = device_;
    orchestrator_->onToggle(ActivationToggle::Start);
    EXPECT_TRUE(orchestrator_->isRecording());
    EXPECT_EQ(devicesCreated_, 1);
    EXPECT_EQ(device_, first);

    EXPECT_TRUE(orchestrator_->stopSession());
    EXPECT_FALSE(orchestrator_->stopSession());
    EXPECT_FALSE(orchestrator_->isRecording());
}

TEST_F(SessionOrchestratorTest, EachSessionStartsFresh) {
    build([](const std::vector<int16_t>& pcm, const std::atomic<bool>*) { return wordFor(pcm); });

    orchestrator_->startSession();
    speak(kHello);
    orchestrator_->stopSession();

    orchestrator_->startSession();
    speak(kWorld);
    orchestrator_->stopSession();

    EXPECT_EQ(sink_.typed(), U"hello world ");
    EXPECT_EQ(devicesCreated_, 2);
    std::lock_guard<std::mutex> lock(mutex_);
    EXPECT_EQ(segments_, (std::vector<uint64_t>{0, 0}));
}

TEST_F(SessionOrchestratorTest, MicrophoneFailureKeepsSessionIdle) {
    failDevices_ = true;
    build([](const std::vector<int16_t>& pcm, const std::atomic<bool>*) { return wordFor(pcm); });

    EXPECT_FALSE(orchestrator_->startSession());
    EXPECT_FALSE(orchestrator_->isRecording());
    EXPECT_EQ(orchestrator_->session().state, SessionState::Idle);

    failDevices_ = false;
    EXPECT_TRUE(orchestrator_->startSession());
    EXPECT_TRUE(orchestrator_->stopSession());
}

TEST_F(SessionOrchestratorTest, AutoSubmitPressesEnterPerSegment) {
    build([](const std::vector<int16_t>& pcm, const std::atomic<bool>*) { return wordFor(pcm); });
    TextInjector::Config ic;
    ic.autoSubmit = true;
    injector_ = std::make_unique<TextInjector>(sink_, ic);
    orchestrator_ = std::make_unique<SessionOrchestrator>(
        testConfig(),
        [this]() -> std::unique_ptr<CaptureDevice> {
            auto device = std::make_unique<FakeCaptureDevice>();
            device_ = device.get();
            return device;
        },
        *engine_, *injector_);

    orchestrator_->startSession();
    speak(kHello);
    speak(kWorld);
    orchestrator_->stopSession();

    EXPECT_EQ(sink_.typed(), U"hello world ");
    EXPECT_EQ(sink_.keys().size(), 2u);
}

} // namespace
