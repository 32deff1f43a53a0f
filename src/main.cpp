#include "audio/portaudio_capture.hpp"
#include "config/dictation_config.hpp"
#include "core/errors.hpp"
#include "input/activation_detector.hpp"
#include "input/evdev_key_source.hpp"
#include "input/key_codes.hpp"
#include "output/text_injector.hpp"
#include "output/xtest_keystroke_sink.hpp"
#include "session/session_orchestrator.hpp"
#include "stt/whisper_stt.hpp"

#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <mutex>
#include <pthread.h>
#include <stdexcept>
#include <string>

static void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [--config PATH] [--debug] [--list-devices] [-h]\n"
              << "\n"
              << "Double-tap the activation key (default: shift) to start dictating,\n"
              << "double-tap it again to stop. Text is typed into the focused window.\n"
              << "\n"
              << "  --config PATH    config file (default: " << defaultConfigPath() << ")\n"
              << "  --debug          print segments and transcriptions as they happen\n"
              << "  --list-devices   list audio input devices and exit\n"
              << "  -h, --help       show this help\n";
}

static int fatal(const PermissionError& e) {
    std::cerr << "[Main] [ERROR] " << e.what() << "\n  hint: " << e.hint() << std::endl;
    return 1;
}

int main(int argc, char** argv) {
    // SIGINT/SIGTERM are taken by sigwait below; threads started later inherit the mask
    sigset_t quitSignals;
    sigemptyset(&quitSignals);
    sigaddset(&quitSignals, SIGINT);
    sigaddset(&quitSignals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &quitSignals, nullptr);

    std::string configPath = defaultConfigPath();
    bool debug = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--debug") {
            debug = true;
        } else if (arg == "--list-devices") {
            for (const auto& d : PortAudioCapture::listInputDevices()) std::cout << d << "\n";
            return 0;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "[Main] [ERROR] Unknown argument: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    DictationConfig config;
    try {
        config = DictationConfig::loadFromFile(configPath);
    } catch (const ConfigError& e) {
        std::cerr << "[Main] [ERROR] " << e.what() << std::endl;
        return 1;
    }

    // Startup checks, in order; any failure ends the process before recording is possible
    try {
        std::cout << "[Main] [INFO] Microphone: " << PortAudioCapture::probe(config.inputDevice) << std::endl;
    } catch (const MicrophoneError& e) {
        return fatal(e);
    }

    std::unique_ptr<WhisperSTT> stt;
    const std::string modelPath = resolveModelPath(config.model);
    try {
        WhisperSTT::Options options;
        options.language = config.language;
        options.initialPrompt = config.whisperPrompt;
        options.threads = config.inferenceThreads;
        stt = std::make_unique<WhisperSTT>(modelPath, options);
    } catch (const InferenceError& e) {
        std::cerr << "[Main] [ERROR] " << e.what()
                  << "\n  hint: download ggml-" << config.model << ".bin into one of:";
        for (const auto& dir : modelSearchDirs()) std::cerr << "\n    " << dir;
        std::cerr << std::endl;
        return 1;
    }

    std::unique_ptr<XTestKeystrokeSink> sink;
    try {
        sink = std::make_unique<XTestKeystrokeSink>();
    } catch (const InjectionError& e) {
        std::cerr << "[Main] [ERROR] " << e.what()
                  << "\n  hint: run inside an X11 session (or XWayland) with DISPLAY set" << std::endl;
        return 1;
    }

    TextInjector::Config injectorCfg;
    injectorCfg.autoSubmit = config.autoSubmit;
    injectorCfg.format.wordOverrides = config.wordOverrides;
    injectorCfg.format.spokenPunctuation = config.spokenPunctuation;
    TextInjector injector(*sink, injectorCfg);

    PipelineHooks hooks;
    if (debug) {
        hooks.onSegment = [](const SpeechSegment& s) {
            std::cout << "[Debug] segment " << s.segmentIndex << ": " << s.durationSeconds() << " s" << std::endl;
        };
        hooks.onResult = [](const TranscriptionResult& r) {
            if (r.ok()) std::cout << "[Debug] result " << r.segmentIndex << ": \"" << r.text << "\"" << std::endl;
            else std::cout << "[Debug] result " << r.segmentIndex << " failed: " << r.reason << std::endl;
        };
    }

    const int inputDevice = config.inputDevice;
    SessionOrchestrator orchestrator(
        config,
        [inputDevice]() -> std::unique_ptr<CaptureDevice> {
            return std::make_unique<PortAudioCapture>(inputDevice);
        },
        *stt, injector, hooks);

    ActivationDetector::Config detectorCfg;
    detectorCfg.monitoredKeys = modifierKeyCodes(config.activationKey);
    detectorCfg.modifierKeys = allModifierKeyCodes();
    detectorCfg.window = config.doubleTapWindow;
    ActivationDetector detector(detectorCfg, [&orchestrator] { return orchestrator.isRecording(); });

    // Toggles run on the key listener thread; stop blocks it for at most the grace period
    std::mutex detectorMutex;
    EvdevKeySource keys;
    try {
        keys.start([&](const KeyEvent& evt) {
            std::lock_guard<std::mutex> lock(detectorMutex);
            if (auto toggle = detector.onKeyEvent(evt)) orchestrator.onToggle(*toggle);
        });
    } catch (const KeySourcePermissionError& e) {
        return fatal(e);
    } catch (const std::runtime_error& e) {
        std::cerr << "[Main] [ERROR] Key source: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "[Main] [INFO] Ready. Double-tap " << config.activationKey
              << " to start or stop dictation. Ctrl+C quits." << std::endl;

    int sig = 0;
    sigwait(&quitSignals, &sig);

    std::cout << "[Main] [INFO] " << strsignal(sig) << ", shutting down" << std::endl;
    keys.stop();
    orchestrator.stopSession();
    return 0;
}
