#ifndef PORTAUDIO_CAPTURE_HPP
#define PORTAUDIO_CAPTURE_HPP

#include "audio/capture_device.hpp"

#include <portaudio.h>

#include <string>
#include <vector>

// Mono paInt16 microphone capture in callback mode.
class PortAudioCapture : public CaptureDevice {
public:
    explicit PortAudioCapture(int deviceIndex = -1);
    ~PortAudioCapture() override;

    PortAudioCapture(const PortAudioCapture&) = delete;
    PortAudioCapture& operator=(const PortAudioCapture&) = delete;

    void start(int sampleRate, int framesPerBuffer, SampleCallback callback) override;
    void stop() override;

    // Startup check: throws MicrophoneError when no usable input device exists.
    static std::string probe(int deviceIndex = -1);

    static std::vector<std::string> listInputDevices();

private:
    static int paCallback(const void* input, void* output,
                          unsigned long frameCount,
                          const PaStreamCallbackTimeInfo* timeInfo,
                          PaStreamCallbackFlags statusFlags,
                          void* userData);

    int deviceIndex_;
    PaStream* stream_ = nullptr;
    SampleCallback callback_;
};

#endif
