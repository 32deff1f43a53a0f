#include "audio/portaudio_capture.hpp"
#include "core/errors.hpp"

#include <iostream>
#include <sstream>
#include <utility>

static const char* kMicHint =
    "Check that a microphone is connected and that this user may open it "
    "(PulseAudio/PipeWire running, user in the 'audio' group).";

static void pa_check(PaError e, const char* msg) {
    if (e != paNoError) {
        throw MicrophoneError(std::string(msg) + " (" + std::to_string((int)e) + "): " + Pa_GetErrorText(e),
                              kMicHint);
    }
}

static PaDeviceIndex resolve_device(int deviceIndex) {
    if (deviceIndex >= 0 && deviceIndex < Pa_GetDeviceCount()) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(deviceIndex);
        if (info && info->maxInputChannels > 0) return deviceIndex;
        std::cerr << "[Audio] [WARN] Device " << deviceIndex
                  << " has no input channels, falling back to default input device" << std::endl;
    } else if (deviceIndex >= 0) {
        std::cerr << "[Audio] [WARN] Invalid device ID " << deviceIndex
                  << ", falling back to default input device" << std::endl;
    }
    return Pa_GetDefaultInputDevice();
}

// Constructor
PortAudioCapture::PortAudioCapture(int deviceIndex) : deviceIndex_(deviceIndex) {
    pa_check(Pa_Initialize(), "Pa_Initialize");
}

// Destructor
PortAudioCapture::~PortAudioCapture() {
    stop();
    Pa_Terminate();
}

std::string PortAudioCapture::probe(int deviceIndex) {
    pa_check(Pa_Initialize(), "Pa_Initialize");

    const PaDeviceIndex device = resolve_device(deviceIndex);
    if (device == paNoDevice) {
        Pa_Terminate();
        throw MicrophoneError("No default input device", kMicHint);
    }
    const PaDeviceInfo* info = Pa_GetDeviceInfo(device);
    std::string name = info ? info->name : "(unknown)";
    Pa_Terminate();
    return name;
}

std::vector<std::string> PortAudioCapture::listInputDevices() {
    std::vector<std::string> out;
    if (Pa_Initialize() != paNoError) return out;

    const int num = Pa_GetDeviceCount();
    for (int i = 0; i < num; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info || info->maxInputChannels <= 0) continue;
        const PaHostApiInfo* api = Pa_GetHostApiInfo(info->hostApi);
        std::ostringstream oss;
        oss << "[" << i << "] " << info->name
            << " (API: " << (api ? api->name : "?")
            << ", inCh: " << info->maxInputChannels
            << ", defaultSR: " << info->defaultSampleRate << ")";
        out.push_back(oss.str());
    }
    Pa_Terminate();
    return out;
}

void PortAudioCapture::start(int sampleRate, int framesPerBuffer, SampleCallback callback) {
    if (stream_) throw MicrophoneError("Stream already open", kMicHint);
    callback_ = std::move(callback);

    PaStreamParameters inParams{};
    inParams.device = resolve_device(deviceIndex_);
    if (inParams.device == paNoDevice) {
        throw MicrophoneError("No default input device", kMicHint);
    }

    const PaDeviceInfo* info = Pa_GetDeviceInfo(inParams.device);
    std::cout << "[Audio] [INFO] Input device: " << (info ? info->name : "(unknown)") << std::endl;

    inParams.channelCount = 1;
    inParams.sampleFormat = paInt16;
    inParams.suggestedLatency = info ? info->defaultLowInputLatency : 0.05;
    inParams.hostApiSpecificStreamInfo = nullptr;

    PaStream* stream = nullptr;
    pa_check(
        Pa_OpenStream(&stream, &inParams, nullptr,
                      sampleRate, framesPerBuffer,
                      paClipOff, &PortAudioCapture::paCallback, this),
        "Pa_OpenStream"
    );

    const PaError e = Pa_StartStream(stream);
    if (e != paNoError) {
        Pa_CloseStream(stream);
        pa_check(e, "Pa_StartStream");
    }
    stream_ = stream;
}

void PortAudioCapture::stop() {
    if (!stream_) return;

    // Pa_StopStream returns after the last callback has completed
    const PaError e = Pa_StopStream(stream_);
    if (e != paNoError) {
        std::cerr << "[Audio] [WARN] Pa_StopStream: " << Pa_GetErrorText(e) << std::endl;
    }
    Pa_CloseStream(stream_);
    stream_ = nullptr;
}

int PortAudioCapture::paCallback(const void* input, void* /*output*/,
                                 unsigned long frameCount,
                                 const PaStreamCallbackTimeInfo* /*timeInfo*/,
                                 PaStreamCallbackFlags statusFlags,
                                 void* userData) {
    auto* self = static_cast<PortAudioCapture*>(userData);
    if (!self || !self->callback_ || !input) return paContinue;

    const bool overflowed = (statusFlags & paInputOverflow) != 0;
    self->callback_(static_cast<const int16_t*>(input), (std::size_t)frameCount, overflowed);
    return paContinue;
}
