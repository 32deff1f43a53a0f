#ifndef CAPTURE_DEVICE_HPP
#define CAPTURE_DEVICE_HPP

#include <cstddef>
#include <cstdint>
#include <functional>

// Source of raw microphone samples. The callback runs on the device's own
// thread and must not block.
class CaptureDevice {
public:
    using SampleCallback = std::function<void(const int16_t* samples, std::size_t count,
                                              bool overflowed)>;

    virtual ~CaptureDevice() = default;

    // Throws MicrophoneError if the device cannot be opened or started.
    virtual void start(int sampleRate, int framesPerBuffer, SampleCallback callback) = 0;

    // Returns once no further callback can run.
    virtual void stop() = 0;
};

#endif
