#ifndef EVDEV_KEY_SOURCE_HPP
#define EVDEV_KEY_SOURCE_HPP

#include "input/key_event_source.hpp"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

// Reads key transitions from every keyboard under /dev/input.
class EvdevKeySource : public KeyEventSource {
public:
    explicit EvdevKeySource(std::string inputDir = "/dev/input");
    ~EvdevKeySource() override;

    EvdevKeySource(const EvdevKeySource&) = delete;
    EvdevKeySource& operator=(const EvdevKeySource&) = delete;

    void start(Callback callback) override;
    void stop() override;

private:
    void openKeyboards();
    void closeAll();
    void run();

    std::string inputDir_;
    Callback callback_;

    std::vector<int> fds_;
    int wakePipe_[2] = {-1, -1};

    std::thread thread_;
    std::atomic<bool> running_{false};
};

#endif
