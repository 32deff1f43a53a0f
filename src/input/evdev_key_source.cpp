#include "input/evdev_key_source.hpp"
#include "core/errors.hpp"

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <ctime>
#include <dirent.h>
#include <fcntl.h>
#include <iostream>
#include <linux/input.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>
#include <utility>

static const char* kInputHint =
    "Reading keyboards needs access to /dev/input/event*. Add this user to the "
    "'input' group (sudo usermod -aG input $USER) and log in again.";

static constexpr std::size_t kBitsPerLong = sizeof(unsigned long) * 8;

static constexpr std::size_t longs_for_bits(std::size_t bits) {
    return (bits + kBitsPerLong - 1) / kBitsPerLong;
}

static bool test_bit(const unsigned long* bits, int bit) {
    return (bits[bit / kBitsPerLong] >> (bit % kBitsPerLong)) & 1UL;
}

// A keyboard reports EV_KEY and has letter keys
static bool is_keyboard(int fd) {
    unsigned long evBits[longs_for_bits(EV_MAX + 1)] = {0};
    if (ioctl(fd, EVIOCGBIT(0, sizeof(evBits)), evBits) < 0) return false;
    if (!test_bit(evBits, EV_KEY)) return false;

    unsigned long keyBits[longs_for_bits(KEY_MAX + 1)] = {0};
    if (ioctl(fd, EVIOCGBIT(EV_KEY, sizeof(keyBits)), keyBits) < 0) return false;
    return test_bit(keyBits, KEY_A) && test_bit(keyBits, KEY_Z);
}

static Clock::time_point to_time_point(const struct input_event& ev) {
    // timestamps are CLOCK_MONOTONIC, the clock steady_clock reads on Linux
    const auto since = std::chrono::seconds(ev.input_event_sec)
                     + std::chrono::microseconds(ev.input_event_usec);
    return Clock::time_point(std::chrono::duration_cast<Clock::duration>(since));
}

// Constructor
EvdevKeySource::EvdevKeySource(std::string inputDir) : inputDir_(std::move(inputDir)) {}

// Destructor
EvdevKeySource::~EvdevKeySource() { stop(); }

void EvdevKeySource::openKeyboards() {
    DIR* dir = opendir(inputDir_.c_str());
    if (!dir) {
        throw KeySourcePermissionError("cannot open " + inputDir_ + ": " + std::strerror(errno), kInputHint);
    }

    int denied = 0;
    while (struct dirent* entry = readdir(dir)) {
        if (std::strncmp(entry->d_name, "event", 5) != 0) continue;

        const std::string path = inputDir_ + "/" + entry->d_name;
        const int fd = ::open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
        if (fd < 0) {
            if (errno == EACCES || errno == EPERM) ++denied;
            continue;
        }
        if (!is_keyboard(fd)) {
            ::close(fd);
            continue;
        }

        int clockId = CLOCK_MONOTONIC;
        if (ioctl(fd, EVIOCSCLOCKID, &clockId) < 0) {
            std::cerr << "[Key Source] [WARN] " << path << ": EVIOCSCLOCKID failed, timestamps may drift" << std::endl;
        }

        char name[256] = "unknown";
        ioctl(fd, EVIOCGNAME(sizeof(name)), name);
        std::cout << "[Key Source] [INFO] Listening on " << path << " (" << name << ")" << std::endl;
        fds_.push_back(fd);
    }
    closedir(dir);

    if (fds_.empty()) {
        if (denied > 0) {
            throw KeySourcePermissionError("permission denied on " + std::to_string(denied)
                                           + " input device(s), no keyboard readable", kInputHint);
        }
        throw KeySourcePermissionError("no keyboard found under " + inputDir_, kInputHint);
    }
}

void EvdevKeySource::closeAll() {
    for (int fd : fds_) ::close(fd);
    fds_.clear();
    for (int& p : wakePipe_) {
        if (p >= 0) ::close(p);
        p = -1;
    }
}

// Starts the listening thread
void EvdevKeySource::start(Callback callback) {
    if (running_.load()) return;
    callback_ = std::move(callback);

    openKeyboards();
    if (::pipe2(wakePipe_, O_CLOEXEC | O_NONBLOCK) < 0) {
        const std::string reason = std::strerror(errno);
        closeAll();
        throw std::runtime_error("pipe2 failed: " + reason);
    }

    running_ = true;
    thread_ = std::thread(&EvdevKeySource::run, this);
}

// Stops the listening thread
void EvdevKeySource::stop() {
    if (!running_.exchange(false)) return;

    const char b = 1;
    if (::write(wakePipe_[1], &b, 1) < 0) {
        std::cerr << "[Key Source] [WARN] wake pipe write failed: " << std::strerror(errno) << std::endl;
    }
    if (thread_.joinable()) thread_.join();
    closeAll();
}

// Thread function that forwards key presses and releases
void EvdevKeySource::run() {
    std::vector<pollfd> pfds;
    pfds.push_back({wakePipe_[0], POLLIN, 0});
    for (int fd : fds_) pfds.push_back({fd, POLLIN, 0});

    while (running_.load()) {
        const int n = ::poll(pfds.data(), pfds.size(), -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::cerr << "[Key Source] [ERROR] poll failed: " << std::strerror(errno) << std::endl;
            break;
        }
        if (pfds[0].revents & POLLIN) break;

        for (std::size_t i = 1; i < pfds.size(); ++i) {
            if (pfds[i].fd < 0) continue;
            if (pfds[i].revents & (POLLERR | POLLHUP | POLLNVAL)) {
                std::cerr << "[Key Source] [WARN] Input device went away, ignoring it" << std::endl;
                pfds[i].fd = -1;
                continue;
            }
            if (!(pfds[i].revents & POLLIN)) continue;

            struct input_event events[64];
            const ssize_t bytes = ::read(pfds[i].fd, events, sizeof(events));
            if (bytes <= 0) continue;

            const std::size_t count = (std::size_t)bytes / sizeof(struct input_event);
            for (std::size_t k = 0; k < count; ++k) {
                const struct input_event& ev = events[k];
                if (ev.type != EV_KEY || ev.value == 2) continue;

                KeyEvent evt;
                evt.key = ev.code;
                evt.transition = ev.value ? KeyTransition::Down : KeyTransition::Up;
                evt.timestamp = to_time_point(ev);

                try {
                    if (callback_) callback_(evt);
                } catch (const std::exception& e) {
                    std::cerr << "[Key Source] [ERROR] Key callback threw: " << e.what() << std::endl;
                }
            }
        }
    }
}
