#ifndef KEY_EVENT_SOURCE_HPP
#define KEY_EVENT_SOURCE_HPP

#include "core/types.hpp"

#include <functional>

// System-wide raw key transitions. The callback runs on the source's own
// listener thread.
class KeyEventSource {
public:
    using Callback = std::function<void(const KeyEvent& evt)>;

    virtual ~KeyEventSource() = default;

    // Throws KeySourcePermissionError if no keyboard can be read.
    virtual void start(Callback callback) = 0;
    virtual void stop() = 0;
};

#endif
