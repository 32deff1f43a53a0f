#ifndef ACTIVATION_DETECTOR_HPP
#define ACTIVATION_DETECTOR_HPP

#include "core/types.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <set>
#include <vector>

// Recognises a double tap of one modifier key.
//
// A tap qualifies when the monitored key goes down and comes straight back
// up with no other event in between and no other modifier held. Two
// qualifying taps of the same physical key whose release times are at most
// `window` apart produce a toggle. Any other key event discards the pending tap.
class ActivationDetector {
public:
    struct Config {
        std::vector<uint32_t> monitoredKeys;    // physical keys of one logical key
        std::vector<uint32_t> modifierKeys;     // keys that block a tap while held
        double window = 0.4;                    // seconds
    };

    using SessionQuery = std::function<bool()>;

    ActivationDetector(Config config, SessionQuery sessionActive);

    std::optional<ActivationToggle> onKeyEvent(const KeyEvent& evt);

    void reset();

private:
    bool isMonitored(uint32_t key) const;
    bool isModifier(uint32_t key) const;
    bool otherModifierHeld() const;
    void invalidate();

    Config config_;
    SessionQuery sessionActive_;
    Clock::duration window_{};

    std::set<uint32_t> heldModifiers_;
    bool tapInProgress_ = false;
    uint32_t tapKey_ = 0;
    bool hasLastTap_ = false;
    uint32_t lastTapKey_ = 0;
    Clock::time_point lastTap_{};
};

#endif
