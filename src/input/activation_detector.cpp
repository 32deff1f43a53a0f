#include "input/activation_detector.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

// Constructor
ActivationDetector::ActivationDetector(Config config, SessionQuery sessionActive)
    : config_(std::move(config)), sessionActive_(std::move(sessionActive)) {
    const auto ns = std::llround(config_.window * 1e9);
    window_ = std::chrono::duration_cast<Clock::duration>(std::chrono::nanoseconds(ns));
}

void ActivationDetector::reset() {
    heldModifiers_.clear();
    invalidate();
}

bool ActivationDetector::isMonitored(uint32_t key) const {
    return std::find(config_.monitoredKeys.begin(), config_.monitoredKeys.end(), key) !=
           config_.monitoredKeys.end();
}

bool ActivationDetector::isModifier(uint32_t key) const {
    return std::find(config_.modifierKeys.begin(), config_.modifierKeys.end(), key) !=
           config_.modifierKeys.end();
}

bool ActivationDetector::otherModifierHeld() const {
    for (uint32_t key : heldModifiers_) {
        if (!isMonitored(key)) return true;
    }
    return false;
}

void ActivationDetector::invalidate() {
    tapInProgress_ = false;
    hasLastTap_ = false;
}

std::optional<ActivationToggle> ActivationDetector::onKeyEvent(const KeyEvent& evt) {
    if (!isMonitored(evt.key)) {
        if (isModifier(evt.key)) {
            if (evt.transition == KeyTransition::Down) heldModifiers_.insert(evt.key);
            else heldModifiers_.erase(evt.key);
        }
        invalidate();
        return std::nullopt;
    }

    if (evt.transition == KeyTransition::Down) {
        if (tapInProgress_ || otherModifierHeld()) {
            invalidate();
            return std::nullopt;
        }
        tapInProgress_ = true;
        tapKey_ = evt.key;
        return std::nullopt;
    }

    // Up
    if (!tapInProgress_ || tapKey_ != evt.key || otherModifierHeld()) {
        invalidate();
        return std::nullopt;
    }
    tapInProgress_ = false;

    if (hasLastTap_ && lastTapKey_ == evt.key &&
        evt.timestamp >= lastTap_ && evt.timestamp - lastTap_ <= window_) {
        hasLastTap_ = false;
        const bool active = sessionActive_ ? sessionActive_() : false;
        std::cout << "[Activation] [INFO] Double-tap detected" << std::endl;
        return active ? ActivationToggle::Stop : ActivationToggle::Start;
    }

    hasLastTap_ = true;
    lastTapKey_ = evt.key;
    lastTap_ = evt.timestamp;
    return std::nullopt;
}
