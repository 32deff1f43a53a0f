#include "input/activation_detector.hpp"
#include "input/key_codes.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <optional>

namespace {

constexpr uint32_t kKeyA = 30;

Clock::time_point at(int ms) { return Clock::time_point(std::chrono::milliseconds(1000 + ms)); }

KeyEvent down(uint32_t key, int ms) { return {key, KeyTransition::Down, at(ms)}; }
KeyEvent up(uint32_t key, int ms) { return {key, KeyTransition::Up, at(ms)}; }

class ActivationDetectorTest : public ::testing::Test {
protected:
    ActivationDetectorTest()
        : detector_({modifierKeyCodes("shift"), allModifierKeyCodes(), 0.4},
                    [this] { return active_; }) {}

    std::optional<ActivationToggle> tap(uint32_t key, int downMs, int upMs) {
        auto first = detector_.onKeyEvent(down(key, downMs));
        EXPECT_FALSE(first.has_value());
        return detector_.onKeyEvent(up(key, upMs));
    }

    bool active_ = false;
    ActivationDetector detector_;
};

TEST_F(ActivationDetectorTest, SingleTapDoesNothing) {
    EXPECT_FALSE(tap(keycode::LeftShift, 0, 50).has_value());
}

TEST_F(ActivationDetectorTest, DoubleTapStartsWhenIdle) {
    EXPECT_FALSE(tap(keycode::LeftShift, 0, 50).has_value());
    auto toggle = tap(keycode::LeftShift, 150, 200);
    ASSERT_TRUE(toggle.has_value());
    EXPECT_EQ(*toggle, ActivationToggle::Start);
}

TEST_F(ActivationDetectorTest, DoubleTapStopsWhenRecording) {
    active_ = true;
    tap(keycode::RightShift, 0, 50);
    auto toggle = tap(keycode::RightShift, 150, 200);
    ASSERT_TRUE(toggle.has_value());
    EXPECT_EQ(*toggle, ActivationToggle::Stop);
}

TEST_F(ActivationDetectorTest, ReleaseExactlyAtWindowToggles) {
    tap(keycode::LeftShift, 0, 100);
    EXPECT_TRUE(tap(keycode::LeftShift, 450, 500).has_value());
}

TEST_F(ActivationDetectorTest, ReleaseJustPastWindowDoesNotToggle) {
    tap(keycode::LeftShift, 0, 100);
    EXPECT_FALSE(tap(keycode::LeftShift, 450, 501).has_value());
}

TEST_F(ActivationDetectorTest, LateSecondTapBecomesNewFirstTap) {
    tap(keycode::LeftShift, 0, 100);
    EXPECT_FALSE(tap(keycode::LeftShift, 600, 700).has_value());
    EXPECT_TRUE(tap(keycode::LeftShift, 800, 900).has_value());
}

TEST_F(ActivationDetectorTest, OtherKeyBetweenTapsInvalidates) {
    tap(keycode::LeftShift, 0, 50);
    detector_.onKeyEvent(down(kKeyA, 80));
    detector_.onKeyEvent(up(kKeyA, 90));
    EXPECT_FALSE(tap(keycode::LeftShift, 150, 200).has_value());
}

TEST_F(ActivationDetectorTest, ShiftUsedForTypingIsNotATap) {
    detector_.onKeyEvent(down(keycode::LeftShift, 0));
    detector_.onKeyEvent(down(kKeyA, 20));
    detector_.onKeyEvent(up(kKeyA, 40));
    EXPECT_FALSE(detector_.onKeyEvent(up(keycode::LeftShift, 60)).has_value());
    EXPECT_FALSE(tap(keycode::LeftShift, 150, 200).has_value());
}

TEST_F(ActivationDetectorTest, HeldModifierBlocksTap) {
    detector_.onKeyEvent(down(keycode::LeftCtrl, 0));
    EXPECT_FALSE(tap(keycode::LeftShift, 10, 50).has_value());
    EXPECT_FALSE(tap(keycode::LeftShift, 150, 200).has_value());
    detector_.onKeyEvent(up(keycode::LeftCtrl, 250));
    tap(keycode::LeftShift, 300, 350);
    EXPECT_TRUE(tap(keycode::LeftShift, 400, 450).has_value());
}

TEST_F(ActivationDetectorTest, LeftThenRightShiftIsNotADoubleTap) {
    tap(keycode::LeftShift, 0, 50);
    EXPECT_FALSE(tap(keycode::RightShift, 150, 200).has_value());
}

TEST_F(ActivationDetectorTest, TripleTapTogglesOnce) {
    tap(keycode::LeftShift, 0, 50);
    EXPECT_TRUE(tap(keycode::LeftShift, 100, 150).has_value());
    EXPECT_FALSE(tap(keycode::LeftShift, 200, 250).has_value());
}

TEST_F(ActivationDetectorTest, BothShiftKeysDownInvalidates) {
    detector_.onKeyEvent(down(keycode::LeftShift, 0));
    detector_.onKeyEvent(down(keycode::RightShift, 10));
    detector_.onKeyEvent(up(keycode::RightShift, 20));
    EXPECT_FALSE(detector_.onKeyEvent(up(keycode::LeftShift, 30)).has_value());
    EXPECT_FALSE(tap(keycode::LeftShift, 100, 150).has_value());
}

TEST(ActivationKeyCodes, NamesMapToBothSides) {
    EXPECT_EQ(modifierKeyCodes("ctrl").size(), 2u);
    EXPECT_EQ(modifierKeyCodes("meta")[0], keycode::LeftMeta);
    EXPECT_TRUE(modifierKeyCodes("hyper").empty());
    EXPECT_EQ(allModifierKeyCodes().size(), 8u);
}

} // namespace
