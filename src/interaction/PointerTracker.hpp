#pragma once
// PointerTracker.hpp - Pointer position, throttling and smoothed velocity.
// Holds no Qt state so it can be driven with synthetic timestamps.

#include <chrono>
#include <optional>
#include "util/Types.hpp"

namespace smu {

class PointerTracker {
public:
    struct Settings {
        std::chrono::milliseconds throttle{8};
        f32 smoothing{0.3f};
        std::chrono::milliseconds outlier{100};
    };

    PointerTracker() = default;
    explicit PointerTracker(Settings settings) : settings_(settings) {
    }

    // Centre position, zero velocity, no previous move
    void reset();
    void resetVelocity() {
        velocity_ = {};
    }

    // False when the move arrived inside the throttle window and was dropped
    bool onMove(Vec2 position, TimePoint now);
    void onEnter(Vec2 position) {
        position_ = position;
    }

    Vec2 position() const {
        return position_;
    }
    Vec2 velocity() const {
        return velocity_;
    }

    static Vec2 clampUnit(Vec2 v);

private:
    Settings settings_;
    Vec2 position_{0.5f, 0.5f};
    Vec2 velocity_;
    std::optional<TimePoint> lastMove_;
};

} // namespace smu
