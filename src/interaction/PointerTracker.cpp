#include "PointerTracker.hpp"
#include <algorithm>

namespace smu {

void PointerTracker::reset() {
    position_ = {0.5f, 0.5f};
    velocity_ = {};
    lastMove_.reset();
}

Vec2 PointerTracker::clampUnit(Vec2 v) {
    return {std::clamp(v.x, 0.0f, 1.0f), std::clamp(v.y, 0.0f, 1.0f)};
}

bool PointerTracker::onMove(Vec2 position, TimePoint now) {
    position = clampUnit(position);

    if (lastMove_) {
        auto elapsed = now - *lastMove_;
        if (elapsed < settings_.throttle)
            return false;

        // Velocity only from gaps within the outlier bound
        if (elapsed > Clock::duration::zero() && elapsed <= settings_.outlier) {
            auto seconds = std::chrono::duration<f32>(elapsed).count();
            Vec2 instant{(position.x - position_.x) / seconds,
                         (position.y - position_.y) / seconds};
            const f32 a = settings_.smoothing;
            velocity_.x = velocity_.x * (1.0f - a) + instant.x * a;
            velocity_.y = velocity_.y * (1.0f - a) + instant.y * a;
        }
    }

    lastMove_ = now;
    position_ = position;
    return true;
}

} // namespace smu
