#pragma once
// SignalTypes.hpp - Normalized interaction events and their batches

#include <optional>
#include <string_view>
#include <vector>
#include "util/Types.hpp"

namespace smu {

enum class SignalKind {
    PointerMove,
    PointerEnter,
    PointerLeave,
    Click,
    FocusChange,
    Scroll
};

constexpr std::string_view toString(SignalKind kind) {
    switch (kind) {
    case SignalKind::PointerMove:
        return "PointerMove";
    case SignalKind::PointerEnter:
        return "PointerEnter";
    case SignalKind::PointerLeave:
        return "PointerLeave";
    case SignalKind::Click:
        return "Click";
    case SignalKind::FocusChange:
        return "FocusChange";
    case SignalKind::Scroll:
        return "Scroll";
    }
    return "PointerMove";
}

struct SignalEvent {
    SignalKind kind{SignalKind::PointerMove};
    Vec2 position{0.5f, 0.5f}; // [0, 1] on both axes
    i64 timestampUs{0};        // relative to the session reference

    Vec2 velocity;            // PointerMove, surface units per second
    i32 button{-1};           // Click: 0 left, 1 middle, 2 right
    std::optional<RectF> bounds; // FocusChange
    f32 delta{0.0f};          // Scroll, positive scrolls down
};

using SignalBatch = std::vector<SignalEvent>;

} // namespace smu
