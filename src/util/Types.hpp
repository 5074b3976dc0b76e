#pragma once
// Types.hpp - Common type aliases and small value types

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>

namespace smu {

namespace fs = std::filesystem;

using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;
using i32 = std::int32_t;
using i64 = std::int64_t;
using f32 = float;
using f64 = double;
using usize = std::size_t;

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::microseconds;

struct Vec2 {
    f32 x{0.0f};
    f32 y{0.0f};

    bool operator==(const Vec2&) const = default;
};

// Normalized rectangle, all components in [0, 1]
struct RectF {
    f32 x{0.0f};
    f32 y{0.0f};
    f32 width{0.0f};
    f32 height{0.0f};

    bool operator==(const RectF&) const = default;
};

} // namespace smu
