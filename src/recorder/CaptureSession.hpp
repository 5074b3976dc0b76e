#pragma once
// CaptureSession.hpp - The single active recording context

#include <map>
#include <memory>
#include <optional>
#include <string_view>
#include "MediaChannel.hpp"
#include "util/Types.hpp"

namespace smu {

enum class SessionState { Idle, Starting, Recording, Paused, Stopping, Stopped };

constexpr std::string_view toString(SessionState state) {
    switch (state) {
    case SessionState::Idle:
        return "Idle";
    case SessionState::Starting:
        return "Starting";
    case SessionState::Recording:
        return "Recording";
    case SessionState::Paused:
        return "Paused";
    case SessionState::Stopping:
        return "Stopping";
    case SessionState::Stopped:
        return "Stopped";
    }
    return "Idle";
}

struct CaptureSession {
    u64 id{0};
    SessionState state{SessionState::Idle};
    TimePoint startedAtMonotonic;
    std::map<ChannelKind, std::unique_ptr<MediaChannel>> channels;

    std::optional<TimePoint> pausedAt;
    Duration pausedTotal{0};

    MediaChannel* channel(ChannelKind kind) const {
        auto it = channels.find(kind);
        return it != channels.end() ? it->second.get() : nullptr;
    }

    // Recorded time, excluding pauses
    Duration activeDuration(TimePoint now) const {
        auto end = pausedAt ? *pausedAt : now;
        auto total = std::chrono::duration_cast<Duration>(end -
                                                          startedAtMonotonic);
        return total - pausedTotal;
    }
};

} // namespace smu
