/**
 * @file Signal.hpp
 * @brief Minimal thread-safe observer signal for non-QObject types.
 *
 * Slots are invoked synchronously on the emitting thread. The slot list is
 * copied before invocation so a slot may connect or disconnect others.
 *
 * @section Patterns
 * - Observer: decouples producers (tracks, capturers) from consumers.
 */

#pragma once
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace smu {

template <typename... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;
    using SlotId = std::size_t;

    SlotId connect(Slot slot) {
        std::lock_guard lock(mutex_);
        SlotId id = nextId_++;
        slots_.emplace_back(id, std::move(slot));
        return id;
    }

    void disconnect(SlotId id) {
        std::lock_guard lock(mutex_);
        std::erase_if(slots_, [id](const auto& s) { return s.first == id; });
    }

    void disconnectAll() {
        std::lock_guard lock(mutex_);
        slots_.clear();
    }

    void emitSignal(Args... args) const {
        std::vector<std::pair<SlotId, Slot>> copy;
        {
            std::lock_guard lock(mutex_);
            copy = slots_;
        }
        for (const auto& [id, slot] : copy) {
            slot(args...);
        }
    }

    bool empty() const {
        std::lock_guard lock(mutex_);
        return slots_.empty();
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::pair<SlotId, Slot>> slots_;
    SlotId nextId_{1};
};

} // namespace smu
