/**
 * @file SignalCapturer.hpp
 * @brief Captures pointer, click, focus and scroll events on a surface.
 *
 * Events are normalized against the surface size, timestamped in
 * microseconds from the session reference and buffered. A repeating timer
 * drains the buffer into one SignalBatch per interval. Pausing gates event
 * production without removing listeners; stopping removes them, cancels
 * the timer and performs one last flush before finished fires.
 *
 * The record* methods are what the event filter calls. They take explicit
 * timestamps so tests can drive the capturer without a window system.
 *
 * @section Dependencies
 * - Qt6 Gui (QWindow, QGuiApplication focus tracking)
 * - Qt6 Widgets (focus widget geometry)
 *
 * @section Patterns
 * - RAII: listener registration lives in a scoped object.
 */

#pragma once
#include <QObject>
#include <QPointF>
#include <QPointer>
#include <QRectF>
#include <QSizeF>
#include <QTimer>
#include <QWindow>
#include <memory>
#include "PointerTracker.hpp"
#include "SignalTypes.hpp"
#include "core/ConfigData.hpp"
#include "util/Signal.hpp"

namespace smu {

struct SignalCapturerSettings {
    std::chrono::milliseconds flushInterval{100};
    PointerTracker::Settings tracker;
    bool resetVelocityOnResume{false};

    static SignalCapturerSettings fromConfig(const InteractionConfig& cfg);
};

class SignalCapturer : public QObject {
    Q_OBJECT

public:
    explicit SignalCapturer(SignalCapturerSettings settings = {},
                            QObject* parent = nullptr);
    ~SignalCapturer() override;

    // The observed surface; may be null when only driven programmatically
    void attach(QWindow* surface);

    void start(TimePoint reference);
    void pause();
    void resume();
    void stop();

    bool isCapturing() const {
        return capturing_;
    }
    bool isPaused() const {
        return paused_;
    }

    void recordMove(QPointF pos, QSizeF surface, TimePoint now);
    void recordEnter(QPointF pos, QSizeF surface, TimePoint now);
    void recordLeave(TimePoint now);
    void recordClick(QPointF pos, QSizeF surface, int button, TimePoint now);
    void recordFocus(QRectF bounds, QSizeF surface, TimePoint now);
    void recordScroll(QPointF pos, QSizeF surface, f32 deltaY, TimePoint now);

    // Drains the buffer into one batch; nothing is emitted when empty
    void flush();

    usize bufferedCount() const {
        return buffer_.size();
    }
    u64 totalEvents() const {
        return totalEvents_;
    }
    const PointerTracker& tracker() const {
        return tracker_;
    }

    void setSettings(SignalCapturerSettings settings);

    Signal<const SignalBatch&> batchReady;
    Signal<> finished;

protected:
    bool eventFilter(QObject* watched, QEvent* event) override;

private:
    class ListenerRegistration;

    bool accepting() const {
        return capturing_ && !paused_;
    }
    i64 timestampFor(TimePoint now);
    void push(SignalEvent event);
    void onFocusObjectChanged(QObject* focus);

    static Vec2 normalize(QPointF pos, QSizeF surface);

    SignalCapturerSettings settings_;
    PointerTracker tracker_;
    QPointer<QWindow> surface_;
    std::unique_ptr<ListenerRegistration> listeners_;
    QTimer flushTimer_;

    bool capturing_{false};
    bool paused_{false};
    TimePoint reference_;
    i64 lastTimestampUs_{0};
    SignalBatch buffer_;
    u64 totalEvents_{0};
};

} // namespace smu
