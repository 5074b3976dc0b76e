#include "SignalCapturer.hpp"
#include <QEnterEvent>
#include <QGuiApplication>
#include <QMouseEvent>
#include <QWheelEvent>
#include <QWidget>
#include <algorithm>
#include "core/Logger.hpp"

namespace smu {

// Installs the surface event filter and the focus tracking connection for
// as long as it lives
class SignalCapturer::ListenerRegistration {
public:
    ListenerRegistration(SignalCapturer& owner, QWindow* surface)
        : owner_(owner), surface_(surface) {
        if (surface_)
            surface_->installEventFilter(&owner_);
        if (auto* app = qobject_cast<QGuiApplication*>(
                    QCoreApplication::instance())) {
            focusConnection_ = QObject::connect(
                    app,
                    &QGuiApplication::focusObjectChanged,
                    &owner_,
                    [this](QObject* focus) {
                        owner_.onFocusObjectChanged(focus);
                    });
        }
    }

    ~ListenerRegistration() {
        if (surface_)
            surface_->removeEventFilter(&owner_);
        QObject::disconnect(focusConnection_);
    }

    ListenerRegistration(const ListenerRegistration&) = delete;
    ListenerRegistration& operator=(const ListenerRegistration&) = delete;

private:
    SignalCapturer& owner_;
    QPointer<QWindow> surface_;
    QMetaObject::Connection focusConnection_;
};

namespace {
// DOM numbering, which downstream consumers expect
int domButton(Qt::MouseButton button) {
    switch (button) {
    case Qt::LeftButton:
        return 0;
    case Qt::MiddleButton:
        return 1;
    case Qt::RightButton:
        return 2;
    case Qt::BackButton:
        return 3;
    case Qt::ForwardButton:
        return 4;
    default:
        return -1;
    }
}

f32 unit(f64 v) {
    return std::clamp(static_cast<f32>(v), 0.0f, 1.0f);
}
} // namespace

SignalCapturerSettings SignalCapturerSettings::fromConfig(
        const InteractionConfig& cfg) {
    SignalCapturerSettings s;
    s.flushInterval = std::chrono::milliseconds(cfg.flushIntervalMs);
    s.tracker.throttle = std::chrono::milliseconds(cfg.moveThrottleMs);
    s.tracker.smoothing = cfg.velocitySmoothing;
    s.tracker.outlier = std::chrono::milliseconds(cfg.velocityOutlierMs);
    s.resetVelocityOnResume = cfg.resetVelocityOnResume;
    return s;
}

SignalCapturer::SignalCapturer(SignalCapturerSettings settings, QObject* parent)
    : QObject(parent), settings_(settings), tracker_(settings.tracker) {
    flushTimer_.setTimerType(Qt::PreciseTimer);
    connect(&flushTimer_, &QTimer::timeout, this, &SignalCapturer::flush);
}

SignalCapturer::~SignalCapturer() {
    listeners_.reset();
}

void SignalCapturer::setSettings(SignalCapturerSettings settings) {
    settings_ = settings;
    if (!capturing_)
        tracker_ = PointerTracker(settings_.tracker);
}

void SignalCapturer::attach(QWindow* surface) {
    surface_ = surface;
    if (capturing_) {
        listeners_.reset();
        listeners_ = std::make_unique<ListenerRegistration>(*this, surface);
    }
}

void SignalCapturer::start(TimePoint reference) {
    if (capturing_) {
        LOG_WARN("Signal capture already running");
        return;
    }
    capturing_ = true;
    paused_ = false;
    reference_ = reference;
    lastTimestampUs_ = 0;
    totalEvents_ = 0;
    buffer_.clear();
    tracker_ = PointerTracker(settings_.tracker);

    listeners_ = std::make_unique<ListenerRegistration>(*this, surface_);
    flushTimer_.start(settings_.flushInterval);
    LOG_DEBUG("Signal capture started ({} ms batches)",
              settings_.flushInterval.count());
}

void SignalCapturer::pause() {
    if (capturing_)
        paused_ = true;
}

void SignalCapturer::resume() {
    if (!capturing_ || !paused_)
        return;
    paused_ = false;
    if (settings_.resetVelocityOnResume)
        tracker_.resetVelocity();
}

void SignalCapturer::stop() {
    if (!capturing_)
        return;
    listeners_.reset();
    flushTimer_.stop();
    flush();
    capturing_ = false;
    paused_ = false;
    LOG_DEBUG("Signal capture stopped after {} events", totalEvents_);
    finished.emitSignal();
}

void SignalCapturer::flush() {
    if (buffer_.empty())
        return;
    SignalBatch batch;
    batch.swap(buffer_);
    batchReady.emitSignal(batch);
}

i64 SignalCapturer::timestampFor(TimePoint now) {
    auto us = std::chrono::duration_cast<Duration>(now - reference_).count();
    lastTimestampUs_ = std::max<i64>(lastTimestampUs_, us);
    return lastTimestampUs_;
}

void SignalCapturer::push(SignalEvent event) {
    buffer_.push_back(std::move(event));
    ++totalEvents_;
}

Vec2 SignalCapturer::normalize(QPointF pos, QSizeF surface) {
    auto w = surface.width() > 0 ? surface.width() : 1.0;
    auto h = surface.height() > 0 ? surface.height() : 1.0;
    return {unit(pos.x() / w), unit(pos.y() / h)};
}

void SignalCapturer::recordMove(QPointF pos, QSizeF surface, TimePoint now) {
    if (!accepting())
        return;
    if (!tracker_.onMove(normalize(pos, surface), now))
        return;

    SignalEvent e;
    e.kind = SignalKind::PointerMove;
    e.position = tracker_.position();
    e.velocity = tracker_.velocity();
    e.timestampUs = timestampFor(now);
    push(std::move(e));
}

void SignalCapturer::recordEnter(QPointF pos, QSizeF surface, TimePoint now) {
    if (!accepting())
        return;
    tracker_.onEnter(normalize(pos, surface));

    SignalEvent e;
    e.kind = SignalKind::PointerEnter;
    e.position = tracker_.position();
    e.timestampUs = timestampFor(now);
    push(std::move(e));
}

void SignalCapturer::recordLeave(TimePoint now) {
    if (!accepting())
        return;

    // Last known position, so playback does not jump on re-entry
    SignalEvent e;
    e.kind = SignalKind::PointerLeave;
    e.position = tracker_.position();
    e.timestampUs = timestampFor(now);
    push(std::move(e));
}

void SignalCapturer::recordClick(QPointF pos,
                                 QSizeF surface,
                                 int button,
                                 TimePoint now) {
    if (!accepting())
        return;

    SignalEvent e;
    e.kind = SignalKind::Click;
    e.position = normalize(pos, surface);
    e.button = button;
    e.timestampUs = timestampFor(now);
    push(std::move(e));
}

void SignalCapturer::recordFocus(QRectF bounds, QSizeF surface, TimePoint now) {
    if (!accepting())
        return;

    auto w = surface.width() > 0 ? surface.width() : 1.0;
    auto h = surface.height() > 0 ? surface.height() : 1.0;
    RectF r;
    r.x = unit(bounds.x() / w);
    r.y = unit(bounds.y() / h);
    r.width = std::clamp(static_cast<f32>(bounds.width() / w), 0.0f, 1.0f - r.x);
    r.height =
            std::clamp(static_cast<f32>(bounds.height() / h), 0.0f, 1.0f - r.y);

    SignalEvent e;
    e.kind = SignalKind::FocusChange;
    e.position = {r.x + r.width / 2.0f, r.y + r.height / 2.0f};
    e.bounds = r;
    e.timestampUs = timestampFor(now);
    push(std::move(e));
}

void SignalCapturer::recordScroll(QPointF pos,
                                  QSizeF surface,
                                  f32 deltaY,
                                  TimePoint now) {
    if (!accepting())
        return;

    SignalEvent e;
    e.kind = SignalKind::Scroll;
    e.position = normalize(pos, surface);
    e.delta = deltaY;
    e.timestampUs = timestampFor(now);
    push(std::move(e));
}

void SignalCapturer::onFocusObjectChanged(QObject* focus) {
    if (!accepting() || !surface_ || !focus)
        return;
    if (QGuiApplication::focusWindow() != surface_.data())
        return;

    auto* widget = qobject_cast<QWidget*>(focus);
    if (!widget)
        return;

    QPointF topLeft = widget->mapTo(widget->window(), QPoint(0, 0));
    recordFocus(QRectF(topLeft, QSizeF(widget->size())),
                QSizeF(surface_->size()),
                Clock::now());
}

bool SignalCapturer::eventFilter(QObject* watched, QEvent* event) {
    if (watched != surface_.data() || !accepting())
        return QObject::eventFilter(watched, event);

    const QSizeF size(surface_->size());
    const auto now = Clock::now();

    switch (event->type()) {
    case QEvent::MouseMove: {
        auto* me = static_cast<QMouseEvent*>(event);
        recordMove(me->position(), size, now);
        break;
    }
    case QEvent::Enter: {
        auto* ee = static_cast<QEnterEvent*>(event);
        recordEnter(ee->position(), size, now);
        break;
    }
    case QEvent::Leave:
        recordLeave(now);
        break;
    case QEvent::MouseButtonRelease: {
        auto* me = static_cast<QMouseEvent*>(event);
        recordClick(me->position(), size, domButton(me->button()), now);
        break;
    }
    case QEvent::Wheel: {
        auto* we = static_cast<QWheelEvent*>(event);
        // One wheel notch is 120 angle units and scrolls about 100 pixels
        f32 dy = !we->pixelDelta().isNull()
                         ? static_cast<f32>(-we->pixelDelta().y())
                         : static_cast<f32>(-we->angleDelta().y()) * 100.0f /
                                   120.0f;
        recordScroll(we->position(), size, dy, now);
        break;
    }
    default:
        break;
    }
    return QObject::eventFilter(watched, event);
}

} // namespace smu
