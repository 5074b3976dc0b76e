/**
 * @file Dispatcher.hpp
 * @brief Routes control messages to the orchestrator and the signal capturer.
 *
 * The dispatcher owns the session-level bookkeeping that neither component
 * knows about on its own: the latest permission result, the signals
 * accumulated for the running session and the wall-clock creation time.
 * Every request gets exactly one REPLY through the callback it was handed;
 * STOP_CAPTURE replies once the artifacts are assembled.
 *
 * @section Dependencies
 * - RecorderOrchestrator, SignalCapturer
 * - ControlMessages (wire format)
 *
 * @section Patterns
 * - Mediator: the only place where media and interaction capture meet.
 */

#pragma once
#include <QDateTime>
#include <QJsonObject>
#include <QObject>
#include <functional>
#include <optional>
#include "ControlMessages.hpp"
#include "interaction/SignalCapturer.hpp"
#include "recorder/RecorderOrchestrator.hpp"
#include "util/Signal.hpp"

namespace smu {

struct CompletedRecording {
    ArtifactList artifacts;
    SignalBatch events;
    i64 durationMs{0};
    QDateTime createdAt;
};

struct DispatcherSettings {
    bool defaultWantMicrophone{true};
    bool defaultWantCamera{false};
    DisplayIntent defaultDisplayIntent{DisplayIntent::Monitor};
};

class Dispatcher : public QObject {
    Q_OBJECT

public:
    using Reply = std::function<void(const QJsonObject&)>;

    Dispatcher(RecorderOrchestrator& orchestrator,
               SignalCapturer& capturer,
               DispatcherSettings settings = {},
               QObject* parent = nullptr);
    ~Dispatcher() override;

    // Parses one line; malformed input is answered with an error REPLY
    void handleLine(const QByteArray& line, const Reply& reply);
    void handle(const ControlMessage& msg, const Reply& reply);

    CaptureRequest resolveRequest(const ControlMessage& msg) const;
    CaptureStatus status() const;

    void setPermissions(PermissionsResult permissions);
    const std::optional<PermissionsResult>& permissions() const {
        return permissions_;
    }

    const SignalBatch& recordedSignals() const {
        return recordedSignals_;
    }

    // Every batch the capturer flushes, in order
    Signal<const SignalBatch&> signalBatch;
    // After STOP_CAPTURE, once the last batch has been forwarded
    Signal<const CompletedRecording&> recordingFinished;

private:
    void onStart(const ControlMessage& msg, const Reply& reply);
    void onPause(const ControlMessage& msg, const Reply& reply);
    void onResume(const ControlMessage& msg, const Reply& reply);
    void onStop(const ControlMessage& msg, const Reply& reply);
    void onBatch(const SignalBatch& batch);

    RecorderOrchestrator& orchestrator_;
    SignalCapturer& capturer_;
    DispatcherSettings settings_;
    Signal<const SignalBatch&>::SlotId batchSlot_{0};

    std::optional<PermissionsResult> permissions_;
    SignalBatch recordedSignals_;
    i64 lastTimestampUs_{0};
    QDateTime createdAt_;
    bool stopping_{false};
};

} // namespace smu
