#include "Dispatcher.hpp"
#include <QFuture>
#include <QJsonArray>
#include <algorithm>
#include "core/Logger.hpp"

namespace smu {

namespace {

bool resolveWant(std::optional<bool> requested,
                 std::optional<bool> permitted,
                 bool fallback) {
    if (requested && permitted)
        return *requested && *permitted;
    if (requested)
        return *requested;
    if (permitted)
        return *permitted;
    return fallback;
}

} // namespace

Dispatcher::Dispatcher(RecorderOrchestrator& orchestrator,
                       SignalCapturer& capturer,
                       DispatcherSettings settings,
                       QObject* parent)
    : QObject(parent),
      orchestrator_(orchestrator),
      capturer_(capturer),
      settings_(settings) {
    batchSlot_ = capturer_.batchReady.connect(
            [this](const SignalBatch& batch) { onBatch(batch); });
}

Dispatcher::~Dispatcher() {
    capturer_.batchReady.disconnect(batchSlot_);
}

void Dispatcher::handleLine(const QByteArray& line, const Reply& reply) {
    if (line.trimmed().isEmpty())
        return;

    auto msg = ControlMessages::parse(line);
    if (!msg) {
        LOG_WARN("Rejected control message: {}", msg.error().message);
        reply(ControlMessages::replyError(QJsonValue::Undefined, msg.error()));
        return;
    }
    handle(*msg, reply);
}

void Dispatcher::handle(const ControlMessage& msg, const Reply& reply) {
    LOG_DEBUG("Control message {}", toString(msg.type));

    switch (msg.type) {
    case MessageType::StartCapture:
        onStart(msg, reply);
        break;
    case MessageType::PauseCapture:
        onPause(msg, reply);
        break;
    case MessageType::ResumeCapture:
        onResume(msg, reply);
        break;
    case MessageType::StopCapture:
        onStop(msg, reply);
        break;
    case MessageType::SignalBatch:
        // Batches from an external producer join the running session; like
        // captured events they are dropped while paused
        if (orchestrator_.state() == SessionState::Recording && !stopping_)
            onBatch(msg.events);
        reply(ControlMessages::reply(msg.id));
        break;
    case MessageType::PermissionsResult:
        setPermissions(msg.permissions);
        reply(ControlMessages::reply(msg.id));
        break;
    case MessageType::GetStatus:
        reply(ControlMessages::reply(msg.id, ControlMessages::status(status())));
        break;
    }
}

CaptureRequest Dispatcher::resolveRequest(const ControlMessage& msg) const {
    CaptureRequest request;
    std::optional<bool> micPermitted;
    std::optional<bool> camPermitted;
    if (permissions_) {
        micPermitted = permissions_->hasMicrophone;
        camPermitted = permissions_->hasCamera;
    }
    request.wantMicrophone = resolveWant(
            msg.wantMicrophone, micPermitted, settings_.defaultWantMicrophone);
    request.wantCamera = resolveWant(
            msg.wantCamera, camPermitted, settings_.defaultWantCamera);
    request.displayIntent =
            msg.displayIntent.value_or(settings_.defaultDisplayIntent);
    return request;
}

CaptureStatus Dispatcher::status() const {
    CaptureStatus s;
    auto state = orchestrator_.state();
    s.isRecording = state == SessionState::Recording ||
                    state == SessionState::Paused ||
                    state == SessionState::Stopping;
    s.isPaused = state == SessionState::Paused;
    s.durationMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                           orchestrator_.elapsed())
                           .count();
    s.signalCount = recordedSignals_.size();
    s.channels = orchestrator_.activeChannels();
    return s;
}

void Dispatcher::setPermissions(PermissionsResult permissions) {
    LOG_INFO("Permissions: microphone={} camera={}",
             permissions.hasMicrophone,
             permissions.hasCamera);
    permissions_ = permissions;
}

void Dispatcher::onStart(const ControlMessage& msg, const Reply& reply) {
    if (orchestrator_.isActive()) {
        reply(ControlMessages::replyError(
                msg.id, Error{"Already recording", ErrorCode::InvalidState}));
        return;
    }

    auto request = resolveRequest(msg);
    LOG_INFO("Starting capture: intent={} microphone={} camera={}",
             toString(request.displayIntent),
             request.wantMicrophone,
             request.wantCamera);

    auto started = orchestrator_.start(request);
    if (!started) {
        LOG_ERROR("Capture start failed: {} ({})",
                  started.error().message,
                  toString(started.error().code));
        reply(ControlMessages::replyError(msg.id, started.error()));
        return;
    }

    recordedSignals_.clear();
    lastTimestampUs_ = 0;
    createdAt_ = QDateTime::currentDateTimeUtc();
    stopping_ = false;
    if (auto reference = orchestrator_.startedAt())
        capturer_.start(*reference);

    reply(ControlMessages::reply(msg.id, ControlMessages::status(status())));
}

void Dispatcher::onPause(const ControlMessage& msg, const Reply& reply) {
    auto paused = orchestrator_.pause();
    if (!paused) {
        reply(ControlMessages::replyError(msg.id, paused.error()));
        return;
    }
    capturer_.pause();
    reply(ControlMessages::reply(msg.id));
}

void Dispatcher::onResume(const ControlMessage& msg, const Reply& reply) {
    auto resumed = orchestrator_.resume();
    if (!resumed) {
        reply(ControlMessages::replyError(msg.id, resumed.error()));
        return;
    }
    capturer_.resume();
    reply(ControlMessages::reply(msg.id));
}

void Dispatcher::onStop(const ControlMessage& msg, const Reply& reply) {
    auto state = orchestrator_.state();
    if (state != SessionState::Recording && state != SessionState::Paused) {
        reply(ControlMessages::replyError(
                msg.id, Error{"Not recording", ErrorCode::InvalidState}));
        return;
    }

    const i64 durationMs =
            std::chrono::duration_cast<std::chrono::milliseconds>(
                    orchestrator_.elapsed())
                    .count();

    // Final flush goes out before the artifacts
    capturer_.stop();
    stopping_ = true;

    QJsonValue id = msg.id;
    orchestrator_.stop().then(
            this,
            [this, id, reply, durationMs](QFuture<ArtifactList> future) {
                CompletedRecording done;
                if (future.resultCount() > 0)
                    done.artifacts = future.result();
                done.events = std::move(recordedSignals_);
                done.durationMs = durationMs;
                done.createdAt = createdAt_;
                recordedSignals_.clear();
                stopping_ = false;

                LOG_INFO("Capture stopped: {} ms, {} artifact(s), {} signal(s)",
                         done.durationMs,
                         done.artifacts.size(),
                         done.events.size());

                QJsonArray artifacts;
                for (const auto& artifact : done.artifacts)
                    artifacts.append(ControlMessages::artifactInfo(artifact));
                QJsonObject fields;
                fields["durationMs"] = static_cast<qint64>(done.durationMs);
                fields["signalCount"] =
                        static_cast<qint64>(done.events.size());
                fields["artifacts"] = artifacts;

                recordingFinished.emitSignal(done);
                reply(ControlMessages::reply(id, fields));
            });
}

void Dispatcher::onBatch(const SignalBatch& batch) {
    if (batch.empty())
        return;

    // Captured and inbound events share one timeline that never goes back
    SignalBatch accepted = batch;
    for (auto& ev : accepted) {
        ev.timestampUs = std::max(ev.timestampUs, lastTimestampUs_);
        lastTimestampUs_ = ev.timestampUs;
    }
    recordedSignals_.insert(
            recordedSignals_.end(), accepted.begin(), accepted.end());
    signalBatch.emitSignal(accepted);
}

} // namespace smu
