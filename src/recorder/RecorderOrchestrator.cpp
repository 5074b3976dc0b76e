#include "RecorderOrchestrator.hpp"
#include <QFuture>
#include <QList>
#include "capture/CapabilityNegotiator.hpp"
#include "core/Logger.hpp"

namespace smu {

namespace {
QFuture<ArtifactList> readyFuture(ArtifactList artifacts) {
    QPromise<ArtifactList> promise;
    promise.start();
    promise.addResult(std::move(artifacts));
    promise.finish();
    return promise.future();
}
} // namespace

OrchestratorSettings OrchestratorSettings::fromConfig(
        const RecordingConfig& recording,
        const DisplayConfig& display,
        const MicrophoneConfig& microphone,
        const CameraConfig& camera) {
    OrchestratorSettings s;
    s.chunkInterval = std::chrono::milliseconds(recording.chunkIntervalMs);
    s.stopTimeout = std::chrono::milliseconds(recording.stopTimeoutMs);
    s.videoMimeTypes = recording.videoMimeTypes;
    s.audioMimeTypes = recording.audioMimeTypes;
    s.display = {display.bitrate, microphone.bitrate};
    s.microphone = {0, microphone.bitrate};
    s.camera = {camera.bitrate, microphone.bitrate};
    return s;
}

RecorderOrchestrator::RecorderOrchestrator(ChannelAcquirer& acquirer,
                                           RecorderFactory& factory,
                                           OrchestratorSettings settings,
                                           QObject* parent)
    : QObject(parent),
      acquirer_(acquirer),
      factory_(factory),
      settings_(std::move(settings)) {
    stopTimer_.setSingleShot(true);
    connect(&stopTimer_, &QTimer::timeout, this, [this] {
        if (state() == SessionState::Stopping) {
            LOG_WARN("Stop timed out after {} ms, finalizing with collected "
                     "chunks",
                     settings_.stopTimeout.count());
            finalize(true);
        }
    });
}

RecorderOrchestrator::~RecorderOrchestrator() {
    stopTimer_.stop();
    if (session_) {
        for (auto& [kind, channel] : session_->channels) {
            if (auto* rec = channel->recorder()) {
                rec->disconnect(this);
                rec->stop();
            }
            channel->releaseStream();
        }
    }
    if (stopPromise_) {
        stopPromise_->finish();
    }
}

void RecorderOrchestrator::setState(SessionState state) {
    if (session_)
        session_->state = state;
    LOG_DEBUG("Session state -> {}", toString(state));
    stateChanged.emitSignal(state);
}

const RecorderOptions& RecorderOrchestrator::optionsFor(
        ChannelKind kind) const {
    switch (kind) {
    case ChannelKind::Microphone:
        return settings_.microphone;
    case ChannelKind::Camera:
        return settings_.camera;
    case ChannelKind::Display:
        break;
    }
    return settings_.display;
}

Result<void> RecorderOrchestrator::start(const CaptureRequest& request) {
    if (session_) {
        return Result<void>::err("Already recording", ErrorCode::InvalidState);
    }

    session_ = std::make_unique<CaptureSession>();
    session_->id = nextSessionId_++;
    setState(SessionState::Starting);

    auto acquired = acquirer_.acquire(request);
    if (!acquired) {
        session_.reset();
        setState(SessionState::Idle);
        return Result<void>::err(acquired.error());
    }

    auto& streams = *acquired;
    createChannel(ChannelKind::Display, std::move(streams.display));
    if (streams.microphone)
        createChannel(ChannelKind::Microphone, std::move(streams.microphone));
    if (streams.camera)
        createChannel(ChannelKind::Camera, std::move(streams.camera));

    // One reference instant for every channel and for interaction signals
    session_->startedAtMonotonic = Clock::now();
    for (auto& [kind, channel] : session_->channels) {
        if (auto* rec = channel->recorder())
            rec->start(settings_.chunkInterval);
    }

    setState(SessionState::Recording);
    LOG_INFO("Recording started with {} channel(s)", session_->channels.size());
    return Result<void>::ok();
}

void RecorderOrchestrator::createChannel(ChannelKind kind,
                                         std::unique_ptr<MediaStream> stream) {
    const auto& candidates = isVideoChannel(kind) ? settings_.videoMimeTypes
                                                  : settings_.audioMimeTypes;
    auto negotiated = CapabilityNegotiator::negotiate(
            candidates,
            [this](const std::string& mime) {
                return factory_.isEncodingSupported(mime);
            });
    if (negotiated.empty()) {
        LOG_WARN("{}: no preferred encoding supported ({}), using platform "
                 "default",
                 toString(kind),
                 toString(ErrorCode::EncodingUnsupported));
    } else {
        LOG_DEBUG("{}: negotiated {}", toString(kind), negotiated);
    }

    auto channel =
            std::make_unique<MediaChannel>(kind, std::move(stream), negotiated);

    auto profile = EncodingProfile::resolve(negotiated, kind);
    if (!profile) {
        LOG_WARN("{}: {} ({})",
                 toString(kind),
                 profile.error().message,
                 toString(ErrorCode::RecorderFault));
        channel->markFaulted(QString::fromStdString(profile.error().message));
    } else {
        auto recorder = factory_.create(
                kind, channel->stream(), *profile, optionsFor(kind));
        if (!recorder) {
            LOG_WARN("{}: recorder unavailable: {} ({})",
                     toString(kind),
                     recorder.error().message,
                     toString(ErrorCode::RecorderFault));
            channel->markFaulted(
                    QString::fromStdString(recorder.error().message));
        } else {
            channel->setRecorder(std::move(*recorder));
            bindRecorder(*channel);
        }
    }

    session_->channels.emplace(kind, std::move(channel));
}

void RecorderOrchestrator::bindRecorder(MediaChannel& channel) {
    auto* rec = channel.recorder();
    const u64 id = session_->id;
    const ChannelKind kind = channel.kind();

    auto channelFor = [this, id, kind]() -> MediaChannel* {
        if (!session_ || session_->id != id)
            return nullptr;
        return session_->channel(kind);
    };

    connect(rec,
            &RecorderPrimitive::dataAvailable,
            this,
            [this, channelFor](const QByteArray& chunk) {
                auto* ch = channelFor();
                if (!ch)
                    return;
                auto s = state();
                if (s == SessionState::Recording || s == SessionState::Paused ||
                    s == SessionState::Stopping) {
                    ch->appendChunk(chunk);
                }
            });

    connect(rec,
            &RecorderPrimitive::faulted,
            this,
            [channelFor, kind](const QString& message) {
                auto* ch = channelFor();
                if (!ch)
                    return;
                LOG_WARN("{} channel stopped producing ({}): {}",
                         toString(kind),
                         toString(ErrorCode::RecorderFault),
                         message.toStdString());
                ch->markFaulted(message);
            });

    connect(rec, &RecorderPrimitive::stopped, this, [channelFor] {
        if (auto* ch = channelFor())
            ch->markStopped();
    });
}

Result<void> RecorderOrchestrator::pause() {
    if (state() != SessionState::Recording) {
        return Result<void>::err("Not recording", ErrorCode::InvalidState);
    }
    for (auto& [kind, channel] : session_->channels) {
        auto* rec = channel->recorder();
        if (rec && rec->state() == RecorderState::Recording)
            rec->pause();
    }
    session_->pausedAt = Clock::now();
    setState(SessionState::Paused);
    return Result<void>::ok();
}

Result<void> RecorderOrchestrator::resume() {
    if (state() != SessionState::Paused) {
        return Result<void>::err("Not paused", ErrorCode::InvalidState);
    }
    for (auto& [kind, channel] : session_->channels) {
        auto* rec = channel->recorder();
        if (rec && rec->state() == RecorderState::Paused)
            rec->resume();
    }
    if (session_->pausedAt) {
        session_->pausedTotal += std::chrono::duration_cast<Duration>(
                Clock::now() - *session_->pausedAt);
        session_->pausedAt.reset();
    }
    setState(SessionState::Recording);
    return Result<void>::ok();
}

QFuture<ArtifactList> RecorderOrchestrator::stop() {
    auto s = state();
    if (s != SessionState::Recording && s != SessionState::Paused) {
        LOG_WARN("Stop ignored in state {}", toString(s));
        return readyFuture({});
    }

    setState(SessionState::Stopping);
    stopPromise_ = std::make_shared<QPromise<ArtifactList>>();
    stopPromise_->start();
    auto future = stopPromise_->future();

    QList<QFuture<void>> completions;
    for (auto& [kind, channel] : session_->channels) {
        completions.append(channel->stopAsync());
    }

    if (completions.isEmpty()) {
        finalize(false);
        return future;
    }

    stopTimer_.start(settings_.stopTimeout);

    const u64 id = session_->id;
    QtFuture::whenAll(completions.begin(), completions.end())
            .then(this, [this, id](const QList<QFuture<void>>&) {
                // Leave the recorder's signal emission before tearing down
                QMetaObject::invokeMethod(
                        this,
                        [this, id] {
                            if (session_ && session_->id == id &&
                                session_->state == SessionState::Stopping) {
                                finalize(false);
                            }
                        },
                        Qt::QueuedConnection);
            });

    return future;
}

void RecorderOrchestrator::finalize(bool forced) {
    stopTimer_.stop();

    for (auto& [kind, channel] : session_->channels) {
        if (forced && !channel->isStopped()) {
            LOG_WARN("{} channel did not complete in time", toString(kind));
        }
        if (auto* rec = channel->recorder())
            rec->disconnect(this);
    }

    auto artifacts = ArtifactAssembler::assembleAll(*session_);
    for (const auto& artifact : artifacts) {
        LOG_INFO("{} artifact: {} bytes ({})",
                 toString(artifact.channelKind),
                 artifact.byteSize,
                 artifact.mimeType.toStdString());
    }

    for (auto& [kind, channel] : session_->channels) {
        channel->releaseStream();
    }

    // A recorder still encoding would block the event loop when destroyed
    if (forced) {
        for (auto& [kind, channel] : session_->channels) {
            if (channel->recorder() && !channel->isStopped())
                retireLagging(std::move(channel));
        }
        std::erase_if(session_->channels,
                      [](const auto& entry) { return !entry.second; });
    }

    setState(SessionState::Stopped);

    auto promise = std::move(stopPromise_);
    auto session = std::move(session_);
    setState(SessionState::Idle);

    session.reset();

    if (promise) {
        promise->addResult(std::move(artifacts));
        promise->finish();
    }
}

void RecorderOrchestrator::retireLagging(
        std::unique_ptr<MediaChannel> channel) {
    auto* rec = channel->recorder();
    auto* raw = channel.get();
    connect(rec,
            &RecorderPrimitive::stopped,
            this,
            [this, raw] {
                LOG_DEBUG("{} recorder finished after the session ended",
                          toString(raw->kind()));
                std::erase_if(lagging_, [raw](const auto& c) {
                    return c.get() == raw;
                });
            },
            Qt::QueuedConnection);
    lagging_.push_back(std::move(channel));
}

std::optional<TimePoint> RecorderOrchestrator::startedAt() const {
    if (!session_ || session_->state == SessionState::Starting)
        return std::nullopt;
    return session_->startedAtMonotonic;
}

Duration RecorderOrchestrator::elapsed() const {
    if (!session_ || session_->state == SessionState::Starting)
        return Duration{0};
    return session_->activeDuration(Clock::now());
}

std::vector<ChannelKind> RecorderOrchestrator::activeChannels() const {
    std::vector<ChannelKind> out;
    if (session_) {
        for (const auto& [kind, channel] : session_->channels)
            out.push_back(kind);
    }
    return out;
}

} // namespace smu
