/**
 * @file RecorderOrchestrator.hpp
 * @brief Capture session state machine.
 *
 * Idle -> Starting -> Recording <-> Paused -> Stopping -> Stopped -> Idle
 *
 * start() acquires the channels, negotiates an encoding per channel, binds
 * one recorder to each and starts them all with the same timeslice right
 * after taking the session's reference timestamp. stop() fans out to every
 * recorder and joins their completion futures; a bounded timer finalizes
 * with whatever was collected if a recorder never reports back.
 *
 * All methods must be called on the thread that owns the orchestrator.
 * Recorder notifications are delivered there through queued connections.
 *
 * @section Dependencies
 * - ChannelAcquirer, CapabilityNegotiator
 * - RecorderFactory, ArtifactAssembler
 * - Qt6 Core (QFuture, QPromise, QTimer)
 *
 * @section Patterns
 * - State Machine: explicit SessionState with guarded transitions.
 * - Fan-out / Join: per-channel futures joined with QtFuture::whenAll.
 */

#pragma once
#include <QFuture>
#include <QObject>
#include <QPromise>
#include <QTimer>
#include <chrono>
#include <memory>
#include <optional>
#include <vector>
#include "ArtifactAssembler.hpp"
#include "CaptureSession.hpp"
#include "RecorderFactory.hpp"
#include "capture/ChannelAcquirer.hpp"
#include "core/ConfigData.hpp"
#include "util/Result.hpp"
#include "util/Signal.hpp"

namespace smu {

struct OrchestratorSettings {
    std::chrono::milliseconds chunkInterval{100};
    std::chrono::milliseconds stopTimeout{5000};
    std::vector<std::string> videoMimeTypes{RecordingConfig{}.videoMimeTypes};
    std::vector<std::string> audioMimeTypes{RecordingConfig{}.audioMimeTypes};
    RecorderOptions display{5000000, 128000};
    RecorderOptions microphone{0, 128000};
    RecorderOptions camera{2000000, 128000};

    static OrchestratorSettings fromConfig(const RecordingConfig& recording,
                                           const DisplayConfig& display,
                                           const MicrophoneConfig& microphone,
                                           const CameraConfig& camera);
};

using ArtifactList = std::vector<RecordingArtifact>;

class RecorderOrchestrator : public QObject {
    Q_OBJECT

public:
    RecorderOrchestrator(ChannelAcquirer& acquirer,
                         RecorderFactory& factory,
                         OrchestratorSettings settings,
                         QObject* parent = nullptr);
    ~RecorderOrchestrator() override;

    Result<void> start(const CaptureRequest& request);
    Result<void> pause();
    Result<void> resume();

    // Resolves once every channel completed or the stop timeout fired.
    // Returns an already finished, empty future when not recording.
    QFuture<ArtifactList> stop();

    SessionState state() const {
        return session_ ? session_->state : SessionState::Idle;
    }
    bool isActive() const {
        auto s = state();
        return s != SessionState::Idle && s != SessionState::Stopped;
    }
    std::optional<TimePoint> startedAt() const;
    Duration elapsed() const;
    std::vector<ChannelKind> activeChannels() const;
    const CaptureSession* session() const {
        return session_.get();
    }
    // Channels cut off by the stop timeout whose recorder has not stopped yet
    usize laggingChannelCount() const {
        return lagging_.size();
    }

    void setSettings(OrchestratorSettings settings) {
        settings_ = std::move(settings);
    }

    Signal<SessionState> stateChanged;

private:
    void setState(SessionState state);
    void createChannel(ChannelKind kind, std::unique_ptr<MediaStream> stream);
    void bindRecorder(MediaChannel& channel);
    const RecorderOptions& optionsFor(ChannelKind kind) const;
    void finalize(bool forced);
    void retireLagging(std::unique_ptr<MediaChannel> channel);

    ChannelAcquirer& acquirer_;
    RecorderFactory& factory_;
    OrchestratorSettings settings_;

    std::unique_ptr<CaptureSession> session_;
    u64 nextSessionId_{1};
    std::vector<std::unique_ptr<MediaChannel>> lagging_;

    std::shared_ptr<QPromise<ArtifactList>> stopPromise_;
    QTimer stopTimer_;
};

} // namespace smu
