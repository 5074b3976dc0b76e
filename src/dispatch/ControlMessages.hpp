/**
 * @file ControlMessages.hpp
 * @brief JSON wire format of the control channel.
 *
 * Every message is one JSON object per line with a "type" field. Requests
 * may carry an "id" which is echoed in the matching REPLY. Outgoing
 * messages are REPLY, SIGNAL_BATCH and RECORDING_ARTIFACT.
 *
 * @section Dependencies
 * - Qt6 Core (QJsonDocument, QJsonObject, QJsonArray)
 */

#pragma once
#include <QByteArray>
#include <QJsonObject>
#include <QJsonValue>
#include <optional>
#include <string_view>
#include <vector>
#include "capture/CaptureTypes.hpp"
#include "interaction/SignalTypes.hpp"
#include "recorder/ArtifactAssembler.hpp"
#include "util/Result.hpp"

namespace smu {

enum class MessageType {
    StartCapture,
    PauseCapture,
    ResumeCapture,
    StopCapture,
    SignalBatch,
    PermissionsResult,
    GetStatus
};

std::string_view toString(MessageType type);
std::optional<MessageType> parseMessageType(std::string_view text);

struct ControlMessage {
    MessageType type{MessageType::GetStatus};
    QJsonValue id; // Undefined when the sender did not set one

    // START_CAPTURE
    std::optional<bool> wantMicrophone;
    std::optional<bool> wantCamera;
    std::optional<DisplayIntent> displayIntent;

    // PERMISSIONS_RESULT
    PermissionsResult permissions;

    // SIGNAL_BATCH
    SignalBatch events;
};

struct CaptureStatus {
    bool isRecording{false};
    bool isPaused{false};
    i64 durationMs{0};
    u64 signalCount{0};
    std::vector<ChannelKind> channels;
};

class ControlMessages {
public:
    static Result<ControlMessage> parse(const QByteArray& line);

    static QJsonObject reply(const QJsonValue& id, QJsonObject fields = {});
    static QJsonObject replyError(const QJsonValue& id, const Error& error);

    static QJsonObject status(const CaptureStatus& status);
    static QJsonObject permissionsResult(const PermissionsResult& result);
    static QJsonObject signalBatch(const SignalBatch& batch);
    static QJsonObject artifact(const RecordingArtifact& artifact,
                                bool embedPayload);

    // Metadata only, used in the STOP_CAPTURE reply and recording.json
    static QJsonObject artifactInfo(const RecordingArtifact& artifact);

    static QJsonObject signalEvent(const SignalEvent& event);
    static Result<SignalEvent> parseSignalEvent(const QJsonObject& obj);

    static QByteArray toLine(const QJsonObject& obj);
};

} // namespace smu
