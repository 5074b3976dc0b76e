/**
 * @file ArtifactAssembler.hpp
 * @brief Turns a stopped channel's chunks into one deliverable payload.
 *
 * Chunks are concatenated in arrival order. A channel that produced nothing
 * still yields an artifact with byteSize 0. Assembly clears the channel's
 * chunk list.
 */

#pragma once
#include <QByteArray>
#include <QString>
#include <vector>
#include "capture/CaptureTypes.hpp"

namespace smu {

class MediaChannel;
struct CaptureSession;

struct RecordingArtifact {
    ChannelKind channelKind{ChannelKind::Display};
    QByteArray payload;
    QString mimeType;
    qint64 byteSize{0};

    // data:<mime>;base64,<payload>
    QString toDataUri() const;
};

class ArtifactAssembler {
public:
    static RecordingArtifact assemble(MediaChannel& channel);

    // Display first, then microphone, then camera
    static std::vector<RecordingArtifact> assembleAll(CaptureSession& session);
};

} // namespace smu
