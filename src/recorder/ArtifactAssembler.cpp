#include "ArtifactAssembler.hpp"
#include "CaptureSession.hpp"
#include "MediaChannel.hpp"

namespace smu {

QString RecordingArtifact::toDataUri() const {
    return QStringLiteral("data:") + mimeType + QStringLiteral(";base64,") +
           QString::fromLatin1(payload.toBase64());
}

RecordingArtifact ArtifactAssembler::assemble(MediaChannel& channel) {
    RecordingArtifact artifact;
    artifact.channelKind = channel.kind();

    if (!channel.encoding().empty()) {
        artifact.mimeType = QString::fromStdString(channel.encoding());
    } else if (channel.recorder() && !channel.recorder()->mimeType().isEmpty()) {
        artifact.mimeType = channel.recorder()->mimeType();
    } else {
        artifact.mimeType = isVideoChannel(channel.kind())
                                    ? QStringLiteral("video/webm")
                                    : QStringLiteral("audio/webm");
    }

    auto chunks = channel.takeChunks();
    qsizetype total = 0;
    for (const auto& chunk : chunks)
        total += chunk.size();

    artifact.payload.reserve(total);
    for (const auto& chunk : chunks)
        artifact.payload.append(chunk);
    artifact.byteSize = artifact.payload.size();
    return artifact;
}

std::vector<RecordingArtifact> ArtifactAssembler::assembleAll(
        CaptureSession& session) {
    std::vector<RecordingArtifact> out;
    out.reserve(session.channels.size());
    for (auto& [kind, channel] : session.channels) {
        out.push_back(assemble(*channel));
    }
    return out;
}

} // namespace smu
