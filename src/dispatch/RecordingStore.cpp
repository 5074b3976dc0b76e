#include "RecordingStore.hpp"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <cctype>
#include "core/Logger.hpp"
#include "recorder/EncodingProfile.hpp"
#include "util/FileUtils.hpp"

namespace smu {

RecordingStore::RecordingStore(fs::path directory)
    : directory_(std::move(directory)) {}

std::string RecordingStore::fileNameFor(const RecordingArtifact& artifact) {
    std::string name(toString(artifact.channelKind));
    for (auto& c : name)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return name + "." + fileExtensionFor(artifact.mimeType.toStdString());
}

QByteArray RecordingStore::manifest(const CompletedRecording& recording) {
    QJsonArray artifacts;
    for (const auto& artifact : recording.artifacts) {
        QJsonObject info = ControlMessages::artifactInfo(artifact);
        info["file"] = QString::fromStdString(fileNameFor(artifact));
        artifacts.append(info);
    }

    QJsonArray events;
    for (const auto& ev : recording.events)
        events.append(ControlMessages::signalEvent(ev));

    QJsonObject root;
    root["version"] = 1;
    root["createdAt"] = recording.createdAt.toString(Qt::ISODateWithMs);
    root["durationMs"] = static_cast<qint64>(recording.durationMs);
    root["artifacts"] = artifacts;
    root["signals"] = events;
    return QJsonDocument(root).toJson(QJsonDocument::Indented);
}

fs::path RecordingStore::uniqueSessionDir(
        const CompletedRecording& recording) const {
    QDateTime created = recording.createdAt.isValid()
                                ? recording.createdAt
                                : QDateTime::currentDateTimeUtc();
    std::string stem = created.toLocalTime()
                               .toString(QStringLiteral("yyyyMMdd-HHmmss"))
                               .toStdString();

    fs::path dir = directory_ / stem;
    std::error_code ec;
    for (int n = 2; fs::exists(dir, ec); ++n) {
        dir = directory_ / (stem + "-" + std::to_string(n));
    }
    return dir;
}

Result<fs::path> RecordingStore::save(const CompletedRecording& recording) {
    fs::path dir = uniqueSessionDir(recording);
    if (!file::ensureDir(dir)) {
        return Result<fs::path>::err(
                "Cannot create recording directory " + dir.string(),
                ErrorCode::IoError);
    }

    for (const auto& artifact : recording.artifacts) {
        fs::path target = dir / fileNameFor(artifact);
        auto written = file::writeAtomic(
                target,
                std::string_view(artifact.payload.constData(),
                                 static_cast<usize>(artifact.payload.size())));
        if (!written)
            return Result<fs::path>::err(written.error());
    }

    QByteArray json = manifest(recording);
    auto written = file::writeAtomic(
            dir / "recording.json",
            std::string_view(json.constData(), static_cast<usize>(json.size())));
    if (!written)
        return Result<fs::path>::err(written.error());

    LOG_INFO("Recording saved to {}", dir.string());
    return Result<fs::path>::ok(dir);
}

} // namespace smu
