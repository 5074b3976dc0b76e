#include "ControlMessages.hpp"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <algorithm>
#include <array>
#include <initializer_list>
#include <utility>

namespace smu {

namespace {

constexpr std::array<std::pair<MessageType, std::string_view>, 7> kTypeNames{{
        {MessageType::StartCapture, "START_CAPTURE"},
        {MessageType::PauseCapture, "PAUSE_CAPTURE"},
        {MessageType::ResumeCapture, "RESUME_CAPTURE"},
        {MessageType::StopCapture, "STOP_CAPTURE"},
        {MessageType::SignalBatch, "SIGNAL_BATCH"},
        {MessageType::PermissionsResult, "PERMISSIONS_RESULT"},
        {MessageType::GetStatus, "GET_STATUS"},
}};

std::optional<SignalKind> parseSignalKind(const QString& text) {
    static constexpr std::array kKinds{SignalKind::PointerMove,
                                       SignalKind::PointerEnter,
                                       SignalKind::PointerLeave,
                                       SignalKind::Click,
                                       SignalKind::FocusChange,
                                       SignalKind::Scroll};
    for (auto kind : kKinds) {
        auto name = toString(kind);
        if (text == QLatin1String(name.data(), static_cast<int>(name.size())))
            return kind;
    }
    return std::nullopt;
}

f32 unit(double v) {
    return std::clamp(static_cast<f32>(v), 0.0f, 1.0f);
}

QString qstr(std::string_view s) {
    return QString::fromUtf8(s.data(), static_cast<qsizetype>(s.size()));
}

std::optional<bool> optionalBool(const QJsonObject& obj,
                                 std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto v = obj.value(QLatin1String(key));
        if (v.isBool())
            return v.toBool();
    }
    return std::nullopt;
}

} // namespace

std::string_view toString(MessageType type) {
    for (const auto& [t, name] : kTypeNames) {
        if (t == type)
            return name;
    }
    return "GET_STATUS";
}

std::optional<MessageType> parseMessageType(std::string_view text) {
    for (const auto& [t, name] : kTypeNames) {
        if (name == text)
            return t;
    }
    return std::nullopt;
}

Result<ControlMessage> ControlMessages::parse(const QByteArray& line) {
    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(line, &parseError);
    if (doc.isNull()) {
        return Result<ControlMessage>::err(
                "Malformed message: " + parseError.errorString().toStdString(),
                ErrorCode::ParseError);
    }
    if (!doc.isObject()) {
        return Result<ControlMessage>::err("Message is not a JSON object",
                                           ErrorCode::ParseError);
    }

    QJsonObject obj = doc.object();
    std::string typeName = obj["type"].toString().toStdString();
    auto type = parseMessageType(typeName);
    if (!type) {
        return Result<ControlMessage>::err(
                "Unknown message type '" + typeName + "'",
                ErrorCode::InvalidArgument);
    }

    ControlMessage msg;
    msg.type = *type;
    if (obj.contains("id"))
        msg.id = obj["id"];

    switch (msg.type) {
    case MessageType::StartCapture: {
        msg.wantMicrophone = optionalBool(obj, {"wantMicrophone"});
        msg.wantCamera = optionalBool(obj, {"wantCamera"});
        if (obj.contains("displayIntent")) {
            auto text = obj["displayIntent"].toString().toStdString();
            msg.displayIntent = parseDisplayIntent(text);
            if (!msg.displayIntent) {
                return Result<ControlMessage>::err(
                        "Invalid displayIntent '" + text + "'",
                        ErrorCode::InvalidArgument);
            }
        }
        break;
    }
    case MessageType::PermissionsResult:
        msg.permissions.hasMicrophone =
                optionalBool(obj, {"hasMicrophone", "hasMic"}).value_or(false);
        msg.permissions.hasCamera =
                optionalBool(obj, {"hasCamera"}).value_or(false);
        break;
    case MessageType::SignalBatch: {
        QJsonArray events = obj["events"].toArray();
        if (events.isEmpty())
            events = obj["signals"].toArray();
        for (const auto& item : events) {
            auto ev = parseSignalEvent(item.toObject());
            if (!ev)
                return Result<ControlMessage>::err(ev.error());
            msg.events.push_back(*ev);
        }
        break;
    }
    default:
        break;
    }

    return Result<ControlMessage>::ok(std::move(msg));
}

QJsonObject ControlMessages::reply(const QJsonValue& id, QJsonObject fields) {
    fields["type"] = QStringLiteral("REPLY");
    fields["success"] = true;
    if (!id.isUndefined())
        fields["id"] = id;
    return fields;
}

QJsonObject ControlMessages::replyError(const QJsonValue& id,
                                        const Error& error) {
    QJsonObject obj;
    obj["type"] = QStringLiteral("REPLY");
    obj["success"] = false;
    obj["error"] = QString::fromStdString(error.message);
    obj["code"] = qstr(toString(error.code));
    if (!id.isUndefined())
        obj["id"] = id;
    return obj;
}

QJsonObject ControlMessages::status(const CaptureStatus& status) {
    QJsonArray channels;
    for (auto kind : status.channels)
        channels.append(qstr(toString(kind)));

    QJsonObject obj;
    obj["isRecording"] = status.isRecording;
    obj["isPaused"] = status.isPaused;
    obj["durationMs"] = static_cast<qint64>(status.durationMs);
    obj["signalCount"] = static_cast<qint64>(status.signalCount);
    obj["channels"] = channels;
    return obj;
}

QJsonObject ControlMessages::permissionsResult(
        const PermissionsResult& result) {
    QJsonObject obj;
    obj["type"] = QStringLiteral("PERMISSIONS_RESULT");
    obj["hasMicrophone"] = result.hasMicrophone;
    obj["hasCamera"] = result.hasCamera;
    return obj;
}

QJsonObject ControlMessages::signalBatch(const SignalBatch& batch) {
    QJsonArray events;
    for (const auto& ev : batch)
        events.append(signalEvent(ev));

    QJsonObject obj;
    obj["type"] = QStringLiteral("SIGNAL_BATCH");
    obj["events"] = events;
    return obj;
}

QJsonObject ControlMessages::artifactInfo(const RecordingArtifact& artifact) {
    QJsonObject obj;
    obj["channelKind"] = qstr(toString(artifact.channelKind));
    obj["mimeType"] = artifact.mimeType;
    obj["byteSize"] = artifact.byteSize;
    return obj;
}

QJsonObject ControlMessages::artifact(const RecordingArtifact& artifact,
                                      bool embedPayload) {
    QJsonObject obj = artifactInfo(artifact);
    obj["type"] = QStringLiteral("RECORDING_ARTIFACT");
    if (embedPayload)
        obj["encodedPayload"] = artifact.toDataUri();
    return obj;
}

QJsonObject ControlMessages::signalEvent(const SignalEvent& event) {
    QJsonObject obj;
    obj["kind"] = qstr(toString(event.kind));
    obj["timestampUs"] = static_cast<qint64>(event.timestampUs);

    switch (event.kind) {
    case SignalKind::PointerMove:
        obj["x"] = event.position.x;
        obj["y"] = event.position.y;
        obj["velocityX"] = event.velocity.x;
        obj["velocityY"] = event.velocity.y;
        break;
    case SignalKind::PointerEnter:
    case SignalKind::PointerLeave:
        obj["x"] = event.position.x;
        obj["y"] = event.position.y;
        break;
    case SignalKind::Click:
        obj["x"] = event.position.x;
        obj["y"] = event.position.y;
        obj["button"] = event.button;
        break;
    case SignalKind::FocusChange:
        obj["x"] = event.position.x;
        obj["y"] = event.position.y;
        if (event.bounds) {
            QJsonObject bounds;
            bounds["x"] = event.bounds->x;
            bounds["y"] = event.bounds->y;
            bounds["width"] = event.bounds->width;
            bounds["height"] = event.bounds->height;
            obj["bounds"] = bounds;
        }
        break;
    case SignalKind::Scroll:
        obj["x"] = event.position.x;
        obj["y"] = event.position.y;
        obj["deltaY"] = event.delta;
        break;
    }
    return obj;
}

Result<SignalEvent> ControlMessages::parseSignalEvent(const QJsonObject& obj) {
    auto kind = parseSignalKind(obj["kind"].toString());
    if (!kind) {
        return Result<SignalEvent>::err(
                "Unknown signal kind '" +
                        obj["kind"].toString().toStdString() + "'",
                ErrorCode::ParseError);
    }

    SignalEvent ev;
    ev.kind = *kind;
    ev.timestampUs = std::max<i64>(obj["timestampUs"].toInteger(), 0);
    ev.position = {unit(obj["x"].toDouble(0.5)), unit(obj["y"].toDouble(0.5))};
    ev.velocity = {static_cast<f32>(obj["velocityX"].toDouble()),
                   static_cast<f32>(obj["velocityY"].toDouble())};
    ev.button = obj["button"].toInt(-1);
    ev.delta = static_cast<f32>(obj["deltaY"].toDouble());
    if (obj["bounds"].isObject()) {
        QJsonObject b = obj["bounds"].toObject();
        RectF r;
        r.x = unit(b["x"].toDouble());
        r.y = unit(b["y"].toDouble());
        r.width = std::clamp(
                static_cast<f32>(b["width"].toDouble()), 0.0f, 1.0f - r.x);
        r.height = std::clamp(
                static_cast<f32>(b["height"].toDouble()), 0.0f, 1.0f - r.y);
        ev.bounds = r;
    }
    return Result<SignalEvent>::ok(ev);
}

QByteArray ControlMessages::toLine(const QJsonObject& obj) {
    QByteArray line = QJsonDocument(obj).toJson(QJsonDocument::Compact);
    line.append('\n');
    return line;
}

} // namespace smu
