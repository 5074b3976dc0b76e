/**
 * @file MediaChannel.hpp
 * @brief One recordable source inside a capture session.
 *
 * Owns the acquired stream, the recorder bound to it and the ordered list
 * of chunks that recorder produced. The stream is released exactly once.
 * Stop completion is exposed as a QFuture so the orchestrator can join
 * channels in any order.
 */

#pragma once
#include <QByteArray>
#include <QFuture>
#include <QPromise>
#include <QString>
#include <memory>
#include <string>
#include <vector>
#include "RecorderPrimitive.hpp"
#include "capture/CaptureTypes.hpp"
#include "capture/MediaStream.hpp"

namespace smu {

class MediaChannel {
public:
    MediaChannel(ChannelKind kind,
                 std::unique_ptr<MediaStream> stream,
                 std::string encoding);
    ~MediaChannel();

    MediaChannel(const MediaChannel&) = delete;
    MediaChannel& operator=(const MediaChannel&) = delete;

    ChannelKind kind() const {
        return kind_;
    }
    MediaStream& stream() {
        return *stream_;
    }
    // Negotiated encoding; empty means the platform default
    const std::string& encoding() const {
        return encoding_;
    }

    void setRecorder(std::unique_ptr<RecorderPrimitive> recorder) {
        recorder_ = std::move(recorder);
    }
    RecorderPrimitive* recorder() const {
        return recorder_.get();
    }

    // Empty chunks are dropped; nothing is appended after a fault
    void appendChunk(const QByteArray& chunk);
    const std::vector<QByteArray>& chunks() const {
        return chunks_;
    }
    std::vector<QByteArray> takeChunks();
    qint64 byteCount() const {
        return byteCount_;
    }

    void markFaulted(const QString& reason);
    bool isFaulted() const {
        return faulted_;
    }
    const QString& faultReason() const {
        return faultReason_;
    }

    // Asks the recorder to stop; the future finishes on its stopped() signal
    QFuture<void> stopAsync();
    void markStopped();
    bool isStopped() const {
        return stopped_;
    }

    void releaseStream();
    bool isStreamReleased() const {
        return stream_->isReleased();
    }

private:
    ChannelKind kind_;
    std::unique_ptr<MediaStream> stream_;
    std::string encoding_;
    // Declared after stream_ so the recorder goes first
    std::unique_ptr<RecorderPrimitive> recorder_;

    std::vector<QByteArray> chunks_;
    qint64 byteCount_{0};

    bool faulted_{false};
    QString faultReason_;

    QPromise<void> stopPromise_;
    bool stopRequested_{false};
    bool stopped_{false};
};

} // namespace smu
