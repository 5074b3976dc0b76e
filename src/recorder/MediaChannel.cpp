#include "MediaChannel.hpp"
#include "core/Logger.hpp"

namespace smu {

MediaChannel::MediaChannel(ChannelKind kind,
                           std::unique_ptr<MediaStream> stream,
                           std::string encoding)
    : kind_(kind), stream_(std::move(stream)), encoding_(std::move(encoding)) {
    stopPromise_.start();
}

MediaChannel::~MediaChannel() {
    recorder_.reset();
    markStopped();
    releaseStream();
}

void MediaChannel::appendChunk(const QByteArray& chunk) {
    if (faulted_ || chunk.isEmpty())
        return;
    chunks_.push_back(chunk);
    byteCount_ += chunk.size();
}

std::vector<QByteArray> MediaChannel::takeChunks() {
    std::vector<QByteArray> out;
    out.swap(chunks_);
    byteCount_ = 0;
    return out;
}

void MediaChannel::markFaulted(const QString& reason) {
    if (faulted_)
        return;
    faulted_ = true;
    faultReason_ = reason;
}

QFuture<void> MediaChannel::stopAsync() {
    auto future = stopPromise_.future();
    if (stopRequested_)
        return future;
    stopRequested_ = true;

    if (!recorder_) {
        markStopped();
        return future;
    }
    recorder_->stop();
    return future;
}

void MediaChannel::markStopped() {
    if (stopped_)
        return;
    stopped_ = true;
    stopPromise_.finish();
}

void MediaChannel::releaseStream() {
    if (!stream_ || stream_->isReleased())
        return;
    LOG_DEBUG("Releasing {} stream", toString(kind_));
    stream_->release();
}

} // namespace smu
