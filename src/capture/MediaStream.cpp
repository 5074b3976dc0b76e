#include "MediaStream.hpp"
#include "core/Logger.hpp"

namespace smu {

MediaTrack::MediaTrack(Kind kind, std::string label)
    : kind_(kind), label_(std::move(label)) {
}

void MediaTrack::stop() {
    if (stopped_.exchange(true))
        return;
    LOG_DEBUG("Stopping track '{}'", label_);
    onStop();
}

MediaStream::~MediaStream() {
    release();
}

void MediaStream::addTrack(std::unique_ptr<MediaTrack> track) {
    if (track)
        tracks_.push_back(std::move(track));
}

void MediaStream::release() {
    if (released_)
        return;
    released_ = true;
    for (auto& track : tracks_) {
        track->stop();
    }
}

VideoTrack* MediaStream::videoTrack() const {
    for (const auto& track : tracks_) {
        if (track->kind() == MediaTrack::Kind::Video)
            return static_cast<VideoTrack*>(track.get());
    }
    return nullptr;
}

AudioTrack* MediaStream::audioTrack() const {
    for (const auto& track : tracks_) {
        if (track->kind() == MediaTrack::Kind::Audio)
            return static_cast<AudioTrack*>(track.get());
    }
    return nullptr;
}

} // namespace smu
