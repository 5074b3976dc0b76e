/**
 * @file EncodingProfile.hpp
 * @brief Maps MIME encodings onto FFmpeg muxers and encoders.
 *
 * "video/webm;codecs=vp9" becomes the webm muxer with libvpx-vp9 for video
 * and libopus for any audio track. Codecs missing from the MIME string are
 * filled in from the container's usual pairing.
 *
 * @section Dependencies
 * - FFmpeg (libavformat, libavcodec) for the support probe
 */

#pragma once
#include <string>
#include <string_view>
#include "capture/CaptureTypes.hpp"
#include "util/Result.hpp"

namespace smu {

struct EncodingProfile {
    std::string mimeType;
    std::string container; // FFmpeg muxer short name
    std::string videoEncoder;
    std::string audioEncoder;

    bool hasVideo() const {
        return !videoEncoder.empty();
    }

    static Result<EncodingProfile> fromMimeType(std::string_view mime);

    // Used when negotiation found nothing supported
    static EncodingProfile platformDefault(ChannelKind kind);

    // Resolves "" to the platform default for the channel kind
    static Result<EncodingProfile> resolve(std::string_view negotiated,
                                           ChannelKind kind);

    // True when the muxer and every named encoder are compiled into FFmpeg
    static bool isSupportedByFFmpeg(std::string_view mime);
};

// webm, mp4, ogg, mkv; falls back to "bin"
std::string fileExtensionFor(std::string_view mime);

} // namespace smu
