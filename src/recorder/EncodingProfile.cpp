#include "EncodingProfile.hpp"
#include <algorithm>
#include <cctype>
#include <optional>
#include <vector>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
}

namespace smu {

namespace {

struct ParsedMime {
    bool video{false};
    std::string container;
    std::string videoEncoder;
    std::string audioEncoder;
    bool audioNamed{false};
};

std::string trim(std::string_view s) {
    auto begin = s.find_first_not_of(" \t\"'");
    if (begin == std::string_view::npos)
        return {};
    auto end = s.find_last_not_of(" \t\"'");
    return std::string(s.substr(begin, end - begin + 1));
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

std::vector<std::string> split(std::string_view s, char sep) {
    std::vector<std::string> out;
    usize pos = 0;
    while (pos <= s.size()) {
        auto next = s.find(sep, pos);
        if (next == std::string_view::npos)
            next = s.size();
        auto part = trim(s.substr(pos, next - pos));
        if (!part.empty())
            out.push_back(std::move(part));
        pos = next + 1;
    }
    return out;
}

std::optional<std::string> containerFor(std::string_view subtype) {
    if (subtype == "webm")
        return "webm";
    if (subtype == "mp4")
        return "mp4";
    if (subtype == "ogg")
        return "ogg";
    if (subtype == "x-matroska")
        return "matroska";
    return std::nullopt;
}

struct CodecMapping {
    bool video;
    std::string encoder;
};

std::optional<CodecMapping> encoderFor(const std::string& codec) {
    if (codec == "vp9" || codec.starts_with("vp09"))
        return CodecMapping{true, "libvpx-vp9"};
    if (codec == "vp8" || codec.starts_with("vp08"))
        return CodecMapping{true, "libvpx"};
    if (codec == "h264" || codec.starts_with("avc1"))
        return CodecMapping{true, "libx264"};
    if (codec == "opus")
        return CodecMapping{false, "libopus"};
    if (codec == "vorbis")
        return CodecMapping{false, "libvorbis"};
    if (codec == "aac" || codec.starts_with("mp4a"))
        return CodecMapping{false, "aac"};
    return std::nullopt;
}

std::string defaultVideoEncoder(const std::string& container) {
    if (container == "webm")
        return "libvpx";
    if (container == "ogg")
        return "libtheora";
    return "libx264";
}

std::string defaultAudioEncoder(const std::string& container) {
    return container == "mp4" ? "aac" : "libopus";
}

Result<ParsedMime> parseMime(std::string_view mime) {
    auto params = split(mime, ';');
    if (params.empty()) {
        return Result<ParsedMime>::err("Empty MIME type",
                                       ErrorCode::InvalidArgument);
    }

    auto essence = lower(params.front());
    auto slash = essence.find('/');
    if (slash == std::string::npos) {
        return Result<ParsedMime>::err("Malformed MIME type: " + essence,
                                       ErrorCode::InvalidArgument);
    }

    ParsedMime parsed;
    auto type = essence.substr(0, slash);
    if (type != "video" && type != "audio") {
        return Result<ParsedMime>::err("Not a media MIME type: " + essence,
                                       ErrorCode::EncodingUnsupported);
    }
    parsed.video = type == "video";

    auto container = containerFor(essence.substr(slash + 1));
    if (!container) {
        return Result<ParsedMime>::err("Unknown container: " + essence,
                                       ErrorCode::EncodingUnsupported);
    }
    parsed.container = *container;

    for (usize i = 1; i < params.size(); ++i) {
        auto eq = params[i].find('=');
        if (eq == std::string::npos)
            continue;
        if (lower(trim(params[i].substr(0, eq))) != "codecs")
            continue;

        for (const auto& codec : split(params[i].substr(eq + 1), ',')) {
            auto mapping = encoderFor(lower(codec));
            if (!mapping) {
                return Result<ParsedMime>::err("Unknown codec: " + codec,
                                               ErrorCode::EncodingUnsupported);
            }
            if (mapping->video) {
                if (!parsed.video) {
                    return Result<ParsedMime>::err(
                            "Video codec in audio MIME type: " + codec,
                            ErrorCode::EncodingUnsupported);
                }
                parsed.videoEncoder = mapping->encoder;
            } else {
                parsed.audioEncoder = mapping->encoder;
                parsed.audioNamed = true;
            }
        }
    }

    if (parsed.video && parsed.videoEncoder.empty())
        parsed.videoEncoder = defaultVideoEncoder(parsed.container);
    if (parsed.audioEncoder.empty())
        parsed.audioEncoder = defaultAudioEncoder(parsed.container);

    return Result<ParsedMime>::ok(std::move(parsed));
}

} // namespace

Result<EncodingProfile> EncodingProfile::fromMimeType(std::string_view mime) {
    auto parsed = parseMime(mime);
    if (!parsed)
        return Result<EncodingProfile>::err(parsed.error());

    EncodingProfile profile;
    profile.mimeType = std::string(mime);
    profile.container = parsed->container;
    profile.videoEncoder = parsed->videoEncoder;
    profile.audioEncoder = parsed->audioEncoder;
    return Result<EncodingProfile>::ok(std::move(profile));
}

EncodingProfile EncodingProfile::platformDefault(ChannelKind kind) {
    if (isVideoChannel(kind))
        return {"video/webm", "webm", "libvpx", "libopus"};
    return {"audio/webm", "webm", "", "libopus"};
}

Result<EncodingProfile> EncodingProfile::resolve(std::string_view negotiated,
                                                 ChannelKind kind) {
    if (negotiated.empty())
        return Result<EncodingProfile>::ok(platformDefault(kind));
    return fromMimeType(negotiated);
}

bool EncodingProfile::isSupportedByFFmpeg(std::string_view mime) {
    auto parsed = parseMime(mime);
    if (!parsed)
        return false;

    if (!av_guess_format(parsed->container.c_str(), nullptr, nullptr))
        return false;

    if (parsed->video &&
        !avcodec_find_encoder_by_name(parsed->videoEncoder.c_str()))
        return false;

    // A video profile only needs its audio encoder when one was named
    bool audioRequired = !parsed->video || parsed->audioNamed;
    if (audioRequired &&
        !avcodec_find_encoder_by_name(parsed->audioEncoder.c_str()))
        return false;

    return true;
}

std::string fileExtensionFor(std::string_view mime) {
    auto parsed = parseMime(mime);
    if (!parsed)
        return "bin";
    if (parsed->container == "matroska")
        return "mkv";
    return parsed->container;
}

} // namespace smu
