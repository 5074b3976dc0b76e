#include "PulseAudioTrack.hpp"
#include <pulse/error.h>
#include "core/Logger.hpp"

namespace smu {

namespace {
constexpr const char* kClientName = "screenmu-capture";
constexpr u32 kFragmentUs = 20000;
} // namespace

PulseAudioTrack::PulseAudioTrack(std::string label,
                                 u32 sampleRate,
                                 u32 channels,
                                 PaSimplePtr stream,
                                 std::string source)
    : AudioTrack(std::move(label), sampleRate, channels),
      stream_(std::move(stream)),
      source_(std::move(source)) {
}

PulseAudioTrack::~PulseAudioTrack() {
    stop();
}

Result<std::unique_ptr<PulseAudioTrack>> PulseAudioTrack::open(
        std::string label,
        const std::vector<std::string>& sources,
        u32 sampleRate,
        u32 channels) {
    pa_sample_spec ss;
    ss.format = PA_SAMPLE_FLOAT32LE;
    ss.rate = sampleRate;
    ss.channels = static_cast<uint8_t>(channels);

    pa_buffer_attr ba;
    ba.maxlength = static_cast<uint32_t>(-1);
    ba.tlength = static_cast<uint32_t>(-1);
    ba.prebuf = static_cast<uint32_t>(-1);
    ba.minreq = static_cast<uint32_t>(-1);
    ba.fragsize = static_cast<uint32_t>(pa_usec_to_bytes(kFragmentUs, &ss));

    std::string lastError = "no source given";
    for (const auto& source : sources) {
        int error = 0;
        const char* dev = source == "default" ? nullptr : source.c_str();
        PaSimplePtr stream(pa_simple_new(nullptr,
                                         kClientName,
                                         PA_STREAM_RECORD,
                                         dev,
                                         label.c_str(),
                                         &ss,
                                         nullptr,
                                         &ba,
                                         &error));
        if (!stream) {
            lastError = source + ": " + pa_strerror(error);
            LOG_DEBUG("PulseAudio source {} failed, trying next", lastError);
            continue;
        }

        LOG_INFO("Opened PulseAudio source '{}' ({} Hz, {} ch)",
                 source,
                 sampleRate,
                 channels);
        std::unique_ptr<PulseAudioTrack> track(new PulseAudioTrack(
                std::move(label), sampleRate, channels, std::move(stream),
                source));
        track->thread_ = std::jthread(
                [t = track.get()](std::stop_token st) { t->captureLoop(st); });
        return Result<std::unique_ptr<PulseAudioTrack>>::ok(std::move(track));
    }

    return Result<std::unique_ptr<PulseAudioTrack>>::err(
            "PulseAudio unavailable: " + lastError, ErrorCode::DeviceError);
}

void PulseAudioTrack::captureLoop(std::stop_token stopToken) {
    const usize frames = static_cast<usize>(sampleRate_) * kFragmentUs / 1000000;
    std::vector<f32> buffer(frames * channels_);
    int error = 0;

    while (!stopToken.stop_requested()) {
        int result = pa_simple_read(
                stream_.get(), buffer.data(), buffer.size() * sizeof(f32), &error);
        if (result < 0) {
            if (!stopToken.stop_requested())
                LOG_WARN("{}: read error: {}", label(), pa_strerror(error));
            break;
        }

        AudioBuffer out;
        out.samples = buffer;
        out.channels = channels_;
        out.sampleRate = sampleRate_;
        out.captured = Clock::now();
        samplesCaptured.emitSignal(out);
    }
}

void PulseAudioTrack::onStop() {
    thread_.request_stop();
    if (thread_.joinable())
        thread_.join();
    stream_.reset();
    LOG_DEBUG("{} closed", label());
}

} // namespace smu
