#pragma once
// PulseAudioTrack.hpp - Audio track reading float32 PCM from PulseAudio
// through the simple API. Used for the microphone and for display audio
// (the monitor of the default sink).

#include <pulse/simple.h>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "capture/MediaStream.hpp"
#include "util/Result.hpp"

namespace smu {

struct PaSimpleDeleter {
    void operator()(pa_simple* s) const {
        if (s)
            pa_simple_free(s);
    }
};
using PaSimplePtr = std::unique_ptr<pa_simple, PaSimpleDeleter>;

class PulseAudioTrack : public AudioTrack {
public:
    // Tries each source in order; "default" selects the server default
    static Result<std::unique_ptr<PulseAudioTrack>> open(
            std::string label,
            const std::vector<std::string>& sources,
            u32 sampleRate,
            u32 channels);
    ~PulseAudioTrack() override;

    const std::string& source() const {
        return source_;
    }

protected:
    void onStop() override;

private:
    PulseAudioTrack(std::string label,
                    u32 sampleRate,
                    u32 channels,
                    PaSimplePtr stream,
                    std::string source);

    void captureLoop(std::stop_token stopToken);

    PaSimplePtr stream_;
    std::string source_;
    std::jthread thread_;
};

} // namespace smu
