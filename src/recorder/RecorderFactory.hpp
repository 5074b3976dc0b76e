#pragma once
// RecorderFactory.hpp - Creates recorder primitives and answers encoding
// support queries for the negotiator

#include <memory>
#include <string>
#include "EncodingProfile.hpp"
#include "RecorderPrimitive.hpp"
#include "capture/CaptureTypes.hpp"
#include "capture/MediaStream.hpp"
#include "util/Result.hpp"

namespace smu {

struct RecorderOptions {
    u32 videoBitrate{5000000};
    u32 audioBitrate{128000};
};

class RecorderFactory {
public:
    virtual ~RecorderFactory() = default;

    virtual bool isEncodingSupported(const std::string& mimeType) const = 0;

    // The stream must outlive the returned recorder
    virtual Result<std::unique_ptr<RecorderPrimitive>> create(
            ChannelKind kind,
            MediaStream& stream,
            const EncodingProfile& profile,
            const RecorderOptions& options) = 0;
};

} // namespace smu
