#pragma once
// CapabilityNegotiator.hpp - Picks the first encoding the platform supports

#include <functional>
#include <string>
#include <vector>

namespace smu {

class CapabilityNegotiator {
public:
    using SupportProbe = std::function<bool(const std::string& mimeType)>;

    // Returns the first supported candidate, or an empty string meaning
    // "platform default"
    static std::string negotiate(const std::vector<std::string>& candidates,
                                 const SupportProbe& isSupported);
};

} // namespace smu
