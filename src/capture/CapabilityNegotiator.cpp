#include "CapabilityNegotiator.hpp"
#include <algorithm>

namespace smu {

std::string CapabilityNegotiator::negotiate(
        const std::vector<std::string>& candidates,
        const SupportProbe& isSupported) {
    if (!isSupported)
        return {};

    auto it = std::find_if(candidates.begin(),
                           candidates.end(),
                           [&](const std::string& mime) {
                               return !mime.empty() && isSupported(mime);
                           });
    return it != candidates.end() ? *it : std::string();
}

} // namespace smu
