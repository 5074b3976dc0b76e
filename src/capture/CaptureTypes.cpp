#include "CaptureTypes.hpp"
#include <algorithm>
#include <cctype>

namespace smu {

namespace {
bool equalsIgnoreCase(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}
} // namespace

std::optional<DisplayIntent> parseDisplayIntent(std::string_view text) {
    if (equalsIgnoreCase(text, "window"))
        return DisplayIntent::Window;
    if (equalsIgnoreCase(text, "monitor"))
        return DisplayIntent::Monitor;
    return std::nullopt;
}

std::optional<ChannelKind> parseChannelKind(std::string_view text) {
    for (auto kind :
         {ChannelKind::Display, ChannelKind::Microphone, ChannelKind::Camera}) {
        if (equalsIgnoreCase(text, toString(kind)))
            return kind;
    }
    return std::nullopt;
}

} // namespace smu
