/**
 * VoiceCatalog.cpp - Name/index lookups over the enumerated voices
 */

#include "ttsr/tts/VoiceCatalog.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace ttsr::tts {

std::string displayName(const Voice& voice) {
    return voice.name + " [" + voice.language + "]";
}

VoiceCatalog::VoiceCatalog(std::vector<Voice> voices)
    : voices_(std::move(voices)) {
}

const Voice* VoiceCatalog::findByName(const std::string& name) const {
    auto it = std::find_if(voices_.begin(), voices_.end(), [&](const Voice& v) {
        return displayName(v) == name;
    });
    return it != voices_.end() ? &*it : nullptr;
}

std::optional<size_t> VoiceCatalog::indexOf(const std::string& name) const {
    auto it = std::find_if(voices_.begin(), voices_.end(), [&](const Voice& v) {
        return displayName(v) == name;
    });
    if (it == voices_.end()) {
        return std::nullopt;
    }
    return static_cast<size_t>(std::distance(voices_.begin(), it));
}

std::string VoiceCatalog::nameAt(size_t index) const {
    if (index < voices_.size()) {
        return displayName(voices_[index]);
    }
    return "";
}

std::vector<std::string> VoiceCatalog::names() const {
    std::vector<std::string> out;
    out.reserve(voices_.size());
    for (const auto& v : voices_) {
        out.push_back(displayName(v));
    }
    return out;
}

} // namespace ttsr::tts
