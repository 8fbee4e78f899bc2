/**
 * VoiceCatalog.hpp - Installed voices, enumerated once
 *
 * Voices are keyed by their display identifier "name [language]", which is
 * what the settings persist.
 */

#pragma once

#include "ttsr/tts/SpeechPlatform.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace ttsr::tts {

std::string displayName(const Voice& voice);

class VoiceCatalog {
public:
    VoiceCatalog() = default;
    explicit VoiceCatalog(std::vector<Voice> voices);

    /**
     * First voice whose display identifier equals `name`.
     */
    const Voice* findByName(const std::string& name) const;

    std::optional<size_t> indexOf(const std::string& name) const;

    /**
     * Display identifier at `index`, or "" when out of range.
     */
    std::string nameAt(size_t index) const;

    std::vector<std::string> names() const;

    const Voice& front() const { return voices_.front(); }
    bool empty() const { return voices_.empty(); }
    size_t size() const { return voices_.size(); }

private:
    std::vector<Voice> voices_;
};

} // namespace ttsr::tts
