/**
 * EspeakPlatform.hpp - eSpeak NG speech platform with PortAudio playback
 *
 * eSpeak NG keeps its state process-wide, so only one EspeakPlatform may
 * exist at a time. Sessions must not outlive the platform that made them.
 */

#pragma once

#include "ttsr/tts/SpeechPlatform.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace ttsr::tts {

struct EspeakConfig {
    std::string data_path;      // Empty = library default
    int output_device = -1;     // PortAudio device index, -1 = default
    size_t max_text_bytes = 4096;   // Longer text is cut at a character boundary
};

/**
 * Longest prefix of `text` that fits in `max_bytes` without splitting a
 * UTF-8 sequence.
 */
std::string truncateUtf8(const std::string& text, size_t max_bytes);

/**
 * Words per minute for a -10..10 rate: 0 is the engine default and each
 * end is three times faster or slower, limited to what eSpeak accepts.
 */
int rateToWordsPerMinute(int rate);

class EspeakPlatform : public SpeechPlatform {
public:
    /**
     * Initializes eSpeak NG and PortAudio.
     * @throws EngineError if either fails or another instance is alive
     */
    explicit EspeakPlatform(const EspeakConfig& config = {});
    ~EspeakPlatform() override;

    EspeakPlatform(const EspeakPlatform&) = delete;
    EspeakPlatform& operator=(const EspeakPlatform&) = delete;

    std::vector<Voice> enumerateVoices() override;
    std::unique_ptr<SynthesisSession> newSession(SessionEventHandler& handler) override;

    int sampleRate() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ttsr::tts
