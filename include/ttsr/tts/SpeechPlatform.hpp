/**
 * SpeechPlatform.hpp - Seam between the speech core and a TTS engine
 *
 * A platform enumerates voices and creates synthesis sessions. A session
 * has no cancel operation: the only way to silence it is to destroy it.
 * Every fallible call throws EngineError.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace ttsr::tts {

using UtteranceId = std::uint32_t;

/**
 * Voice descriptor as reported by the engine.
 * `handle` is the engine's own key for selecting the voice.
 */
struct Voice {
    std::string name;
    std::string language;
    std::string handle;
};

/**
 * Receives session events. Called from the engine's audio thread; must not
 * block or call back into whoever owns the session.
 */
class SessionEventHandler {
public:
    virtual ~SessionEventHandler() = default;
    virtual void onSpeechFinished(UtteranceId id) = 0;
};

class SynthesisSession {
public:
    virtual ~SynthesisSession() = default;

    virtual void setVoice(const Voice& voice) = 0;
    virtual void setRate(int rate) = 0;            // -10..10
    virtual void setVolume(unsigned volume) = 0;   // 0..100

    /**
     * Submit text for asynchronous playback.
     * @return Engine-assigned utterance id
     */
    virtual UtteranceId speak(const std::string& text) = 0;
};

/**
 * Process-wide engine lifecycle: constructing a platform initializes the
 * engine, destroying it finalizes the engine.
 */
class SpeechPlatform {
public:
    virtual ~SpeechPlatform() = default;

    virtual std::vector<Voice> enumerateVoices() = 0;

    /**
     * @param handler Must outlive the returned session
     */
    virtual std::unique_ptr<SynthesisSession> newSession(SessionEventHandler& handler) = 0;
};

} // namespace ttsr::tts
