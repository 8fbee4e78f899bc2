/**
 * SpeechCoordinator.hpp - Single owner of the synthesis session
 *
 * Serializes every speech operation behind one lock, applies and persists
 * the user's voice/rate/volume, and stops in-flight speech by replacing the
 * session (the engine has no cancel call).
 *
 * Share it as std::shared_ptr; background threads should hold a weak_ptr.
 */

#pragma once

#include "ttsr/config/Settings.hpp"
#include "ttsr/tts/SpeechPlatform.hpp"
#include "ttsr/tts/VoiceCatalog.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace ttsr::tts {

enum class CoordinatorState {
    UNINITIALIZED,
    READY,
    SPEAKING,   // Inside speak(): session being replaced
    FAILED,     // No valid session until the next speak() or reinitialize()
    SHUT_DOWN
};

/**
 * Sub-steps of replacing the session, in order.
 */
enum class RestartStep {
    DISCARD,
    CONSTRUCT,
    RECONFIGURE,
    SUBMIT
};

const char* stateName(CoordinatorState state);
const char* stepName(RestartStep step);

/**
 * Observers, invoked with the coordinator lock held. They must not call
 * back into the coordinator.
 */
struct CoordinatorCallbacks {
    std::function<void(CoordinatorState)> onStateChange;
    std::function<void(RestartStep)> onRestartStep;
};

class SpeechCoordinator {
public:
    /**
     * Takes ownership of the platform (finalized on shutdown), enumerates
     * voices, creates the first session and applies `settings` to it.
     *
     * @throws EngineError if any of that fails
     */
    SpeechCoordinator(std::unique_ptr<SpeechPlatform> platform,
                      config::SettingsStore store,
                      config::Settings settings,
                      CoordinatorCallbacks callbacks = {});
    ~SpeechCoordinator();

    SpeechCoordinator(const SpeechCoordinator&) = delete;
    SpeechCoordinator& operator=(const SpeechCoordinator&) = delete;

    /**
     * Persist `name` if given, then select the matching voice, falling back
     * to the first installed voice. No-op on the engine when none are
     * installed.
     */
    void setVoice(std::optional<std::string> name = std::nullopt);

    void setRate(std::optional<int> rate = std::nullopt);
    void setVolume(std::optional<unsigned> volume = std::nullopt);

    void setHidden(bool hidden);

    /**
     * Cancel-and-restart: discard the session, build a fresh one, re-apply
     * voice/rate/volume, then submit `text`. Returns once submitted; audio
     * plays in the background.
     *
     * @throws EngineError on any failed step; the coordinator is then FAILED
     */
    UtteranceId speak(const std::string& text);

    /**
     * Rebuild and reconfigure the session without speaking.
     */
    void reinitialize();

    /**
     * Drop the session and finalize the platform. Idempotent.
     */
    void shutdown();

    config::Settings settings() const;
    CoordinatorState state() const;

    /** Immutable after construction; safe to read without the lock. */
    const VoiceCatalog& voices() const;

    std::string voiceNameAt(size_t index) const;

    /** Catalog index of the persisted voice name, if installed. */
    std::optional<size_t> currentVoiceIndex() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ttsr::tts
