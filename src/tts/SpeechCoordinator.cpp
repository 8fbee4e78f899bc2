/**
 * SpeechCoordinator.cpp - Lock-serialized speech session management
 *
 * Every public operation takes the lock for its whole duration. Helpers
 * suffixed _locked expect it to be held already.
 */

#include "ttsr/tts/SpeechCoordinator.hpp"
#include "ttsr/tts/EngineError.hpp"

#include <exception>
#include <iostream>
#include <mutex>
#include <string>
#include <utility>

namespace ttsr::tts {

const char* stateName(CoordinatorState state) {
    switch (state) {
        case CoordinatorState::UNINITIALIZED: return "UNINITIALIZED";
        case CoordinatorState::READY:         return "READY";
        case CoordinatorState::SPEAKING:      return "SPEAKING";
        case CoordinatorState::FAILED:        return "FAILED";
        case CoordinatorState::SHUT_DOWN:     return "SHUT_DOWN";
    }
    return "UNKNOWN";
}

const char* stepName(RestartStep step) {
    switch (step) {
        case RestartStep::DISCARD:     return "DISCARD";
        case RestartStep::CONSTRUCT:   return "CONSTRUCT";
        case RestartStep::RECONFIGURE: return "RECONFIGURE";
        case RestartStep::SUBMIT:      return "SUBMIT";
    }
    return "UNKNOWN";
}

namespace {

// Playback completion is not tracked beyond a log line.
class LoggingEventHandler : public SessionEventHandler {
public:
    void onSpeechFinished(UtteranceId id) override {
        std::cout << "[SpeechCoordinator] Utterance " << id << " finished" << std::endl;
    }
};

} // anonymous namespace

struct SpeechCoordinator::Impl {
    mutable std::mutex mutex;

    std::unique_ptr<SpeechPlatform> platform;
    config::SettingsStore store;
    config::Settings settings;
    VoiceCatalog catalog;
    CoordinatorCallbacks callbacks;
    CoordinatorState state = CoordinatorState::UNINITIALIZED;

    // Declared before the session so it outlives it
    LoggingEventHandler handler;
    std::unique_ptr<SynthesisSession> session;

    Impl(std::unique_ptr<SpeechPlatform> p, config::SettingsStore s,
         config::Settings initial, CoordinatorCallbacks cb)
        : platform(std::move(p))
        , store(std::move(s))
        , settings(std::move(initial))
        , callbacks(std::move(cb)) {
    }

    void setState(CoordinatorState next) {
        if (state == next) return;
        state = next;
        if (callbacks.onStateChange) {
            callbacks.onStateChange(next);
        }
    }

    void step(RestartStep s) {
        if (callbacks.onRestartStep) {
            callbacks.onRestartStep(s);
        }
    }

    void ensureOpen_locked() const {
        if (state == CoordinatorState::SHUT_DOWN) {
            throw EngineError("Speech coordinator is shut down");
        }
    }

    // Anything a platform call throws reaches callers as EngineError
    template <typename Fn>
    static auto engineCall(const char* what, Fn&& fn) -> decltype(fn()) {
        try {
            return fn();
        } catch (const EngineError&) {
            throw;
        } catch (const std::exception& e) {
            throw EngineError(std::string(what) + " failed: " + e.what());
        }
    }

    void applyVoice_locked() {
        if (!session) return;

        const Voice* voice = catalog.findByName(settings.voice_name);
        if (!voice) {
            if (catalog.empty()) return;
            voice = &catalog.front();
        }
        engineCall("setVoice", [&]() { session->setVoice(*voice); });
    }

    void applyRate_locked() {
        if (session) engineCall("setRate", [&]() { session->setRate(settings.rate); });
    }

    void applyVolume_locked() {
        if (session) engineCall("setVolume", [&]() { session->setVolume(settings.volume); });
    }

    void fail_locked(const char* reason) {
        session.reset();
        setState(CoordinatorState::FAILED);
        std::cerr << "[SpeechCoordinator] Session restart failed: " << reason << std::endl;
    }

    /**
     * DISCARD -> CONSTRUCT -> RECONFIGURE [-> SUBMIT]. On failure the
     * session is dropped and the coordinator is left FAILED.
     */
    std::optional<UtteranceId> restart_locked(const std::string* text) {
        step(RestartStep::DISCARD);
        session.reset();

        try {
            step(RestartStep::CONSTRUCT);
            session = engineCall("newSession", [&]() { return platform->newSession(handler); });

            step(RestartStep::RECONFIGURE);
            applyVoice_locked();
            applyRate_locked();
            applyVolume_locked();

            if (text) {
                step(RestartStep::SUBMIT);
                return engineCall("speak", [&]() { return session->speak(*text); });
            }
            return std::nullopt;
        } catch (const EngineError& e) {
            fail_locked(e.what());
            throw;
        }
    }
};

SpeechCoordinator::SpeechCoordinator(std::unique_ptr<SpeechPlatform> platform,
                                     config::SettingsStore store,
                                     config::Settings settings,
                                     CoordinatorCallbacks callbacks)
    : impl_(std::make_unique<Impl>(std::move(platform), std::move(store),
                                   std::move(settings), std::move(callbacks))) {
    if (!impl_->platform) {
        throw EngineError("No speech platform");
    }

    std::lock_guard<std::mutex> lock(impl_->mutex);

    impl_->catalog = VoiceCatalog(
        Impl::engineCall("enumerateVoices", [&]() { return impl_->platform->enumerateVoices(); }));
    std::cout << "[SpeechCoordinator] " << impl_->catalog.size() << " voices installed" << std::endl;

    impl_->session = Impl::engineCall("newSession", [&]() {
        return impl_->platform->newSession(impl_->handler);
    });
    impl_->applyVoice_locked();
    impl_->applyRate_locked();
    impl_->applyVolume_locked();

    impl_->setState(CoordinatorState::READY);
}

SpeechCoordinator::~SpeechCoordinator() {
    shutdown();
}

void SpeechCoordinator::setVoice(std::optional<std::string> name) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->ensureOpen_locked();

    if (name) {
        impl_->settings.voice_name = std::move(*name);
        impl_->store.store(impl_->settings);
    }
    impl_->applyVoice_locked();
}

void SpeechCoordinator::setRate(std::optional<int> rate) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->ensureOpen_locked();

    if (rate) {
        impl_->settings.rate = config::clampRate(*rate);
        impl_->store.store(impl_->settings);
    }
    impl_->applyRate_locked();
}

void SpeechCoordinator::setVolume(std::optional<unsigned> volume) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->ensureOpen_locked();

    if (volume) {
        impl_->settings.volume = config::clampVolume(*volume);
        impl_->store.store(impl_->settings);
    }
    impl_->applyVolume_locked();
}

void SpeechCoordinator::setHidden(bool hidden) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->ensureOpen_locked();

    impl_->settings.hidden = hidden;
    impl_->store.store(impl_->settings);
}

UtteranceId SpeechCoordinator::speak(const std::string& text) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->ensureOpen_locked();

    impl_->setState(CoordinatorState::SPEAKING);
    auto id = impl_->restart_locked(&text);
    impl_->setState(CoordinatorState::READY);
    return *id;
}

void SpeechCoordinator::reinitialize() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->ensureOpen_locked();

    impl_->restart_locked(nullptr);
    impl_->setState(CoordinatorState::READY);
}

void SpeechCoordinator::shutdown() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->state == CoordinatorState::SHUT_DOWN) {
        return;
    }

    impl_->session.reset();
    impl_->platform.reset();
    impl_->setState(CoordinatorState::SHUT_DOWN);
    std::cout << "[SpeechCoordinator] Shut down" << std::endl;
}

config::Settings SpeechCoordinator::settings() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->settings;
}

CoordinatorState SpeechCoordinator::state() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->state;
}

const VoiceCatalog& SpeechCoordinator::voices() const {
    return impl_->catalog;
}

std::string SpeechCoordinator::voiceNameAt(size_t index) const {
    return impl_->catalog.nameAt(index);
}

std::optional<size_t> SpeechCoordinator::currentVoiceIndex() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->catalog.indexOf(impl_->settings.voice_name);
}

} // namespace ttsr::tts
