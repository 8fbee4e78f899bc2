/**
 * EspeakPlatform.cpp - eSpeak NG synthesis, PortAudio playback
 *
 * eSpeak runs in synchronous mode: espeak_Synth() renders the utterance
 * chunk by chunk through the synth callback, and each chunk is queued on
 * the session's own output stream as it arrives, so playback starts before
 * rendering ends. Destroying the session aborts that stream.
 */

#include "ttsr/tts/EspeakPlatform.hpp"
#include "ttsr/audio/AudioOutput.hpp"
#include "ttsr/tts/EngineError.hpp"

#include <espeak-ng/speak_lib.h>
#include <portaudio.h>

#include <algorithm>
#include <atomic>
#include <cmath>
#include <exception>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

namespace ttsr::tts {

namespace {

constexpr int kDefaultWordsPerMinute = 175;
constexpr int kMinWordsPerMinute = 80;
constexpr int kMaxWordsPerMinute = 450;

std::atomic<bool> g_instance_alive{false};

// Synchronous mode leaves espeak's own unique identifier at 0
std::atomic<UtteranceId> g_next_utterance{0};

// Synthesized audio goes straight to the session's output while eSpeak renders
struct SynthTarget {
    audio::AudioOutput* output = nullptr;
    std::vector<float> scratch;
    bool failed = false;
    std::string error;
};

// Called by espeak_Synth() on the synthesizing thread. Returning 1 aborts
// synthesis; nothing may propagate back through eSpeak.
int synthCallback(short* wav, int numsamples, espeak_EVENT* events) noexcept {
    if (!wav || numsamples <= 0 || !events) {
        return 0;
    }
    auto* target = static_cast<SynthTarget*>(events->user_data);
    if (!target || target->failed) {
        return 1;
    }

    try {
        target->scratch.resize(static_cast<size_t>(numsamples));
        for (int i = 0; i < numsamples; ++i) {
            target->scratch[i] = static_cast<float>(wav[i]) / 32768.0f;
        }
        if (!target->output->queuePlayback(target->scratch.data(), target->scratch.size())) {
            target->failed = true;
            target->error = target->output->lastError();
            return 1;
        }
    } catch (const std::exception& e) {
        target->failed = true;
        target->error = e.what();
        return 1;
    }
    return 0;
}

std::string errorText(espeak_ERROR err) {
    switch (err) {
        case EE_OK:             return "ok";
        case EE_INTERNAL_ERROR: return "internal error";
        case EE_BUFFER_FULL:    return "buffer full";
        case EE_NOT_FOUND:      return "not found";
        default:                return "error " + std::to_string(static_cast<int>(err));
    }
}

// First entry of eSpeak's language list: a priority byte, then the tag
std::string primaryLanguage(const char* languages) {
    if (!languages || languages[0] == '\0') {
        return "";
    }
    return std::string(languages + 1);
}

} // anonymous namespace

std::string truncateUtf8(const std::string& text, size_t max_bytes) {
    if (text.size() <= max_bytes) {
        return text;
    }
    size_t end = max_bytes;
    // Back off continuation bytes so a multi-byte character is never split
    while (end > 0 && (static_cast<unsigned char>(text[end]) & 0xC0) == 0x80) {
        --end;
    }
    return text.substr(0, end);
}

int rateToWordsPerMinute(int rate) {
    double wpm = kDefaultWordsPerMinute * std::pow(3.0, rate / 10.0);
    return std::clamp(static_cast<int>(std::lround(wpm)), kMinWordsPerMinute, kMaxWordsPerMinute);
}

struct EspeakPlatform::Impl {
    EspeakConfig config;
    int sample_rate = 0;
    bool espeak_ready = false;
    bool portaudio_ready = false;

    // eSpeak's parameters and synthesis are process-global
    std::mutex engine_mutex;

    ~Impl() {
        if (espeak_ready) {
            espeak_Terminate();
        }
        if (portaudio_ready) {
            Pa_Terminate();
        }
    }
};

namespace {

class EspeakSession : public SynthesisSession {
public:
    EspeakSession(std::mutex& engine_mutex, int sample_rate, int output_device,
                  size_t max_text_bytes, SessionEventHandler& handler)
        : engine_mutex_(engine_mutex)
        , handler_(handler)
        , max_text_bytes_(max_text_bytes)
        , output_(audio::OutputConfig{.sample_rate = sample_rate,
                                      .channels = 1,
                                      .frames_per_buffer = 512,
                                      .output_device = output_device}) {
        if (!output_.open()) {
            throw EngineError("Cannot open audio output: " + output_.lastError());
        }
        output_.setDrainedCallback([this]() {
            UtteranceId id = last_id_.load();
            if (id != 0) {
                handler_.onSpeechFinished(id);
            }
        });
    }

    ~EspeakSession() override {
        if (output_.isPlaying()) {
            std::cout << "[EspeakPlatform] Cutting off utterance " << last_id_.load() << std::endl;
        }
    }

    void setVoice(const Voice& voice) override {
        std::lock_guard<std::mutex> lock(engine_mutex_);
        espeak_ERROR err = espeak_SetVoiceByName(voice.handle.c_str());
        if (err != EE_OK) {
            throw EngineError("espeak_SetVoiceByName(" + voice.handle + ") failed: " + errorText(err));
        }
        voice_ = voice.handle;
    }

    void setRate(int rate) override {
        std::lock_guard<std::mutex> lock(engine_mutex_);
        int wpm = rateToWordsPerMinute(rate);
        espeak_ERROR err = espeak_SetParameter(espeakRATE, wpm, 0);
        if (err != EE_OK) {
            throw EngineError("espeak_SetParameter(RATE) failed: " + errorText(err));
        }
        wpm_ = wpm;
    }

    void setVolume(unsigned volume) override {
        std::lock_guard<std::mutex> lock(engine_mutex_);
        int value = static_cast<int>(std::min(volume, 100u));
        espeak_ERROR err = espeak_SetParameter(espeakVOLUME, value, 0);
        if (err != EE_OK) {
            throw EngineError("espeak_SetParameter(VOLUME) failed: " + errorText(err));
        }
        volume_ = value;
    }

    UtteranceId speak(const std::string& text) override {
        std::string submitted = truncateUtf8(text, max_text_bytes_);
        if (submitted.size() < text.size()) {
            std::cerr << "[EspeakPlatform] Text truncated from " << text.size() << " to "
                      << submitted.size() << " bytes" << std::endl;
        }

        UtteranceId id = ++g_next_utterance;
        last_id_ = id;

        SynthTarget target;
        target.output = &output_;

        std::lock_guard<std::mutex> lock(engine_mutex_);

        // Another session may have changed the global parameters since
        if (!voice_.empty()) {
            espeak_ERROR err = espeak_SetVoiceByName(voice_.c_str());
            if (err != EE_OK) {
                throw EngineError("espeak_SetVoiceByName(" + voice_ + ") failed: " + errorText(err));
            }
        }
        espeak_ERROR err = espeak_SetParameter(espeakRATE, wpm_, 0);
        if (err == EE_OK) {
            err = espeak_SetParameter(espeakVOLUME, volume_, 0);
        }
        if (err != EE_OK) {
            throw EngineError("espeak_SetParameter failed: " + errorText(err));
        }

        err = espeak_Synth(submitted.c_str(), submitted.size() + 1, 0, POS_CHARACTER, 0,
                           espeakCHARS_UTF8, nullptr, &target);
        if (target.failed) {
            throw EngineError("Audio playback failed: " + target.error);
        }
        if (err != EE_OK) {
            throw EngineError("espeak_Synth failed: " + errorText(err));
        }
        return id;
    }

private:
    std::mutex& engine_mutex_;
    SessionEventHandler& handler_;
    size_t max_text_bytes_;
    std::string voice_;
    int wpm_ = kDefaultWordsPerMinute;
    int volume_ = 100;
    std::atomic<UtteranceId> last_id_{0};

    // Last member: destroyed first, aborting playback while the rest is alive
    audio::AudioOutput output_;
};

} // anonymous namespace

EspeakPlatform::EspeakPlatform(const EspeakConfig& config)
    : impl_(std::make_unique<Impl>()) {
    if (g_instance_alive.exchange(true)) {
        throw EngineError("eSpeak NG is already initialized in this process");
    }
    impl_->config = config;

    try {
        const char* path = config.data_path.empty() ? nullptr : config.data_path.c_str();
        int rate = espeak_Initialize(AUDIO_OUTPUT_SYNCHRONOUS, 0, path, 0);
        if (rate <= 0) {
            throw EngineError("Failed to initialize eSpeak NG");
        }
        impl_->espeak_ready = true;
        impl_->sample_rate = rate;
        espeak_SetSynthCallback(synthCallback);

        PaError err = Pa_Initialize();
        if (err != paNoError) {
            throw EngineError(std::string("Pa_Initialize failed: ") + Pa_GetErrorText(err));
        }
        impl_->portaudio_ready = true;
    } catch (const EngineError&) {
        impl_.reset();
        g_instance_alive = false;
        throw;
    }

    std::cout << "[EspeakPlatform] Ready (sample_rate=" << impl_->sample_rate << "Hz)" << std::endl;
}

EspeakPlatform::~EspeakPlatform() {
    impl_.reset();
    g_instance_alive = false;
    std::cout << "[EspeakPlatform] Finalized" << std::endl;
}

std::vector<Voice> EspeakPlatform::enumerateVoices() {
    std::lock_guard<std::mutex> lock(impl_->engine_mutex);

    std::vector<Voice> voices;
    const espeak_VOICE** list = espeak_ListVoices(nullptr);
    if (!list) {
        throw EngineError("espeak_ListVoices failed");
    }
    for (size_t i = 0; list[i] != nullptr; ++i) {
        const espeak_VOICE* v = list[i];
        if (!v->name) continue;
        voices.push_back(Voice{v->name, primaryLanguage(v->languages), v->name});
    }
    return voices;
}

std::unique_ptr<SynthesisSession> EspeakPlatform::newSession(SessionEventHandler& handler) {
    return std::make_unique<EspeakSession>(impl_->engine_mutex, impl_->sample_rate,
                                           impl_->config.output_device,
                                           impl_->config.max_text_bytes, handler);
}

int EspeakPlatform::sampleRate() const {
    return impl_->sample_rate;
}

} // namespace ttsr::tts
