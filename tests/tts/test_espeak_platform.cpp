/**
 * test_espeak_platform.cpp - eSpeak NG platform
 * Engine-dependent checks are skipped when eSpeak NG or audio is unavailable
 */

#include "ttsr/tts/EngineError.hpp"
#include "ttsr/tts/EspeakPlatform.hpp"
#include "ttsr/tts/VoiceCatalog.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

using namespace ttsr::tts;

namespace {

class CountingHandler : public SessionEventHandler {
public:
    void onSpeechFinished(UtteranceId id) override {
        last = id;
        ++finished;
    }

    std::atomic<UtteranceId> last{0};
    std::atomic<int> finished{0};
};

} // anonymous namespace

void test_rate_mapping() {
    assert(rateToWordsPerMinute(0) == 175);
    assert(rateToWordsPerMinute(5) == 303);
    assert(rateToWordsPerMinute(-5) == 101);
    assert(rateToWordsPerMinute(10) == 450);
    assert(rateToWordsPerMinute(-10) == 80);
    for (int r = -10; r < 10; ++r) {
        assert(rateToWordsPerMinute(r) <= rateToWordsPerMinute(r + 1));
    }

    std::cout << "[PASS] test_rate_mapping" << std::endl;
}

void test_truncate_utf8() {
    assert(truncateUtf8("hello", 10) == "hello");
    assert(truncateUtf8("hello", 5) == "hello");
    assert(truncateUtf8("hello", 3) == "hel");
    assert(truncateUtf8("", 0).empty());

    // The two-byte e-acute is never split
    std::string cafe = "caf\xC3\xA9!";
    assert(truncateUtf8(cafe, 4) == "caf");
    assert(truncateUtf8(cafe, 5) == "caf\xC3\xA9");

    // Four-byte sequence (U+1F600)
    std::string smile = "a\xF0\x9F\x98\x80" "b";
    assert(truncateUtf8(smile, 2) == "a");
    assert(truncateUtf8(smile, 4) == "a");
    assert(truncateUtf8(smile, 5) == "a\xF0\x9F\x98\x80");

    std::string big(100000, 'x');
    assert(truncateUtf8(big, EspeakConfig{}.max_text_bytes).size() == 4096);

    std::cout << "[PASS] test_truncate_utf8" << std::endl;
}

void test_engine() {
    std::unique_ptr<EspeakPlatform> platform;
    try {
        platform = std::make_unique<EspeakPlatform>();
    } catch (const EngineError& e) {
        std::cout << "[SKIP] test_engine: " << e.what() << std::endl;
        return;
    }
    assert(platform->sampleRate() > 0);

    // eSpeak state is process-wide
    bool second_rejected = false;
    try {
        EspeakPlatform second;
    } catch (const EngineError&) {
        second_rejected = true;
    }
    assert(second_rejected);

    VoiceCatalog catalog(platform->enumerateVoices());
    std::cout << "Voices installed: " << catalog.size() << std::endl;
    assert(!catalog.empty());

    CountingHandler handler;
    std::unique_ptr<SynthesisSession> session;
    try {
        session = platform->newSession(handler);
    } catch (const EngineError& e) {
        std::cout << "[SKIP] test_engine playback: " << e.what() << std::endl;
        return;
    }

    session->setVoice(catalog.front());
    session->setRate(3);
    session->setVolume(50);

    UtteranceId id = 0;
    try {
        id = session->speak("Testing one two three.");
    } catch (const EngineError& e) {
        std::cout << "[SKIP] test_engine playback: " << e.what() << std::endl;
        return;
    }
    assert(id != 0);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (handler.finished == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    assert(handler.finished >= 1);
    assert(handler.last == id);

    // Destroying a session mid-utterance silences it
    session->speak("This sentence is cut off long before it can finish playing.");
    session.reset();

    std::cout << "[PASS] test_engine" << std::endl;
}

int main() {
    std::cout << "=== EspeakPlatform Tests ===" << std::endl;

    test_rate_mapping();
    test_truncate_utf8();
    test_engine();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
