/**
 * ClipboardWatcher.cpp - Clipboard change -> speak, never fatal
 */

#include "ttsr/clipboard/ClipboardWatcher.hpp"
#include "ttsr/tts/EngineError.hpp"
#include "ttsr/tts/SpeechCoordinator.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace ttsr::clipboard {

ClipboardWatcher::ClipboardWatcher(std::unique_ptr<ClipboardSource> source,
                                   std::weak_ptr<tts::SpeechCoordinator> coordinator)
    : source_(std::move(source))
    , coordinator_(std::move(coordinator)) {
}

ClipboardWatcher::~ClipboardWatcher() {
    stop();
}

void ClipboardWatcher::start() {
    if (running_ || !source_) return;
    if (stopped_) {
        std::cerr << "[ClipboardWatcher] Already stopped, not restarting" << std::endl;
        return;
    }

    // The listener returned on its own earlier
    if (thread_.joinable()) {
        thread_.join();
    }

    running_ = true;
    thread_ = std::thread([this]() {
        std::cout << "[ClipboardWatcher] Started" << std::endl;
        try {
            source_->listen(*this);
        } catch (const std::exception& e) {
            std::cerr << "[ClipboardWatcher] Listener failed: " << e.what() << std::endl;
        }
        running_ = false;
        std::cout << "[ClipboardWatcher] Exited" << std::endl;
    });
}

void ClipboardWatcher::stop() {
    stopped_ = true;
    if (source_) {
        source_->stop();
    }
    if (thread_.joinable()) {
        thread_.join();
    }
}

WatchStats ClipboardWatcher::stats() const {
    WatchStats s;
    s.spoken = spoken_;
    s.skipped_unreadable = skipped_unreadable_;
    s.skipped_gone = skipped_gone_;
    s.failed = failed_;
    return s;
}

CallbackResult ClipboardWatcher::onClipboardChange() {
    std::optional<std::string> text;
    try {
        text = source_->readText();
    } catch (const std::exception& e) {
        std::cerr << "[ClipboardWatcher] Clipboard read failed: " << e.what() << std::endl;
    }
    if (!text) {
        ++skipped_unreadable_;
        return CallbackResult::NEXT;
    }

    auto coordinator = coordinator_.lock();
    if (!coordinator) {
        ++skipped_gone_;
        return CallbackResult::NEXT;
    }

    try {
        tts::UtteranceId id = coordinator->speak(*text);
        ++spoken_;
        std::cout << "[ClipboardWatcher] Speaking clipboard text (utterance " << id << ", "
                  << text->size() << " bytes)" << std::endl;
    } catch (const tts::EngineError& e) {
        ++failed_;
        std::cerr << "[ClipboardWatcher] Speak failed: " << e.what() << std::endl;
    } catch (const std::exception& e) {
        ++failed_;
        std::cerr << "[ClipboardWatcher] Speak failed unexpectedly: " << e.what() << std::endl;
    }
    return CallbackResult::NEXT;
}

CallbackResult ClipboardWatcher::onClipboardError(const std::string& error) {
    std::cerr << "[ClipboardWatcher] Listener error: " << error << std::endl;
    return CallbackResult::NEXT;
}

} // namespace ttsr::clipboard
