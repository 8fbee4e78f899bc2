/**
 * ClipboardWatcher.hpp - Speaks new clipboard text on a background thread
 *
 * Holds the coordinator only weakly: once its owner releases it, change
 * events are skipped instead of keeping it alive.
 */

#pragma once

#include "ttsr/clipboard/ClipboardSource.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>

namespace ttsr::tts {
class SpeechCoordinator;
}

namespace ttsr::clipboard {

struct WatchStats {
    size_t spoken = 0;
    size_t skipped_unreadable = 0;
    size_t skipped_gone = 0;
    size_t failed = 0;
};

class ClipboardWatcher : public ClipboardHandler {
public:
    ClipboardWatcher(std::unique_ptr<ClipboardSource> source,
                     std::weak_ptr<tts::SpeechCoordinator> coordinator);
    ~ClipboardWatcher() override;

    ClipboardWatcher(const ClipboardWatcher&) = delete;
    ClipboardWatcher& operator=(const ClipboardWatcher&) = delete;

    /**
     * Start the listening thread. Starting again is allowed after the
     * source ended listening by itself, but not after stop().
     */
    void start();

    /**
     * Stop listening and join the thread. Idempotent and final.
     */
    void stop();

    bool isRunning() const { return running_; }
    WatchStats stats() const;

    CallbackResult onClipboardChange() override;
    CallbackResult onClipboardError(const std::string& error) override;

private:
    std::unique_ptr<ClipboardSource> source_;
    std::weak_ptr<tts::SpeechCoordinator> coordinator_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopped_{false};

    std::atomic<size_t> spoken_{0};
    std::atomic<size_t> skipped_unreadable_{0};
    std::atomic<size_t> skipped_gone_{0};
    std::atomic<size_t> failed_{0};
};

} // namespace ttsr::clipboard
