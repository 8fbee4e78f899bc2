/**
 * Application.cpp - Startup, run loop and shutdown ordering
 *
 * The coordinator is the one explicitly shared instance: the front-end
 * borrows it, the clipboard watcher holds it weakly.
 */

#include "ttsr/Application.hpp"
#include "ttsr/Version.hpp"
#include "ttsr/clipboard/ClipboardWatcher.hpp"
#include "ttsr/clipboard/X11Clipboard.hpp"
#include "ttsr/config/Settings.hpp"
#include "ttsr/tts/EngineError.hpp"
#include "ttsr/tts/EspeakPlatform.hpp"
#include "ttsr/tts/SpeechCoordinator.hpp"
#include "ttsr/ui/ConsoleFrontend.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <utility>

#include <pthread.h>
#include <signal.h>

namespace ttsr {

struct Application::Impl {
    ApplicationOptions options;
    std::shared_ptr<tts::SpeechCoordinator> coordinator;
    std::unique_ptr<clipboard::ClipboardWatcher> watcher;

    explicit Impl(ApplicationOptions opts) : options(std::move(opts)) {}

    void startClipboardWatch() {
        try {
            auto source = std::make_unique<clipboard::X11Clipboard>();
            watcher = std::make_unique<clipboard::ClipboardWatcher>(std::move(source), coordinator);

            // Shutdown signals must reach the main thread's console read,
            // so the watcher thread (and threads it spawns) blocks them
            sigset_t blocked;
            sigset_t previous;
            sigemptyset(&blocked);
            sigaddset(&blocked, SIGINT);
            sigaddset(&blocked, SIGTERM);
            bool masked = pthread_sigmask(SIG_BLOCK, &blocked, &previous) == 0;
            if (!masked) {
                std::cerr << "[Application] Cannot block signals for the clipboard thread" << std::endl;
            }
            watcher->start();
            if (masked && pthread_sigmask(SIG_SETMASK, &previous, nullptr) != 0) {
                std::cerr << "[Application] Cannot restore the signal mask" << std::endl;
            }
        } catch (const std::runtime_error& e) {
            std::cerr << "[Application] Clipboard watch disabled: " << e.what() << std::endl;
        }
    }
};

Application::Application(ApplicationOptions options)
    : impl_(std::make_unique<Impl>(std::move(options))) {
}

Application::~Application() {
    shutdown();
}

bool Application::initialize() {
    std::cout << "[Application] " << TTSR_APP_NAME << " v" << TTSR_VERSION_FULL << std::endl;

    config::SettingsStore store(TTSR_APP_NAME, "config", impl_->options.config_root);
    config::Settings settings = store.loadForStartup(impl_->options.hidden);

    try {
        tts::CoordinatorCallbacks callbacks;
        callbacks.onStateChange = [](tts::CoordinatorState state) {
            std::cout << "[Application] Speech state: " << tts::stateName(state) << std::endl;
        };

        impl_->coordinator = std::make_shared<tts::SpeechCoordinator>(
            std::make_unique<tts::EspeakPlatform>(), store, settings, std::move(callbacks));
    } catch (const tts::EngineError& e) {
        std::cerr << "[Application] Cannot start speech engine: " << e.what() << std::endl;
        return false;
    }

    if (impl_->options.watch_clipboard) {
        impl_->startClipboardWatch();
    }
    return true;
}

int Application::run(const std::atomic<bool>& running) {
    if (!impl_->coordinator) {
        std::cerr << "[Application] Not initialized" << std::endl;
        return 1;
    }

    if (!impl_->coordinator->settings().hidden) {
        ui::ConsoleFrontend frontend(*impl_->coordinator, std::cout);
        frontend.run(std::cin, running);
    } else {
        std::cout << "[Application] Running hidden (Ctrl+C to quit)" << std::endl;
        while (running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }

    shutdown();
    return 0;
}

void Application::shutdown() {
    // Release the coordinator first so the watcher sees it gone, then join
    impl_->coordinator.reset();
    if (impl_->watcher) {
        impl_->watcher->stop();
        impl_->watcher.reset();
    }
}

} // namespace ttsr
