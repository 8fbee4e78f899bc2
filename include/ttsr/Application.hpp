/**
 * Application.hpp - Wires settings, speech coordinator, clipboard watcher
 * and console front-end together
 */

#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>

namespace ttsr {

struct ApplicationOptions {
    std::optional<bool> hidden;             // Command-line override
    std::filesystem::path config_root;      // Empty = XDG default
    bool watch_clipboard = true;
};

class Application {
public:
    explicit Application(ApplicationOptions options = {});
    ~Application();

    /**
     * Load settings and start the speech engine.
     * @return false if the engine could not be started
     */
    bool initialize();

    /**
     * Run until quit or until `running` turns false, then shut down.
     * @return process exit status
     */
    int run(const std::atomic<bool>& running);

    void shutdown();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ttsr
