/**
 * Simple TTS Reader - Main Entry Point
 *
 * Speaks whatever text is copied to the clipboard, or typed at the prompt.
 */

#include <atomic>
#include <csignal>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>

#include "ttsr/Application.hpp"
#include "ttsr/Version.hpp"
#include "ttsr/ui/ConsoleFrontend.hpp"

std::atomic<bool> g_running{true};

void signalHandler(int signal) {
    (void)signal;
    g_running = false;
}

static std::optional<bool> parseBool(const std::string& value) {
    if (value == "true" || value == "1" || value == "yes" || value == "on") return true;
    if (value == "false" || value == "0" || value == "no" || value == "off") return false;
    return std::nullopt;
}

static void printUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [--hidden[=true|false]] [--no-clipboard] [--version]" << std::endl;
}

int main(int argc, char* argv[]) {
    ttsr::ApplicationOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--version") {
            std::cout << TTSR_APP_NAME << " v" << TTSR_VERSION_FULL << std::endl;
            return 0;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--no-clipboard") {
            options.watch_clipboard = false;
        } else if (arg == "--hidden") {
            // Bare flag means hidden; a following non-flag argument is its value
            if (i + 1 < argc && std::strncmp(argv[i + 1], "--", 2) != 0) {
                auto value = parseBool(argv[++i]);
                if (!value) {
                    std::cerr << "Invalid value for --hidden: " << argv[i] << std::endl;
                    return 2;
                }
                options.hidden = *value;
            } else {
                options.hidden = true;
            }
        } else if (arg.rfind("--hidden=", 0) == 0) {
            auto value = parseBool(arg.substr(9));
            if (!value) {
                std::cerr << "Invalid value for --hidden: " << arg.substr(9) << std::endl;
                return 2;
            }
            options.hidden = *value;
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            printUsage(argv[0]);
            return 2;
        }
    }

    if (!ttsr::ui::installInterruptingHandler(SIGINT, signalHandler) ||
        !ttsr::ui::installInterruptingHandler(SIGTERM, signalHandler)) {
        std::cerr << "Cannot install signal handlers" << std::endl;
        return 1;
    }

    ttsr::Application app(options);
    if (!app.initialize()) {
        return 1;
    }
    return app.run(g_running);
}
