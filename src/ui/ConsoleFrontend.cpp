/**
 * ConsoleFrontend.cpp - Text commands mapped onto coordinator calls
 */

#include "ttsr/ui/ConsoleFrontend.hpp"
#include "ttsr/Version.hpp"
#include "ttsr/tts/EngineError.hpp"
#include "ttsr/tts/SpeechCoordinator.hpp"

#include <algorithm>
#include <climits>
#include <optional>
#include <stdexcept>

#include <signal.h>

namespace ttsr::ui {

namespace {

std::optional<long long> parseInteger(const std::string& arg) {
    if (arg.empty()) return std::nullopt;
    try {
        size_t used = 0;
        long long value = std::stoll(arg, &used);
        if (used != arg.size()) return std::nullopt;
        return value;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

} // anonymous namespace

bool installInterruptingHandler(int signal, void (*handler)(int)) {
    struct sigaction action {};
    action.sa_handler = handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    return ::sigaction(signal, &action, nullptr) == 0;
}

ConsoleFrontend::ConsoleFrontend(tts::SpeechCoordinator& coordinator, std::ostream& out)
    : coordinator_(coordinator)
    , out_(out) {
}

void ConsoleFrontend::printVoices() {
    const auto& catalog = coordinator_.voices();
    if (catalog.empty()) {
        out_ << "No voices installed" << std::endl;
        return;
    }

    // Unknown stored names show the fallback voice as selected
    size_t current = coordinator_.currentVoiceIndex().value_or(0);
    for (size_t i = 0; i < catalog.size(); ++i) {
        out_ << (i == current ? " * " : "   ") << "[" << i << "] " << catalog.nameAt(i) << std::endl;
    }
}

void ConsoleFrontend::printSettings() {
    auto s = coordinator_.settings();
    out_ << "voice:  " << (s.voice_name.empty() ? "(default)" : s.voice_name) << std::endl;
    out_ << "rate:   " << s.rate << std::endl;
    out_ << "volume: " << s.volume << std::endl;
    out_ << "hidden: " << (s.hidden ? "on" : "off") << std::endl;
}

bool ConsoleFrontend::execute(const std::string& line) {
    std::string input = trim(line);
    if (input.empty()) {
        return true;
    }

    std::string command = input;
    std::string arg;
    if (auto space = input.find(' '); space != std::string::npos) {
        command = input.substr(0, space);
        arg = trim(input.substr(space + 1));
    }

    try {
        if (command == "quit" || command == "exit") {
            return false;
        } else if (command == "help") {
            out_ << "Commands:\n"
                 << "  voices            list installed voices\n"
                 << "  voice <index>     select a voice\n"
                 << "  rate <-10..10>    set speaking rate\n"
                 << "  volume <0..100>   set volume\n"
                 << "  say <text>        speak text now\n"
                 << "  hidden <on|off>   start hidden next time\n"
                 << "  settings          show current settings\n"
                 << "  about             show version\n"
                 << "  quit              exit" << std::endl;
        } else if (command == "voices") {
            printVoices();
        } else if (command == "voice") {
            auto index = parseInteger(arg);
            if (!index || *index < 0) {
                out_ << "Usage: voice <index>" << std::endl;
                return true;
            }
            std::string name = coordinator_.voiceNameAt(static_cast<size_t>(*index));
            coordinator_.setVoice(name);
            out_ << "Voice: " << (name.empty() ? "(default)" : name) << std::endl;
        } else if (command == "rate") {
            auto rate = parseInteger(arg);
            if (!rate) {
                out_ << "Usage: rate <-10..10>" << std::endl;
                return true;
            }
            coordinator_.setRate(static_cast<int>(std::clamp<long long>(*rate, INT_MIN, INT_MAX)));
            out_ << "Rate: " << coordinator_.settings().rate << std::endl;
        } else if (command == "volume") {
            auto volume = parseInteger(arg);
            if (!volume) {
                out_ << "Usage: volume <0..100>" << std::endl;
                return true;
            }
            coordinator_.setVolume(static_cast<unsigned>(std::clamp<long long>(*volume, 0, UINT_MAX)));
            out_ << "Volume: " << coordinator_.settings().volume << std::endl;
        } else if (command == "say") {
            if (arg.empty()) {
                out_ << "Usage: say <text>" << std::endl;
                return true;
            }
            coordinator_.speak(arg);
        } else if (command == "hidden") {
            if (arg != "on" && arg != "off") {
                out_ << "Usage: hidden <on|off>" << std::endl;
                return true;
            }
            coordinator_.setHidden(arg == "on");
            out_ << "Start hidden: " << arg << std::endl;
        } else if (command == "settings") {
            printSettings();
        } else if (command == "about") {
            out_ << TTSR_APP_NAME << " v" << TTSR_VERSION_FULL << std::endl;
        } else {
            out_ << "Unknown command '" << command << "' (try 'help')" << std::endl;
        }
    } catch (const tts::EngineError& e) {
        out_ << "Notice: " << e.what() << std::endl;
    } catch (const std::exception& e) {
        out_ << "Error: " << e.what() << std::endl;
    }

    return true;
}

void ConsoleFrontend::run(std::istream& in, const std::atomic<bool>& keep_running) {
    out_ << TTSR_APP_NAME << " - type 'help' for commands" << std::endl;
    printVoices();

    std::string line;
    while (keep_running) {
        out_ << "> " << std::flush;
        if (!std::getline(in, line)) {
            break;
        }
        if (!execute(line)) {
            break;
        }
    }
}

} // namespace ttsr::ui
