/**
 * ConsoleFrontend.hpp - Line-oriented front-end over the speech coordinator
 *
 * Voice list, rate/volume controls, test speech and the visibility
 * preference, driven by text commands.
 */

#pragma once

#include <atomic>
#include <istream>
#include <ostream>
#include <string>

namespace ttsr::tts {
class SpeechCoordinator;
}

namespace ttsr::ui {

/**
 * Install `handler` for `signal` without SA_RESTART, so a console read
 * blocked in the receiving thread fails with EINTR and run() returns.
 */
bool installInterruptingHandler(int signal, void (*handler)(int));

class ConsoleFrontend {
public:
    ConsoleFrontend(tts::SpeechCoordinator& coordinator, std::ostream& out);

    /**
     * Run one command. Returns false when the user asked to quit.
     * Engine failures are reported as a notice, never thrown.
     */
    bool execute(const std::string& line);

    /**
     * Read commands until quit, end of input, or `keep_running` turns false.
     * A blocked read only notices `keep_running` when a signal installed
     * with installInterruptingHandler() interrupts it.
     */
    void run(std::istream& in, const std::atomic<bool>& keep_running);

    void printVoices();
    void printSettings();

private:
    tts::SpeechCoordinator& coordinator_;
    std::ostream& out_;
};

} // namespace ttsr::ui
