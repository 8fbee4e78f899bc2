/**
 * ClipboardSource.hpp - System clipboard access and change notifications
 */

#pragma once

#include <optional>
#include <string>

namespace ttsr::clipboard {

enum class CallbackResult {
    NEXT,   // Keep listening
    STOP
};

class ClipboardHandler {
public:
    virtual ~ClipboardHandler() = default;

    virtual CallbackResult onClipboardChange() = 0;
    virtual CallbackResult onClipboardError(const std::string& error) = 0;
};

class ClipboardSource {
public:
    virtual ~ClipboardSource() = default;

    /**
     * Current clipboard content as UTF-8 text, or nullopt when it is not
     * text or cannot be read. Only call from the listening thread.
     */
    virtual std::optional<std::string> readText() = 0;

    /**
     * Block, calling `handler` for every change, until the handler returns
     * STOP or stop() is called.
     */
    virtual void listen(ClipboardHandler& handler) = 0;

    /**
     * Ask a running listen() to return. Safe from any thread.
     */
    virtual void stop() = 0;
};

} // namespace ttsr::clipboard
