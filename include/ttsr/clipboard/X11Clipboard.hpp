/**
 * X11Clipboard.hpp - CLIPBOARD selection via Xlib and XFixes
 */

#pragma once

#include "ttsr/clipboard/ClipboardSource.hpp"

#include <chrono>
#include <memory>

namespace ttsr::clipboard {

class X11Clipboard : public ClipboardSource {
public:
    /**
     * @param display_name X display, nullptr = $DISPLAY
     * @throws std::runtime_error if the display or XFixes is unavailable
     */
    explicit X11Clipboard(const char* display_name = nullptr);
    ~X11Clipboard() override;

    X11Clipboard(const X11Clipboard&) = delete;
    X11Clipboard& operator=(const X11Clipboard&) = delete;

    std::optional<std::string> readText() override;
    void listen(ClipboardHandler& handler) override;
    void stop() override;

    void setReadTimeout(std::chrono::milliseconds timeout);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ttsr::clipboard
