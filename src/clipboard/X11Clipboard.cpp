/**
 * X11Clipboard.cpp - XFixes selection-owner notifications
 *
 * A hidden 1x1 window receives both the XFixes owner-change events and the
 * converted selection data. All Xlib calls happen on the listening thread;
 * stop() only flips an atomic that the poll loop checks.
 */

#include "ttsr/clipboard/X11Clipboard.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <climits>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

#include <poll.h>

#include <X11/Xatom.h>
#include <X11/Xlib.h>
#include <X11/extensions/Xfixes.h>

namespace ttsr::clipboard {

namespace {

constexpr int kPollIntervalMs = 250;
constexpr int kReadPollIntervalMs = 50;

// Each request names its own property, so a late reply to an earlier,
// timed-out request cannot be taken for the current one
constexpr int kReplyProperties = 4;

} // anonymous namespace

struct X11Clipboard::Impl {
    Display* display = nullptr;
    Window window = 0;
    Atom clipboard = None;
    Atom utf8 = None;
    Atom properties[kReplyProperties] = {};
    unsigned next_property = 0;
    Atom incr = None;
    int fixes_event_base = 0;

    std::atomic<bool> stop_requested{false};
    std::chrono::milliseconds read_timeout{1000};

    ~Impl() {
        if (display) {
            if (window) {
                XDestroyWindow(display, window);
            }
            XCloseDisplay(display);
        }
    }

    // Wait for data on the X connection. Returns false on an unrecoverable error.
    bool waitForEvents(int timeout_ms, std::string& error) {
        pollfd pfd{};
        pfd.fd = ConnectionNumber(display);
        pfd.events = POLLIN;

        int rc = ::poll(&pfd, 1, timeout_ms);
        if (rc < 0) {
            if (errno != EINTR) {
                error = std::string("poll failed: ") + std::strerror(errno);
            }
            return true;
        }
        if (rc > 0 && (pfd.revents & (POLLERR | POLLHUP | POLLNVAL))) {
            error = "X connection lost";
            return false;
        }
        return true;
    }
};

X11Clipboard::X11Clipboard(const char* display_name)
    : impl_(std::make_unique<Impl>()) {
    impl_->display = XOpenDisplay(display_name);
    if (!impl_->display) {
        throw std::runtime_error("Cannot open X display");
    }

    int error_base = 0;
    if (!XFixesQueryExtension(impl_->display, &impl_->fixes_event_base, &error_base)) {
        throw std::runtime_error("X server lacks the XFixes extension");
    }

    impl_->window = XCreateSimpleWindow(impl_->display, DefaultRootWindow(impl_->display),
                                        0, 0, 1, 1, 0, 0, 0);
    impl_->clipboard = XInternAtom(impl_->display, "CLIPBOARD", False);
    impl_->utf8 = XInternAtom(impl_->display, "UTF8_STRING", False);
    for (int i = 0; i < kReplyProperties; ++i) {
        std::string name = "TTSR_CLIPBOARD_" + std::to_string(i);
        impl_->properties[i] = XInternAtom(impl_->display, name.c_str(), False);
    }
    impl_->incr = XInternAtom(impl_->display, "INCR", False);

    std::cout << "[X11Clipboard] Connected to " << DisplayString(impl_->display) << std::endl;
}

X11Clipboard::~X11Clipboard() = default;

void X11Clipboard::setReadTimeout(std::chrono::milliseconds timeout) {
    impl_->read_timeout = timeout;
}

std::optional<std::string> X11Clipboard::readText() {
    Display* d = impl_->display;

    // Drop replies to earlier requests that timed out
    XSync(d, False);
    XEvent stale;
    while (XCheckTypedWindowEvent(d, impl_->window, SelectionNotify, &stale)) {
    }

    const Atom property = impl_->properties[impl_->next_property++ % kReplyProperties];
    XDeleteProperty(d, impl_->window, property);
    XConvertSelection(d, impl_->clipboard, impl_->utf8, property, impl_->window, CurrentTime);
    XFlush(d);

    const auto deadline = std::chrono::steady_clock::now() + impl_->read_timeout;
    XEvent ev;
    while (true) {
        if (XCheckTypedWindowEvent(d, impl_->window, SelectionNotify, &ev)) {
            // A refusal carries no property and cannot be told apart
            if (ev.xselection.property == None || ev.xselection.property == property) {
                break;
            }
            continue;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            std::cerr << "[X11Clipboard] Timed out waiting for clipboard owner" << std::endl;
            return std::nullopt;
        }

        std::string error;
        if (!impl_->waitForEvents(static_cast<int>(std::min<long long>(remaining, kReadPollIntervalMs)), error)) {
            std::cerr << "[X11Clipboard] " << error << std::endl;
            return std::nullopt;
        }
    }

    // Owner refused the conversion: not text
    if (ev.xselection.property == None) {
        return std::nullopt;
    }

    Atom type = None;
    int format = 0;
    unsigned long nitems = 0;
    unsigned long bytes_after = 0;
    unsigned char* data = nullptr;

    int rc = XGetWindowProperty(d, impl_->window, property, 0, LONG_MAX / 4, True,
                                AnyPropertyType, &type, &format, &nitems, &bytes_after, &data);
    if (rc != Success) {
        return std::nullopt;
    }
    std::unique_ptr<unsigned char, int (*)(void*)> guard(data, XFree);

    if (type == impl_->incr) {
        // TODO: support INCR transfers for selections larger than the server's request limit
        std::cerr << "[X11Clipboard] Incremental clipboard transfer not supported" << std::endl;
        return std::nullopt;
    }
    if (format != 8 || !data) {
        return std::nullopt;
    }

    return std::string(reinterpret_cast<const char*>(data), nitems);
}

void X11Clipboard::listen(ClipboardHandler& handler) {
    Display* d = impl_->display;

    XFixesSelectSelectionInput(d, impl_->window, impl_->clipboard,
                               XFixesSetSelectionOwnerNotifyMask);
    XFlush(d);
    std::cout << "[X11Clipboard] Listening for clipboard changes" << std::endl;

    const int selection_notify = impl_->fixes_event_base + XFixesSelectionNotify;

    while (!impl_->stop_requested) {
        if (XPending(d) == 0) {
            std::string error;
            bool alive = impl_->waitForEvents(kPollIntervalMs, error);
            if (!error.empty()) {
                CallbackResult result = handler.onClipboardError(error);
                if (!alive || result == CallbackResult::STOP) {
                    break;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(kPollIntervalMs));
            }
            continue;
        }

        XEvent ev;
        XNextEvent(d, &ev);
        if (ev.type == selection_notify) {
            if (handler.onClipboardChange() == CallbackResult::STOP) {
                break;
            }
        }
    }

    std::cout << "[X11Clipboard] Stopped listening" << std::endl;
}

void X11Clipboard::stop() {
    impl_->stop_requested = true;
}

} // namespace ttsr::clipboard
