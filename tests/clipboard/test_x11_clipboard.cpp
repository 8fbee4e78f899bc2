/**
 * test_x11_clipboard.cpp - X11 clipboard connection
 * Skipped when no X display is reachable
 */

#include "ttsr/clipboard/X11Clipboard.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

#include <X11/Xatom.h>
#include <X11/Xlib.h>

using namespace ttsr::clipboard;

namespace {

class NullHandler : public ClipboardHandler {
public:
    CallbackResult onClipboardChange() override { return CallbackResult::NEXT; }
    CallbackResult onClipboardError(const std::string& error) override {
        std::cout << "  listener error: " << error << std::endl;
        return CallbackResult::NEXT;
    }
};

// Owns CLIPBOARD on its own connection and answers requests after a delay
class SelectionOwner {
public:
    ~SelectionOwner() {
        stop_ = true;
        if (thread_.joinable()) thread_.join();
        if (display_) XCloseDisplay(display_);
    }

    bool acquire() {
        display_ = XOpenDisplay(nullptr);
        if (!display_) return false;
        window_ = XCreateSimpleWindow(display_, DefaultRootWindow(display_), 0, 0, 1, 1, 0, 0, 0);
        clipboard_ = XInternAtom(display_, "CLIPBOARD", False);
        utf8_ = XInternAtom(display_, "UTF8_STRING", False);
        XSetSelectionOwner(display_, clipboard_, window_, CurrentTime);
        XSync(display_, False);
        if (XGetSelectionOwner(display_, clipboard_) != window_) return false;

        thread_ = std::thread([this]() { serve(); });
        return true;
    }

    void setText(const std::string& text) {
        std::lock_guard<std::mutex> lock(mutex_);
        text_ = text;
    }

    std::atomic<int> reply_delay_ms{0};

private:
    void serve() {
        while (!stop_) {
            if (XPending(display_) == 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
                continue;
            }
            XEvent ev;
            XNextEvent(display_, &ev);
            if (ev.type == SelectionRequest) {
                std::this_thread::sleep_for(std::chrono::milliseconds(reply_delay_ms.load()));
                reply(ev.xselectionrequest);
            }
        }
    }

    void reply(const XSelectionRequestEvent& req) {
        XSelectionEvent notify{};
        notify.type = SelectionNotify;
        notify.display = req.display;
        notify.requestor = req.requestor;
        notify.selection = req.selection;
        notify.target = req.target;
        notify.time = req.time;
        notify.property = None;

        if (req.target == utf8_) {
            std::string text;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                text = text_;
            }
            XChangeProperty(display_, req.requestor, req.property, utf8_, 8, PropModeReplace,
                            reinterpret_cast<const unsigned char*>(text.data()),
                            static_cast<int>(text.size()));
            notify.property = req.property;
        }

        XEvent out{};
        out.xselection = notify;
        XSendEvent(display_, req.requestor, False, NoEventMask, &out);
        XFlush(display_);
    }

    Display* display_ = nullptr;
    Window window_ = 0;
    Atom clipboard_ = None;
    Atom utf8_ = None;
    std::thread thread_;
    std::atomic<bool> stop_{false};
    std::mutex mutex_;
    std::string text_;
};

} // anonymous namespace

void test_bad_display_throws() {
    bool threw = false;
    try {
        X11Clipboard clipboard(":9999");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "[PASS] test_bad_display_throws" << std::endl;
}

void test_listen_and_stop() {
    std::unique_ptr<X11Clipboard> clipboard;
    try {
        clipboard = std::make_unique<X11Clipboard>();
    } catch (const std::runtime_error& e) {
        std::cout << "[SKIP] test_listen_and_stop: " << e.what() << std::endl;
        return;
    }

    clipboard->setReadTimeout(std::chrono::milliseconds(200));
    auto text = clipboard->readText();
    std::cout << "  clipboard holds " << (text ? "text" : "no text") << std::endl;

    NullHandler handler;
    std::thread listener([&]() { clipboard->listen(handler); });
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    auto begin = std::chrono::steady_clock::now();
    clipboard->stop();
    listener.join();
    assert(std::chrono::steady_clock::now() - begin < std::chrono::seconds(2));

    std::cout << "[PASS] test_listen_and_stop" << std::endl;
}

void test_late_reply_is_not_reused() {
    std::unique_ptr<X11Clipboard> clipboard;
    try {
        clipboard = std::make_unique<X11Clipboard>();
    } catch (const std::runtime_error& e) {
        std::cout << "[SKIP] test_late_reply_is_not_reused: " << e.what() << std::endl;
        return;
    }

    SelectionOwner owner;
    if (!owner.acquire()) {
        std::cout << "[SKIP] test_late_reply_is_not_reused: cannot own CLIPBOARD" << std::endl;
        return;
    }

    owner.setText("first");
    auto text = clipboard->readText();
    assert(text && *text == "first");

    // The owner answers only after the reader gave up
    clipboard->setReadTimeout(std::chrono::milliseconds(150));
    owner.reply_delay_ms = 500;
    owner.setText("old");
    assert(!clipboard->readText());
    std::this_thread::sleep_for(std::chrono::milliseconds(700));

    owner.reply_delay_ms = 0;
    owner.setText("new");
    clipboard->setReadTimeout(std::chrono::milliseconds(1000));
    text = clipboard->readText();
    assert(text && *text == "new");

    owner.setText("newer");
    text = clipboard->readText();
    assert(text && *text == "newer");

    std::cout << "[PASS] test_late_reply_is_not_reused" << std::endl;
}

int main() {
    std::cout << "=== X11Clipboard Tests ===" << std::endl;

    test_bad_display_throws();
    test_listen_and_stop();
    test_late_reply_is_not_reused();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
