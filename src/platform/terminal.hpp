#pragma once

#include <unistd.h>

namespace platform {

// Get terminal dimensions of `fd` (80x24 when it is not a terminal).
int term_width(int fd = STDOUT_FILENO);
int term_height(int fd = STDOUT_FILENO);

// True if `fd` refers to a terminal.
bool is_tty(int fd);

// RAII guard for raw terminal mode (cfmakeraw: no echo, no line
// buffering, no signal keys, so every keystroke reaches the child).
// Constructor saves the current mode of `fd` and enters raw mode.
// Destructor restores the saved mode. When `fd` is not a terminal the
// guard does nothing and active() is false.
struct RawModeGuard {
    explicit RawModeGuard(int fd = STDIN_FILENO);
    ~RawModeGuard();

    RawModeGuard(const RawModeGuard&) = delete;
    RawModeGuard& operator=(const RawModeGuard&) = delete;

    bool active() const { return impl_ != nullptr; }

private:
    struct Impl;
    Impl* impl_ = nullptr;
};

// SIGINT / SIGTERM / SIGHUP delivered to this process set a flag instead
// of killing it, so the capture loop can end and tear down cleanly.
void watch_interrupts();
void unwatch_interrupts();
bool interrupt_requested();
void clear_interrupt();

} // namespace platform
