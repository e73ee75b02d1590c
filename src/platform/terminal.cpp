#include "terminal.hpp"

#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>
#include <signal.h>

namespace platform {

// ── Terminal dimensions ──────────────────────────────────────

int term_width(int fd) {
    struct winsize ws;
    if (ioctl(fd, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0)
        return ws.ws_col;
    return 80;
}

int term_height(int fd) {
    struct winsize ws;
    if (ioctl(fd, TIOCGWINSZ, &ws) == 0 && ws.ws_row > 0)
        return ws.ws_row;
    return 24;
}

bool is_tty(int fd) {
    return fd >= 0 && isatty(fd) == 1;
}

// ── RawModeGuard ─────────────────────────────────────────────

struct RawModeGuard::Impl {
    int fd;
    struct termios old_term;
};

RawModeGuard::RawModeGuard(int fd) {
    struct termios saved;
    if (!is_tty(fd) || tcgetattr(fd, &saved) != 0) return;

    impl_ = new Impl{fd, saved};
    struct termios raw = saved;
    cfmakeraw(&raw);
    tcsetattr(fd, TCSAFLUSH, &raw);
}

RawModeGuard::~RawModeGuard() {
    if (impl_) {
        tcsetattr(impl_->fd, TCSADRAIN, &impl_->old_term);
        delete impl_;
    }
}

// ── Interrupt flag ───────────────────────────────────────────

static volatile sig_atomic_t g_interrupt_flag = 0;
static struct sigaction g_old_int;
static struct sigaction g_old_term;
static struct sigaction g_old_hup;
static bool g_watching = false;

static void interrupt_handler(int) {
    g_interrupt_flag = 1;
}

void watch_interrupts() {
    if (g_watching) return;
    g_interrupt_flag = 0;

    struct sigaction sa;
    sa.sa_handler = interrupt_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, &g_old_int);
    sigaction(SIGTERM, &sa, &g_old_term);
    sigaction(SIGHUP, &sa, &g_old_hup);
    g_watching = true;
}

void unwatch_interrupts() {
    if (!g_watching) return;
    sigaction(SIGINT, &g_old_int, nullptr);
    sigaction(SIGTERM, &g_old_term, nullptr);
    sigaction(SIGHUP, &g_old_hup, nullptr);
    g_watching = false;
}

bool interrupt_requested() {
    return g_interrupt_flag != 0;
}

void clear_interrupt() {
    g_interrupt_flag = 0;
}

} // namespace platform
