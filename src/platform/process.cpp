#include "process.hpp"
#include "platform.hpp"

#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    // Never leave a zombie behind; a still-running child is the owner's problem.
    if (pid_ > 0 && !reaped_) {
        int status;
        if (waitpid(pid_, &status, WNOHANG) == pid_) record_status(status);
    }
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept
    : pid_(other.pid_), reaped_(other.reaped_), exit_code_(other.exit_code_) {
    other.pid_ = -1;
    other.reaped_ = false;
    other.exit_code_ = -1;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        pid_ = other.pid_;
        reaped_ = other.reaped_;
        exit_code_ = other.exit_code_;
        other.pid_ = -1;
        other.reaped_ = false;
        other.exit_code_ = -1;
    }
    return *this;
}

ProcessHandle ProcessHandle::adopt(int pid) {
    ProcessHandle handle;
    handle.pid_ = pid;
    return handle;
}

void ProcessHandle::record_status(int status) {
    reaped_ = true;
    exit_code_ = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

bool ProcessHandle::running() {
    if (pid_ <= 0 || reaped_) return false;
    int status;
    pid_t ret = waitpid(pid_, &status, WNOHANG);
    if (ret == 0) return true;  // 0 means still running
    if (ret == pid_) record_status(status);
    else reaped_ = true;        // ECHILD: someone else reaped it
    return false;
}

int ProcessHandle::wait(int timeout_ms) {
    if (pid_ <= 0) return -1;
    if (reaped_) return exit_code_;
    if (timeout_ms < 0) {
        int status;
        if (waitpid(pid_, &status, 0) == pid_) record_status(status);
        else reaped_ = true;
        return exit_code_;
    }
    // Poll with timeout
    int elapsed = 0;
    for (;;) {
        if (!running()) return exit_code_;
        if (elapsed >= timeout_ms) return -1;  // timed out
        sleep_ms(50);
        elapsed += 50;
    }
}

void ProcessHandle::terminate(int grace_ms) {
    if (!running()) return;
    kill(pid_, SIGTERM);
    if (wait(grace_ms) >= 0 || reaped_) return;
    kill(pid_, SIGKILL);
    int status;
    if (waitpid(pid_, &status, 0) == pid_) record_status(status);
    else reaped_ = true;
}

} // namespace platform
