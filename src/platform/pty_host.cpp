#include "pty_host.hpp"
#include "platform.hpp"
#include "terminal.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <stdlib.h>
#include <sys/ioctl.h>
#include <sys/wait.h>
#include <termios.h>
#include <unistd.h>
#include <cerrno>
#include <vector>

namespace platform {

PosixTerminalHost::PosixTerminalHost(int operator_in, int operator_out)
    : operator_in_(operator_in), operator_out_(operator_out) {}

PosixTerminalHost::~PosixTerminalHost() {
    restore_mode();
    if (child_.running()) child_.terminate(500);
    close();
}

// ── Pseudo-terminal and child ────────────────────────────────

Result<void> PosixTerminalHost::allocate_pty() {
    if (master_fd_ >= 0) return Result<void>::Ok();

    int fd = posix_openpt(O_RDWR | O_NOCTTY);
    if (fd < 0) {
        last_error_ = "posix_openpt failed: " + errno_text(errno);
        return Result<void>::Err(last_error_);
    }
    if (grantpt(fd) != 0 || unlockpt(fd) != 0) {
        last_error_ = "grantpt/unlockpt failed: " + errno_text(errno);
        ::close(fd);
        return Result<void>::Err(last_error_);
    }

    char name[256];
    if (ptsname_r(fd, name, sizeof(name)) != 0) {
        last_error_ = "ptsname failed: " + errno_text(errno);
        ::close(fd);
        return Result<void>::Err(last_error_);
    }

    // Start the child at the operator's window size.
    struct winsize ws = {};
    ws.ws_col = static_cast<unsigned short>(term_width(operator_out_));
    ws.ws_row = static_cast<unsigned short>(term_height(operator_out_));
    ioctl(fd, TIOCSWINSZ, &ws);

    fcntl(fd, F_SETFD, FD_CLOEXEC);
    master_fd_ = fd;
    slave_name_ = name;
    return Result<void>::Ok();
}

Result<void> PosixTerminalHost::spawn(const std::string& program) {
    if (master_fd_ < 0) {
        last_error_ = "spawn before allocate_pty";
        return Result<void>::Err(last_error_);
    }
    if (program.empty()) {
        last_error_ = "no command given";
        return Result<void>::Err(last_error_);
    }

    // Exec status pipe: closes on successful exec, carries errno otherwise.
    int status_pipe[2];
    if (pipe2(status_pipe, O_CLOEXEC) != 0) {
        last_error_ = "pipe failed: " + errno_text(errno);
        return Result<void>::Err(last_error_);
    }

    std::vector<const char*> argv = {program.c_str(), nullptr};
    const char* slave = slave_name_.c_str();

    pid_t pid = fork();
    if (pid < 0) {
        last_error_ = "fork failed: " + errno_text(errno);
        ::close(status_pipe[0]);
        ::close(status_pipe[1]);
        return Result<void>::Err(last_error_);
    }

    if (pid == 0) {
        // Child: new session with the slave as controlling terminal
        ::close(status_pipe[0]);
        setsid();
        int slave_fd = open(slave, O_RDWR);
        if (slave_fd < 0) {
            int err = errno;
            (void)!write(status_pipe[1], &err, sizeof(err));
            _exit(127);
        }
        ioctl(slave_fd, TIOCSCTTY, 0);
        dup2(slave_fd, STDIN_FILENO);
        dup2(slave_fd, STDOUT_FILENO);
        dup2(slave_fd, STDERR_FILENO);
        if (slave_fd > STDERR_FILENO) ::close(slave_fd);

        signal(SIGINT, SIG_DFL);
        signal(SIGTERM, SIG_DFL);
        signal(SIGHUP, SIG_DFL);

        execvp(argv[0], const_cast<char* const*>(argv.data()));
        int err = errno;
        (void)!write(status_pipe[1], &err, sizeof(err));
        _exit(127);  // exec failed
    }

    // Parent
    ::close(status_pipe[1]);
    int child_errno = 0;
    ssize_t n;
    do {
        n = read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        waitpid(pid, nullptr, 0);
        last_error_ = "cannot execute '" + program + "': " + errno_text(child_errno);
        return Result<void>::Err(last_error_);
    }

    child_ = ProcessHandle::adopt(pid);
    return Result<void>::Ok();
}

// ── Operator terminal mode ───────────────────────────────────

void PosixTerminalHost::set_raw_mode() {
    if (!raw_) raw_ = std::make_unique<RawModeGuard>(operator_in_);
}

void PosixTerminalHost::restore_mode() {
    raw_.reset();
}

// ── I/O ──────────────────────────────────────────────────────

Result<Readiness> PosixTerminalHost::wait_readable(int timeout_ms) {
    Readiness ready;
    struct pollfd fds[2];
    fds[0] = {operator_in_, POLLIN, 0};
    fds[1] = {master_fd_, POLLIN, 0};

    int rc = poll(fds, 2, timeout_ms);
    if (rc < 0) {
        if (errno == EINTR) return Result<Readiness>::Ok(ready);
        last_error_ = "poll failed: " + errno_text(errno);
        return Result<Readiness>::Err(last_error_);
    }

    // A hangup is reported as readable so the following read sees EOF.
    const short wake = POLLIN | POLLHUP | POLLERR;
    ready.operator_input = operator_in_ >= 0 && (fds[0].revents & wake);
    ready.child_output = master_fd_ >= 0 && (fds[1].revents & wake);
    if ((fds[0].revents & POLLNVAL) || (fds[1].revents & POLLNVAL)) {
        last_error_ = "poll: invalid descriptor";
        return Result<Readiness>::Err(last_error_);
    }
    return Result<Readiness>::Ok(ready);
}

long PosixTerminalHost::read_fd(int fd, char* buf, size_t len, const char* what) {
    for (;;) {
        ssize_t n = read(fd, buf, len);
        if (n >= 0) return static_cast<long>(n);
        if (errno == EINTR) continue;
        // Linux reports a closed slave side as EIO on the master.
        if (fd == master_fd_ && errno == EIO) return 0;
        last_error_ = std::string("read from ") + what + " failed: " + errno_text(errno);
        return -1;
    }
}

bool PosixTerminalHost::write_fd(int fd, const char* data, size_t len, const char* what) {
    size_t sent = 0;
    while (sent < len) {
        ssize_t w = write(fd, data + sent, len - sent);
        if (w < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN) { sleep_ms(1); continue; }
            last_error_ = std::string("write to ") + what + " failed: " + errno_text(errno);
            return false;
        }
        sent += static_cast<size_t>(w);
    }
    return true;
}

long PosixTerminalHost::read_operator(char* buf, size_t len) {
    return read_fd(operator_in_, buf, len, "operator");
}

long PosixTerminalHost::read_child(char* buf, size_t len) {
    return read_fd(master_fd_, buf, len, "child");
}

bool PosixTerminalHost::write_operator(const char* data, size_t len) {
    return write_fd(operator_out_, data, len, "operator");
}

bool PosixTerminalHost::write_child(const char* data, size_t len) {
    return write_fd(master_fd_, data, len, "child");
}

// ── Lifecycle ────────────────────────────────────────────────

bool PosixTerminalHost::child_running() {
    return child_.running();
}

int PosixTerminalHost::child_exit_code() const {
    return child_.exit_code();
}

void PosixTerminalHost::terminate_child(int grace_ms) {
    child_.terminate(grace_ms);
}

void PosixTerminalHost::close() {
    if (master_fd_ >= 0) {
        ::close(master_fd_);
        master_fd_ = -1;
    }
}

} // namespace platform
