#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <unistd.h>
#include <core/types.hpp>
#include "process.hpp"

namespace platform {

struct RawModeGuard;

// Which of the two relay sources have data (or a hangup) pending.
struct Readiness {
    bool operator_input = false;
    bool child_output = false;
};

// Everything the capture loop needs from the operating system:
// a pseudo-terminal pair with one child attached to its slave side,
// the operator's terminal mode, and byte I/O on both ends.
// The loop and everything above it only talk to this interface.
class TerminalHost {
public:
    virtual ~TerminalHost() = default;

    virtual Result<void> allocate_pty() = 0;

    // Start `program` (looked up in PATH, caller's environment and cwd)
    // with the slave side as its controlling terminal. Fails if the
    // program cannot be executed.
    virtual Result<void> spawn(const std::string& program) = 0;

    virtual void set_raw_mode() = 0;
    virtual void restore_mode() = 0;

    // Block up to timeout_ms until either side is readable.
    // An interrupted wait returns Ok with nothing ready.
    virtual Result<Readiness> wait_readable(int timeout_ms) = 0;

    // > 0: bytes read. 0: that side reached end of stream. -1: I/O error.
    virtual long read_operator(char* buf, size_t len) = 0;
    virtual long read_child(char* buf, size_t len) = 0;

    // Write everything or fail.
    virtual bool write_operator(const char* data, size_t len) = 0;
    virtual bool write_child(const char* data, size_t len) = 0;

    virtual bool child_running() = 0;
    virtual int child_exit_code() const = 0;
    virtual void terminate_child(int grace_ms) = 0;

    // Release the pseudo-terminal. Safe to call more than once.
    virtual void close() = 0;

    // Description of the most recent failure.
    virtual std::string last_error() const = 0;
};

// POSIX implementation: posix_openpt + fork/exec + poll.
class PosixTerminalHost : public TerminalHost {
public:
    explicit PosixTerminalHost(int operator_in = STDIN_FILENO,
                               int operator_out = STDOUT_FILENO);
    ~PosixTerminalHost() override;

    PosixTerminalHost(const PosixTerminalHost&) = delete;
    PosixTerminalHost& operator=(const PosixTerminalHost&) = delete;

    Result<void> allocate_pty() override;
    Result<void> spawn(const std::string& program) override;

    void set_raw_mode() override;
    void restore_mode() override;

    Result<Readiness> wait_readable(int timeout_ms) override;
    long read_operator(char* buf, size_t len) override;
    long read_child(char* buf, size_t len) override;
    bool write_operator(const char* data, size_t len) override;
    bool write_child(const char* data, size_t len) override;

    bool child_running() override;
    int child_exit_code() const override;
    void terminate_child(int grace_ms) override;
    void close() override;
    std::string last_error() const override { return last_error_; }

    const std::string& slave_name() const { return slave_name_; }

private:
    int operator_in_;
    int operator_out_;
    int master_fd_ = -1;
    std::string slave_name_;
    ProcessHandle child_;
    std::unique_ptr<RawModeGuard> raw_;
    std::string last_error_;

    long read_fd(int fd, char* buf, size_t len, const char* what);
    bool write_fd(int fd, const char* data, size_t len, const char* what);
};

} // namespace platform
