#pragma once

namespace platform {

// Owning handle to a spawned child process. The child is reaped through
// the handle; its exit status is remembered once observed.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // Take ownership of an already forked child.
    static ProcessHandle adopt(int pid);

    // True if the process is still running. Reaps it if it has exited.
    bool running();

    // Wait for the process to exit. Returns exit code, or -1 on timeout
    // or abnormal termination. timeout_ms = -1 means indefinite wait.
    int wait(int timeout_ms = -1);

    // SIGTERM, wait up to grace_ms, then SIGKILL. Bounded by grace_ms
    // plus the time the kernel takes to deliver SIGKILL.
    void terminate(int grace_ms = 2000);

    // Exit code once reaped; -1 if unknown or killed by a signal.
    int exit_code() const { return exit_code_; }

private:
    int pid_ = -1;
    bool reaped_ = false;
    int exit_code_ = -1;

    void record_status(int status);
};

} // namespace platform
