#pragma once

#include <string>
#include <vector>
#include <optional>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#endif

namespace platform {

// Opaque handle to a spawned child process.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // Wait for the process to exit. Returns exit code, -1 if it died from a signal.
    int wait();

    // Wait at most timeout_ms. Returns the exit code, or nothing if the
    // process is still running when the deadline passes.
    std::optional<int> wait_for(int timeout_ms);

    // Terminate the process (SIGTERM then SIGKILL on Unix, TerminateProcess on Windows).
    void terminate();

#ifdef _WIN32
    HANDLE native_handle() const { return handle_; }
#else
    int native_handle() const { return pid_; }
#endif

private:
    // Collapse the handle once the child has been reaped.
    void release();

#ifdef _WIN32
    HANDLE handle_ = INVALID_HANDLE_VALUE;
    HANDLE thread_ = INVALID_HANDLE_VALUE;
#else
    int pid_ = -1;
#endif
    friend ProcessHandle spawn(const std::string& program,
                               const std::vector<std::string>& args,
                               const std::string& stderr_log,
                               const std::string& cwd);
};

// Spawn a child process.
// stderr_log: if non-empty, redirect child's stderr to this file (append mode).
// cwd: if non-empty, the child's working directory.
ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const std::string& stderr_log = "",
                    const std::string& cwd = "");

} // namespace platform
