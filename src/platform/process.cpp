#include "process.hpp"
#include "platform.hpp"
#include <core/constants.hpp>

#ifdef _WIN32
#  include <windows.h>
#else
#  include <unistd.h>
#  include <sys/wait.h>
#  include <signal.h>
#  include <fcntl.h>
#  include <cerrno>
#endif

#include <sstream>

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
#ifdef _WIN32
    release();
#endif
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept {
#ifdef _WIN32
    handle_ = other.handle_;
    thread_ = other.thread_;
    other.handle_ = INVALID_HANDLE_VALUE;
    other.thread_ = INVALID_HANDLE_VALUE;
#else
    pid_ = other.pid_;
    other.pid_ = -1;
#endif
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
#ifdef _WIN32
        release();
        handle_ = other.handle_;
        thread_ = other.thread_;
        other.handle_ = INVALID_HANDLE_VALUE;
        other.thread_ = INVALID_HANDLE_VALUE;
#else
        pid_ = other.pid_;
        other.pid_ = -1;
#endif
    }
    return *this;
}

void ProcessHandle::release() {
#ifdef _WIN32
    if (handle_ != INVALID_HANDLE_VALUE) CloseHandle(handle_);
    if (thread_ != INVALID_HANDLE_VALUE) CloseHandle(thread_);
    handle_ = INVALID_HANDLE_VALUE;
    thread_ = INVALID_HANDLE_VALUE;
#else
    pid_ = -1;
#endif
}

bool ProcessHandle::valid() const {
#ifdef _WIN32
    return handle_ != INVALID_HANDLE_VALUE;
#else
    return pid_ > 0;
#endif
}

int ProcessHandle::wait() {
#ifdef _WIN32
    if (handle_ == INVALID_HANDLE_VALUE) return -1;
    WaitForSingleObject(handle_, INFINITE);
    DWORD code = 1;
    GetExitCodeProcess(handle_, &code);
    release();
    return static_cast<int>(code);
#else
    if (pid_ <= 0) return -1;
    int status = 0;
    pid_t ret;
    do {
        ret = waitpid(pid_, &status, 0);
    } while (ret < 0 && errno == EINTR);
    release();
    if (ret < 0) return -1;
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
#endif
}

std::optional<int> ProcessHandle::wait_for(int timeout_ms) {
#ifdef _WIN32
    if (handle_ == INVALID_HANDLE_VALUE) return -1;
    if (WaitForSingleObject(handle_, static_cast<DWORD>(timeout_ms)) == WAIT_TIMEOUT)
        return std::nullopt;
    DWORD code = 1;
    GetExitCodeProcess(handle_, &code);
    release();
    return static_cast<int>(code);
#else
    if (pid_ <= 0) return -1;
    // Poll with timeout
    int elapsed = 0;
    while (true) {
        int status = 0;
        pid_t ret = waitpid(pid_, &status, WNOHANG);
        if (ret == pid_) {
            release();
            return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        }
        if (ret < 0 && errno != EINTR) {
            release();
            return -1;
        }
        if (elapsed >= timeout_ms) break;
        sleep_ms(PROCESS_POLL_MS);
        elapsed += PROCESS_POLL_MS;
    }
    return std::nullopt;  // still running
#endif
}

void ProcessHandle::terminate() {
#ifdef _WIN32
    if (handle_ != INVALID_HANDLE_VALUE) {
        TerminateProcess(handle_, 1);
        WaitForSingleObject(handle_, 2000);
        release();
    }
#else
    if (pid_ <= 0) return;
    kill(pid_, SIGTERM);
    // Wait up to 2s for graceful exit
    for (int i = 0; i < 20; i++) {
        int status;
        if (waitpid(pid_, &status, WNOHANG) == pid_) {
            release();
            return;
        }
        sleep_ms(100);
    }
    kill(pid_, SIGKILL);
    waitpid(pid_, nullptr, 0);
    release();
#endif
}

// ── spawn ────────────────────────────────────────────────────

#ifdef _WIN32

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const std::string& stderr_log,
                    const std::string& cwd) {
    ProcessHandle handle;

    // Build command line
    std::ostringstream cmdline;
    cmdline << "\"" << program << "\"";
    for (const auto& arg : args) {
        cmdline << " \"" << arg << "\"";
    }
    std::string cmd_str = cmdline.str();

    STARTUPINFOA si = {};
    si.cb = sizeof(si);
    PROCESS_INFORMATION pi = {};

    // Redirect stderr if requested
    HANDLE hStderr = INVALID_HANDLE_VALUE;
    if (!stderr_log.empty()) {
        SECURITY_ATTRIBUTES sa = {};
        sa.nLength = sizeof(sa);
        sa.bInheritHandle = TRUE;
        hStderr = CreateFileA(stderr_log.c_str(), FILE_APPEND_DATA,
                              FILE_SHARE_READ | FILE_SHARE_WRITE, &sa,
                              OPEN_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
        if (hStderr != INVALID_HANDLE_VALUE) {
            si.dwFlags |= STARTF_USESTDHANDLES;
            si.hStdError = hStderr;
            si.hStdOutput = GetStdHandle(STD_OUTPUT_HANDLE);
            si.hStdInput = GetStdHandle(STD_INPUT_HANDLE);
        }
    }

    if (CreateProcessA(nullptr, cmd_str.data(), nullptr, nullptr, TRUE,
                       0, nullptr, cwd.empty() ? nullptr : cwd.c_str(), &si, &pi)) {
        handle.handle_ = pi.hProcess;
        handle.thread_ = pi.hThread;
    }

    if (hStderr != INVALID_HANDLE_VALUE) CloseHandle(hStderr);
    return handle;
}

#else // Unix

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const std::string& stderr_log,
                    const std::string& cwd) {
    ProcessHandle handle;

    // Build argv before forking; the child must not allocate.
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) return handle;  // fork failed

    if (pid == 0) {
        // Child process
        close(STDIN_FILENO);

        if (!stderr_log.empty()) {
            int fd = open(stderr_log.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
            if (fd >= 0) {
                dup2(fd, STDERR_FILENO);
                close(fd);
            }
        }

        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            _exit(126);
        }

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(127);  // exec failed
    }

    // Parent
    handle.pid_ = pid;
    return handle;
}

#endif

} // namespace platform
