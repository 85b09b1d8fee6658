#include "process_runner.h"
#include "core/log.h"

#include <unistd.h>
#include <signal.h>
#include <sys/wait.h>
#include <sys/ioctl.h>
#include <fcntl.h>
#include <poll.h>
#include <cstring>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <termios.h>
#include <thread>
#include <chrono>
#include <sstream>

#if defined(__APPLE__)
#include <util.h>
#elif defined(__linux__)
#include <pty.h>
#endif

extern char** environ;

namespace station {

namespace {

enum class SpawnStage : int {
    Chdir = 1,
    Exec = 2
};

struct ChildFailure {
    int stage;
    int error;
};

[[noreturn]] void report_child_failure(int fd, SpawnStage stage) {
    ChildFailure failure{static_cast<int>(stage), errno};
    ssize_t ignored = ::write(fd, &failure, sizeof(failure));
    (void)ignored;
    _exit(127);
}

int decode_wait_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

unsigned short clamp_dimension(int value) {
    if (value < 1) return 1;
    if (value > USHRT_MAX) return USHRT_MAX;
    return static_cast<unsigned short>(value);
}

std::vector<std::string> build_environment(const ProcessConfig& config) {
    std::vector<std::string> result;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string item(*entry);
        std::string key = item.substr(0, item.find('='));
        bool overridden = false;
        for (const auto& kv : config.env) {
            if (kv.first == key) {
                overridden = true;
                break;
            }
        }
        if (!overridden) {
            result.push_back(std::move(item));
        }
    }
    for (const auto& kv : config.env) {
        result.push_back(kv.first + "=" + kv.second);
    }
    return result;
}

}

ProcessRunner::ProcessRunner() = default;

ProcessRunner::~ProcessRunner() {
    stop();
    join();
}

std::string ProcessRunner::resolve_executable(const std::string& executable) {
    if (executable.empty()) return {};
    if (executable.find('/') != std::string::npos) {
        return access(executable.c_str(), X_OK) == 0 ? executable : std::string();
    }

    const char* env_path = std::getenv("PATH");
    std::string path_list = (env_path && *env_path) ? env_path : "/usr/local/bin:/usr/bin:/bin";
    std::stringstream ss(path_list);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) continue;
        std::string candidate = dir + "/" + executable;
        if (access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return {};
}

Status ProcessRunner::start(const ProcessConfig& config) {
    if (running_.load() || io_thread_.joinable()) {
        return Status(ErrorCode::SpawnError, "process already started");
    }

    std::string executable = resolve_executable(config.executable);
    if (executable.empty()) {
        return Status(ErrorCode::SpawnError, "executable not found: " + config.executable);
    }

    // Everything the child needs is built before fork(); the child only makes
    // async-signal-safe calls.
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(config.executable.c_str()));
    for (const auto& arg : config.args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_storage = build_environment(config);
    std::vector<char*> envp;
    envp.reserve(env_storage.size() + 1);
    for (auto& entry : env_storage) {
        envp.push_back(const_cast<char*>(entry.c_str()));
    }
    envp.push_back(nullptr);

    int status_pipe[2];
    if (pipe2(status_pipe, O_CLOEXEC) != 0) {
        return Status(ErrorCode::SpawnError, std::string("pipe: ") + strerror(errno));
    }

    struct winsize ws;
    ws.ws_col = clamp_dimension(config.cols);
    ws.ws_row = clamp_dimension(config.rows);
    ws.ws_xpixel = 0;
    ws.ws_ypixel = 0;

    int master_fd = -1;
    pid_t pid = forkpty(&master_fd, nullptr, nullptr, &ws);

    if (pid < 0) {
        int err = errno;
        close(status_pipe[0]);
        close(status_pipe[1]);
        return Status(ErrorCode::SpawnError, std::string("forkpty: ") + strerror(err));
    }

    if (pid == 0) {
        close(status_pipe[0]);
        signal(SIGCHLD, SIG_DFL);
        signal(SIGPIPE, SIG_DFL);

        if (!config.working_dir.empty() && chdir(config.working_dir.c_str()) != 0) {
            report_child_failure(status_pipe[1], SpawnStage::Chdir);
        }

        execve(executable.c_str(), argv.data(), envp.data());
        report_child_failure(status_pipe[1], SpawnStage::Exec);
    }

    close(status_pipe[1]);

    ChildFailure failure{};
    ssize_t n;
    do {
        n = read(status_pipe[0], &failure, sizeof(failure));
    } while (n < 0 && errno == EINTR);
    close(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(failure))) {
        int status;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        close(master_fd);
        bool chdir_failed = failure.stage == static_cast<int>(SpawnStage::Chdir);
        std::string what = chdir_failed
            ? "cannot enter working directory " + config.working_dir
            : "cannot execute " + executable;
        return Status(ErrorCode::SpawnError, what + ": " + strerror(failure.error));
    }

    // Later shells must not inherit this session's master.
    fcntl(master_fd, F_SETFD, fcntl(master_fd, F_GETFD) | FD_CLOEXEC);
    fcntl(master_fd, F_SETFL, fcntl(master_fd, F_GETFL) | O_NONBLOCK);

    {
        std::lock_guard<std::mutex> lock(fd_mutex_);
        pty_fd_ = master_fd;
    }
    pid_.store(pid);
    running_.store(true);
    stop_requested_.store(false);
    hung_up_.store(false);
    finished_.store(false);

    io_thread_ = std::thread(&ProcessRunner::io_thread_func, this);

    return {};
}

void ProcessRunner::stop() {
    if (!running_.load()) return;

    stop_requested_.store(true);

    // Interactive shells ignore SIGTERM; SIGHUP is what a closing terminal sends.
    signal_group(SIGHUP);
    signal_group(SIGTERM);
}

void ProcessRunner::kill() {
    if (!running_.load()) return;

    stop_requested_.store(true);
    signal_group(SIGKILL);
}

void ProcessRunner::join() {
    if (!io_thread_.joinable()) return;

    if (io_thread_.get_id() == std::this_thread::get_id()) {
        io_thread_.detach();
    } else {
        io_thread_.join();
    }
}

Status ProcessRunner::write_stdin(const std::string& data) {
    std::lock_guard<std::mutex> write_lock(write_mutex_);

    size_t offset = 0;
    while (offset < data.size()) {
        std::lock_guard<std::mutex> lock(fd_mutex_);
        if (pty_fd_ < 0) {
            return Status(ErrorCode::IOError, "pseudo-terminal is closed");
        }
        if (hung_up_.load()) {
            return Status(ErrorCode::IOError, "terminal hung up");
        }

        ssize_t written = ::write(pty_fd_, data.data() + offset, data.size() - offset);
        if (written > 0) {
            offset += static_cast<size_t>(written);
            continue;
        }
        if (written < 0 && errno == EINTR) {
            continue;
        }
        if (written < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            if (stop_requested_.load()) {
                return Status(ErrorCode::IOError, "session is stopping");
            }
            struct pollfd pfd;
            pfd.fd = pty_fd_;
            pfd.events = POLLOUT;
            pfd.revents = 0;
            poll(&pfd, 1, 100);
            continue;
        }
        return Status(ErrorCode::IOError, std::string("write: ") + strerror(errno));
    }

    return {};
}

bool ProcessRunner::resize(int rows, int cols) {
    std::lock_guard<std::mutex> lock(fd_mutex_);
    if (pty_fd_ < 0) return false;

    struct winsize ws;
    ws.ws_row = clamp_dimension(rows);
    ws.ws_col = clamp_dimension(cols);
    ws.ws_xpixel = 0;
    ws.ws_ypixel = 0;

    return ioctl(pty_fd_, TIOCSWINSZ, &ws) == 0;
}

bool ProcessRunner::window_size(int& rows, int& cols) const {
    std::lock_guard<std::mutex> lock(fd_mutex_);
    if (pty_fd_ < 0) return false;

    struct winsize ws;
    if (ioctl(pty_fd_, TIOCGWINSZ, &ws) != 0) return false;
    rows = ws.ws_row;
    cols = ws.ws_col;
    return true;
}

bool ProcessRunner::drain_output(int fd, char* buffer, size_t size) {
    while (true) {
        ssize_t n = read(fd, buffer, size);
        if (n > 0) {
            if (output_callback_) {
                output_callback_(std::string(buffer, static_cast<size_t>(n)));
            }
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return true;
        }
        // EIO: every slave descriptor is closed.
        return false;
    }
}

bool ProcessRunner::try_reap(int options, int& exit_code) {
    std::lock_guard<std::mutex> lock(pid_mutex_);
    pid_t pid = pid_.load();
    if (pid <= 0) return true;

    int status;
    pid_t result;
    do {
        result = waitpid(pid, &status, options);
    } while (result < 0 && errno == EINTR);

    if (result == pid) {
        exit_code = decode_wait_status(status);
        pid_.store(-1);
        return true;
    }
    if (result < 0 && errno == ECHILD) {
        // Someone else reaped it (a SIGCHLD=SIG_IGN host); the status is gone.
        pid_.store(-1);
        return true;
    }
    return false;
}

void ProcessRunner::signal_group(int sig) {
    std::lock_guard<std::mutex> lock(pid_mutex_);
    pid_t pid = pid_.load();
    if (pid > 0) {
        // forkpty() makes the child a session and group leader.
        ::kill(-pid, sig);
        ::kill(pid, sig);
    }
}

void ProcessRunner::io_thread_func() {
    constexpr size_t BUFFER_SIZE = 4096;
    char buffer[BUFFER_SIZE];

    int fd;
    {
        std::lock_guard<std::mutex> lock(fd_mutex_);
        fd = pty_fd_;
    }

    struct pollfd fds[1];
    fds[0].fd = fd;
    fds[0].events = POLLIN;

    int exit_code = -1;
    bool reaped = false;

    while (!stop_requested_.load()) {
        int ret = poll(fds, 1, 100);

        if (ret < 0) {
            if (errno == EINTR) continue;
            log_message("pty", "poll failed for pid %d: %s", static_cast<int>(pid_.load()), strerror(errno));
            break;
        }

        bool hangup = ret > 0 && (fds[0].revents & (POLLHUP | POLLERR | POLLNVAL));
        if (ret > 0 && (fds[0].revents & (POLLIN | POLLHUP))) {
            if (!drain_output(fd, buffer, BUFFER_SIZE)) {
                hangup = true;
            }
        }

        if (try_reap(WNOHANG, exit_code)) {
            reaped = true;

            for (int drain_attempts = 0; drain_attempts < 50; ++drain_attempts) {
                ssize_t n = read(fd, buffer, BUFFER_SIZE);
                if (n > 0) {
                    if (output_callback_) {
                        output_callback_(std::string(buffer, static_cast<size_t>(n)));
                    }
                    continue;
                }
                if (n == 0) break;
                if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) break;
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
            break;
        }

        if (hangup) {
            hung_up_.store(true);
            break;
        }
    }

    if (!reaped && stop_requested_.load()) {
        close_pty();

        std::this_thread::sleep_for(std::chrono::milliseconds(50));

        if (!try_reap(WNOHANG, exit_code)) {
            signal_group(SIGKILL);
            try_reap(0, exit_code);
        }
    } else if (!reaped) {
        // The slave side hung up; the shell is normally on its way out.
        for (int attempt = 0; attempt < 100 && !reaped && !stop_requested_.load(); ++attempt) {
            reaped = try_reap(WNOHANG, exit_code);
            if (!reaped) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
        }
        if (!reaped) {
            if (!stop_requested_.load()) {
                log_message("pty", "child %d outlived its terminal, killing it", static_cast<int>(pid_.load()));
            }
            signal_group(SIGKILL);
            try_reap(0, exit_code);
        }
    }

    close_pty();
    running_.store(false);

    ExitCallback exit_callback = exit_callback_;
    if (exit_callback) {
        exit_callback(exit_code);
    }
    finished_.store(true);
}

void ProcessRunner::close_pty() {
    std::lock_guard<std::mutex> lock(fd_mutex_);
    if (pty_fd_ >= 0) {
        close(pty_fd_);
        pty_fd_ = -1;
    }
}

}
