#pragma once

#include "core/types.h"
#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include <sys/types.h>

namespace station {

struct ProcessConfig {
    std::string executable;
    std::vector<std::string> args;
    std::string working_dir;
    std::vector<std::pair<std::string, std::string>> env;
    int rows = 24;
    int cols = 80;
};

using OutputCallback = std::function<void(const std::string& data)>;
using ExitCallback = std::function<void(int exit_code)>;

// A child process attached to a freshly allocated pseudo-terminal. One I/O
// thread reads the master side until the child is reaped; writes and resizes
// happen on the caller's thread. Callbacks run on the I/O thread and must be
// installed before start().
class ProcessRunner {
public:
    ProcessRunner();
    ~ProcessRunner();

    ProcessRunner(const ProcessRunner&) = delete;
    ProcessRunner& operator=(const ProcessRunner&) = delete;

    Status start(const ProcessConfig& config);
    void stop();
    void kill();
    void join();

    Status write_stdin(const std::string& data);
    bool resize(int rows, int cols);
    bool window_size(int& rows, int& cols) const;

    bool is_running() const { return running_.load(); }
    bool finished() const { return finished_.load(); }
    pid_t pid() const { return pid_.load(); }

    void set_output_callback(OutputCallback cb) { output_callback_ = std::move(cb); }
    void set_exit_callback(ExitCallback cb) { exit_callback_ = std::move(cb); }

    static std::string resolve_executable(const std::string& executable);

private:
    void io_thread_func();
    bool drain_output(int fd, char* buffer, size_t size);
    bool try_reap(int options, int& exit_code);
    void signal_group(int sig);
    void close_pty();

    std::atomic<pid_t> pid_{-1};
    std::mutex pid_mutex_;

    int pty_fd_ = -1;
    mutable std::mutex fd_mutex_;
    std::mutex write_mutex_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> hung_up_{false};
    std::atomic<bool> finished_{false};
    std::thread io_thread_;

    OutputCallback output_callback_;
    ExitCallback exit_callback_;
};

}
