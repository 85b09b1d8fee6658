#pragma once

#include "core/types.h"
#include "core/session_events.h"
#include "process/output_broadcast.h"
#include "process/process_runner.h"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace station {

enum class SessionPhase {
    Starting,
    Running,
    Exited,
    Closed
};

// One shell on one pseudo-terminal. Phases only move forward:
// Starting -> Running -> (Exited | Closed). Leaving Running publishes exactly
// one exit event to subscribers and then to the exit hook.
class TerminalSession {
public:
    using ExitHook = std::function<void(const ExitEvent& event)>;

    TerminalSession(SessionId id, ProjectId project_id);
    ~TerminalSession();

    TerminalSession(const TerminalSession&) = delete;
    TerminalSession& operator=(const TerminalSession&) = delete;

    Status start(const ProcessConfig& config);

    Status write(const std::string& data);
    Status resize(int cols, int rows);
    void close();

    Result<Subscription> attach(ChunkHandler on_chunk, ExitHandler on_exit);

    // Runs the hook immediately if the session already ended.
    void set_exit_hook(ExitHook hook);

    const SessionId& id() const { return id_; }
    const ProjectId& project_id() const { return project_id_; }
    SessionDescriptor descriptor() const;

    SessionPhase phase() const { return phase_.load(); }
    bool is_running() const { return phase_.load() == SessionPhase::Running; }
    int exit_code() const { return exit_code_.load(); }
    pid_t pid() const { return runner_.pid(); }

    void applied_size(int& cols, int& rows) const;
    bool device_size(int& cols, int& rows) const;

    bool finished() const { return runner_.finished(); }
    void join() { runner_.join(); }

    size_t subscriber_count() const { return broadcast_->subscriber_count(); }

    static const char* phase_name(SessionPhase phase);

private:
    void on_process_exit(int exit_code);

    SessionId id_;
    ProjectId project_id_;

    std::atomic<SessionPhase> phase_{SessionPhase::Starting};
    std::atomic<bool> close_requested_{false};
    std::atomic<int> exit_code_{-1};

    std::shared_ptr<OutputBroadcast> broadcast_;

    mutable std::mutex geometry_mutex_;
    int cols_ = 0;
    int rows_ = 0;

    std::mutex hook_mutex_;
    ExitHook exit_hook_;
    std::optional<ExitEvent> pending_exit_;

    // Declared last: its destructor joins the I/O thread, which still uses
    // the members above.
    ProcessRunner runner_;
};

}
