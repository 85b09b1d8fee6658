#include "terminal_session.h"
#include "core/log.h"

namespace station {

TerminalSession::TerminalSession(SessionId id, ProjectId project_id)
    : id_(std::move(id))
    , project_id_(std::move(project_id))
    , broadcast_(std::make_shared<OutputBroadcast>(id_))
{
}

TerminalSession::~TerminalSession() {
    close_requested_.store(true);
    runner_.stop();
    runner_.join();
}

Status TerminalSession::start(const ProcessConfig& config) {
    {
        std::lock_guard<std::mutex> lock(geometry_mutex_);
        cols_ = config.cols;
        rows_ = config.rows;
    }

    std::weak_ptr<OutputBroadcast> broadcast = broadcast_;
    runner_.set_output_callback([broadcast](const std::string& data) {
        if (auto locked = broadcast.lock()) {
            locked->publish(data);
        }
    });
    runner_.set_exit_callback([this](int exit_code) {
        on_process_exit(exit_code);
    });

    Status status = runner_.start(config);
    if (!status.ok()) {
        phase_.store(SessionPhase::Exited);
        broadcast_->finish(-1, false);
        return status;
    }

    SessionPhase expected = SessionPhase::Starting;
    phase_.compare_exchange_strong(expected, SessionPhase::Running);
    return {};
}

Status TerminalSession::write(const std::string& data) {
    if (!is_running()) {
        return Status(ErrorCode::IOError, "session " + id_ + " is no longer running");
    }

    Status status = runner_.write_stdin(data);
    if (!status.ok()) {
        // A broken pipe means the shell is gone; make the I/O thread finish up.
        log_message("session", "write to %s failed: %s", id_.c_str(), status.message.c_str());
        runner_.stop();
    }
    return status;
}

Status TerminalSession::resize(int cols, int rows) {
    if (!is_running()) {
        return Status(ErrorCode::ResizeIgnored, "session " + id_ + " is no longer running");
    }

    std::lock_guard<std::mutex> lock(geometry_mutex_);
    if (cols == cols_ && rows == rows_) {
        return {};
    }
    if (!runner_.resize(rows, cols)) {
        return Status(ErrorCode::ResizeIgnored, "pseudo-terminal of " + id_ + " is closed");
    }
    cols_ = cols;
    rows_ = rows;
    return {};
}

void TerminalSession::close() {
    SessionPhase current = phase_.load();
    if (current == SessionPhase::Exited || current == SessionPhase::Closed) {
        return;
    }
    close_requested_.store(true);
    runner_.stop();
}

Result<Subscription> TerminalSession::attach(ChunkHandler on_chunk, ExitHandler on_exit) {
    if (!is_running()) {
        return Status(ErrorCode::UnknownSession, "session " + id_ + " has ended");
    }

    auto token = broadcast_->subscribe(std::move(on_chunk), std::move(on_exit));
    if (!token) {
        return Status(ErrorCode::UnknownSession, "session " + id_ + " has ended");
    }
    return Subscription(broadcast_, *token);
}

void TerminalSession::set_exit_hook(ExitHook hook) {
    std::optional<ExitEvent> pending;
    {
        std::lock_guard<std::mutex> lock(hook_mutex_);
        exit_hook_ = hook;
        pending.swap(pending_exit_);
    }
    if (pending && hook) {
        hook(*pending);
    }
}

SessionDescriptor TerminalSession::descriptor() const {
    SessionDescriptor descriptor;
    descriptor.id = id_;
    descriptor.project_id = project_id_;
    descriptor.is_running = is_running();
    return descriptor;
}

void TerminalSession::applied_size(int& cols, int& rows) const {
    std::lock_guard<std::mutex> lock(geometry_mutex_);
    cols = cols_;
    rows = rows_;
}

bool TerminalSession::device_size(int& cols, int& rows) const {
    return runner_.window_size(rows, cols);
}

void TerminalSession::on_process_exit(int exit_code) {
    bool closed = close_requested_.load();
    SessionPhase target = closed ? SessionPhase::Closed : SessionPhase::Exited;

    SessionPhase current = phase_.load();
    do {
        if (current == SessionPhase::Exited || current == SessionPhase::Closed) {
            return;
        }
    } while (!phase_.compare_exchange_weak(current, target));

    exit_code_.store(closed ? -1 : exit_code);
    broadcast_->finish(exit_code_.load(), closed);

    ExitEvent event{id_, exit_code_.load(), closed};
    ExitHook hook;
    {
        std::lock_guard<std::mutex> lock(hook_mutex_);
        if (!exit_hook_) {
            pending_exit_ = event;
            return;
        }
        hook = exit_hook_;
    }
    hook(event);
}

const char* TerminalSession::phase_name(SessionPhase phase) {
    switch (phase) {
        case SessionPhase::Starting: return "Starting";
        case SessionPhase::Running:  return "Running";
        case SessionPhase::Exited:   return "Exited";
        case SessionPhase::Closed:   return "Closed";
    }
    return "Unknown";
}

}
