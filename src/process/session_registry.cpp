#include "session_registry.h"
#include "core/log.h"
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <random>

namespace station {

namespace {

std::string make_salt() {
    std::random_device rd;
    char buffer[9];
    std::snprintf(buffer, sizeof(buffer), "%08x", static_cast<unsigned>(rd()));
    return buffer;
}

std::string get_working_dir() {
    const char* home = std::getenv("HOME");
    return home ? home : "/tmp";
}

}

SessionRegistry::SessionRegistry(StationConfig config)
    : config_(std::move(config))
    , id_salt_(make_salt())
{
}

SessionRegistry::~SessionRegistry() {
    shutdown();
}

SessionId SessionRegistry::next_id() {
    return "t-" + id_salt_ + "-" + std::to_string(next_serial_.fetch_add(1));
}

ProcessConfig SessionRegistry::build_config(const ProjectId& project_id, const std::string& working_dir) const {
    ProcessConfig config;
    config.executable = config_.resolved_shell();
    config.args = config_.shell_args;
    config.working_dir = working_dir.empty() ? get_working_dir() : working_dir;
    config.rows = config_.default_rows;
    config.cols = config_.default_cols;

    config.env.emplace_back("TERM", "xterm-256color");
    config.env.emplace_back("COLORTERM", "truecolor");
    // Agents started from the same project share one task list.
    config.env.emplace_back("CLAUDE_CODE_TASK_LIST_ID", project_id);
    for (const auto& kv : config_.env) {
        config.env.push_back(kv);
    }
    return config;
}

Result<SessionId> SessionRegistry::create(const ProjectId& project_id, const std::string& working_dir) {
    reap_retired();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) {
            return Status(ErrorCode::SpawnError, "registry is shut down");
        }
    }

    SessionId id = next_id();
    auto session = std::make_shared<TerminalSession>(id, project_id);

    Status status = session->start(build_config(project_id, working_dir));
    if (!status.ok()) {
        log_message("registry", "spawn for project %s failed: %s",
            project_id.c_str(), status.message.c_str());
        return status;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) {
            session->close();
            retired_ids_.insert(id);
            retired_.push_back(session);
            return Status(ErrorCode::SpawnError, "registry is shut down");
        }
        sessions_.push_back(session);
    }

    // Installed after insertion so an instant exit still finds the entry.
    session->set_exit_hook([this](const ExitEvent& event) {
        on_session_exit(event);
    });

    return id;
}

std::vector<SessionDescriptor> SessionRegistry::list(const std::optional<ProjectId>& project_filter) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SessionDescriptor> result;
    for (const auto& session : sessions_) {
        if (project_filter && session->project_id() != *project_filter) {
            continue;
        }
        result.push_back(session->descriptor());
    }
    return result;
}

Result<SessionDescriptor> SessionRegistry::descriptor(const SessionId& id) const {
    auto session = find(id);
    if (!session) {
        return Status(ErrorCode::UnknownSession, "unknown session " + id);
    }
    return session->descriptor();
}

Status SessionRegistry::write(const SessionId& id, const std::string& data) {
    auto session = find(id);
    if (!session) {
        return Status(ErrorCode::UnknownSession, "unknown session " + id);
    }
    return session->write(data);
}

Status SessionRegistry::resize(const SessionId& id, int cols, int rows) {
    auto session = find(id);
    if (!session) {
        if (is_retired(id)) {
            return Status(ErrorCode::ResizeIgnored, "session " + id + " has ended");
        }
        return Status(ErrorCode::UnknownSession, "unknown session " + id);
    }
    return session->resize(cols, rows);
}

Status SessionRegistry::close(const SessionId& id) {
    reap_retired();

    std::shared_ptr<TerminalSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(sessions_.begin(), sessions_.end(),
            [&id](const std::shared_ptr<TerminalSession>& s) { return s->id() == id; });
        if (it == sessions_.end()) {
            return {};
        }
        session = *it;
        sessions_.erase(it);
        retired_ids_.insert(id);
        retired_.push_back(session);
    }

    session->close();
    return {};
}

Result<Subscription> SessionRegistry::attach(const SessionId& id, ChunkHandler on_chunk, ExitHandler on_exit) {
    auto session = find(id);
    if (!session) {
        return Status(ErrorCode::UnknownSession, "unknown session " + id);
    }
    return session->attach(std::move(on_chunk), std::move(on_exit));
}

Status SessionRegistry::detach(Subscription& subscription) {
    subscription.detach();
    return {};
}

void SessionRegistry::shutdown() {
    std::vector<std::shared_ptr<TerminalSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shut_down_ = true;
        for (auto& session : sessions_) {
            retired_ids_.insert(session->id());
            sessions.push_back(session);
        }
        sessions_.clear();
        for (auto& session : retired_) {
            sessions.push_back(session);
        }
        retired_.clear();
    }

    for (auto& session : sessions) {
        session->close();
    }
    for (auto& session : sessions) {
        session->join();
    }
}

void SessionRegistry::set_exit_observer(ExitObserver observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    exit_observer_ = std::move(observer);
}

std::shared_ptr<TerminalSession> SessionRegistry::find(const SessionId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& session : sessions_) {
        if (session->id() == id) {
            return session;
        }
    }
    return nullptr;
}

bool SessionRegistry::is_retired(const SessionId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return retired_ids_.count(id) > 0;
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

void SessionRegistry::on_session_exit(const ExitEvent& event) {
    ExitObserver observer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(sessions_.begin(), sessions_.end(),
            [&event](const std::shared_ptr<TerminalSession>& s) { return s->id() == event.session_id; });
        if (it != sessions_.end()) {
            retired_ids_.insert(event.session_id);
            retired_.push_back(*it);
            sessions_.erase(it);
        }
        observer = exit_observer_;
    }

    if (observer) {
        observer(event);
    }
}

void SessionRegistry::reap_retired() {
    std::vector<std::shared_ptr<TerminalSession>> done;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto split = std::stable_partition(retired_.begin(), retired_.end(),
            [](const std::shared_ptr<TerminalSession>& s) { return !s->finished(); });
        done.assign(std::make_move_iterator(split), std::make_move_iterator(retired_.end()));
        retired_.erase(split, retired_.end());
    }

    for (auto& session : done) {
        session->join();
    }
}

}
