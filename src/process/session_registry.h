#pragma once

#include "adapters/station_config.h"
#include "core/session_events.h"
#include "core/types.h"
#include "process/terminal_session.h"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace station {

// Owns every live TerminalSession. The only place that spawns shells.
//
// A session leaves the table when its exit event has been observed or when it
// is closed; its id is retired for good at that point. Retired sessions are
// joined lazily from the caller's thread, never from an I/O thread.
class SessionRegistry {
public:
    using ExitObserver = std::function<void(const ExitEvent& event)>;

    explicit SessionRegistry(StationConfig config = StationConfig{});
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    Result<SessionId> create(const ProjectId& project_id, const std::string& working_dir);

    std::vector<SessionDescriptor> list(const std::optional<ProjectId>& project_filter = std::nullopt) const;
    Result<SessionDescriptor> descriptor(const SessionId& id) const;

    Status write(const SessionId& id, const std::string& data);
    Status resize(const SessionId& id, int cols, int rows);
    Status close(const SessionId& id);

    Result<Subscription> attach(const SessionId& id, ChunkHandler on_chunk, ExitHandler on_exit);
    Status detach(Subscription& subscription);

    // Closes every session and waits for their I/O threads.
    void shutdown();

    // Called once per session, on that session's I/O thread.
    void set_exit_observer(ExitObserver observer);

    std::shared_ptr<TerminalSession> find(const SessionId& id) const;
    bool is_retired(const SessionId& id) const;
    size_t size() const;

    const StationConfig& config() const { return config_; }

private:
    ProcessConfig build_config(const ProjectId& project_id, const std::string& working_dir) const;
    SessionId next_id();
    void on_session_exit(const ExitEvent& event);
    void reap_retired();

    StationConfig config_;
    std::string id_salt_;
    std::atomic<uint64_t> next_serial_{1};

    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<TerminalSession>> sessions_;
    std::vector<std::shared_ptr<TerminalSession>> retired_;
    std::unordered_set<SessionId> retired_ids_;
    ExitObserver exit_observer_;
    bool shut_down_ = false;
};

}
