#pragma once

#include "core/event_queue.h"
#include "core/session_events.h"
#include "core/types.h"
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace station {

class DisplayNameStore;
class SessionRegistry;
class TerminalView;

// What the UI believes about each project's terminals: an ordered list of
// session ids and which one is showing. This view is reconciled against the
// registry on every project activation and never mutates a session just
// because focus moved. UI thread only.
class Workspace {
public:
    Workspace(SessionRegistry& registry, TerminalView& view, DisplayNameStore& names);
    ~Workspace();

    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;

    // Attaches the view to the project's running sessions, spawning one only
    // if this project has never had a session in this run.
    Status activate(const Project& project);

    Result<SessionId> add_session();
    // Refuses to close the project's last terminal.
    bool close_session(const SessionId& id);
    Status select_session(size_t index);

    // Applies exits reported by the registry. Call once per frame.
    size_t process_exits();
    void on_session_exit(const SessionId& id);

    const std::optional<Project>& active_project() const { return active_project_; }
    std::vector<SessionId> sessions() const;
    std::vector<SessionId> sessions_for(const ProjectId& project_id) const;
    SessionId active_session() const;
    size_t active_index() const;

    std::string display_name(const SessionId& id) const;
    bool rename_session(const SessionId& id, const std::string& name);

    bool has_spawned(const ProjectId& project_id) const { return spawned_.count(project_id) > 0; }

private:
    struct ProjectSessions {
        std::vector<SessionId> ids;
        size_t active = 0;
    };

    void refresh(const ProjectId& project_id);
    Status show_active();
    bool locate(const SessionId& id, ProjectId& project_id, size_t& slot) const;
    void drop(const ProjectId& project_id, size_t slot);

    SessionRegistry& registry_;
    TerminalView& view_;
    DisplayNameStore& names_;

    std::optional<Project> active_project_;
    std::unordered_map<ProjectId, ProjectSessions> projects_;
    std::unordered_set<ProjectId> spawned_;

    // Shared with the registry's exit observer, which may still be running on
    // an I/O thread while this object is destroyed.
    std::shared_ptr<EventQueue<ExitEvent>> exits_;
};

}
