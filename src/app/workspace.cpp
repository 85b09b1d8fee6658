#include "app/workspace.h"
#include "adapters/display_name_store.h"
#include "core/log.h"
#include "process/session_registry.h"
#include "terminal/terminal_view.h"
#include <algorithm>
#include <cctype>

namespace station {

namespace {

bool is_blank(const std::string& name) {
    return std::all_of(name.begin(), name.end(),
        [](unsigned char c) { return std::isspace(c) != 0; });
}

}

Workspace::Workspace(SessionRegistry& registry, TerminalView& view, DisplayNameStore& names)
    : registry_(registry)
    , view_(view)
    , names_(names)
    , exits_(std::make_shared<EventQueue<ExitEvent>>())
{
    std::weak_ptr<EventQueue<ExitEvent>> exits = exits_;
    registry_.set_exit_observer([exits](const ExitEvent& event) {
        if (auto queue = exits.lock()) {
            queue->push(event);
        }
    });
}

Workspace::~Workspace() {
    registry_.set_exit_observer(nullptr);
    exits_->close();
}

Status Workspace::activate(const Project& project) {
    active_project_ = project;
    refresh(project.id);

    ProjectSessions& entry = projects_[project.id];
    if (!entry.ids.empty()) {
        spawned_.insert(project.id);
        return show_active();
    }

    if (has_spawned(project.id)) {
        // The project's terminals have all ended; a new one is the user's call.
        view_.hide();
        return {};
    }

    auto result = registry_.create(project.id, project.path);
    if (!result.ok()) {
        view_.hide();
        return result.status();
    }

    spawned_.insert(project.id);
    entry.ids.push_back(result.value());
    entry.active = 0;
    return show_active();
}

Result<SessionId> Workspace::add_session() {
    if (!active_project_) {
        return Status(ErrorCode::SpawnError, "no active project");
    }

    auto result = registry_.create(active_project_->id, active_project_->path);
    if (!result.ok()) {
        return result;
    }

    spawned_.insert(active_project_->id);
    ProjectSessions& entry = projects_[active_project_->id];
    entry.ids.push_back(result.value());
    entry.active = entry.ids.size() - 1;

    Status status = show_active();
    if (!status.ok()) {
        return status;
    }
    return result;
}

bool Workspace::close_session(const SessionId& id) {
    ProjectId project_id;
    size_t slot = 0;
    if (!locate(id, project_id, slot)) {
        return false;
    }
    if (projects_[project_id].ids.size() <= 1) {
        return false;
    }

    Status status = registry_.close(id);
    if (!status.ok()) {
        log_message("workspace", "close %s: %s", id.c_str(), status.to_string().c_str());
    }
    drop(project_id, slot);
    return true;
}

Status Workspace::select_session(size_t index) {
    if (!active_project_) {
        return Status(ErrorCode::UnknownSession, "no active project");
    }
    ProjectSessions& entry = projects_[active_project_->id];
    if (index >= entry.ids.size()) {
        return Status(ErrorCode::UnknownSession, "no terminal at position " + std::to_string(index + 1));
    }
    entry.active = index;
    return show_active();
}

size_t Workspace::process_exits() {
    size_t handled = 0;
    for (auto& event : exits_->drain()) {
        on_session_exit(event.session_id);
        ++handled;
    }
    return handled;
}

void Workspace::on_session_exit(const SessionId& id) {
    ProjectId project_id;
    size_t slot = 0;
    if (locate(id, project_id, slot)) {
        drop(project_id, slot);
    }
}

std::vector<SessionId> Workspace::sessions() const {
    if (!active_project_) return {};
    return sessions_for(active_project_->id);
}

std::vector<SessionId> Workspace::sessions_for(const ProjectId& project_id) const {
    auto it = projects_.find(project_id);
    if (it == projects_.end()) return {};
    return it->second.ids;
}

SessionId Workspace::active_session() const {
    if (!active_project_) return {};
    auto it = projects_.find(active_project_->id);
    if (it == projects_.end() || it->second.ids.empty()) return {};
    return it->second.ids[it->second.active];
}

size_t Workspace::active_index() const {
    if (!active_project_) return 0;
    auto it = projects_.find(active_project_->id);
    return it == projects_.end() ? 0 : it->second.active;
}

std::string Workspace::display_name(const SessionId& id) const {
    ProjectId project_id;
    size_t slot = 0;
    if (!locate(id, project_id, slot)) {
        return id;
    }
    if (auto name = names_.get(project_id, slot)) {
        return *name;
    }
    return "Agent " + std::to_string(slot + 1);
}

bool Workspace::rename_session(const SessionId& id, const std::string& name) {
    if (is_blank(name)) {
        return false;
    }
    ProjectId project_id;
    size_t slot = 0;
    if (!locate(id, project_id, slot)) {
        return false;
    }
    if (!names_.set(project_id, slot, name)) {
        log_message("workspace", "could not persist name for %s", id.c_str());
    }
    return true;
}

void Workspace::refresh(const ProjectId& project_id) {
    ProjectSessions& entry = projects_[project_id];
    SessionId shown = entry.ids.empty() ? SessionId{} : entry.ids[entry.active];

    std::vector<SessionId> running;
    for (const auto& descriptor : registry_.list(project_id)) {
        if (descriptor.is_running) {
            running.push_back(descriptor.id);
        }
    }

    // Keep the cached order, drop what ended, append what the view missed.
    std::vector<SessionId> merged;
    for (const auto& id : entry.ids) {
        if (std::find(running.begin(), running.end(), id) != running.end()) {
            merged.push_back(id);
        }
    }
    for (const auto& id : running) {
        if (std::find(merged.begin(), merged.end(), id) == merged.end()) {
            merged.push_back(id);
        }
    }

    entry.ids = std::move(merged);
    auto it = std::find(entry.ids.begin(), entry.ids.end(), shown);
    entry.active = it == entry.ids.end() ? 0 : static_cast<size_t>(it - entry.ids.begin());
}

Status Workspace::show_active() {
    if (!active_project_) {
        view_.hide();
        return {};
    }

    ProjectSessions& entry = projects_[active_project_->id];
    while (!entry.ids.empty()) {
        entry.active = std::min(entry.active, entry.ids.size() - 1);
        Status status = view_.show(entry.ids[entry.active]);
        if (status.ok()) {
            return status;
        }
        if (status.code != ErrorCode::UnknownSession) {
            return status;
        }
        // Ended before we got to it.
        drop(active_project_->id, entry.active);
    }

    view_.hide();
    return {};
}

bool Workspace::locate(const SessionId& id, ProjectId& project_id, size_t& slot) const {
    for (const auto& [pid, entry] : projects_) {
        auto it = std::find(entry.ids.begin(), entry.ids.end(), id);
        if (it != entry.ids.end()) {
            project_id = pid;
            slot = static_cast<size_t>(it - entry.ids.begin());
            return true;
        }
    }
    return false;
}

void Workspace::drop(const ProjectId& project_id, size_t slot) {
    ProjectSessions& entry = projects_[project_id];
    if (slot >= entry.ids.size()) return;

    SessionId id = entry.ids[slot];
    bool was_shown = id == view_.current();

    entry.ids.erase(entry.ids.begin() + static_cast<std::ptrdiff_t>(slot));
    names_.remove_slot(project_id, slot);
    view_.forget(id);

    if (slot < entry.active) {
        --entry.active;
    }
    if (!entry.ids.empty()) {
        entry.active = std::min(entry.active, entry.ids.size() - 1);
    } else {
        entry.active = 0;
    }

    if (was_shown && active_project_ && active_project_->id == project_id) {
        Status status = show_active();
        if (!status.ok()) {
            log_message("workspace", "cannot show next terminal: %s", status.to_string().c_str());
        }
    }
}

}
