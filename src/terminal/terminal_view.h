#pragma once

#include "core/event_queue.h"
#include "core/session_events.h"
#include "process/output_broadcast.h"
#include "terminal/geometry_sync.h"
#include "terminal/vterminal.h"
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace station {

class SessionRegistry;

// One terminal pane. Shows at most one session at a time; output for it is
// queued by the session's I/O thread and applied by process_events() on the
// UI thread. An emulator is kept per session so switching back shows what
// was already on screen.
class TerminalView {
public:
    using ExitListener = std::function<void(const ExitEvent& event)>;
    using OutputListener = std::function<void(const OutputEvent& event)>;

    TerminalView(SessionRegistry& registry, CellMetrics metrics, float zoom = 1.0f);
    ~TerminalView();

    TerminalView(const TerminalView&) = delete;
    TerminalView& operator=(const TerminalView&) = delete;

    Status show(const SessionId& id);
    void hide();

    const SessionId& current() const { return current_; }
    bool attached() const { return subscription_.attached(); }

    size_t process_events();

    Status send_input(const std::string& bytes);
    Status send_key(int vterm_key, int modifiers = 0);

    GridSize set_surface(float width_px, float height_px);
    GridSize set_zoom(float zoom);
    GeometrySynchronizer& geometry() { return geometry_; }

    VTerminal* terminal(const SessionId& id);
    std::vector<std::string> screen_lines() const;

    void forget(const SessionId& id);

    void set_exit_listener(ExitListener listener) { exit_listener_ = std::move(listener); }
    void set_output_listener(OutputListener listener) { output_listener_ = std::move(listener); }

private:
    VTerminal& terminal_for(const SessionId& id);

    SessionRegistry& registry_;
    GeometrySynchronizer geometry_;

    EventQueue<SessionEvent> events_;
    Subscription subscription_;
    SessionId current_;

    std::unordered_map<SessionId, std::unique_ptr<VTerminal>> terminals_;

    ExitListener exit_listener_;
    OutputListener output_listener_;
};

}
