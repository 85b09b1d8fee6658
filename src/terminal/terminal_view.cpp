#include "terminal_view.h"
#include "process/session_registry.h"
#include <type_traits>
#include <variant>

namespace station {

namespace {
const char* EXIT_BANNER = "\r\n\x1b[90m[Process exited]\x1b[0m\r\n";
}

TerminalView::TerminalView(SessionRegistry& registry, CellMetrics metrics, float zoom)
    : registry_(registry)
    , geometry_(registry, metrics, zoom)
{
}

TerminalView::~TerminalView() {
    // Must stop delivery before events_ goes away.
    subscription_.detach();
}

Status TerminalView::show(const SessionId& id) {
    if (id == current_ && subscription_.attached()) {
        return {};
    }

    hide();

    auto result = registry_.attach(id,
        [this](const OutputEvent& event) { events_.push(event); },
        [this](const ExitEvent& event) { events_.push(event); });
    if (!result.ok()) {
        return result.status();
    }

    subscription_ = result.take();
    current_ = id;

    GridSize grid = geometry_.became_visible(id);
    terminal_for(id).resize(grid.rows, grid.cols);
    return {};
}

void TerminalView::hide() {
    subscription_.detach();
    current_.clear();
}

size_t TerminalView::process_events() {
    size_t handled = 0;
    while (auto event_opt = events_.try_pop()) {
        ++handled;
        std::visit([this](auto&& evt) {
            using T = std::decay_t<decltype(evt)>;

            if constexpr (std::is_same_v<T, OutputEvent>) {
                // Chunks can still be queued for a session that was forgotten.
                auto it = terminals_.find(evt.session_id);
                if (it == terminals_.end()) {
                    return;
                }
                it->second->write(evt.data.data(), evt.data.size());
                if (output_listener_) {
                    output_listener_(evt);
                }
            }
            else if constexpr (std::is_same_v<T, ExitEvent>) {
                auto it = terminals_.find(evt.session_id);
                if (it != terminals_.end()) {
                    it->second->write(EXIT_BANNER, std::char_traits<char>::length(EXIT_BANNER));
                }
                geometry_.forget(evt.session_id);
                if (evt.session_id == current_) {
                    subscription_.detach();
                }
                if (exit_listener_) {
                    exit_listener_(evt);
                }
            }
        }, *event_opt);
    }
    return handled;
}

Status TerminalView::send_input(const std::string& bytes) {
    if (current_.empty()) {
        return Status(ErrorCode::UnknownSession, "no session is shown");
    }
    return registry_.write(current_, bytes);
}

Status TerminalView::send_key(int vterm_key, int modifiers) {
    if (current_.empty()) {
        return Status(ErrorCode::UnknownSession, "no session is shown");
    }
    VTerminal& terminal = terminal_for(current_);
    terminal.keyboard_key(vterm_key, modifiers);
    std::string output = terminal.get_output();
    if (output.empty()) {
        return {};
    }
    return registry_.write(current_, output);
}

GridSize TerminalView::set_surface(float width_px, float height_px) {
    GridSize grid = geometry_.surface_changed(current_, width_px, height_px);
    if (!current_.empty()) {
        terminal_for(current_).resize(grid.rows, grid.cols);
    }
    return grid;
}

GridSize TerminalView::set_zoom(float zoom) {
    GridSize grid = geometry_.zoom_changed(current_, zoom);
    if (!current_.empty()) {
        terminal_for(current_).resize(grid.rows, grid.cols);
    }
    return grid;
}

VTerminal* TerminalView::terminal(const SessionId& id) {
    auto it = terminals_.find(id);
    return it == terminals_.end() ? nullptr : it->second.get();
}

std::vector<std::string> TerminalView::screen_lines() const {
    auto it = terminals_.find(current_);
    if (it == terminals_.end()) {
        return {};
    }
    return it->second->screen_text();
}

void TerminalView::forget(const SessionId& id) {
    if (id == current_) {
        hide();
    }
    terminals_.erase(id);
    geometry_.forget(id);
}

VTerminal& TerminalView::terminal_for(const SessionId& id) {
    auto it = terminals_.find(id);
    if (it == terminals_.end()) {
        GridSize grid = geometry_.grid();
        it = terminals_.emplace(id, std::make_unique<VTerminal>(grid.rows, grid.cols)).first;
    }
    return *it->second;
}

}
