#pragma once

#include "app/workspace.h"
#include "terminal/terminal_view.h"
#include <string>
#include <vector>
#include <termios.h>

namespace station {

class DisplayNameStore;
class SessionRegistry;

// Drives the session manager from the user's own terminal: one session is
// shown full-screen at a time and Ctrl-] introduces a command key.
class ConsoleFrontend {
public:
    static constexpr char PREFIX_KEY = 0x1d;

    ConsoleFrontend(SessionRegistry& registry, DisplayNameStore& names, int in_fd, int out_fd);
    ~ConsoleFrontend();

    ConsoleFrontend(const ConsoleFrontend&) = delete;
    ConsoleFrontend& operator=(const ConsoleFrontend&) = delete;

    // Returns the process exit status.
    int run(const std::vector<Project>& projects);

    // Takes over the project list and activates the first project.
    void open(const std::vector<Project>& projects);

    // Feeds keyboard bytes as if typed; false once quit was requested.
    bool handle_input(const char* data, size_t len);
    // One iteration of UI work: applies queued output and exits, redraws on switch.
    void pump();

    void switch_project(int delta);
    void cycle_session(int delta);
    void sync_window_size();
    // Steps of ZOOM_STEP between 1.0 and MAX_ZOOM; zooming in shrinks the grid.
    void zoom_to(float zoom);

    Workspace& workspace() { return workspace_; }
    TerminalView& view() { return view_; }
    bool running() const { return running_; }

private:
    void forward(const std::string& keys);
    bool handle_command(char c);
    void handle_rename_key(char c);
    void activate_current_project();

    bool enter_raw_mode();
    void leave_raw_mode();

    void redraw();
    void update_title();
    void show_status(const std::string& message);
    void write_out(const std::string& data);

    SessionRegistry& registry_;
    int in_fd_;
    int out_fd_;

    TerminalView view_;
    Workspace workspace_;

    std::vector<Project> projects_;
    size_t project_index_ = 0;

    bool running_ = false;
    bool prefix_pending_ = false;
    bool renaming_ = false;
    std::string rename_buffer_;

    SessionId drawn_;
    bool needs_redraw_ = true;
    std::string pending_status_;

    bool raw_mode_ = false;
    bool logging_was_enabled_ = true;
    struct termios saved_termios_{};
};

}
