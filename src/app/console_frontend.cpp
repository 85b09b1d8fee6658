#include "app/console_frontend.h"
#include "adapters/display_name_store.h"
#include "core/log.h"
#include "process/session_registry.h"
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace station {

namespace {

constexpr int POLL_INTERVAL_MS = 16;

// A grid larger than the user's window cannot be shown.
constexpr float CONSOLE_MIN_ZOOM = 1.0f;

volatile sig_atomic_t g_window_changed = 0;

void on_sigwinch(int) {
    g_window_changed = 1;
}

}

ConsoleFrontend::ConsoleFrontend(SessionRegistry& registry, DisplayNameStore& names, int in_fd, int out_fd)
    : registry_(registry)
    , in_fd_(in_fd)
    , out_fd_(out_fd)
    , view_(registry,
            CellMetrics{registry.config().cell_width, registry.config().cell_height},
            std::max(CONSOLE_MIN_ZOOM, registry.config().zoom))
    , workspace_(registry, view_, names)
{
    view_.set_output_listener([this](const OutputEvent& event) {
        if (event.session_id == view_.current() && event.session_id == drawn_) {
            write_out(event.data);
        }
    });
}

ConsoleFrontend::~ConsoleFrontend() {
    leave_raw_mode();
}

int ConsoleFrontend::run(const std::vector<Project>& projects) {
    if (projects.empty()) {
        fprintf(stderr, "station: no project to open\n");
        return 1;
    }
    if (!enter_raw_mode()) {
        fprintf(stderr, "station: standard input is not a terminal\n");
        return 1;
    }

    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = on_sigwinch;
    sigemptyset(&sa.sa_mask);
    struct sigaction old_sa;
    sigaction(SIGWINCH, &sa, &old_sa);

    open(projects);

    char buffer[4096];
    while (running_) {
        if (g_window_changed) {
            g_window_changed = 0;
            sync_window_size();
        }

        struct pollfd pfd;
        pfd.fd = in_fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ret = poll(&pfd, 1, POLL_INTERVAL_MS);
        if (ret < 0 && errno != EINTR) {
            break;
        }

        if (ret > 0 && (pfd.revents & POLLIN)) {
            ssize_t n = read(in_fd_, buffer, sizeof(buffer));
            if (n > 0) {
                handle_input(buffer, static_cast<size_t>(n));
            } else if (n == 0) {
                running_ = false;
            }
        } else if (ret > 0 && (pfd.revents & (POLLHUP | POLLERR))) {
            running_ = false;
        }

        pump();
    }

    sigaction(SIGWINCH, &old_sa, nullptr);

    write_out("\x1b[H\x1b[2J");
    leave_raw_mode();
    registry_.shutdown();
    return 0;
}

void ConsoleFrontend::open(const std::vector<Project>& projects) {
    projects_ = projects;
    project_index_ = 0;
    running_ = !projects_.empty();
    if (!running_) return;

    sync_window_size();
    activate_current_project();
}

bool ConsoleFrontend::handle_input(const char* data, size_t len) {
    std::string passthrough;

    for (size_t i = 0; i < len && running_; ++i) {
        char c = data[i];

        if (renaming_) {
            handle_rename_key(c);
            continue;
        }

        if (prefix_pending_) {
            prefix_pending_ = false;
            if (c == PREFIX_KEY) {
                passthrough += c;
                continue;
            }
            forward(passthrough);
            passthrough.clear();
            running_ = handle_command(c);
            continue;
        }

        if (c == PREFIX_KEY) {
            prefix_pending_ = true;
            continue;
        }
        passthrough += c;
    }

    forward(passthrough);
    return running_;
}

void ConsoleFrontend::forward(const std::string& keys) {
    if (keys.empty()) return;

    // A dead session reports itself through its exit event.
    Status status = view_.send_input(keys);
    if (!status.ok() && status.code != ErrorCode::UnknownSession && status.code != ErrorCode::IOError) {
        show_status(status.to_string());
    }
}

bool ConsoleFrontend::handle_command(char c) {
    switch (c) {
        case 'q':
            return false;
        case 'c': {
            auto result = workspace_.add_session();
            if (!result.ok()) {
                show_status(result.status().to_string());
            }
            break;
        }
        case 'x': {
            SessionId id = workspace_.active_session();
            if (!id.empty() && !workspace_.close_session(id)) {
                show_status("the last terminal of a project stays open");
            }
            break;
        }
        case 'n':
            cycle_session(1);
            break;
        case 'p':
            cycle_session(-1);
            break;
        case ']':
            switch_project(1);
            break;
        case '[':
            switch_project(-1);
            break;
        case '+':
        case '=':
            zoom_to(view_.geometry().zoom() + ZOOM_STEP);
            break;
        case '-':
            zoom_to(view_.geometry().zoom() - ZOOM_STEP);
            break;
        case '0':
            zoom_to(1.0f);
            break;
        case 'r':
            if (!workspace_.active_session().empty()) {
                renaming_ = true;
                rename_buffer_.clear();
                update_title();
            }
            break;
        default:
            break;
    }
    return true;
}

void ConsoleFrontend::handle_rename_key(char c) {
    if (c == '\r' || c == '\n') {
        renaming_ = false;
        if (!workspace_.rename_session(workspace_.active_session(), rename_buffer_)) {
            show_status("name unchanged");
        }
        update_title();
    } else if (c == 0x1b || c == 0x03) {
        renaming_ = false;
        update_title();
    } else if (c == 0x7f || c == 0x08) {
        if (!rename_buffer_.empty()) {
            rename_buffer_.pop_back();
        }
        update_title();
    } else if (static_cast<unsigned char>(c) >= 0x20) {
        rename_buffer_ += c;
        update_title();
    }
}

void ConsoleFrontend::pump() {
    view_.process_events();
    workspace_.process_exits();

    if (view_.current() != drawn_ || needs_redraw_) {
        redraw();
    }
}

void ConsoleFrontend::switch_project(int delta) {
    if (projects_.size() < 2) return;
    size_t count = projects_.size();
    project_index_ = (project_index_ + static_cast<size_t>(static_cast<int>(count) + delta)) % count;
    activate_current_project();
}

void ConsoleFrontend::cycle_session(int delta) {
    auto ids = workspace_.sessions();
    if (ids.size() < 2) return;
    size_t count = ids.size();
    size_t next = (workspace_.active_index() + static_cast<size_t>(static_cast<int>(count) + delta)) % count;
    Status status = workspace_.select_session(next);
    if (!status.ok()) {
        show_status(status.to_string());
    }
}

void ConsoleFrontend::sync_window_size() {
    struct winsize ws;
    if (ioctl(out_fd_, TIOCGWINSZ, &ws) < 0 || ws.ws_col == 0 || ws.ws_row == 0) {
        return;
    }
    // The window is measured in cells of the configured size.
    CellMetrics metrics = view_.geometry().metrics();
    view_.set_surface(ws.ws_col * metrics.width, ws.ws_row * metrics.height);
    needs_redraw_ = true;
}

void ConsoleFrontend::zoom_to(float zoom) {
    // Snap to whole steps so repeated steps land back on 1.0 exactly.
    float snapped = static_cast<float>(std::lround(zoom / ZOOM_STEP)) * ZOOM_STEP;
    float clamped = std::clamp(snapped, CONSOLE_MIN_ZOOM, MAX_ZOOM);
    if (clamped == view_.geometry().zoom()) {
        return;
    }
    view_.set_zoom(clamped);
    needs_redraw_ = true;
}

void ConsoleFrontend::activate_current_project() {
    Status status = workspace_.activate(projects_[project_index_]);
    needs_redraw_ = true;
    if (!status.ok()) {
        show_status("cannot start a shell in " + projects_[project_index_].path + ": " + status.message);
    }
}

void ConsoleFrontend::redraw() {
    drawn_ = view_.current();
    needs_redraw_ = false;

    std::string frame = "\x1b[0m\x1b[H\x1b[2J";
    if (drawn_.empty()) {
        frame += "No terminal is running here. Press Ctrl-] c to open one.\r\n";
    } else {
        if (VTerminal* terminal = view_.terminal(drawn_)) {
            for (int row = 0; row < terminal->rows(); ++row) {
                frame += terminal->row_ansi(row);
                if (row + 1 < terminal->rows()) {
                    frame += "\r\n";
                }
            }
            CursorInfo cursor = terminal->get_cursor();
            frame += "\x1b[" + std::to_string(cursor.row + 1) + ";" + std::to_string(cursor.col + 1) + "H";
        }
    }

    if (!pending_status_.empty()) {
        frame += "\x1b[1;31m[station] " + pending_status_ + "\x1b[0m\r\n";
        pending_status_.clear();
    }

    write_out(frame);
    update_title();
}

void ConsoleFrontend::update_title() {
    std::string title = "station";
    if (workspace_.active_project()) {
        title += ": " + workspace_.active_project()->name;
    }

    SessionId id = workspace_.active_session();
    if (!id.empty()) {
        title += " - " + workspace_.display_name(id) + " (" + std::to_string(workspace_.active_index() + 1)
            + "/" + std::to_string(workspace_.sessions().size()) + ")";
    }
    if (renaming_) {
        title += " - rename: " + rename_buffer_;
    }

    write_out("\x1b]0;" + title + "\x07");
}

void ConsoleFrontend::show_status(const std::string& message) {
    if (needs_redraw_ || view_.current() != drawn_) {
        pending_status_ = message;
        return;
    }
    write_out("\r\n\x1b[1;31m[station] " + message + "\x1b[0m\r\n");
}

void ConsoleFrontend::write_out(const std::string& data) {
    size_t offset = 0;
    while (offset < data.size()) {
        ssize_t n = ::write(out_fd_, data.data() + offset, data.size() - offset);
        if (n < 0) {
            if (errno == EINTR) continue;
            return;
        }
        offset += static_cast<size_t>(n);
    }
}

bool ConsoleFrontend::enter_raw_mode() {
    if (raw_mode_) return true;
    if (!isatty(in_fd_) || tcgetattr(in_fd_, &saved_termios_) < 0) {
        return false;
    }

    struct termios raw = saved_termios_;
    cfmakeraw(&raw);
    if (tcsetattr(in_fd_, TCSANOW, &raw) < 0) {
        return false;
    }

    raw_mode_ = true;
    logging_was_enabled_ = logging_enabled();
    set_logging_enabled(false);
    return true;
}

void ConsoleFrontend::leave_raw_mode() {
    if (!raw_mode_) return;
    tcsetattr(in_fd_, TCSANOW, &saved_termios_);
    raw_mode_ = false;
    set_logging_enabled(logging_was_enabled_);
}

}
