#pragma once

#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <vector>

namespace station {

constexpr int TERMINAL_MAX_CHARS_PER_CELL = 6;

struct TerminalCell {
    uint32_t chars[TERMINAL_MAX_CHARS_PER_CELL];
    uint8_t width;
    uint32_t fg;
    uint32_t bg;
    bool bold;
    bool underline;
    bool reverse;
};

struct CursorInfo {
    int row;
    int col;
    bool visible;
};

class VTerminalImpl;

// Screen model of one displayed session, backed by libvterm. Keeps what was
// rendered while the pane is showing something else.
class VTerminal {
public:
    VTerminal(int rows, int cols);
    ~VTerminal();

    VTerminal(const VTerminal&) = delete;
    VTerminal& operator=(const VTerminal&) = delete;

    void resize(int rows, int cols);
    void write(const char* data, size_t len);

    int rows() const { return rows_; }
    int cols() const { return cols_; }

    TerminalCell get_cell(int row, int col) const;
    CursorInfo get_cursor() const { return cursor_; }

    // UTF-8 text of one screen row, trailing blanks removed.
    std::string row_text(int row) const;
    std::vector<std::string> screen_text() const;

    // Same row with SGR sequences for colour and attributes, ending in the
    // default rendition.
    std::string row_ansi(int row) const;

    uint32_t default_fg() const { return default_fg_; }
    uint32_t default_bg() const { return default_bg_; }

    // Bytes produced by the keyboard encoder since the last call.
    std::string get_output();

    void keyboard_key(int key, int modifiers = 0);
    void keyboard_unichar(uint32_t c, int modifiers = 0);

    const std::deque<std::vector<TerminalCell>>& scrollback() const { return scrollback_; }
    size_t scrollback_size() const { return scrollback_.size(); }

    static void append_utf8(uint32_t codepoint, std::string& out);

private:
    friend class VTerminalImpl;

    std::string sgr_for(const TerminalCell& cell) const;

    std::unique_ptr<VTerminalImpl> impl_;
    int rows_;
    int cols_;

    CursorInfo cursor_{0, 0, true};

    std::deque<std::vector<TerminalCell>> scrollback_;
    static constexpr size_t MAX_SCROLLBACK = 10000;

    uint32_t default_fg_ = 0xFFAAA1A1;
    uint32_t default_bg_ = 0xFF0B0909;
};

}
