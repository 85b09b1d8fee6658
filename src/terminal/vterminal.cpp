#include "vterminal.h"

extern "C" {
#include <vterm.h>
}

#include <algorithm>
#include <cstring>

namespace station {

namespace {

uint32_t vterm_color_to_u32(const VTermScreen* screen, const VTermColor* color, uint32_t default_fg, uint32_t default_bg) {
    if (VTERM_COLOR_IS_DEFAULT_FG(color)) {
        return default_fg;
    }
    if (VTERM_COLOR_IS_DEFAULT_BG(color)) {
        return default_bg;
    }

    VTermColor rgb_color = *color;
    if (VTERM_COLOR_IS_INDEXED(&rgb_color)) {
        vterm_screen_convert_color_to_rgb(screen, &rgb_color);
    }

    return 0xFF000000 |
           (static_cast<uint32_t>(rgb_color.rgb.blue) << 16) |
           (static_cast<uint32_t>(rgb_color.rgb.green) << 8) |
           static_cast<uint32_t>(rgb_color.rgb.red);
}

void convert_vterm_cell(const VTermScreen* screen, const VTermScreenCell* src, TerminalCell* dst, uint32_t default_fg, uint32_t default_bg) {
    for (int i = 0; i < TERMINAL_MAX_CHARS_PER_CELL && i < VTERM_MAX_CHARS_PER_CELL; ++i) {
        dst->chars[i] = src->chars[i];
    }

    dst->width = static_cast<uint8_t>(src->width);
    dst->fg = vterm_color_to_u32(screen, &src->fg, default_fg, default_bg);
    dst->bg = vterm_color_to_u32(screen, &src->bg, default_fg, default_bg);

    dst->bold = src->attrs.bold;
    dst->underline = src->attrs.underline != 0;
    dst->reverse = src->attrs.reverse;
}

void append_truecolor(std::string& sgr, int selector, uint32_t color) {
    sgr += ";" + std::to_string(selector) + ";2;" +
           std::to_string(color & 0xFF) + ";" +
           std::to_string((color >> 8) & 0xFF) + ";" +
           std::to_string((color >> 16) & 0xFF);
}

}

class VTerminalImpl {
public:
    VTerm* vt = nullptr;
    VTermScreen* screen = nullptr;
    VTerminal* owner;

    VTerminalImpl(VTerminal* o, int rows, int cols) : owner(o) {
        vt = vterm_new(rows, cols);
        vterm_set_utf8(vt, 1);

        screen = vterm_obtain_screen(vt);

        vterm_screen_set_callbacks(screen, &callbacks(), this);
        vterm_screen_set_damage_merge(screen, VTERM_DAMAGE_SCROLL);
        vterm_screen_enable_altscreen(screen, 1);
        vterm_screen_reset(screen, 1);
    }

    ~VTerminalImpl() {
        if (vt) {
            vterm_free(vt);
        }
    }

    static const VTermScreenCallbacks& callbacks() {
        static const VTermScreenCallbacks cbs = [] {
            VTermScreenCallbacks c;
            std::memset(&c, 0, sizeof(c));
            c.movecursor = on_movecursor;
            c.sb_pushline = on_sb_pushline;
            c.sb_popline = on_sb_popline;
            return c;
        }();
        return cbs;
    }

    static int on_movecursor(VTermPos pos, VTermPos oldpos, int visible, void* user) {
        (void)oldpos;
        auto* impl = static_cast<VTerminalImpl*>(user);
        impl->owner->cursor_.row = pos.row;
        impl->owner->cursor_.col = pos.col;
        impl->owner->cursor_.visible = visible != 0;
        return 1;
    }

    static int on_sb_pushline(int cols, const VTermScreenCell* cells, void* user) {
        auto* impl = static_cast<VTerminalImpl*>(user);
        auto* owner = impl->owner;

        std::vector<TerminalCell> line;
        line.reserve(static_cast<size_t>(cols));

        for (int i = 0; i < cols; ++i) {
            TerminalCell tc{};
            convert_vterm_cell(impl->screen, &cells[i], &tc, owner->default_fg_, owner->default_bg_);
            line.push_back(tc);
        }

        owner->scrollback_.push_back(std::move(line));
        if (owner->scrollback_.size() > VTerminal::MAX_SCROLLBACK) {
            owner->scrollback_.pop_front();
        }
        return 1;
    }

    static int on_sb_popline(int cols, VTermScreenCell* cells, void* user) {
        auto* impl = static_cast<VTerminalImpl*>(user);
        auto* owner = impl->owner;

        if (owner->scrollback_.empty()) {
            return 0;
        }

        const auto& line = owner->scrollback_.back();
        int copy_cols = std::min(cols, static_cast<int>(line.size()));

        for (int i = 0; i < copy_cols; ++i) {
            const auto& tc = line[static_cast<size_t>(i)];
            std::memset(&cells[i], 0, sizeof(VTermScreenCell));

            for (int j = 0; j < VTERM_MAX_CHARS_PER_CELL && j < TERMINAL_MAX_CHARS_PER_CELL && tc.chars[j]; ++j) {
                cells[i].chars[j] = tc.chars[j];
            }
            cells[i].width = tc.width ? tc.width : 1;

            vterm_color_rgb(&cells[i].fg, (tc.fg >> 0) & 0xFF, (tc.fg >> 8) & 0xFF, (tc.fg >> 16) & 0xFF);
            vterm_color_rgb(&cells[i].bg, (tc.bg >> 0) & 0xFF, (tc.bg >> 8) & 0xFF, (tc.bg >> 16) & 0xFF);
            if (tc.fg == owner->default_fg_) {
                cells[i].fg.type |= VTERM_COLOR_DEFAULT_FG;
            }
            if (tc.bg == owner->default_bg_) {
                cells[i].bg.type |= VTERM_COLOR_DEFAULT_BG;
            }

            cells[i].attrs.bold = tc.bold;
            cells[i].attrs.underline = tc.underline ? 1 : 0;
            cells[i].attrs.reverse = tc.reverse;
        }

        for (int i = copy_cols; i < cols; ++i) {
            std::memset(&cells[i], 0, sizeof(VTermScreenCell));
            cells[i].chars[0] = ' ';
            cells[i].width = 1;
        }

        owner->scrollback_.pop_back();
        return 1;
    }
};

VTerminal::VTerminal(int rows, int cols)
    : rows_(std::max(1, rows))
    , cols_(std::max(1, cols))
{
    impl_ = std::make_unique<VTerminalImpl>(this, rows_, cols_);
}

VTerminal::~VTerminal() = default;

void VTerminal::resize(int rows, int cols) {
    rows = std::max(1, rows);
    cols = std::max(1, cols);
    if (rows == rows_ && cols == cols_) return;

    rows_ = rows;
    cols_ = cols;
    vterm_set_size(impl_->vt, rows, cols);
}

void VTerminal::write(const char* data, size_t len) {
    vterm_input_write(impl_->vt, data, len);
    vterm_screen_flush_damage(impl_->screen);
}

TerminalCell VTerminal::get_cell(int row, int col) const {
    TerminalCell result{};

    VTermPos pos;
    pos.row = row;
    pos.col = col;
    VTermScreenCell cell;

    if (vterm_screen_get_cell(impl_->screen, pos, &cell)) {
        convert_vterm_cell(impl_->screen, &cell, &result, default_fg_, default_bg_);
    }

    return result;
}

void VTerminal::append_utf8(uint32_t codepoint, std::string& out) {
    if (codepoint > 0x10FFFF) {
        out += '?';
    } else if (codepoint < 0x80) {
        out += static_cast<char>(codepoint);
    } else if (codepoint < 0x800) {
        out += static_cast<char>(0xC0 | (codepoint >> 6));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint < 0x10000) {
        out += static_cast<char>(0xE0 | (codepoint >> 12));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (codepoint >> 18));
        out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    }
}

std::string VTerminal::row_text(int row) const {
    std::string text;
    if (row < 0 || row >= rows_) return text;

    for (int col = 0; col < cols_; ) {
        TerminalCell cell = get_cell(row, col);
        if (cell.chars[0] == 0) {
            text += ' ';
        } else {
            for (int i = 0; i < TERMINAL_MAX_CHARS_PER_CELL && cell.chars[i] != 0; ++i) {
                append_utf8(cell.chars[i], text);
            }
        }
        col += cell.width > 1 ? cell.width : 1;
    }

    size_t end = text.find_last_not_of(' ');
    text.erase(end == std::string::npos ? 0 : end + 1);
    return text;
}

std::string VTerminal::row_ansi(int row) const {
    std::string out;
    if (row < 0 || row >= rows_) return out;

    int last = -1;
    for (int col = 0; col < cols_; ++col) {
        TerminalCell cell = get_cell(row, col);
        bool blank = cell.chars[0] == 0 || cell.chars[0] == ' ';
        if (!blank || cell.bg != default_bg_ || cell.reverse || cell.underline) {
            last = col;
        }
    }

    std::string current = "0";
    for (int col = 0; col <= last; ) {
        TerminalCell cell = get_cell(row, col);
        std::string sgr = sgr_for(cell);
        if (sgr != current) {
            out += "\x1b[" + sgr + "m";
            current = sgr;
        }
        if (cell.chars[0] == 0) {
            out += ' ';
        } else {
            for (int i = 0; i < TERMINAL_MAX_CHARS_PER_CELL && cell.chars[i] != 0; ++i) {
                append_utf8(cell.chars[i], out);
            }
        }
        col += cell.width > 1 ? cell.width : 1;
    }

    if (current != "0") {
        out += "\x1b[0m";
    }
    return out;
}

std::string VTerminal::sgr_for(const TerminalCell& cell) const {
    std::string sgr = "0";
    if (cell.bold) sgr += ";1";
    if (cell.underline) sgr += ";4";
    if (cell.reverse) sgr += ";7";
    if (cell.fg != default_fg_) append_truecolor(sgr, 38, cell.fg);
    if (cell.bg != default_bg_) append_truecolor(sgr, 48, cell.bg);
    return sgr;
}

std::vector<std::string> VTerminal::screen_text() const {
    std::vector<std::string> lines;
    lines.reserve(static_cast<size_t>(rows_));
    for (int row = 0; row < rows_; ++row) {
        lines.push_back(row_text(row));
    }
    return lines;
}

std::string VTerminal::get_output() {
    std::string result;
    size_t len = vterm_output_get_buffer_current(impl_->vt);
    if (len > 0) {
        result.resize(len);
        vterm_output_read(impl_->vt, &result[0], len);
    }
    return result;
}

void VTerminal::keyboard_key(int key, int modifiers) {
    vterm_keyboard_key(impl_->vt, static_cast<VTermKey>(key), static_cast<VTermModifier>(modifiers));
}

void VTerminal::keyboard_unichar(uint32_t c, int modifiers) {
    vterm_keyboard_unichar(impl_->vt, c, static_cast<VTermModifier>(modifiers));
}

}
