#include "terminal.hpp"
#include "key_decoder.hpp"

// clear() and refresh() name Screen members here, not curses macros.
#define NCURSES_NOMACROS
#include <curses.h>
#include <locale.h>

#include <algorithm>

namespace sqlnav::tool {

namespace {

enum Pair : short {
    PairDim = 1,
    PairHeader,
    PairAccent,
    PairError
};

// Byte offset just past the first `columns` code points of `s`.
size_t prefix_bytes(const std::string& s, int columns) {
    int n = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if ((static_cast<unsigned char>(s[i]) & 0xC0) != 0x80) {
            if (n == columns) return i;
            ++n;
        }
    }
    return s.size();
}

int code_points(const std::string& s) {
    int n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

} // namespace

Terminal::Terminal() {
    setlocale(LC_ALL, "");
    initscr();
    raw();
    noecho();
    keypad(stdscr, TRUE);
    ESCDELAY = 25;
    curs_set(0);

    if (has_colors()) {
        start_color();
        short bg = use_default_colors() == OK ? -1 : COLOR_BLACK;
        init_pair(PairDim, COLOR_BLUE, bg);
        init_pair(PairHeader, COLOR_CYAN, bg);
        init_pair(PairAccent, COLOR_YELLOW, bg);
        init_pair(PairError, COLOR_WHITE, COLOR_RED);
        colors_ = true;
    }
}

Terminal::~Terminal() {
    endwin();
}

ScreenSize Terminal::size() const {
    int r, c;
    getmaxyx(stdscr, r, c);
    return {r, c};
}

void Terminal::clear() { erase(); }

void Terminal::draw(int row, int col, const std::string& text, int width, Style style) {
    if (width <= 0) return;
    attr_t attrs = A_NORMAL;
    short pair = 0;
    switch (style) {
        case Style::Normal:   break;
        case Style::Dim:      attrs = A_DIM; pair = PairDim; break;
        case Style::Selected: attrs = A_REVERSE; break;
        case Style::Header:   attrs = A_BOLD; pair = PairHeader; break;
        case Style::Accent:   attrs = A_BOLD; pair = PairAccent; break;
        case Style::Error:    attrs = A_BOLD; pair = PairError; break;
    }
    if (colors_ && pair != 0) attrs |= COLOR_PAIR(pair);

    std::string clipped = text.substr(0, prefix_bytes(text, width));
    int pad = std::max(0, width - code_points(clipped));
    clipped.append(static_cast<size_t>(pad), ' ');

    attron(attrs);
    mvaddnstr(row, col, clipped.c_str(), static_cast<int>(clipped.size()));
    attroff(attrs);
}

void Terminal::show_cursor(int row, int col) {
    curs_set(1);
    move(row, col);
}

void Terminal::hide_cursor() { curs_set(0); }

void Terminal::refresh() { ::refresh(); }

std::optional<ui::Key> Terminal::read_key(std::chrono::milliseconds wait) {
    wtimeout(stdscr, static_cast<int>(wait.count()));
    wint_t ch = 0;
    int rc = get_wch(&ch);
    if (rc == ERR) return std::nullopt;
    if (rc == KEY_CODE_YES && ch == KEY_RESIZE) return std::nullopt;

    auto key = decode_key(rc == KEY_CODE_YES, static_cast<unsigned int>(ch));
    if (!key || key->code != ui::KeyCode::Esc) return key;

    // ESC followed at once by another key is Alt+key.
    wtimeout(stdscr, 0);
    wint_t next = 0;
    int rc2 = get_wch(&next);
    if (rc2 == ERR) return key;
    auto follow = decode_key(rc2 == KEY_CODE_YES, static_cast<unsigned int>(next));
    if (!follow) return key;
    return with_alt(*follow);
}

} // namespace sqlnav::tool
