#pragma once
/*
 * Screen
 *
 * Drawing surface the renderer paints on. The ncurses implementation is
 * in terminal.hpp; tests can substitute a recording one.
 */
#include <string>

namespace sqlnav::tool {

struct ScreenSize {
    int rows;
    int cols;
};

enum class Style {
    Normal,
    Dim,        // NULL cells, inactive borders
    Selected,   // cursor and block selection
    Header,     // column headers, titles of the focused pane
    Accent,     // active connection, tabs
    Error
};

class Screen {
public:
    virtual ~Screen() = default;
    virtual ScreenSize size() const = 0;
    virtual void clear() = 0;
    // Draws at most `width` columns of `text`, padding with spaces.
    virtual void draw(int row, int col, const std::string& text, int width, Style style) = 0;
    virtual void show_cursor(int row, int col) = 0;
    virtual void hide_cursor() = 0;
    virtual void refresh() = 0;
};

} // namespace sqlnav::tool
