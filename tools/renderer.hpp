#pragma once
/*
 * Renderer
 *
 * Paints one frame of the App onto a Screen. Stateless: everything it
 * shows comes from the App's read-only accessors.
 */
#include "screen.hpp"
#include <sqlnav/ui/app.hpp>

namespace sqlnav::tool {

struct Rect {
    int row;
    int col;
    int rows;
    int cols;
};

struct Layout {
    Rect connections;
    Rect schema;
    Rect tabs;      // one line above the grid
    Rect grid;      // header line + data rows
    Rect status;
};

Layout compute_layout(ScreenSize size, size_t connection_count);

class Renderer {
public:
    void render(Screen& screen, const ui::App& app);

private:
    void draw_connections(Screen& s, const Rect& r, const ui::App& app);
    void draw_schema(Screen& s, const Rect& r, const ui::App& app);
    void draw_tabs(Screen& s, const Rect& r, const ui::App& app);
    void draw_grid(Screen& s, const Rect& r, const ui::App& app);
    void draw_status(Screen& s, const Rect& r, const ui::App& app);
    void draw_help(Screen& s, ScreenSize size, const ui::App& app);
    void draw_error(Screen& s, ScreenSize size, const ui::ErrorOverlay& error);
};

} // namespace sqlnav::tool
