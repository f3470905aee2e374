#include "renderer.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace sqlnav::tool {

namespace {

// Keep the first `width` code points, marking a cut with "~".
std::string fit(const std::string& text, size_t width) {
    if (display_width(text) <= width) return text;
    std::string out;
    size_t n = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(text[i]);
        if ((c & 0xC0) != 0x80) {
            if (n + 1 == width) break;
            ++n;
        }
        out += text[i];
    }
    return out + "~";
}

// Control characters would corrupt the grid.
std::string flatten(const std::string& text) {
    std::string out = text;
    for (auto& c : out) {
        if (c == '\n' || c == '\r' || c == '\t') c = ' ';
    }
    return out;
}

} // namespace

Layout compute_layout(ScreenSize size, size_t connection_count) {
    const int rows = std::max(size.rows, 4);
    const int cols = std::max(size.cols, 20);
    const int left = std::clamp(cols / 4, 16, 40);
    const int body = rows - 1;
    const int conn_rows = std::clamp(static_cast<int>(connection_count) + 1, 2, std::max(2, body / 3));

    Layout l;
    l.connections = {0, 0, conn_rows, left};
    l.schema = {conn_rows, 0, body - conn_rows, left};
    l.tabs = {0, left + 1, 1, cols - left - 1};
    l.grid = {1, left + 1, body - 1, cols - left - 1};
    l.status = {rows - 1, 0, 1, cols};
    return l;
}

void Renderer::render(Screen& screen, const ui::App& app) {
    const ScreenSize size = screen.size();
    const Layout l = compute_layout(size, app.connections().connections().size());

    screen.clear();
    screen.hide_cursor();
    for (int r = 0; r < l.status.row; ++r) {
        screen.draw(r, l.connections.cols, "|", 1, Style::Dim);
    }
    draw_connections(screen, l.connections, app);
    draw_schema(screen, l.schema, app);
    draw_tabs(screen, l.tabs, app);
    draw_grid(screen, l.grid, app);
    draw_status(screen, l.status, app);

    if (app.help_visible()) draw_help(screen, size, app);
    if (app.error()) draw_error(screen, size, *app.error());
    screen.refresh();
}

void Renderer::draw_connections(Screen& s, const Rect& r, const ui::App& app) {
    const bool focused = app.focus() == ui::Focus::ConnectionList;
    const auto& list = app.connections();
    s.draw(r.row, r.col, " Connections", r.cols, focused ? Style::Header : Style::Dim);

    const int visible = r.rows - 1;
    const int sel = static_cast<int>(list.selected());
    const int top = sel >= visible ? sel - visible + 1 : 0;
    const auto& conns = list.connections();
    for (int i = 0; i < visible && top + i < static_cast<int>(conns.size()); ++i) {
        const size_t idx = static_cast<size_t>(top + i);
        const bool active = list.active() && *list.active() == idx;
        std::string line = std::string(active ? "* " : "  ") + conns[idx].label();
        Style style = active ? Style::Accent : Style::Normal;
        if (focused && static_cast<int>(idx) == sel) style = Style::Selected;
        s.draw(r.row + 1 + i, r.col, fit(line, static_cast<size_t>(r.cols)), r.cols, style);
    }
}

void Renderer::draw_schema(Screen& s, const Rect& r, const ui::App& app) {
    const bool focused = app.focus() == ui::Focus::SchemaTree;
    const auto& tree = app.schema();
    std::string title = " Schema";
    if (!tree.filter().empty()) title += " [" + tree.filter() + "]";
    s.draw(r.row, r.col, title, r.cols, focused ? Style::Header : Style::Dim);

    const auto& items = tree.items();
    const int visible = r.rows - 1;
    const int cursor = static_cast<int>(tree.cursor());
    const int top = cursor >= visible ? cursor - visible + 1 : 0;
    for (int i = 0; i < visible && top + i < static_cast<int>(items.size()); ++i) {
        const auto& item = items[static_cast<size_t>(top + i)];
        Style style = item.kind == ui::TreeItem::Kind::Database ? Style::Accent : Style::Normal;
        if (focused && top + i == cursor) style = Style::Selected;
        s.draw(r.row + 1 + i, r.col, fit(tree.label(item), static_cast<size_t>(r.cols)), r.cols, style);
    }
    if (items.empty() && app.busy() && app.connected()) {
        s.draw(r.row + 1, r.col, "  loading...", r.cols, Style::Dim);
    }
}

void Renderer::draw_tabs(Screen& s, const Rect& r, const ui::App& app) {
    const auto& view = app.table_view();
    int col = r.col;
    for (size_t t = 0; t < ui::tab_count; ++t) {
        const auto tab = static_cast<ui::Tab>(t);
        std::string label = " " + std::to_string(t + 1) + " " + ui::tab_title(tab) + " ";
        const int w = std::min(static_cast<int>(label.size()), r.col + r.cols - col);
        if (w <= 0) break;
        s.draw(r.row, col, label, w, tab == view.tab() ? Style::Accent : Style::Dim);
        col += w;
    }
    if (view.table() && col < r.col + r.cols) {
        std::string name = "  " + view.table()->database + "." + view.table()->name;
        s.draw(r.row, col, name, r.col + r.cols - col, Style::Header);
    }
}

void Renderer::draw_grid(Screen& s, const Rect& r, const ui::App& app) {
    const auto& view = app.table_view();
    const ui::TableState& state = view.current();
    const bool focused = app.focus() == ui::Focus::TableView;

    if (!view.table()) {
        s.draw(r.row + 1, r.col + 1, "select a table", r.cols - 1, Style::Dim);
        return;
    }
    const auto& columns = state.columns();
    if (columns.empty()) {
        s.draw(r.row + 1, r.col + 1, state.loading() ? "loading..." : "no rows", r.cols - 1, Style::Dim);
        return;
    }

    const auto& widths = state.column_widths();
    const auto rect = state.selected_rect();
    const auto& rows = state.rows();
    const auto& sort = state.sort();
    const int right = r.col + r.cols;

    int col = r.col;
    for (size_t c = state.scroll_left(); c < columns.size() && col < right; ++c) {
        const int w = std::min(static_cast<int>(widths[c]), right - col);
        std::string head = columns[c];
        if (sort && sort->column == head) {
            head += sort->direction == SortDirection::Ascending ? " ^" : " v";
        }
        s.draw(r.row, col, fit(head, static_cast<size_t>(w)), w, Style::Header);

        for (int i = 0; i + 1 < r.rows; ++i) {
            const size_t row = state.scroll_top() + static_cast<size_t>(i);
            if (row >= rows.size()) break;
            const Cell& cell = rows[row][c];
            Style style = cell.is_null() ? Style::Dim : Style::Normal;
            if (focused && rect && rect->contains(row, c)) style = Style::Selected;
            s.draw(r.row + 1 + i, col, fit(flatten(cell.display()), static_cast<size_t>(w)), w, style);
        }
        col += w + 1;
    }
}

void Renderer::draw_status(Screen& s, const Rect& r, const ui::App& app) {
    const auto& view = app.table_view();

    if (app.prompting()) {
        s.draw(r.row, r.col, ":" + app.prompt().text(), r.cols, Style::Normal);
        s.show_cursor(r.row, r.col + 1 + static_cast<int>(app.prompt().cursor()));
        return;
    }
    if (app.focus() == ui::Focus::TableView && view.editing()) {
        s.draw(r.row, r.col, "/" + view.editor().text(), r.cols, Style::Normal);
        s.show_cursor(r.row, r.col + 1 + static_cast<int>(view.editor().cursor()));
        return;
    }
    if (app.focus() == ui::Focus::SchemaTree && app.schema().editing()) {
        s.draw(r.row, r.col, "/" + app.schema().editor().text(), r.cols, Style::Normal);
        s.show_cursor(r.row, r.col + 1 + static_cast<int>(app.schema().editor().cursor()));
        return;
    }

    std::string right;
    if (view.table()) {
        const auto& state = view.current();
        if (!state.filter().empty()) right += "filter: " + state.filter() + "  ";
        right += ui::position_text(state);
    }
    std::string left = app.status().empty() ? " ? help" : " " + app.status();
    const int rw = static_cast<int>(display_width(right));
    s.draw(r.row, r.col, fit(left, static_cast<size_t>(std::max(1, r.cols - rw - 1))), r.cols - rw - 1, Style::Dim);
    if (rw > 0 && rw < r.cols) {
        s.draw(r.row, r.col + r.cols - rw, right, rw, Style::Dim);
    }
}

void Renderer::draw_help(Screen& s, ScreenSize size, const ui::App& app) {
    std::vector<std::string> lines;
    for (const auto& info : ui::action_table()) {
        std::string key = ui::format_key(app.keys().key(info.action));
        key.resize(std::max<size_t>(key.size(), 10), ' ');
        lines.push_back(key + info.help);
    }
    const int w = std::min(48, size.cols - 4);
    const int h = std::min(static_cast<int>(lines.size()) + 2, size.rows - 2);
    const int top = (size.rows - h) / 2;
    const int left = (size.cols - w) / 2;
    s.draw(top, left, " Keys (Esc to close)", w, Style::Header);
    for (int i = 0; i + 2 < h; ++i) {
        s.draw(top + 1 + i, left, " " + lines[static_cast<size_t>(i)], w, Style::Normal);
    }
    s.draw(top + h - 1, left, "", w, Style::Normal);
}

void Renderer::draw_error(Screen& s, ScreenSize size, const ui::ErrorOverlay& error) {
    const int w = std::min(70, size.cols - 4);
    std::vector<std::string> lines;
    std::string msg = flatten(error.message);
    const size_t width = static_cast<size_t>(std::max(1, w - 2));
    while (!msg.empty() && lines.size() < 8) {
        lines.push_back(msg.substr(0, width));
        msg.erase(0, std::min(width, msg.size()));
    }
    const int h = static_cast<int>(lines.size()) + 3;
    const int top = std::max(0, (size.rows - h) / 2);
    const int left = (size.cols - w) / 2;
    const char* title = error.kind == ErrorKind::Connectivity ? " Connection error" : " Query error";
    s.draw(top, left, title, w, Style::Error);
    for (size_t i = 0; i < lines.size(); ++i) {
        s.draw(top + 1 + static_cast<int>(i), left, " " + lines[i], w, Style::Error);
    }
    s.draw(top + h - 2, left, "", w, Style::Error);
    s.draw(top + h - 1, left, " Esc / Enter to dismiss", w, Style::Error);
}

} // namespace sqlnav::tool
