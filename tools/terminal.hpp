#pragma once
/*
 * Terminal
 *
 * RAII wrapper around ncurses init/teardown plus the Screen
 * implementation on top of stdscr. Construct once in main; the
 * destructor restores the terminal.
 */
#include "screen.hpp"
#include <sqlnav/ui/key.hpp>

#include <chrono>
#include <optional>

namespace sqlnav::tool {

class Terminal : public Screen {
public:
    Terminal();
    ~Terminal() override;

    Terminal(const Terminal&) = delete;
    Terminal& operator=(const Terminal&) = delete;

    ScreenSize size() const override;
    void clear() override;
    void draw(int row, int col, const std::string& text, int width, Style style) override;
    void show_cursor(int row, int col) override;
    void hide_cursor() override;
    void refresh() override;

    /**
     * Wait up to `wait` for a key. nullopt on timeout, resize or an
     * undecodable sequence.
     */
    std::optional<ui::Key> read_key(std::chrono::milliseconds wait);

private:
    bool colors_ = false;
};

} // namespace sqlnav::tool
