/**
 * sqlnav/ui/key_config.hpp - Action to key bindings
 *
 * Part of sqlnav - a terminal browser for relational databases.
 *
 * Components never compare against literal keys; they ask the binding
 * table whether a key triggers an action. The table starts from the
 * defaults below and the "key_config" section of the configuration file
 * overrides individual entries by action name.
 */

#pragma once

#include "key.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <string>

namespace sqlnav::ui {

enum class Action {
    ScrollUp,
    ScrollDown,
    ScrollLeft,
    ScrollRight,
    MoveUp,
    MoveDown,
    ScrollUpMultiline,
    ScrollDownMultiline,
    ScrollToTop,
    ScrollToBottom,
    ExtendSelectionUp,
    ExtendSelectionDown,
    ExtendSelectionLeft,
    ExtendSelectionRight,
    Enter,
    Copy,
    Filter,
    Sort,
    Refresh,
    Command,
    FocusRight,
    FocusLeft,
    FocusConnections,
    OpenHelp,
    ExitPopup,
    Quit,
    Exit,
    TabRecords,
    TabColumns,
    TabConstraints,
    TabForeignKeys,
    TabIndexes,
};

constexpr size_t action_count = static_cast<size_t>(Action::TabIndexes) + 1;

struct ActionInfo {
    Action action;
    const char* name;
    const char* help;
};

inline const std::array<ActionInfo, action_count>& action_table() {
    static const std::array<ActionInfo, action_count> table = {{
        {Action::ScrollUp,             "scroll_up",              "move up"},
        {Action::ScrollDown,           "scroll_down",            "move down"},
        {Action::ScrollLeft,           "scroll_left",            "move left"},
        {Action::ScrollRight,          "scroll_right",           "move right"},
        {Action::MoveUp,               "move_up",                "move up"},
        {Action::MoveDown,             "move_down",              "move down"},
        {Action::ScrollUpMultiline,    "scroll_up_multiline",    "page up"},
        {Action::ScrollDownMultiline,  "scroll_down_multiline",  "page down"},
        {Action::ScrollToTop,          "scroll_to_top",          "go to first row"},
        {Action::ScrollToBottom,       "scroll_to_bottom",       "go to last row"},
        {Action::ExtendSelectionUp,    "extend_selection_up",    "extend selection up"},
        {Action::ExtendSelectionDown,  "extend_selection_down",  "extend selection down"},
        {Action::ExtendSelectionLeft,  "extend_selection_left",  "extend selection left"},
        {Action::ExtendSelectionRight, "extend_selection_right", "extend selection right"},
        {Action::Enter,                "enter",                  "open / expand"},
        {Action::Copy,                 "copy",                   "copy selection"},
        {Action::Filter,               "filter",                 "filter"},
        {Action::Sort,                 "sort",                   "sort by column"},
        {Action::Refresh,              "refresh",                "reload"},
        {Action::Command,              "command",                "run statement"},
        {Action::FocusRight,           "focus_right",            "focus right pane"},
        {Action::FocusLeft,            "focus_left",             "focus left pane"},
        {Action::FocusConnections,     "focus_connections",      "connection list"},
        {Action::OpenHelp,             "open_help",              "help"},
        {Action::ExitPopup,            "exit_popup",             "close popup"},
        {Action::Quit,                 "quit",                   "quit"},
        {Action::Exit,                 "exit",                   "quit"},
        {Action::TabRecords,           "tab_records",            "records tab"},
        {Action::TabColumns,           "tab_columns",            "columns tab"},
        {Action::TabConstraints,       "tab_constraints",        "constraints tab"},
        {Action::TabForeignKeys,       "tab_foreign_keys",       "foreign keys tab"},
        {Action::TabIndexes,           "tab_indexes",            "indexes tab"},
    }};
    return table;
}

inline const char* action_name(Action a) {
    return action_table()[static_cast<size_t>(a)].name;
}

inline std::optional<Action> parse_action(const std::string& name) {
    for (const auto& info : action_table()) {
        if (name == info.name) return info.action;
    }
    return std::nullopt;
}

class KeyConfig {
public:
    KeyConfig() {
        bind(Action::ScrollUp, Key::chr('k'));
        bind(Action::ScrollDown, Key::chr('j'));
        bind(Action::ScrollLeft, Key::chr('h'));
        bind(Action::ScrollRight, Key::chr('l'));
        bind(Action::MoveUp, Key::of(KeyCode::Up));
        bind(Action::MoveDown, Key::of(KeyCode::Down));
        bind(Action::ScrollUpMultiline, Key::control('u'));
        bind(Action::ScrollDownMultiline, Key::control('d'));
        bind(Action::ScrollToTop, Key::chr('g'));
        bind(Action::ScrollToBottom, Key::chr('G'));
        bind(Action::ExtendSelectionUp, Key::chr('K'));
        bind(Action::ExtendSelectionDown, Key::chr('J'));
        bind(Action::ExtendSelectionLeft, Key::chr('H'));
        bind(Action::ExtendSelectionRight, Key::chr('L'));
        bind(Action::Enter, Key::of(KeyCode::Enter));
        bind(Action::Copy, Key::chr('y'));
        bind(Action::Filter, Key::chr('/'));
        bind(Action::Sort, Key::chr('s'));
        bind(Action::Refresh, Key::chr('r'));
        bind(Action::Command, Key::chr(':'));
        bind(Action::FocusRight, Key::of(KeyCode::Right));
        bind(Action::FocusLeft, Key::of(KeyCode::Left));
        bind(Action::FocusConnections, Key::chr('c'));
        bind(Action::OpenHelp, Key::chr('?'));
        bind(Action::ExitPopup, Key::of(KeyCode::Esc));
        bind(Action::Quit, Key::chr('q'));
        bind(Action::Exit, Key::control('c'));
        bind(Action::TabRecords, Key::chr('1'));
        bind(Action::TabColumns, Key::chr('2'));
        bind(Action::TabConstraints, Key::chr('3'));
        bind(Action::TabForeignKeys, Key::chr('4'));
        bind(Action::TabIndexes, Key::chr('5'));
    }

    void bind(Action action, const Key& key) { keys_[static_cast<size_t>(action)] = key; }

    const Key& key(Action action) const { return keys_[static_cast<size_t>(action)]; }

    bool matches(Action action, const Key& key) const { return keys_[static_cast<size_t>(action)] == key; }

    /**
     * Up or down movement, whichever of the two bindings fired.
     */
    bool up(const Key& k) const { return matches(Action::ScrollUp, k) || matches(Action::MoveUp, k); }
    bool down(const Key& k) const { return matches(Action::ScrollDown, k) || matches(Action::MoveDown, k); }

private:
    std::array<Key, action_count> keys_{};
};

} // namespace sqlnav::ui
