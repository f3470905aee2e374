/**
 * sqlnav/ui/table_view.hpp - Right-hand pane: records and property tabs
 *
 * Part of sqlnav - a terminal browser for relational databases.
 *
 * The Records tab is a paged TableState backed by the engine; the four
 * property tabs are static TableStates filled once per opened table.
 * Tab switching is an app-level binding; the view only tracks which tab
 * is current and which property tabs are loaded.
 */

#pragma once

#include "../orchestrator.hpp"
#include "key_config.hpp"
#include "line_editor.hpp"
#include "table_state.hpp"

#include <array>
#include <optional>
#include <string>

namespace sqlnav::ui {

enum class Tab {
    Records,
    Columns,
    Constraints,
    ForeignKeys,
    Indexes
};

constexpr size_t tab_count = 5;

inline const char* tab_title(Tab t) {
    switch (t) {
        case Tab::Records:     return "Records";
        case Tab::Columns:     return "Columns";
        case Tab::Constraints: return "Constraints";
        case Tab::ForeignKeys: return "Foreign Keys";
        case Tab::Indexes:     return "Indexes";
    }
    return "";
}

inline PropertyKind property_kind(Tab t) {
    switch (t) {
        case Tab::Constraints: return PropertyKind::Constraints;
        case Tab::ForeignKeys: return PropertyKind::ForeignKeys;
        case Tab::Indexes:     return PropertyKind::Indexes;
        default:               return PropertyKind::Columns;
    }
}

enum class TableViewEvent {
    Unhandled,
    Handled,
    Copy        // copy_payload() of the current tab should go to the clipboard
};

class TableView {
public:
    TableView(TableState::FetchFn fetch, TableState::CountFn count, TableOptions options)
        : records_(std::move(fetch), std::move(count), options) {
        for (auto& p : properties_) p = TableState(options);
    }

    /**
     * Show a table: page 0 of its records is requested at once, property
     * tabs are fetched lazily.
     */
    void open(const Table& table) {
        table_ = table;
        records_.open(table);
        for (auto& p : properties_) p.clear();
        loaded_.fill(false);
        property_token_ = Token{};
        editing_ = false;
    }

    void clear() {
        table_.reset();
        records_.clear();
        for (auto& p : properties_) p.clear();
        loaded_.fill(false);
        property_token_ = Token{};
        editing_ = false;
    }

    void set_tab(Tab tab) {
        tab_ = tab;
        editing_ = false;
    }

    /**
     * True when the current tab is a property tab that has not been
     * fetched for the open table yet.
     */
    bool needs_properties() const {
        if (!table_ || tab_ == Tab::Records || loaded_[index(tab_)]) return false;
        return !(property_token_.valid() && property_tab_ == tab_);
    }

    /**
     * Record the submission that fetches the current tab.
     */
    void await_properties(Token token) {
        property_token_ = token;
        property_tab_ = tab_;
    }

    bool ingest_properties(const Token& token, const RecordSet& rows) {
        if (!property_token_.valid() || token != property_token_) return false;
        property_token_ = Token{};
        properties_[index(property_tab_)].set_rows(rows);
        loaded_[index(property_tab_)] = true;
        return true;
    }

    bool fail_properties(const Token& token) {
        if (!property_token_.valid() || token != property_token_) return false;
        property_token_ = Token{};
        return true;
    }

    TableViewEvent handle(const Key& key, const KeyConfig& keys) {
        TableState& s = current();

        if (editing_) {
            LineResult r = editor_.handle(key);
            if (r == LineResult::Commit) {
                editing_ = false;
                s.set_filter(editor_.text());
            } else if (r == LineResult::Cancel) {
                editing_ = false;
            }
            return TableViewEvent::Handled;
        }

        if (keys.down(key)) {
            s.move(1, 0);
        } else if (keys.up(key)) {
            s.move(-1, 0);
        } else if (keys.matches(Action::ScrollLeft, key)) {
            s.move(0, -1);
        } else if (keys.matches(Action::ScrollRight, key)) {
            s.move(0, 1);
        } else if (keys.matches(Action::ScrollDownMultiline, key)) {
            s.page_down();
        } else if (keys.matches(Action::ScrollUpMultiline, key)) {
            s.page_up();
        } else if (keys.matches(Action::ScrollToTop, key)) {
            s.to_top();
        } else if (keys.matches(Action::ScrollToBottom, key)) {
            s.to_bottom();
        } else if (keys.matches(Action::ExtendSelectionDown, key)) {
            s.extend(1, 0);
        } else if (keys.matches(Action::ExtendSelectionUp, key)) {
            s.extend(-1, 0);
        } else if (keys.matches(Action::ExtendSelectionLeft, key)) {
            s.extend(0, -1);
        } else if (keys.matches(Action::ExtendSelectionRight, key)) {
            s.extend(0, 1);
        } else if (keys.matches(Action::Filter, key)) {
            if (!table_) return TableViewEvent::Unhandled;
            editing_ = true;
            editor_.reset(s.filter());
        } else if (keys.matches(Action::Sort, key)) {
            s.toggle_sort();
        } else if (keys.matches(Action::Refresh, key)) {
            if (tab_ == Tab::Records) {
                records_.reload();
            } else {
                loaded_[index(tab_)] = false;
            }
        } else if (keys.matches(Action::Copy, key)) {
            if (!s.selection()) return TableViewEvent::Handled;
            return TableViewEvent::Copy;
        } else {
            return TableViewEvent::Unhandled;
        }
        return TableViewEvent::Handled;
    }

    void set_viewport(size_t rows, size_t width) {
        records_.set_viewport(rows, width);
        for (auto& p : properties_) p.set_viewport(rows, width);
    }

    TableState& records() { return records_; }
    const TableState& records() const { return records_; }

    TableState& current() { return tab_ == Tab::Records ? records_ : properties_[index(tab_)]; }
    const TableState& current() const { return tab_ == Tab::Records ? records_ : properties_[index(tab_)]; }

    const std::optional<Table>& table() const { return table_; }
    Tab tab() const { return tab_; }
    bool editing() const { return editing_; }
    const LineEditor& editor() const { return editor_; }

private:
    TableState records_;
    std::array<TableState, tab_count> properties_;   // [0] unused
    std::array<bool, tab_count> loaded_{};
    std::optional<Table> table_;
    Tab tab_ = Tab::Records;
    Token property_token_;
    Tab property_tab_ = Tab::Columns;
    bool editing_ = false;
    LineEditor editor_;

    static size_t index(Tab t) { return static_cast<size_t>(t); }
};

/**
 * "row N of M" for the status line; M is "?" when unknown and "~M" for
 * an estimate.
 */
inline std::string position_text(const TableState& s) {
    if (!s.selection()) return s.loading() ? "loading..." : "no rows";
    std::string out = "row " + std::to_string(s.absolute_row()) + " of ";
    if (!s.total()) {
        out += "?";
    } else {
        if (!s.total_exact()) out += "~";
        out += std::to_string(*s.total());
    }
    return out;
}

} // namespace sqlnav::ui
