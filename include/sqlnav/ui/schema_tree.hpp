/**
 * sqlnav/ui/schema_tree.hpp - Database / table tree pane
 *
 * Part of sqlnav - a terminal browser for relational databases.
 *
 * Holds the schema exactly as the last load delivered it; a reload
 * replaces it wholesale. Databases start collapsed. The "/" filter is a
 * case-insensitive substring match on table names that hides
 * non-matching tables and expands every database with a match.
 */

#pragma once

#include "../types.hpp"
#include "key_config.hpp"
#include "line_editor.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <vector>

namespace sqlnav::ui {

enum class SchemaTreeEvent {
    Unhandled,
    Handled,
    OpenTable,  // selected_table() should be shown
    Reload
};

struct TreeItem {
    enum class Kind { Database, Table };

    Kind kind = Kind::Database;
    size_t database = 0;
    size_t table = 0;       // valid for Kind::Table
    bool expanded = false;  // valid for Kind::Database
};

class SchemaTree {
public:
    /**
     * Replace the tree. Keeps the cursor on the same node when it still
     * exists.
     */
    void set_databases(std::vector<Database> databases) {
        std::optional<std::string> keep_db;
        std::optional<std::string> keep_table;
        if (!items_.empty()) {
            const TreeItem& cur = items_[cursor_];
            keep_db = databases_[cur.database].name;
            if (cur.kind == TreeItem::Kind::Table) {
                keep_table = databases_[cur.database].tables[cur.table].name;
            }
        }

        std::vector<std::string> was_expanded;
        for (size_t i = 0; i < databases_.size(); ++i) {
            if (expanded_[i]) was_expanded.push_back(databases_[i].name);
        }

        databases_ = std::move(databases);
        expanded_.assign(databases_.size(), false);
        for (size_t i = 0; i < databases_.size(); ++i) {
            expanded_[i] = std::find(was_expanded.begin(), was_expanded.end(),
                                     databases_[i].name) != was_expanded.end();
        }
        rebuild();

        cursor_ = 0;
        if (keep_db) {
            for (size_t i = 0; i < items_.size(); ++i) {
                const TreeItem& it = items_[i];
                if (databases_[it.database].name != *keep_db) continue;
                if (!keep_table && it.kind == TreeItem::Kind::Database) { cursor_ = i; break; }
                if (keep_table && it.kind == TreeItem::Kind::Table &&
                    databases_[it.database].tables[it.table].name == *keep_table) { cursor_ = i; break; }
            }
        }
    }

    void clear() {
        databases_.clear();
        expanded_.clear();
        items_.clear();
        cursor_ = 0;
        filter_.clear();
        editing_ = false;
    }

    SchemaTreeEvent handle(const Key& key, const KeyConfig& keys) {
        if (editing_) {
            LineResult r = editor_.handle(key);
            if (r == LineResult::Cancel) {
                editing_ = false;
                set_filter({});
            } else if (r == LineResult::Commit) {
                editing_ = false;
            } else {
                set_filter(editor_.text());
            }
            return SchemaTreeEvent::Handled;
        }

        if (keys.matches(Action::Filter, key)) {
            editing_ = true;
            editor_.reset(filter_);
            return SchemaTreeEvent::Handled;
        }
        if (keys.matches(Action::Refresh, key)) {
            return SchemaTreeEvent::Reload;
        }
        if (items_.empty()) {
            return SchemaTreeEvent::Unhandled;
        }

        const size_t last = items_.size() - 1;
        if (keys.down(key)) {
            if (cursor_ < last) ++cursor_;
        } else if (keys.up(key)) {
            if (cursor_ > 0) --cursor_;
        } else if (keys.matches(Action::ScrollDownMultiline, key)) {
            cursor_ = std::min(last, cursor_ + page_);
        } else if (keys.matches(Action::ScrollUpMultiline, key)) {
            cursor_ = cursor_ > page_ ? cursor_ - page_ : 0;
        } else if (keys.matches(Action::ScrollToTop, key)) {
            cursor_ = 0;
        } else if (keys.matches(Action::ScrollToBottom, key)) {
            cursor_ = last;
        } else if (keys.matches(Action::Enter, key)) {
            if (items_[cursor_].kind == TreeItem::Kind::Table) {
                return SchemaTreeEvent::OpenTable;
            }
            toggle(items_[cursor_].database, !expanded_[items_[cursor_].database]);
        } else if (keys.matches(Action::ScrollRight, key)) {
            if (items_[cursor_].kind == TreeItem::Kind::Database) {
                toggle(items_[cursor_].database, true);
            }
        } else if (keys.matches(Action::ScrollLeft, key)) {
            size_t db = items_[cursor_].database;
            toggle(db, false);
        } else {
            return SchemaTreeEvent::Unhandled;
        }
        return SchemaTreeEvent::Handled;
    }

    std::optional<Table> selected_table() const {
        if (items_.empty()) return std::nullopt;
        const TreeItem& it = items_[cursor_];
        if (it.kind != TreeItem::Kind::Table) return std::nullopt;
        return databases_[it.database].tables[it.table];
    }

    void set_page(size_t rows) { page_ = std::max<size_t>(rows, 1); }

    const std::vector<Database>& databases() const { return databases_; }
    const std::vector<TreeItem>& items() const { return items_; }
    size_t cursor() const { return cursor_; }
    const std::string& filter() const { return filter_; }
    bool editing() const { return editing_; }
    const LineEditor& editor() const { return editor_; }

    /**
     * Node label as the renderer shows it.
     */
    std::string label(const TreeItem& it) const {
        if (it.kind == TreeItem::Kind::Database) {
            return std::string(it.expanded ? "v " : "> ") + databases_[it.database].name;
        }
        const Table& t = databases_[it.database].tables[it.table];
        return "  " + t.name + (t.kind == TableKind::View ? " (view)" : "");
    }

private:
    std::vector<Database> databases_;
    std::vector<bool> expanded_;
    std::vector<TreeItem> items_;
    size_t cursor_ = 0;
    size_t page_ = 10;
    std::string filter_;
    bool editing_ = false;
    LineEditor editor_;

    static std::string lower(std::string s) {
        for (auto& ch : s) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        return s;
    }

    void set_filter(const std::string& filter) {
        filter_ = filter;
        rebuild();
        cursor_ = 0;
    }

    void toggle(size_t db, bool expand) {
        if (!filter_.empty()) return;   // filter controls expansion
        expanded_[db] = expand;
        rebuild();
        for (size_t i = 0; i < items_.size(); ++i) {
            if (items_[i].kind == TreeItem::Kind::Database && items_[i].database == db) {
                cursor_ = i;
                break;
            }
        }
    }

    void rebuild() {
        items_.clear();
        const std::string needle = lower(filter_);
        for (size_t d = 0; d < databases_.size(); ++d) {
            const auto& tables = databases_[d].tables;
            std::vector<size_t> visible;
            for (size_t t = 0; t < tables.size(); ++t) {
                if (needle.empty() || lower(tables[t].name).find(needle) != std::string::npos) {
                    visible.push_back(t);
                }
            }
            if (!needle.empty() && visible.empty()) continue;

            const bool open = needle.empty() ? expanded_[d] : true;
            items_.push_back(TreeItem{TreeItem::Kind::Database, d, 0, open});
            if (!open) continue;
            for (size_t t : visible) {
                items_.push_back(TreeItem{TreeItem::Kind::Table, d, t, false});
            }
        }
        if (cursor_ >= items_.size()) {
            cursor_ = items_.empty() ? 0 : items_.size() - 1;
        }
    }
};

} // namespace sqlnav::ui
