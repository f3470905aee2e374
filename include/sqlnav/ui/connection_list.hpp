/**
 * sqlnav/ui/connection_list.hpp - Configured connections pane
 *
 * Part of sqlnav - a terminal browser for relational databases.
 */

#pragma once

#include "../types.hpp"
#include "key_config.hpp"

#include <optional>
#include <vector>

namespace sqlnav::ui {

enum class ConnectionListEvent {
    Unhandled,
    Handled,
    Connect     // the user picked selected() to connect to
};

class ConnectionList {
public:
    ConnectionList() = default;
    explicit ConnectionList(std::vector<Connection> connections)
        : connections_(std::move(connections)) {}

    ConnectionListEvent handle(const Key& key, const KeyConfig& keys) {
        if (connections_.empty()) {
            return keys.matches(Action::Enter, key) ? ConnectionListEvent::Handled
                                                    : ConnectionListEvent::Unhandled;
        }
        const size_t last = connections_.size() - 1;
        if (keys.down(key)) {
            if (selected_ < last) ++selected_;
        } else if (keys.up(key)) {
            if (selected_ > 0) --selected_;
        } else if (keys.matches(Action::ScrollToTop, key)) {
            selected_ = 0;
        } else if (keys.matches(Action::ScrollToBottom, key)) {
            selected_ = last;
        } else if (keys.matches(Action::Enter, key)) {
            return ConnectionListEvent::Connect;
        } else {
            return ConnectionListEvent::Unhandled;
        }
        return ConnectionListEvent::Handled;
    }

    const std::vector<Connection>& connections() const { return connections_; }
    size_t selected() const { return selected_; }

    const Connection* selected_connection() const {
        return connections_.empty() ? nullptr : &connections_[selected_];
    }

    // Index of the connection the open pool belongs to.
    std::optional<size_t> active() const { return active_; }
    void set_active(std::optional<size_t> index) { active_ = index; }

private:
    std::vector<Connection> connections_;
    size_t selected_ = 0;
    std::optional<size_t> active_;
};

} // namespace sqlnav::ui
