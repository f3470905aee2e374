/**
 * sqlnav/ui/line_editor.hpp - Single-line text input
 *
 * Part of sqlnav - a terminal browser for relational databases.
 *
 * Used by the filter prompts and the statement command line. Enter
 * commits, Esc cancels; everything else edits the line.
 */

#pragma once

#include "key.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace sqlnav::ui {

enum class LineResult {
    Editing,
    Commit,
    Cancel
};

class LineEditor {
public:
    void reset(const std::string& initial = {}) {
        chars_.clear();
        size_t i = 0;
        while (i < initial.size()) {
            chars_.push_back(decode(initial, i));
        }
        cursor_ = chars_.size();
    }

    LineResult handle(const Key& key) {
        if (key.code == KeyCode::Enter) return LineResult::Commit;
        if (key.code == KeyCode::Esc) return LineResult::Cancel;

        if (key.is_text()) {
            chars_.insert(chars_.begin() + static_cast<std::ptrdiff_t>(cursor_), key.ch);
            ++cursor_;
            return LineResult::Editing;
        }
        if (key.code == KeyCode::Char && key.ctrl && key.ch == 'u') {
            chars_.erase(chars_.begin(), chars_.begin() + static_cast<std::ptrdiff_t>(cursor_));
            cursor_ = 0;
            return LineResult::Editing;
        }

        switch (key.code) {
            case KeyCode::Backspace:
                if (cursor_ > 0) {
                    chars_.erase(chars_.begin() + static_cast<std::ptrdiff_t>(cursor_ - 1));
                    --cursor_;
                }
                break;
            case KeyCode::Delete:
                if (cursor_ < chars_.size()) {
                    chars_.erase(chars_.begin() + static_cast<std::ptrdiff_t>(cursor_));
                }
                break;
            case KeyCode::Left:
                if (cursor_ > 0) --cursor_;
                break;
            case KeyCode::Right:
                if (cursor_ < chars_.size()) ++cursor_;
                break;
            case KeyCode::Home:
                cursor_ = 0;
                break;
            case KeyCode::End:
                cursor_ = chars_.size();
                break;
            default:
                break;
        }
        return LineResult::Editing;
    }

    std::string text() const {
        std::string out;
        for (uint32_t cp : chars_) detail::append_utf8(out, cp);
        return out;
    }

    // Cursor position in code points.
    size_t cursor() const { return cursor_; }
    bool empty() const { return chars_.empty(); }

private:
    std::vector<uint32_t> chars_;
    size_t cursor_ = 0;

    static uint32_t decode(const std::string& s, size_t& i) {
        const unsigned char lead = static_cast<unsigned char>(s[i++]);
        int extra = lead < 0x80 ? 0 : (lead >> 5) == 0x6 ? 1 : (lead >> 4) == 0xE ? 2 : (lead >> 3) == 0x1E ? 3 : 0;
        uint32_t cp = extra == 0 ? lead : extra == 1 ? (lead & 0x1F) : extra == 2 ? (lead & 0x0F) : (lead & 0x07);
        for (int k = 0; k < extra && i < s.size(); ++k) {
            cp = (cp << 6) | (static_cast<unsigned char>(s[i++]) & 0x3F);
        }
        return cp;
    }
};

} // namespace sqlnav::ui
