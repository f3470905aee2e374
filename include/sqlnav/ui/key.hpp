/**
 * sqlnav/ui/key.hpp - Abstract key events
 *
 * Part of sqlnav - a terminal browser for relational databases.
 *
 * The terminal layer decodes raw input into Key values; everything above
 * it (router, components, key bindings) only sees Key. The textual form
 * is what the configuration file uses:
 *
 *   "j", "G", "/", "Ctrl-d", "Alt-x", "Enter", "Esc", "Tab", "BackTab",
 *   "Backspace", "Delete", "Up", "Down", "Left", "Right", "Home", "End",
 *   "PageUp", "PageDown", "F1".."F12", "Space"
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace sqlnav::ui {

enum class KeyCode {
    Char,
    Enter,
    Esc,
    Tab,
    BackTab,
    Backspace,
    Delete,
    Up,
    Down,
    Left,
    Right,
    Home,
    End,
    PageUp,
    PageDown,
    F,
    Unknown
};

struct Key {
    KeyCode code = KeyCode::Unknown;
    uint32_t ch = 0;      // code point for Char, number for F
    bool ctrl = false;
    bool alt = false;

    static Key chr(uint32_t c) { return Key{KeyCode::Char, c, false, false}; }
    static Key control(char c) { return Key{KeyCode::Char, static_cast<uint32_t>(c), true, false}; }
    static Key meta(char c) { return Key{KeyCode::Char, static_cast<uint32_t>(c), false, true}; }
    static Key of(KeyCode code) { return Key{code, 0, false, false}; }
    static Key function(int n) { return Key{KeyCode::F, static_cast<uint32_t>(n), false, false}; }

    /**
     * A plain printable character, usable as text input.
     */
    bool is_text() const { return code == KeyCode::Char && !ctrl && !alt && ch >= 0x20 && ch != 0x7f; }

    bool operator==(const Key& other) const {
        return code == other.code && ch == other.ch && ctrl == other.ctrl && alt == other.alt;
    }
    bool operator!=(const Key& other) const { return !(*this == other); }
};

// ============================================================================
// Text Form
// ============================================================================

namespace detail {

struct NamedKey {
    const char* name;
    KeyCode code;
};

inline const NamedKey* named_keys() {
    static const NamedKey keys[] = {
        {"Enter", KeyCode::Enter},
        {"Esc", KeyCode::Esc},
        {"Tab", KeyCode::Tab},
        {"BackTab", KeyCode::BackTab},
        {"Backspace", KeyCode::Backspace},
        {"Delete", KeyCode::Delete},
        {"Up", KeyCode::Up},
        {"Down", KeyCode::Down},
        {"Left", KeyCode::Left},
        {"Right", KeyCode::Right},
        {"Home", KeyCode::Home},
        {"End", KeyCode::End},
        {"PageUp", KeyCode::PageUp},
        {"PageDown", KeyCode::PageDown},
        {nullptr, KeyCode::Unknown},
    };
    return keys;
}

inline void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

} // namespace detail

inline std::string format_key(const Key& key) {
    std::string out;
    if (key.ctrl) out += "Ctrl-";
    if (key.alt) out += "Alt-";

    switch (key.code) {
        case KeyCode::Char:
            if (key.ch == ' ') {
                out += "Space";
            } else {
                detail::append_utf8(out, key.ch);
            }
            return out;
        case KeyCode::F:
            return out + "F" + std::to_string(key.ch);
        case KeyCode::Unknown:
            return out + "?";
        default:
            break;
    }
    for (const detail::NamedKey* k = detail::named_keys(); k->name; ++k) {
        if (k->code == key.code) return out + k->name;
    }
    return out + "?";
}

/**
 * Parse the configuration-file form. Returns nullopt when the string
 * names no key.
 */
inline std::optional<Key> parse_key(const std::string& text) {
    std::string rest = text;
    bool ctrl = false;
    bool alt = false;
    for (;;) {
        if (rest.size() > 5 && rest.compare(0, 5, "Ctrl-") == 0) {
            ctrl = true;
            rest.erase(0, 5);
        } else if (rest.size() > 4 && rest.compare(0, 4, "Alt-") == 0) {
            alt = true;
            rest.erase(0, 4);
        } else {
            break;
        }
    }
    if (rest.empty()) return std::nullopt;

    Key key;
    key.ctrl = ctrl;
    key.alt = alt;

    if (rest == "Space") {
        key.code = KeyCode::Char;
        key.ch = ' ';
        return key;
    }
    if (rest.size() >= 2 && rest[0] == 'F' && rest.find_first_not_of("0123456789", 1) == std::string::npos) {
        int n = std::stoi(rest.substr(1));
        if (n < 1 || n > 24) return std::nullopt;
        key.code = KeyCode::F;
        key.ch = static_cast<uint32_t>(n);
        return key;
    }
    for (const detail::NamedKey* k = detail::named_keys(); k->name; ++k) {
        if (rest == k->name) {
            key.code = k->code;
            return key;
        }
    }

    // A single (possibly multi-byte) character.
    const unsigned char lead = static_cast<unsigned char>(rest[0]);
    size_t len = lead < 0x80 ? 1 : (lead >> 5) == 0x6 ? 2 : (lead >> 4) == 0xE ? 3 : (lead >> 3) == 0x1E ? 4 : 0;
    if (len == 0 || len != rest.size()) return std::nullopt;

    uint32_t cp = len == 1 ? lead : len == 2 ? (lead & 0x1F) : len == 3 ? (lead & 0x0F) : (lead & 0x07);
    for (size_t i = 1; i < len; ++i) {
        cp = (cp << 6) | (static_cast<unsigned char>(rest[i]) & 0x3F);
    }
    if (ctrl && cp >= 'A' && cp <= 'Z') cp = cp - 'A' + 'a';
    key.code = KeyCode::Char;
    key.ch = cp;
    return key;
}

} // namespace sqlnav::ui
