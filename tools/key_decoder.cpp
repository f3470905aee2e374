#include "key_decoder.hpp"

#include <curses.h>

namespace sqlnav::tool {

using ui::Key;
using ui::KeyCode;

std::optional<Key> decode_key(bool is_function_key, unsigned int code) {
    if (is_function_key) {
        const int k = static_cast<int>(code);
        switch (k) {
            case KEY_UP:        return Key::of(KeyCode::Up);
            case KEY_DOWN:      return Key::of(KeyCode::Down);
            case KEY_LEFT:      return Key::of(KeyCode::Left);
            case KEY_RIGHT:     return Key::of(KeyCode::Right);
            case KEY_HOME:      return Key::of(KeyCode::Home);
            case KEY_END:       return Key::of(KeyCode::End);
            case KEY_PPAGE:     return Key::of(KeyCode::PageUp);
            case KEY_NPAGE:     return Key::of(KeyCode::PageDown);
            case KEY_DC:        return Key::of(KeyCode::Delete);
            case KEY_BACKSPACE: return Key::of(KeyCode::Backspace);
            case KEY_ENTER:     return Key::of(KeyCode::Enter);
            case KEY_BTAB:      return Key::of(KeyCode::BackTab);
            default:
                break;
        }
        if (k >= KEY_F(1) && k <= KEY_F(24)) {
            return Key::function(k - KEY_F0);
        }
        return std::nullopt;
    }

    switch (code) {
        case 27:   return Key::of(KeyCode::Esc);
        case '\n':
        case '\r': return Key::of(KeyCode::Enter);
        case '\t': return Key::of(KeyCode::Tab);
        case 127:
        case 8:    return Key::of(KeyCode::Backspace);
        default:
            break;
    }
    if (code >= 1 && code <= 26) {
        return Key::control(static_cast<char>('a' + code - 1));
    }
    if (code < 0x20) {
        return std::nullopt;
    }
    return Key::chr(code);
}

Key with_alt(Key key) {
    if (key.code == KeyCode::Esc) return key;
    key.alt = true;
    return key;
}

} // namespace sqlnav::tool
