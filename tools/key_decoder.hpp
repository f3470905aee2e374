#pragma once
/*
 * Key decoding
 *
 * Maps what ncurses get_wch() reports (a function-key code or a wide
 * character) to the abstract ui::Key the router consumes.
 */
#include <sqlnav/ui/key.hpp>

#include <optional>

namespace sqlnav::tool {

// `is_function_key` is true when get_wch returned KEY_CODE_YES.
std::optional<ui::Key> decode_key(bool is_function_key, unsigned int code);

// Apply a preceding ESC to the key that followed it.
ui::Key with_alt(ui::Key key);

} // namespace sqlnav::tool
