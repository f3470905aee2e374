/**
 * sqlnav/cell.hpp - Normalized cell values shared by every backend
 *
 * Part of sqlnav - a terminal browser for relational databases.
 *
 * Every engine-native value (integer widths, decimals, temporal types,
 * booleans, binary, NULL) is translated by its adapter into exactly one
 * Cell. The canonical text produced here is what the table engine, the
 * filter logic and the clipboard see, so two engines holding the same
 * logical value produce equal Cells.
 *
 *   auto c = sqlnav::Cell::integer(42);
 *   c.kind;        // CellKind::Integer
 *   c.text;        // "42"
 *   c.display();   // "42"
 *
 *   sqlnav::Cell::null().display();   // "NULL"
 *   sqlnav::Cell::from_text("").display(); // ""
 */

#pragma once

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <string>
#include <vector>

namespace sqlnav {

// ============================================================================
// Cell Kinds
// ============================================================================

enum class CellKind {
    Null,
    Integer,
    Real,
    Decimal,
    Boolean,
    Text,
    Date,
    Time,
    Timestamp,
    Blob
};

inline const char* cell_kind_name(CellKind k) {
    switch (k) {
        case CellKind::Null:      return "null";
        case CellKind::Integer:   return "integer";
        case CellKind::Real:      return "real";
        case CellKind::Decimal:   return "decimal";
        case CellKind::Boolean:   return "boolean";
        case CellKind::Text:      return "text";
        case CellKind::Date:      return "date";
        case CellKind::Time:      return "time";
        case CellKind::Timestamp: return "timestamp";
        case CellKind::Blob:      return "blob";
    }
    return "text";
}

// ============================================================================
// Canonical Formatting
// ============================================================================

/**
 * Shortest decimal form of a double that parses back to the same value.
 * Engines disagree on float output precision; this is the common form.
 */
inline std::string format_real(double value) {
    char buf[32];
    for (int precision = 1; precision <= 17; ++precision) {
        std::snprintf(buf, sizeof(buf), "%.*g", precision, value);
        if (std::strtod(buf, nullptr) == value) {
            break;
        }
    }
    return buf;
}

inline std::string hex_encode(const unsigned char* data, size_t size) {
    static const char digits[] = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(2 + size * 2);
    for (size_t i = 0; i < size; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0f]);
    }
    return out;
}

/**
 * Canonical timestamp text: "YYYY-MM-DD HH:MM:SS[.fraction][zone]".
 * Accepts the ISO 'T' separator and drops an all-zero fraction, so
 * "2024-01-02T03:04:05.000" and "2024-01-02 03:04:05" compare equal.
 */
inline std::string normalize_timestamp(const std::string& raw) {
    std::string s = raw;
    if (s.size() > 10 && (s[10] == 'T' || s[10] == 't')) {
        s[10] = ' ';
    }
    size_t dot = s.find('.', 10);
    if (dot != std::string::npos) {
        size_t end = dot + 1;
        while (end < s.size() && s[end] >= '0' && s[end] <= '9') ++end;
        std::string fraction = s.substr(dot + 1, end - dot - 1);
        while (!fraction.empty() && fraction.back() == '0') fraction.pop_back();
        std::string zone = s.substr(end);
        s = s.substr(0, dot);
        if (!fraction.empty()) s += "." + fraction;
        s += zone;
    }
    if (s.size() > 19 && (s.back() == 'Z' || s.back() == 'z')) {
        s.pop_back();
        s += "+00";
    }
    return s;
}

/**
 * Unix epoch seconds rendered as a UTC timestamp in canonical form.
 */
inline std::string timestamp_from_epoch(int64_t seconds) {
    std::time_t t = static_cast<std::time_t>(seconds);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

// ============================================================================
// Cell
// ============================================================================

struct Cell {
    CellKind kind = CellKind::Null;
    std::string text;

    static Cell null() { return Cell{}; }

    static Cell integer(int64_t v) {
        return Cell{CellKind::Integer, std::to_string(v)};
    }

    static Cell unsigned_integer(uint64_t v) {
        return Cell{CellKind::Integer, std::to_string(v)};
    }

    static Cell real(double v) {
        return Cell{CellKind::Real, format_real(v)};
    }

    static Cell decimal(std::string v) {
        return Cell{CellKind::Decimal, std::move(v)};
    }

    static Cell boolean(bool v) {
        return Cell{CellKind::Boolean, v ? "true" : "false"};
    }

    static Cell from_text(std::string v) {
        return Cell{CellKind::Text, std::move(v)};
    }

    static Cell date(std::string v) {
        return Cell{CellKind::Date, std::move(v)};
    }

    static Cell time(std::string v) {
        return Cell{CellKind::Time, std::move(v)};
    }

    static Cell timestamp(const std::string& v) {
        return Cell{CellKind::Timestamp, normalize_timestamp(v)};
    }

    static Cell blob(const void* data, size_t size) {
        return Cell{CellKind::Blob,
                    hex_encode(static_cast<const unsigned char*>(data), size)};
    }

    static Cell blob(const std::vector<uint8_t>& bytes) {
        return blob(bytes.data(), bytes.size());
    }

    bool is_null() const { return kind == CellKind::Null; }

    /**
     * Text shown in the grid. NULL is the literal marker "NULL"; an empty
     * string stays empty.
     */
    std::string display() const {
        return is_null() ? "NULL" : text;
    }

    bool operator==(const Cell& other) const {
        return kind == other.kind && text == other.text;
    }
    bool operator!=(const Cell& other) const { return !(*this == other); }
};

/**
 * Number of terminal columns a UTF-8 string occupies, counting one per
 * code point. Used for column-width bookkeeping.
 */
inline size_t display_width(const std::string& s) {
    size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

} // namespace sqlnav
