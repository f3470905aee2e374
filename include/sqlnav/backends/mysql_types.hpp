/**
 * sqlnav/backends/mysql_types.hpp - MySQL value translation
 *
 * Part of sqlnav - a terminal browser for relational databases.
 *
 * The MySQL text protocol sends every value as bytes plus a column
 * descriptor. The field type codes are the protocol-level values, so this
 * header does not need the client library and can be tested on its own.
 */

#pragma once

#include "../cell.hpp"

#include <cstdint>
#include <cstdlib>
#include <string>

namespace sqlnav {

// ============================================================================
// Protocol Field Types
// ============================================================================

enum class MySqlFieldType : uint8_t {
    Decimal    = 0x00,
    Tiny       = 0x01,  // TINYINT
    Short      = 0x02,  // SMALLINT
    Long       = 0x03,  // INT
    Float      = 0x04,
    Double     = 0x05,
    Null       = 0x06,
    Timestamp  = 0x07,
    LongLong   = 0x08,  // BIGINT
    Int24      = 0x09,  // MEDIUMINT
    Date       = 0x0A,
    Time       = 0x0B,
    DateTime   = 0x0C,
    Year       = 0x0D,
    NewDate    = 0x0E,
    VarChar    = 0x0F,
    Bit        = 0x10,
    Json       = 0xF5,
    NewDecimal = 0xF6,
    Enum       = 0xF7,
    Set        = 0xF8,
    TinyBlob   = 0xF9,
    MediumBlob = 0xFA,
    LongBlob   = 0xFB,
    Blob       = 0xFC,  // BLOB and TEXT
    VarString  = 0xFD,  // VARCHAR and VARBINARY
    String     = 0xFE,  // CHAR and BINARY
    Geometry   = 0xFF
};

// Character set number the server reports for binary strings.
constexpr unsigned int mysql_binary_charset = 63;

/**
 * The parts of a column descriptor that decide how a value is shown.
 * `length` is the display width (1 for TINYINT(1)).
 */
struct MySqlColumn {
    MySqlFieldType type = MySqlFieldType::VarString;
    unsigned int charsetnr = 0;
    unsigned long length = 0;
    bool is_unsigned = false;
};

// ============================================================================
// Value Translation
// ============================================================================

inline Cell make_mysql_cell(const MySqlColumn& col, const char* data, unsigned long size) {
    if (!data) {
        return Cell::null();
    }
    std::string text(data, size);

    switch (col.type) {
        case MySqlFieldType::Tiny:
            if (col.length == 1 && !col.is_unsigned) {
                return Cell::boolean(std::strtoll(text.c_str(), nullptr, 10) != 0);
            }
            [[fallthrough]];
        case MySqlFieldType::Short:
        case MySqlFieldType::Long:
        case MySqlFieldType::Int24:
        case MySqlFieldType::LongLong:
        case MySqlFieldType::Year:
            if (col.is_unsigned) {
                return Cell::unsigned_integer(std::strtoull(text.c_str(), nullptr, 10));
            }
            return Cell::integer(std::strtoll(text.c_str(), nullptr, 10));

        case MySqlFieldType::Bit: {
            uint64_t v = 0;
            for (unsigned char c : text) v = (v << 8) | c;
            return Cell::unsigned_integer(v);
        }

        case MySqlFieldType::Float:
        case MySqlFieldType::Double:
            return Cell::real(std::strtod(text.c_str(), nullptr));

        case MySqlFieldType::Decimal:
        case MySqlFieldType::NewDecimal:
            return Cell::decimal(text);

        case MySqlFieldType::Date:
        case MySqlFieldType::NewDate:
            return Cell::date(text);

        case MySqlFieldType::Time:
            return Cell::time(text);

        case MySqlFieldType::Timestamp:
        case MySqlFieldType::DateTime:
            return Cell::timestamp(text);

        case MySqlFieldType::Geometry:
            return Cell::blob(text.data(), text.size());

        case MySqlFieldType::TinyBlob:
        case MySqlFieldType::MediumBlob:
        case MySqlFieldType::LongBlob:
        case MySqlFieldType::Blob:
        case MySqlFieldType::VarString:
        case MySqlFieldType::String:
        case MySqlFieldType::VarChar:
            if (col.charsetnr == mysql_binary_charset) {
                return Cell::blob(text.data(), text.size());
            }
            return Cell::from_text(text);

        case MySqlFieldType::Null:
            return Cell::null();

        default:
            return Cell::from_text(text);
    }
}

/**
 * Client-side error numbers (CR_*, 2000-2999) mean the connection itself
 * failed; 1045/1044/1049 are authentication or unknown-database refusals
 * at connect time.
 */
inline bool is_mysql_connectivity_errno(unsigned int code) {
    if (code >= 2000 && code < 3000) return true;
    return code == 1044 || code == 1045 || code == 1049;
}

} // namespace sqlnav
