/**
 * sqlnav/backends/postgres_types.hpp - PostgreSQL value translation
 *
 * Part of sqlnav - a terminal browser for relational databases.
 *
 * libpq hands every value over in text format together with the column's
 * type OID. The OIDs below are the stable built-in catalogue values from
 * pg_type; libpq itself does not export them.
 */

#pragma once

#include "../cell.hpp"

#include <cstdint>
#include <cstdlib>
#include <string>
#include <vector>

namespace sqlnav {

namespace pg_oid {
constexpr unsigned int Bool        = 16;
constexpr unsigned int Bytea       = 17;
constexpr unsigned int Int8        = 20;
constexpr unsigned int Int2        = 21;
constexpr unsigned int Int4        = 23;
constexpr unsigned int Text        = 25;
constexpr unsigned int Oid         = 26;
constexpr unsigned int Float4      = 700;
constexpr unsigned int Float8      = 701;
constexpr unsigned int Varchar     = 1043;
constexpr unsigned int Date        = 1082;
constexpr unsigned int Time        = 1083;
constexpr unsigned int Timestamp   = 1114;
constexpr unsigned int TimestampTz = 1184;
constexpr unsigned int TimeTz      = 1266;
constexpr unsigned int Numeric     = 1700;
} // namespace pg_oid

/**
 * Decode bytea text output. Handles the hex format ("\x0a0b") and the
 * legacy escape format ("\\012ab").
 */
inline std::vector<uint8_t> decode_pg_bytea(const std::string& text) {
    std::vector<uint8_t> out;
    auto hex = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
        if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
        return -1;
    };

    if (text.size() >= 2 && text[0] == '\\' && text[1] == 'x') {
        out.reserve((text.size() - 2) / 2);
        for (size_t i = 2; i + 1 < text.size(); i += 2) {
            int hi = hex(text[i]);
            int lo = hex(text[i + 1]);
            if (hi < 0 || lo < 0) break;
            out.push_back(static_cast<uint8_t>((hi << 4) | lo));
        }
        return out;
    }

    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '\\') {
            out.push_back(static_cast<uint8_t>(text[i]));
        } else if (i + 1 < text.size() && text[i + 1] == '\\') {
            out.push_back('\\');
            ++i;
        } else if (i + 3 < text.size()) {
            int v = (text[i + 1] - '0') * 64 + (text[i + 2] - '0') * 8 + (text[i + 3] - '0');
            out.push_back(static_cast<uint8_t>(v));
            i += 3;
        }
    }
    return out;
}

/**
 * Translate one text-format libpq value of the given type OID.
 */
inline Cell make_postgres_cell(unsigned int oid, const char* value, int length, bool is_null) {
    if (is_null || !value) {
        return Cell::null();
    }
    std::string text(value, static_cast<size_t>(length));

    switch (oid) {
        case pg_oid::Bool:
            return Cell::boolean(text == "t" || text == "true");
        case pg_oid::Int2:
        case pg_oid::Int4:
        case pg_oid::Int8:
            return Cell::integer(std::strtoll(text.c_str(), nullptr, 10));
        case pg_oid::Oid:
            return Cell::unsigned_integer(std::strtoull(text.c_str(), nullptr, 10));
        case pg_oid::Float4:
        case pg_oid::Float8:
            return Cell::real(std::strtod(text.c_str(), nullptr));
        case pg_oid::Numeric:
            return Cell::decimal(text);
        case pg_oid::Date:
            return Cell::date(text);
        case pg_oid::Time:
        case pg_oid::TimeTz:
            return Cell::time(text);
        case pg_oid::Timestamp:
        case pg_oid::TimestampTz:
            return Cell::timestamp(text);
        case pg_oid::Bytea:
            return Cell::blob(decode_pg_bytea(text));
        default:
            return Cell::from_text(text);
    }
}

} // namespace sqlnav
