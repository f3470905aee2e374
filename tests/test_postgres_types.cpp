/**
 * test_postgres_types.cpp - Tests for PostgreSQL value translation
 */

#include <gtest/gtest.h>
#include <sqlnav/backends/postgres_types.hpp>

#include <cstring>
#include <string>

using namespace sqlnav;

namespace {

Cell pg(unsigned int oid, const char* text) {
    return make_postgres_cell(oid, text, static_cast<int>(std::strlen(text)), false);
}

} // namespace

TEST(PostgresTypesTest, NullWinsOverType) {
    EXPECT_TRUE(make_postgres_cell(pg_oid::Int4, "", 0, true).is_null());
    EXPECT_TRUE(make_postgres_cell(pg_oid::Text, nullptr, 0, false).is_null());
}

TEST(PostgresTypesTest, EmptyTextIsNotNull) {
    Cell c = make_postgres_cell(pg_oid::Text, "", 0, false);
    EXPECT_FALSE(c.is_null());
    EXPECT_EQ(c.text, "");
}

TEST(PostgresTypesTest, Booleans) {
    EXPECT_EQ(pg(pg_oid::Bool, "t"), Cell::boolean(true));
    EXPECT_EQ(pg(pg_oid::Bool, "f"), Cell::boolean(false));
}

TEST(PostgresTypesTest, IntegerWidths) {
    EXPECT_EQ(pg(pg_oid::Int2, "-7"), Cell::integer(-7));
    EXPECT_EQ(pg(pg_oid::Int4, "42"), Cell::integer(42));
    EXPECT_EQ(pg(pg_oid::Int8, "9223372036854775807"), Cell::integer(INT64_MAX));
    EXPECT_EQ(pg(pg_oid::Oid, "4294967295"), Cell::unsigned_integer(4294967295ULL));
}

TEST(PostgresTypesTest, FloatsAndNumeric) {
    EXPECT_EQ(pg(pg_oid::Float8, "1.5"), Cell::real(1.5));
    EXPECT_EQ(pg(pg_oid::Float4, "0.1").kind, CellKind::Real);
    EXPECT_EQ(pg(pg_oid::Numeric, "12.3400"), Cell::decimal("12.3400"));
}

TEST(PostgresTypesTest, Temporal) {
    EXPECT_EQ(pg(pg_oid::Date, "2024-01-02"), Cell::date("2024-01-02"));
    EXPECT_EQ(pg(pg_oid::Time, "03:04:05"), Cell::time("03:04:05"));
    EXPECT_EQ(pg(pg_oid::Timestamp, "2024-01-02 03:04:05").text, "2024-01-02 03:04:05");
    EXPECT_EQ(pg(pg_oid::TimestampTz, "2024-01-02 03:04:05.250+01").text, "2024-01-02 03:04:05.25+01");
    EXPECT_EQ(pg(pg_oid::Timestamp, "2024-01-02 03:04:05").kind, CellKind::Timestamp);
}

TEST(PostgresTypesTest, ByteaHexFormat) {
    EXPECT_EQ(pg(pg_oid::Bytea, "\\x00ff10").text, "0x00ff10");
    EXPECT_EQ(pg(pg_oid::Bytea, "\\x").text, "0x");
}

TEST(PostgresTypesTest, ByteaEscapeFormat) {
    auto bytes = decode_pg_bytea("a\\012\\\\b");
    ASSERT_EQ(bytes.size(), 4u);
    EXPECT_EQ(bytes[0], 'a');
    EXPECT_EQ(bytes[1], 10);
    EXPECT_EQ(bytes[2], '\\');
    EXPECT_EQ(bytes[3], 'b');
}

TEST(PostgresTypesTest, UnknownOidIsText) {
    EXPECT_EQ(pg(114 /* json */, "{\"a\":1}"), Cell::from_text("{\"a\":1}"));
    EXPECT_EQ(pg(pg_oid::Varchar, "hi"), Cell::from_text("hi"));
}
