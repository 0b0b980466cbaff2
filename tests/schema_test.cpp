// SPDX-License-Identifier: MIT

// tests/schema_test.cpp
#include <gtest/gtest.h>

#include "dbxfer/schema.hpp"

namespace dbxfer {
namespace {

TEST(DataTypeTest, NamesRoundTrip) {
    for (auto type : {DataType::Bool, DataType::Date, DataType::Decimal, DataType::Float32,
                      DataType::Float64, DataType::Int16, DataType::Int32, DataType::Int64,
                      DataType::Json, DataType::Text, DataType::TimestampWithoutTimeZone,
                      DataType::TimestampWithTimeZone, DataType::Uuid}) {
        auto parsed = ParseDataType(DataTypeName(type));
        ASSERT_TRUE(parsed.has_value()) << DataTypeName(type);
        EXPECT_EQ(*parsed, type);
    }
}

TEST(DataTypeTest, Spelling) {
    EXPECT_EQ(DataTypeName(DataType::TimestampWithTimeZone), "timestamp_with_time_zone");
    EXPECT_EQ(DataTypeName(DataType::Int64), "int64");
}

TEST(DataTypeTest, UnknownName) {
    auto parsed = ParseDataType("varchar");
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(parsed.error().message, "unknown data type \"varchar\"");
}

TEST(TableTest, FindColumn) {
    Table table{
        .name = "trades",
        .columns = {{.name = "id", .data_type = DataType::Int64, .is_nullable = false},
                    {.name = "price", .data_type = DataType::Decimal}},
    };
    ASSERT_NE(table.FindColumn("price"), nullptr);
    EXPECT_EQ(table.FindColumn("price")->data_type, DataType::Decimal);
    EXPECT_EQ(table.FindColumn("volume"), nullptr);
}

TEST(TableTest, ColumnDefaults) {
    Column column{.name = "note"};
    EXPECT_EQ(column.data_type, DataType::Text);
    EXPECT_TRUE(column.is_nullable);
    EXPECT_FALSE(column.comment.has_value());
}

TEST(TableTest, ValidateAcceptsUniqueNames) {
    Table table{.name = "t", .columns = {{.name = "a"}, {.name = "b"}}};
    EXPECT_TRUE(ValidateTable(table).has_value());
}

TEST(TableTest, ValidateRejectsDuplicateNames) {
    Table table{.name = "t", .columns = {{.name = "a"}, {.name = "b"}, {.name = "a"}}};
    auto result = ValidateTable(table);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::SchemaMismatch);
    EXPECT_EQ(result.error().message, "duplicate column a in table t");
}

TEST(TableTest, EmptyTableIsValid) {
    EXPECT_TRUE(ValidateTable(Table{.name = "empty"}).has_value());
}

}  // namespace
}  // namespace dbxfer
