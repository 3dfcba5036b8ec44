#include <gtest/gtest.h>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "operation_graph/table.hpp"

using namespace MLC::Operations;
using nlohmann::json;

// Tests for the in-memory table
// Tests pour la table en mémoire
class TableTest : public ::testing::Test {
protected:
    void SetUp() override {
        table = Table({"id", "name"});
        table.addRow({1, "alice"});
        table.addRow({2, "bob"});
    }
    
    Table table;
};

TEST_F(TableTest, ColumnsAndRows) {
    EXPECT_EQ(table.getColumnCount(), 2u);
    EXPECT_EQ(table.getRowCount(), 2u);
    EXPECT_TRUE(table.hasColumn("name"));
    EXPECT_FALSE(table.hasColumn("email"));
    EXPECT_EQ(table.columnIndex("name"), 1u);
    EXPECT_EQ(table.at(1, "name"), "bob");
}

TEST_F(TableTest, ShortRowsArePadded) {
    table.addRow({3});
    EXPECT_TRUE(table.at(2, "name").is_null());
}

TEST_F(TableTest, LongRowsAreRejected) {
    EXPECT_THROW(table.addRow({3, "carol", "extra"}), std::invalid_argument);
}

TEST_F(TableTest, AddColumnExtendsRows) {
    EXPECT_EQ(table.addColumn("email"), 2u);
    EXPECT_EQ(table.addColumn("name"), 1u);
    EXPECT_TRUE(table.at(0, "email").is_null());
    
    table.set(0, "email", "alice@example.org");
    EXPECT_EQ(table.getColumn("email"), (std::vector<json>{"alice@example.org", nullptr}));
}

TEST_F(TableTest, UnknownColumn) {
    EXPECT_THROW(table.at(0, "missing"), std::out_of_range);
    EXPECT_THROW(table.getColumn("missing"), std::out_of_range);
}

TEST_F(TableTest, AppendAlignsColumnsByName) {
    Table other({"name", "score"});
    other.addRow({"carol", 9.5});
    table.append(other);
    
    ASSERT_EQ(table.getRowCount(), 3u);
    EXPECT_EQ(table.getColumns(), (std::vector<std::string>{"id", "name", "score"}));
    EXPECT_TRUE(table.at(2, "id").is_null());
    EXPECT_EQ(table.at(2, "name"), "carol");
    EXPECT_TRUE(table.at(0, "score").is_null());
}

TEST_F(TableTest, RowToJson) {
    EXPECT_EQ(table.rowToJson(0), (json{{"id", 1}, {"name", "alice"}}));
}

TEST(TableRecordsTest, FromRecords) {
    json records = json::array({{{"name", "train"}, {"size", 10}}, {{"name", "test"}, {"split", "holdout"}}});
    Table table = Table::fromRecords(records);
    
    EXPECT_EQ(table.getColumns(), (std::vector<std::string>{"name", "size", "split"}));
    ASSERT_EQ(table.getRowCount(), 2u);
    EXPECT_EQ(table.at(0, "size"), 10);
    EXPECT_TRUE(table.at(0, "split").is_null());
    EXPECT_TRUE(table.at(1, "size").is_null());
}

TEST(TableRecordsTest, FromRecordsRejectsNonObjects) {
    EXPECT_THROW(Table::fromRecords(json::array({1, 2})), std::invalid_argument);
    EXPECT_THROW(Table::fromRecords(json::object()), std::invalid_argument);
}

TEST(TableRecordsTest, Equality) {
    Table a({"x"});
    Table b({"x"});
    a.addRow({1});
    EXPECT_NE(a, b);
    b.addRow({1});
    EXPECT_EQ(a, b);
}
