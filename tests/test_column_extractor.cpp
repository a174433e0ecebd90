// EN: Unit tests for numeric column extraction from DDL text
// FR: Tests unitaires pour l'extraction des colonnes numériques depuis un texte DDL

#include <gtest/gtest.h>
#include "schema/column_extractor.hpp"
#include "infrastructure/system/command_error.hpp"
#include "infrastructure/logging/logger.hpp"

using namespace DQS;
using namespace DQS::Schema;

namespace {

// EN: Run extraction and return the SQL error description, or "" when no error was raised
// FR: Exécute l'extraction et retourne la description de l'erreur SQL, ou "" sans erreur
std::string extractionError(const std::string& sql) {
    try {
        extractNumericColumns(sql);
    } catch (const CommandError& e) {
        EXPECT_EQ(e.kind(), CommandError::Kind::SQL);
        return e.describe();
    }
    return "";
}

} // namespace

class ColumnExtractorTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
    }
};

TEST_F(ColumnExtractorTest, NumericColumnsOfSimpleTable) {
    auto columns = extractNumericColumns("CREATE TABLE t (a INT, b VARCHAR(10))");
    EXPECT_EQ(columns, std::set<std::string>{"a"});
}

TEST_F(ColumnExtractorTest, AllNumericFamilies) {
    auto columns = extractNumericColumns(
        "CREATE TABLE metrics (\n"
        "  id BIGINT PRIMARY KEY,\n"
        "  price NUMERIC(10,2),\n"
        "  tax DECIMAL,\n"
        "  ratio FLOAT,\n"
        "  score DOUBLE PRECISION,\n"
        "  label TEXT,\n"
        "  created_at TIMESTAMP\n"
        ");");

    EXPECT_EQ(columns, (std::set<std::string>{"id", "price", "ratio", "score", "tax"}));
}

TEST_F(ColumnExtractorTest, KeywordNamedColumnsAreKept) {
    EXPECT_EQ(extractNumericColumns("CREATE TABLE t (period INT, amount INT)"),
              (std::set<std::string>{"amount", "period"}));
    EXPECT_EQ(extractNumericColumns("CREATE TABLE t (key INT, value TEXT, PRIMARY KEY (key))"),
              std::set<std::string>{"key"});
}

TEST_F(ColumnExtractorTest, NamesKeepTheirCase) {
    auto columns = extractNumericColumns("CREATE TABLE t (\"Amount\" DECIMAL, amount TEXT)");
    EXPECT_EQ(columns, std::set<std::string>{"Amount"});
}

TEST_F(ColumnExtractorTest, OnlyFirstStatementIsUsed) {
    auto columns = extractNumericColumns("CREATE TABLE a (x INT); CREATE TABLE b (y INT);");
    EXPECT_EQ(columns, std::set<std::string>{"x"});
}

TEST_F(ColumnExtractorTest, NoNumericColumns) {
    EXPECT_TRUE(extractNumericColumns("CREATE TABLE t (name TEXT, note VARCHAR(20))").empty());
    EXPECT_TRUE(extractNumericColumns("CREATE TABLE t AS SELECT 1").empty());
}

TEST_F(ColumnExtractorTest, TableSchemaKeepsDeclarationOrder) {
    TableSchema schema = extractTableSchema("CREATE TABLE orders (id INT, customer TEXT, total DECIMAL(8,2))");

    EXPECT_EQ(schema.getName(), "orders");
    ASSERT_EQ(schema.getColumns().size(), 3u);
    EXPECT_EQ(schema.getColumns()[0].name, "id");
    EXPECT_EQ(schema.getColumns()[1].name, "customer");
    EXPECT_EQ(schema.getColumns()[2].data_type, "DECIMAL(8,2)");
}

TEST_F(ColumnExtractorTest, FirstStatementMustBeCreateTable) {
    const std::string expected = "SQL parsing error: Could not parse a CREATE TABLE statement.";

    EXPECT_EQ(extractionError("SELECT * FROM t"), expected);
    EXPECT_EQ(extractionError("SELECT 1; CREATE TABLE t (a INT)"), expected);
    EXPECT_EQ(extractionError("CREATE INDEX idx ON t (a)"), expected);
    EXPECT_EQ(extractionError(""), expected);
    EXPECT_EQ(extractionError("-- just a comment\n"), expected);
}

TEST_F(ColumnExtractorTest, MalformedSqlReportsPosition) {
    EXPECT_EQ(extractionError("CREATE TABLE t (a INT"),
              "SQL parsing error: Expected ')', found: EOF at Line: 1, Column: 22");
    EXPECT_EQ(extractionError("CREATE TABLE t (a INT,)"),
              "SQL parsing error: Expected column name or constraint definition, found: ) at Line: 1, Column: 23");
}

// EN: The whole text is tokenized, so a broken trailing statement still fails
// FR: Tout le texte est tokenisé, donc une déclaration finale cassée échoue quand même
TEST_F(ColumnExtractorTest, BrokenTrailingStatementFails) {
    std::string error = extractionError("CREATE TABLE t (a INT); SELECT (");
    EXPECT_NE(error.find("Expected ')'"), std::string::npos);
}
