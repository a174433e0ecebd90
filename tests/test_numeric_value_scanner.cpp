// EN: Unit tests for the numeric conformance scanner and float literal recognition
// FR: Tests unitaires pour le scanner de conformité numérique et la reconnaissance des littéraux flottants

#include <gtest/gtest.h>
#include "scan/numeric_value_scanner.hpp"
#include "infrastructure/system/command_error.hpp"
#include "infrastructure/logging/logger.hpp"

using namespace DQS;
using namespace DQS::Scan;

namespace {

const std::string kOrdersDdl = "CREATE TABLE t (a INT, b VARCHAR(10))";

} // namespace

class NumericValueScannerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
    }

    NumericValueScanner scanner_;
};

TEST(FloatLiteralTest, AcceptedForms) {
    for (const char* text : {"0", "42", "-7", "+3", "3.14", "1.", ".5", "-.5", "1e10", "1E-3",
                             "2.5e+7", "007", "inf", "-INF", "Infinity", "+infinity", "nan",
                             "-NaN", "NAN"}) {
        EXPECT_TRUE(isFloatLiteral(text)) << text;
    }
}

TEST(FloatLiteralTest, RejectedForms) {
    for (const char* text : {"", "+", "-", ".", "abc", "12abc", "1e", "1e+", "e5", " 1", "1 ",
                             "0x10", "1,5", "1.2.3", "--1", "infinit", "nana", "1_000"}) {
        EXPECT_FALSE(isFloatLiteral(text)) << text;
    }
}

TEST_F(NumericValueScannerTest, StringThatIsNotANumber) {
    auto findings = scanner_.scan(R"([{"a":"12"},{"a":"abc"},{"a":5}])", kOrdersDdl);

    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0], NumericFinding(1, "a", "abc"));
}

TEST_F(NumericValueScannerTest, NonStringNonNumberValuesAreDumped) {
    auto findings = scanner_.scan(
        R"([{"a":null},{"a":true},{"a":[1,2]},{"a":{"x":1}},{"a":""}])", kOrdersDdl);

    ASSERT_EQ(findings.size(), 5u);
    EXPECT_EQ(findings[0], NumericFinding(0, "a", "null"));
    EXPECT_EQ(findings[1], NumericFinding(1, "a", "true"));
    EXPECT_EQ(findings[2], NumericFinding(2, "a", "[1,2]"));
    EXPECT_EQ(findings[3], NumericFinding(3, "a", "{\"x\":1}"));
    EXPECT_EQ(findings[4], NumericFinding(4, "a", ""));
}

TEST_F(NumericValueScannerTest, JsonNumbersAreAlwaysValid) {
    auto findings = scanner_.scan(R"([{"a":-1},{"a":2.5},{"a":1e300},{"a":18446744073709551615}])", kOrdersDdl);
    EXPECT_TRUE(findings.empty());
}

TEST_F(NumericValueScannerTest, NonNumericColumnsAreIgnored) {
    auto findings = scanner_.scan(R"([{"b":"abc","c":null,"a":"1"}])", kOrdersDdl);
    EXPECT_TRUE(findings.empty());
}

TEST_F(NumericValueScannerTest, PreservesFieldInsertionOrder) {
    const std::string ddl = "CREATE TABLE t (x INT, y FLOAT, z DECIMAL)";
    auto findings = scanner_.scan(R"([{"z":"bad","x":"also bad","y":"1.5"},{"y":"n/a"}])", ddl);

    ASSERT_EQ(findings.size(), 3u);
    EXPECT_EQ(findings[0], NumericFinding(0, "z", "bad"));
    EXPECT_EQ(findings[1], NumericFinding(0, "x", "also bad"));
    EXPECT_EQ(findings[2], NumericFinding(1, "y", "n/a"));
}

TEST_F(NumericValueScannerTest, KeysMatchExactly) {
    auto findings = scanner_.scan(R"([{"A":"abc","a ":"abc"}])", kOrdersDdl);
    EXPECT_TRUE(findings.empty());
}

TEST_F(NumericValueScannerTest, NoNumericColumnsMeansNoFindings) {
    auto findings = scanner_.scan(R"([{"b":"abc"}])", "CREATE TABLE t (b TEXT)");
    EXPECT_TRUE(findings.empty());
}

TEST_F(NumericValueScannerTest, ShapeIsTolerated) {
    EXPECT_TRUE(scanner_.scan(R"({"a":"abc"})", kOrdersDdl).empty());

    auto findings = scanner_.scan(R"(["abc", {"a":"abc"}])", kOrdersDdl);
    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0].index, 1u);
}

// EN: The DDL is analysed first, so an SQL error wins over a JSON error
// FR: Le DDL est analysé d'abord, donc une erreur SQL l'emporte sur une erreur JSON
TEST_F(NumericValueScannerTest, SqlErrorTakesPrecedence) {
    try {
        scanner_.scan("{not json", "SELECT 1");
        FAIL() << "Expected CommandError";
    } catch (const CommandError& e) {
        EXPECT_EQ(e.kind(), CommandError::Kind::SQL);
        EXPECT_EQ(e.describe(), "SQL parsing error: Could not parse a CREATE TABLE statement.");
    }
}

TEST_F(NumericValueScannerTest, MalformedJsonRaisesJsonError) {
    try {
        scanner_.scan("[{\"a\":", kOrdersDdl);
        FAIL() << "Expected CommandError";
    } catch (const CommandError& e) {
        EXPECT_EQ(e.kind(), CommandError::Kind::JSON);
    }
}

TEST_F(NumericValueScannerTest, CheckValue) {
    std::string offending;
    EXPECT_TRUE(NumericValueScanner::checkValue(nlohmann::ordered_json(3), offending));
    EXPECT_TRUE(NumericValueScanner::checkValue(nlohmann::ordered_json("-2.5e3"), offending));
    EXPECT_TRUE(offending.empty());

    EXPECT_FALSE(NumericValueScanner::checkValue(nlohmann::ordered_json("twelve"), offending));
    EXPECT_EQ(offending, "twelve");
    EXPECT_FALSE(NumericValueScanner::checkValue(nlohmann::ordered_json(false), offending));
    EXPECT_EQ(offending, "false");
}

TEST_F(NumericValueScannerTest, ScansParsedDocumentWithColumnSet) {
    auto document = nlohmann::ordered_json::parse(R"([{"p":"x","q":"y"}])");

    auto findings = scanner_.scan(document, std::set<std::string>{"q"});
    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0], NumericFinding(0, "q", "y"));

    EXPECT_TRUE(scanner_.scan(document, std::set<std::string>{}).empty());
}
