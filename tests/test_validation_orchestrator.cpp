// EN: Unit tests for the validation orchestrator - timed scans, error propagation and logging
// FR: Tests unitaires pour l'orchestrateur de validation - scans chronométrés, propagation des erreurs et journalisation

#include <gtest/gtest.h>
#include "scan/validation_orchestrator.hpp"
#include "infrastructure/system/command_error.hpp"
#include "infrastructure/logging/logger.hpp"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace DQS;
using namespace DQS::Scan;

// EN: Test fixture capturing orchestrator logs in a temporary file
// FR: Fixture de test capturant les logs de l'orchestrateur dans un fichier temporaire
class ValidationOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_file_ = (std::filesystem::temp_directory_path() /
                     ("dqs_orchestrator_test_" +
                      std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()) + ".log")).string();
        std::remove(log_file_.c_str());

        auto& logger = Logger::getInstance();
        logger.setLogLevel(LogLevel::INFO);
        ASSERT_TRUE(logger.setOutputFile(log_file_));
    }

    void TearDown() override {
        auto& logger = Logger::getInstance();
        logger.resetOutput();
        logger.setLogLevel(LogLevel::ERROR);
        std::remove(log_file_.c_str());
    }

    std::vector<std::string> loggedMessages(const std::string& module) {
        Logger::getInstance().flush();
        std::vector<std::string> messages;
        std::ifstream file(log_file_);
        std::string line;
        while (std::getline(file, line)) {
            auto entry = nlohmann::json::parse(line);
            if (entry["module"] == module) {
                messages.push_back(entry["message"].get<std::string>());
            }
        }
        return messages;
    }

    ValidationOrchestrator orchestrator_;
    std::string log_file_;
};

TEST_F(ValidationOrchestratorTest, FindEmptyValues) {
    auto result = orchestrator_.findEmptyValues(R"([{"a":"x","b":""},{"a":null,"b":"y"}])");

    ASSERT_EQ(result.data.size(), 2u);
    EXPECT_EQ(result.data[0], EmptyFinding(0, "b"));
    EXPECT_EQ(result.data[1], EmptyFinding(1, "a"));
    EXPECT_GE(result.duration_ms, 0);
}

TEST_F(ValidationOrchestratorTest, FindInvalidNumericValues) {
    auto result = orchestrator_.findInvalidNumericValues(R"([{"a":"12"},{"a":"abc"},{"a":5}])",
                                                         "CREATE TABLE t (a INT, b VARCHAR(10))");

    ASSERT_EQ(result.data.size(), 1u);
    EXPECT_EQ(result.data[0], NumericFinding(1, "a", "abc"));
    EXPECT_GE(result.duration_ms, 0);
}

TEST_F(ValidationOrchestratorTest, NullFirstThenEmptyString) {
    auto result = orchestrator_.findEmptyValues(R"([{"a": null, "b": "x"}, {"a": 5, "b": ""}])");

    ASSERT_EQ(result.data.size(), 2u);
    EXPECT_EQ(result.data[0], EmptyFinding(0, "a"));
    EXPECT_EQ(result.data[1], EmptyFinding(1, "b"));
}

TEST_F(ValidationOrchestratorTest, WordInNumericColumn) {
    auto result = orchestrator_.findInvalidNumericValues(R"([{"a": "five", "b": "ok"}, {"a": 5, "b": "ok"}])",
                                                         "CREATE TABLE t (a INT, b VARCHAR(10))");

    ASSERT_EQ(result.data.size(), 1u);
    EXPECT_EQ(result.data[0], NumericFinding(0, "a", "five"));
}

// EN: A null in a numeric column is reported by both scans
// FR: Un null dans une colonne numérique est signalé par les deux scans
TEST_F(ValidationOrchestratorTest, NullInNumericColumnFoundByBothScans) {
    const std::string json = R"([{"a":null}])";

    auto empty = orchestrator_.findEmptyValues(json);
    ASSERT_EQ(empty.data.size(), 1u);
    EXPECT_EQ(empty.data[0], EmptyFinding(0, "a"));

    auto numeric = orchestrator_.findInvalidNumericValues(json, "CREATE TABLE t (a INT)");
    ASSERT_EQ(numeric.data.size(), 1u);
    EXPECT_EQ(numeric.data[0], NumericFinding(0, "a", "null"));
}

TEST_F(ValidationOrchestratorTest, MalformedJsonFailsBothScans) {
    try {
        orchestrator_.findEmptyValues("{not json");
        FAIL() << "Expected CommandError";
    } catch (const CommandError& e) {
        EXPECT_EQ(e.kind(), CommandError::Kind::JSON);
    }

    try {
        orchestrator_.findInvalidNumericValues("{not json", "CREATE TABLE t (a INT)");
        FAIL() << "Expected CommandError";
    } catch (const CommandError& e) {
        EXPECT_EQ(e.kind(), CommandError::Kind::JSON);
    }
}

TEST_F(ValidationOrchestratorTest, SqlIsCheckedBeforeJson) {
    try {
        orchestrator_.findInvalidNumericValues("{not json", "SELECT * FROM t");
        FAIL() << "Expected CommandError";
    } catch (const CommandError& e) {
        EXPECT_EQ(e.kind(), CommandError::Kind::SQL);
        EXPECT_EQ(e.describe(), "SQL parsing error: Could not parse a CREATE TABLE statement.");
    }
}

// EN: Scans hold no state, so repeated calls give the same findings
// FR: Les scans ne gardent aucun état, donc des appels répétés donnent les mêmes constats
TEST_F(ValidationOrchestratorTest, RepeatedCallsAreIdentical) {
    const std::string json = R"([{"a":"","b":"1.5"},{"a":"z","b":"q"}])";
    const std::string sql = "CREATE TABLE t (a TEXT, b DOUBLE)";

    auto first_empty = orchestrator_.findEmptyValues(json);
    auto second_empty = orchestrator_.findEmptyValues(json);
    EXPECT_EQ(first_empty.data, second_empty.data);

    auto first_numeric = orchestrator_.findInvalidNumericValues(json, sql);
    auto second_numeric = orchestrator_.findInvalidNumericValues(json, sql);
    EXPECT_EQ(first_numeric.data, second_numeric.data);
    ASSERT_EQ(first_numeric.data.size(), 1u);
    EXPECT_EQ(first_numeric.data[0], NumericFinding(1, "b", "q"));
}

TEST_F(ValidationOrchestratorTest, LogsOperationProgress) {
    orchestrator_.findEmptyValues(R"([{"a":null}])");
    orchestrator_.findInvalidNumericValues(R"([{"b":"x"}])", "CREATE TABLE t (b INT, a FLOAT, c TEXT)");

    auto messages = loggedMessages("orchestrator");
    ASSERT_EQ(messages.size(), 5u);
    EXPECT_EQ(messages[0], "Starting search for empty values.");
    EXPECT_EQ(messages[1].rfind("Found 1 empty values in ", 0), 0u);
    EXPECT_EQ(messages[2], "Starting search for invalid numeric values.");
    EXPECT_EQ(messages[3], "Identified numeric columns from SQL: [a, b]");
    EXPECT_EQ(messages[4].rfind("Found 1 invalid numeric values in ", 0), 0u);
}

TEST_F(ValidationOrchestratorTest, FailedOperationLogsNoCompletion) {
    EXPECT_THROW(orchestrator_.findEmptyValues("]"), CommandError);

    auto messages = loggedMessages("orchestrator");
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0], "Starting search for empty values.");
}
