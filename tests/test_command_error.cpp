// EN: Unit tests for CommandError display strings and kinds
// FR: Tests unitaires pour les chaînes d'affichage et les types de CommandError

#include <gtest/gtest.h>
#include "infrastructure/system/command_error.hpp"

using namespace DQS;

TEST(CommandErrorTest, IoUsesUnderlyingMessage) {
    CommandError error = CommandError::io("data.json: No such file or directory");

    EXPECT_EQ(error.kind(), CommandError::Kind::IO);
    EXPECT_EQ(error.describe(), "data.json: No such file or directory");
    EXPECT_STREQ(error.what(), "data.json: No such file or directory");
}

TEST(CommandErrorTest, JsonAndSqlArePrefixed) {
    CommandError json = CommandError::json("expected value at line 1 column 2");
    EXPECT_EQ(json.kind(), CommandError::Kind::JSON);
    EXPECT_EQ(json.describe(), "JSON parsing error: expected value at line 1 column 2");
    EXPECT_EQ(json.detail(), "expected value at line 1 column 2");

    CommandError sql = CommandError::sql("Could not parse a CREATE TABLE statement.");
    EXPECT_EQ(sql.kind(), CommandError::Kind::SQL);
    EXPECT_EQ(sql.describe(), "SQL parsing error: Could not parse a CREATE TABLE statement.");
}

TEST(CommandErrorTest, GenericUsesMessage) {
    CommandError error = CommandError::generic("File selection was canceled.");

    EXPECT_EQ(error.kind(), CommandError::Kind::GENERIC);
    EXPECT_EQ(error.describe(), "File selection was canceled.");
}

TEST(CommandErrorTest, CaughtAsRuntimeError) {
    try {
        throw CommandError::sql("boom");
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "SQL parsing error: boom");
        return;
    }
    FAIL() << "CommandError was not caught as std::runtime_error";
}

TEST(CommandErrorTest, KindNames) {
    EXPECT_EQ(CommandError::kindToString(CommandError::Kind::IO), "io");
    EXPECT_EQ(CommandError::kindToString(CommandError::Kind::JSON), "json");
    EXPECT_EQ(CommandError::kindToString(CommandError::Kind::SQL), "sql");
    EXPECT_EQ(CommandError::kindToString(CommandError::Kind::GENERIC), "generic");
}
