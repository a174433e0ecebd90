// EN: Unit tests for the YAML-backed ConfigManager
// FR: Tests unitaires pour le ConfigManager basé sur YAML

#include <gtest/gtest.h>
#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace DQS;

namespace {

const std::string TEST_YAML = R"(
logging:
  level: debug
  file: "/tmp/dqs.log"

output:
  format: text
  detailed: true

input:
  preview_bytes: 512
  ratio: 0.75
  extensions:
    - json
    - ndjson
  label: "1024"
)";

} // namespace

// EN: Test fixture resetting the singleton around each test
// FR: Fixture de test remettant à zéro le singleton autour de chaque test
class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR); // EN: Reduce noise during tests / FR: Réduit le bruit pendant les tests
        ConfigManager::getInstance().reset();
    }

    void TearDown() override {
        ConfigManager::getInstance().reset();
    }
};

TEST_F(ConfigManagerTest, ConfigValueConversions) {
    ConfigValue bool_val(true);
    ConfigValue int_val(42);
    ConfigValue double_val(3.14);
    ConfigValue string_val(std::string("hello"));
    ConfigValue array_val(std::vector<std::string>{"a", "b", "c"});

    EXPECT_TRUE(bool_val.as<bool>());
    EXPECT_EQ(int_val.as<int>(), 42);
    EXPECT_DOUBLE_EQ(double_val.as<double>(), 3.14);
    EXPECT_EQ(string_val.as<std::string>(), "hello");
    ASSERT_EQ(array_val.as<std::vector<std::string>>().size(), 3u);
    EXPECT_EQ(array_val.as<std::vector<std::string>>()[0], "a");

    EXPECT_TRUE(int_val.tryAs<int>().has_value());
    EXPECT_FALSE(int_val.tryAs<std::string>().has_value());
    EXPECT_EQ(int_val.asOrDefault<int>(999), 42);
    EXPECT_EQ(int_val.asOrDefault<std::string>("default"), "default");

    EXPECT_EQ(bool_val.toString(), "true");
    EXPECT_EQ(int_val.toString(), "42");
    EXPECT_EQ(string_val.toString(), "hello");

    EXPECT_FALSE(ConfigValue().isValid());
    EXPECT_THROW(ConfigValue().as<int>(), std::exception);

    EXPECT_EQ(int_val.typeName(), "int");
    EXPECT_EQ(array_val.typeName(), "array");
    EXPECT_EQ(ConfigValue().typeName(), "empty");
    try {
        int_val.as<std::string>();
        FAIL() << "Expected type mismatch";
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "ConfigValue holds a int value");
    }
}

TEST_F(ConfigManagerTest, YamlLoadingTypesScalars) {
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString(TEST_YAML));

    EXPECT_EQ(config.get("logging", "level").as<std::string>(), "debug");
    EXPECT_EQ(config.get("logging", "file").as<std::string>(), "/tmp/dqs.log");
    EXPECT_EQ(config.get("output", "format").as<std::string>(), "text");
    EXPECT_TRUE(config.get("output", "detailed").as<bool>());
    EXPECT_EQ(config.get("input", "preview_bytes").as<int>(), 512);
    EXPECT_DOUBLE_EQ(config.get("input", "ratio").as<double>(), 0.75);

    // EN: Quoted scalars stay strings
    // FR: Les scalaires entre guillemets restent des chaînes
    EXPECT_EQ(config.get("input", "label").as<std::string>(), "1024");

    auto extensions = config.get("input", "extensions").as<std::vector<std::string>>();
    ASSERT_EQ(extensions.size(), 2u);
    EXPECT_EQ(extensions[0], "json");
    EXPECT_EQ(extensions[1], "ndjson");
}

TEST_F(ConfigManagerTest, LoadingReplacesSections) {
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString(TEST_YAML));
    ASSERT_TRUE(config.loadFromString("output:\n  format: json\n"));

    EXPECT_EQ(config.get("output", "format").as<std::string>(), "json");
    EXPECT_FALSE(config.has("logging", "level"));
}

TEST_F(ConfigManagerTest, InvalidYamlIsRejected) {
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString(TEST_YAML));

    EXPECT_FALSE(config.loadFromString("logging: [unclosed"));
    EXPECT_FALSE(config.loadFromString("- just\n- a\n- list\n"));

    // EN: Previous configuration survives a failed load
    // FR: La configuration précédente survit à un chargement échoué
    EXPECT_EQ(config.get("logging", "level").as<std::string>(), "debug");
}

TEST_F(ConfigManagerTest, FileLoading) {
    auto& config = ConfigManager::getInstance();
    auto path = std::filesystem::temp_directory_path() / "dqs_config_manager_test.yaml";
    {
        std::ofstream file(path);
        file << TEST_YAML;
    }

    EXPECT_TRUE(config.loadFromFile(path.string()));
    EXPECT_EQ(config.get("output", "format").as<std::string>(), "text");
    std::filesystem::remove(path);

    EXPECT_FALSE(config.loadFromFile("/nonexistent/dqs.yaml"));
}

TEST_F(ConfigManagerTest, BundledDefaultsFileLoads) {
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromFile(std::string(DQS_SOURCE_DIR) + "/config/dqs.yaml"));

    EXPECT_EQ(config.get("logging", "level").as<std::string>(), "info");
    EXPECT_EQ(config.get("logging", "file").as<std::string>(), "");
    EXPECT_EQ(config.get("output", "format").as<std::string>(), "json");
    EXPECT_FALSE(config.get("output", "detailed").as<bool>());
    EXPECT_EQ(config.get("input", "preview_bytes").as<int>(), 1024);
    EXPECT_EQ(config.get("input", "extensions").as<std::vector<std::string>>(),
              std::vector<std::string>{"json"});
}

TEST_F(ConfigManagerTest, SectionsAndKeys) {
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString(TEST_YAML));

    EXPECT_EQ(config.getSectionNames(), (std::vector<std::string>{"input", "logging", "output"}));

    config.set("input", "new_key", ConfigValue(std::string("new_value")));
    EXPECT_TRUE(config.has("input", "new_key"));
    EXPECT_FALSE(config.has("missing", "new_key"));

    // EN: Keys are listed in sorted order within each section
    // FR: Les clés sont listées triées dans chaque section
    std::string dump = config.dump();
    size_t input = dump.find("[input]\n");
    ASSERT_NE(input, std::string::npos);
    EXPECT_LT(dump.find("  extensions = ", input), dump.find("  label = ", input));
    EXPECT_LT(dump.find("  label = ", input), dump.find("  new_key = new_value", input));
    EXPECT_LT(dump.find("  new_key = new_value", input), dump.find("  preview_bytes = ", input));
    EXPECT_LT(dump.find("  preview_bytes = ", input), dump.find("[logging]"));
}

TEST_F(ConfigManagerTest, DefaultSectionAndMacros) {
    CONFIG_SET("test_key", std::string("test_value"));
    CONFIG_SET_SECTION("test_section", "number", 42);

    EXPECT_EQ(CONFIG_GET("test_key").as<std::string>(), "test_value");
    EXPECT_EQ(CONFIG_GET_SECTION("test_section", "number").as<int>(), 42);
    EXPECT_TRUE(ConfigManager::getInstance().has("test_key"));
}

TEST_F(ConfigManagerTest, EnvironmentOverrides) {
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString(TEST_YAML));

    ::setenv("DQSTEST_OUTPUT_FORMAT", "json", 1);
    ::setenv("DQSTEST_INPUT_PREVIEW_BYTES", "64", 1);
    ::setenv("DQSTEST_LOGGING_FILE", "", 1);
    ::setenv("DQSTEST_BROKEN", "x", 1);

    EXPECT_EQ(config.loadEnvironmentOverrides("DQSTEST_"), 3u);
    EXPECT_EQ(config.get("output", "format").as<std::string>(), "json");
    EXPECT_EQ(config.get("input", "preview_bytes").as<int>(), 64);
    EXPECT_EQ(config.get("logging", "file").as<std::string>(), "");

    ::unsetenv("DQSTEST_OUTPUT_FORMAT");
    ::unsetenv("DQSTEST_INPUT_PREVIEW_BYTES");
    ::unsetenv("DQSTEST_LOGGING_FILE");
    ::unsetenv("DQSTEST_BROKEN");
}

TEST_F(ConfigManagerTest, VariableExpansion) {
    ::setenv("DQS_TEST_LOG_DIR", "/var/log/dqs", 1);

    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString("logging:\n  file: ${DQS_TEST_LOG_DIR}/scan.log\n"));
    EXPECT_EQ(config.get("logging", "file").as<std::string>(), "/var/log/dqs/scan.log");

    ::unsetenv("DQS_TEST_LOG_DIR");
}

TEST_F(ConfigManagerTest, Validation) {
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString(TEST_YAML));

    ConfigManager::ValidationRule format;
    format.key = "output.format";
    format.type = "string";
    format.allowed_values = {"json"};

    ConfigManager::ValidationRule preview;
    preview.key = "input.preview_bytes";
    preview.type = "int";
    preview.min_value = 1024;

    ConfigManager::ValidationRule required;
    required.key = "input.missing";
    required.type = "string";
    required.required = true;

    ConfigManager::ValidationRule detailed;
    detailed.key = "output.detailed";
    detailed.type = "bool";

    config.addValidationRules({format, preview, required, detailed});

    std::vector<std::string> errors;
    EXPECT_FALSE(config.validate(errors));
    ASSERT_EQ(errors.size(), 3u);
    EXPECT_NE(errors[0].find("output.format must be one of: json"), std::string::npos);
    EXPECT_NE(errors[1].find("input.preview_bytes must be >="), std::string::npos);
    EXPECT_EQ(errors[2], "Required configuration missing: input.missing");

    config.set("output", "detailed", ConfigValue(std::string("yes")));
    EXPECT_FALSE(config.validate(errors));
    EXPECT_EQ(errors.back(), "Configuration output.detailed must be of type bool, found string");

    config.set("output", "detailed", ConfigValue(true));
    config.set("output", "format", ConfigValue(std::string("json")));
    config.set("input", "preview_bytes", ConfigValue(2048));
    config.set("input", "missing", ConfigValue(std::string("present")));
    EXPECT_TRUE(config.validate(errors));
    EXPECT_TRUE(errors.empty());
}

TEST_F(ConfigManagerTest, Dump) {
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString(TEST_YAML));

    std::string dump = config.dump();
    EXPECT_NE(dump.find("[logging]"), std::string::npos);
    EXPECT_NE(dump.find("level = debug"), std::string::npos);
    EXPECT_LT(dump.find("[input]"), dump.find("[logging]"));
}
