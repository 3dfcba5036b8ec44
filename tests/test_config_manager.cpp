#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "core/dataset.hpp"
#include "infrastructure/config/config_manager.hpp"

using namespace MLC;

const std::string TEST_YAML = R"(
loader:
  cache_directory: /tmp/mlc-cache

http:
  connect_timeout_ms: 2500
  read_timeout_ms: 30000
  user_agent: "mlc-test/0.1"

logging:
  level: debug
  formats:
    - ndjson
    - text
)";

// Test fixture for ConfigManager tests
// Fixture de test pour les tests ConfigManager
class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ConfigManager::getInstance().reset();
    }
    
    void TearDown() override {
        ConfigManager::getInstance().reset();
        unsetenv("MLC_HTTP_READ_TIMEOUT_MS");
        unsetenv("MLC_TEST_HOME");
    }
};

TEST_F(ConfigManagerTest, ConfigValueTypes) {
    ConfigValue bool_val(true);
    ConfigValue int_val(42);
    ConfigValue string_val("hello");
    ConfigValue array_val(std::vector<std::string>{"a", "b"});
    
    EXPECT_TRUE(bool_val.as<bool>());
    EXPECT_EQ(int_val.as<int>(), 42);
    EXPECT_EQ(string_val.as<std::string>(), "hello");
    EXPECT_EQ(array_val.as<std::vector<std::string>>().size(), 2u);
    
    EXPECT_FALSE(int_val.tryAs<std::string>().has_value());
    EXPECT_EQ(int_val.asOrDefault<std::string>("default"), "default");
    EXPECT_THROW(int_val.as<bool>(), std::runtime_error);
    EXPECT_FALSE(ConfigValue().isValid());
}

TEST_F(ConfigManagerTest, LoadFromString) {
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString(TEST_YAML));
    
    EXPECT_EQ(config.get("loader", "cache_directory").as<std::string>(), "/tmp/mlc-cache");
    EXPECT_EQ(config.get("http", "connect_timeout_ms").as<int>(), 2500);
    EXPECT_EQ(config.get("logging", "formats").as<std::vector<std::string>>().size(), 2u);
    EXPECT_TRUE(config.has("http", "user_agent"));
    EXPECT_FALSE(config.has("http", "proxy"));
}

TEST_F(ConfigManagerTest, InvalidYamlIsRejected) {
    EXPECT_FALSE(ConfigManager::getInstance().loadFromString("loader: [unclosed"));
}

TEST_F(ConfigManagerTest, LoadFromFileAndSave) {
    auto path = std::filesystem::temp_directory_path() / "mlc_config_test.yaml";
    {
        std::ofstream file(path);
        file << TEST_YAML;
    }
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromFile(path.string()));
    EXPECT_EQ(config.get("http", "user_agent").as<std::string>(), "mlc-test/0.1");
    
    auto saved = std::filesystem::temp_directory_path() / "mlc_config_saved.yaml";
    ASSERT_TRUE(config.saveToFile(saved.string()));
    config.reset();
    ASSERT_TRUE(config.loadFromFile(saved.string()));
    EXPECT_EQ(config.get("http", "read_timeout_ms").as<int>(), 30000);
    
    std::filesystem::remove(path);
    std::filesystem::remove(saved);
    EXPECT_FALSE(config.loadFromFile("/nonexistent/mlc.yaml"));
}

TEST_F(ConfigManagerTest, EnvironmentOverrides) {
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString(TEST_YAML));
    setenv("MLC_HTTP_READ_TIMEOUT_MS", "1234", 1);
    
    config.loadEnvironmentOverrides("MLC_");
    EXPECT_EQ(config.get("http", "read_timeout_ms").as<int>(), 1234);
}

TEST_F(ConfigManagerTest, EnvironmentOverridesKeysNamedByRules) {
    // A rule makes an unset key reachable from the environment
    // Une règle rend une clé absente accessible depuis l'environnement
    auto& config = ConfigManager::getInstance();
    config.addValidationRules(LoaderOptions::validationRules());
    ASSERT_TRUE(config.loadFromString("loader:\n  cache_directory: /tmp/x\n"));
    setenv("MLC_HTTP_READ_TIMEOUT_MS", "750", 1);

    config.loadEnvironmentOverrides("MLC_");
    EXPECT_EQ(config.get("http", "read_timeout_ms").as<int>(), 750);
}

TEST_F(ConfigManagerTest, SectionsMustBeMappings) {
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString(TEST_YAML));
    EXPECT_FALSE(config.loadFromString("loader: /tmp/cache\n"));
    EXPECT_FALSE(config.loadFromString("- loader\n- http\n"));

    // A rejected document leaves the previous settings in place
    // Un document rejeté laisse les réglages précédents en place
    EXPECT_EQ(config.get("http", "connect_timeout_ms").as<int>(), 2500);
}

TEST_F(ConfigManagerTest, ScalarTyping) {
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString("http:\n  retry: true\n  backoff: 1.5\n  agent: v1.2.3\n  empty:\n"));
    EXPECT_TRUE(config.get("http", "retry").as<bool>());
    EXPECT_DOUBLE_EQ(config.get("http", "backoff").as<double>(), 1.5);
    EXPECT_EQ(config.get("http", "agent").as<std::string>(), "v1.2.3");
    EXPECT_FALSE(config.has("http", "empty"));
    EXPECT_EQ(config.get("http", "backoff").typeName(), "double");
}

TEST_F(ConfigManagerTest, VariableExpansion) {
    setenv("MLC_TEST_HOME", "/data", 1);
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString("loader:\n  cache_directory: ${MLC_TEST_HOME}/cache\n"));
    EXPECT_EQ(config.get("loader", "cache_directory").as<std::string>(), "/data/cache");
}

TEST_F(ConfigManagerTest, ValidationRules) {
    auto& config = ConfigManager::getInstance();
    config.addValidationRules(LoaderOptions::validationRules());
    ASSERT_TRUE(config.loadFromString(TEST_YAML));
    
    std::vector<std::string> errors;
    EXPECT_TRUE(config.validate(errors));
    EXPECT_TRUE(errors.empty());
    
    config.set("http", "connect_timeout_ms", ConfigValue(-5));
    config.set("logging", "level", ConfigValue("verbose"));
    EXPECT_FALSE(config.validate(errors));
    EXPECT_EQ(errors.size(), 2u);
}

TEST_F(ConfigManagerTest, LoaderOptionsFromConfig) {
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString(TEST_YAML));
    
    auto options = LoaderOptions::fromConfig(config);
    EXPECT_EQ(options.cache_directory, std::filesystem::path("/tmp/mlc-cache"));
    EXPECT_EQ(options.connect_timeout.count(), 2500);
    EXPECT_EQ(options.read_timeout.count(), 30000);
    EXPECT_EQ(options.user_agent, "mlc-test/0.1");
}

TEST_F(ConfigManagerTest, LoaderOptionsDefaults) {
    auto options = LoaderOptions::fromConfig(ConfigManager::getInstance());
    EXPECT_TRUE(options.cache_directory.empty());
    EXPECT_EQ(options.connect_timeout.count(), 10000);
    EXPECT_EQ(options.getCacheDirectory(), std::filesystem::temp_directory_path() / "mlcroissant-cpp");
}
