/**
 * @file test_config_manager.cpp
 * @brief ConfigManager .env 로딩 / 우선순위 / 변수 확장 테스트
 */

#include "Logging/LogManager.h"
#include "Utils/ConfigManager.h"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class ConfigManagerTest : public ::testing::Test {
protected:
  void SetUp() override {
    LogManager::getInstance().setLogLevel(LogLevel::WARN);
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    dir_ = fs::temp_directory_path() /
           ("otlink_config_test_" + std::to_string(stamp));
    fs::create_directories(dir_);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir_, ec);
    ::unsetenv("OTLINK_TEST_ENV_ONLY");
  }

  void Write(const std::string &name, const std::string &content) {
    std::ofstream file(dir_ / name);
    file << content;
  }

  ConfigManager &Load() {
    auto &config = ConfigManager::getInstance();
    config.setConfigDirectory(dir_.string());
    return config;
  }

  fs::path dir_;
};

TEST_F(ConfigManagerTest, LoadsEnvAndConnectionsFile) {
  Write(".env", "DATABASE_PATH=/tmp/otlink-test.db\n");
  Write("connections.env", "PROBE_TIMEOUT_MS=2500\nHEALTH_CHECK_ENABLED=false\n");

  auto &config = Load();
  EXPECT_EQ(config.getConfigDirectory(), dir_.string());
  EXPECT_EQ(config.get("DATABASE_PATH"), "/tmp/otlink-test.db");
  EXPECT_EQ(config.getDatabasePath(), "/tmp/otlink-test.db");
  EXPECT_EQ(config.getInt("PROBE_TIMEOUT_MS", 5000), 2500);
  EXPECT_FALSE(config.getBool("HEALTH_CHECK_ENABLED", true));
  EXPECT_EQ(config.getLoadedFiles().size(), 2u);
}

TEST_F(ConfigManagerTest, CreatesConnectionsTemplateWhenMissing) {
  auto &config = Load();
  EXPECT_TRUE(fs::exists(dir_ / "connections.env"));
  EXPECT_EQ(config.getInt("HEALTH_CHECK_INTERVAL_MS", 0), 300000);
  EXPECT_TRUE(config.getBool("DRIVER_MODBUS_ENABLED", false));
}

TEST_F(ConfigManagerTest, ParsesCommentsQuotesAndExport) {
  Write(".env", "# comment\n"
                "   \n"
                "export QUOTED=\"hello world\"\n"
                "SINGLE='a # b'\n"
                "INLINE=value # trailing comment\n"
                "NO_EQUALS_LINE\n");

  auto &config = Load();
  EXPECT_EQ(config.get("QUOTED"), "hello world");
  EXPECT_EQ(config.get("SINGLE"), "a # b");
  EXPECT_EQ(config.get("INLINE"), "value");
  EXPECT_FALSE(config.hasKey("NO_EQUALS_LINE"));
}

TEST_F(ConfigManagerTest, ExpandsVariables) {
  Write(".env", "DATA_DIR=/var/otlink\n"
                "DATABASE_PATH=${DATA_DIR}/conn.db\n"
                "LOG_FILE_PATH=${CONFIG_DIR}/logs\n");

  auto &config = Load();
  EXPECT_EQ(config.get("DATABASE_PATH"), "/var/otlink/conn.db");
  EXPECT_EQ(config.get("LOG_FILE_PATH"), dir_.string() + "/logs");
}

TEST_F(ConfigManagerTest, FileValuesTakePrecedenceOverEnvironment) {
  Write(".env", "OTLINK_TEST_ENV_ONLY=from-file\n");
  ::setenv("OTLINK_TEST_ENV_ONLY", "from-env", 1);

  auto &config = Load();
  EXPECT_EQ(config.get("OTLINK_TEST_ENV_ONLY"), "from-file");
}

TEST_F(ConfigManagerTest, MissingKeysFallBackToEnvironment) {
  ::setenv("OTLINK_TEST_ENV_ONLY", "from-env", 1);

  auto &config = Load();
  EXPECT_FALSE(config.hasKey("OTLINK_TEST_ENV_ONLY"));
  EXPECT_EQ(config.get("OTLINK_TEST_ENV_ONLY"), "from-env");
  EXPECT_EQ(config.getOrDefault("OTLINK_TEST_NOWHERE", "fallback"), "fallback");
}

TEST_F(ConfigManagerTest, TypedGettersUseDefaultsOnBadValues) {
  Write(".env", "BAD_INT=abc\nYES_FLAG=yes\nOFF_FLAG=off\n");

  auto &config = Load();
  EXPECT_EQ(config.getInt("BAD_INT", 42), 42);
  EXPECT_EQ(config.getInt("MISSING_INT", 7), 7);
  EXPECT_TRUE(config.getBool("YES_FLAG", false));
  EXPECT_FALSE(config.getBool("OFF_FLAG", true));
}

TEST_F(ConfigManagerTest, SetOverridesAndReloadRestoresFile) {
  Write(".env", "PROBE_TIMEOUT_MS=1000\n");
  auto &config = Load();
  config.set("PROBE_TIMEOUT_MS", "9000");
  EXPECT_EQ(config.getInt("PROBE_TIMEOUT_MS", 0), 9000);

  config.reload();
  EXPECT_EQ(config.getInt("PROBE_TIMEOUT_MS", 0), 1000);
}
