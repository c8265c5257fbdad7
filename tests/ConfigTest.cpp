#include <filesystem> // std::filesystem::{path, temp_directory_path, remove}
#include <fstream>    // std::ofstream
#include <toml++/toml.h>

#include <Clima/Utils/Env.hpp>
#include <Clima/Utils/Error.hpp>
#include <Clima/Utils/Types.hpp>

#include "Config/Config.hpp"

#include "gtest/gtest.h"

using namespace clima::utils::types;
using namespace clima::config;
using clima::utils::env::SetEnv;
using clima::utils::env::UnsetEnv;
using enum clima::utils::error::ClimaErrorCode;

class ConfigTest : public testing::Test {
 protected:
  std::filesystem::path m_configPath;

  fn SetUp() -> void override {
    m_configPath = std::filesystem::temp_directory_path() / "clima-config-test.toml";

    for (const PCStr name : { "WEATHERBIT_API_KEY", "DEFAULT_CITY", "DEFAULT_COUNTRY", "CLIMA_DB_PATH", "HOURS_WINDOW" })
      UnsetEnv(name);
  }

  fn TearDown() -> void override {
    std::error_code errc;
    std::filesystem::remove(m_configPath, errc);

    for (const PCStr name : { "WEATHERBIT_API_KEY", "DEFAULT_CITY", "DEFAULT_COUNTRY", "CLIMA_DB_PATH", "HOURS_WINDOW" })
      UnsetEnv(name);
  }

  fn writeConfig(const String& contents) const -> void {
    std::ofstream(m_configPath) << contents;
  }

  fn options() const -> LoadOptions {
    return LoadOptions { .configPath = m_configPath, .useDotenv = false };
  }
};

// NOLINTBEGIN(modernize-use-trailing-return-type, cert-err58-cpp)
TEST_F(ConfigTest, ProviderFromToml_AllKeys) {
  toml::parse_result tbl = toml::parse(R"(
    api_key = "abc"
    base_url = "https://example.test/current"
    timeout_secs = 5
    lang = "en"
    units = "I"
  )");

  ASSERT_TRUE(tbl.is_table());
  const Provider provider = Provider::fromToml(*tbl.as_table());

  EXPECT_EQ(provider.apiKey, "abc");
  EXPECT_EQ(provider.baseUrl, "https://example.test/current");
  EXPECT_EQ(provider.timeoutSecs, 5);
  EXPECT_EQ(provider.lang, "en");
  EXPECT_EQ(provider.units, "I");
}

TEST_F(ConfigTest, ProviderFromToml_Defaults) {
  toml::parse_result tbl = toml::parse("");

  ASSERT_TRUE(tbl.is_table());
  const Provider provider = Provider::fromToml(*tbl.as_table());

  EXPECT_FALSE(provider.apiKey.has_value());
  EXPECT_EQ(provider.baseUrl, "https://api.weatherbit.io/v2.0/current");
  EXPECT_EQ(provider.timeoutSecs, 20);
  EXPECT_EQ(provider.lang, "pt");
  EXPECT_EQ(provider.units, "M");
}

TEST_F(ConfigTest, Config_BuiltInDefaults) {
  const Config config {};

  EXPECT_EQ(config.location.city, "Rio de Janeiro");
  EXPECT_EQ(config.location.country, "BR");
  EXPECT_EQ(config.storage.databasePath, std::filesystem::path("./data/weather.db"));
  EXPECT_EQ(config.charts.hoursWindow, 168);
  EXPECT_EQ(config.charts.outputDir, std::filesystem::path("./plots"));
  EXPECT_EQ(config.server.port, 8000);
}

TEST_F(ConfigTest, Load_ReadsSections) {
  writeConfig(R"(
    [location]
    city = "Lisbon"
    country = "PT"

    [storage]
    database_path = "/tmp/clima/weather.db"

    [charts]
    hours_window = 48

    [server]
    port = 9090
  )");

  const Result<Config> config = Config::Load(options());

  ASSERT_TRUE(config.has_value()) << config.error().message;
  EXPECT_EQ(config->location.city, "Lisbon");
  EXPECT_EQ(config->location.country, "PT");
  EXPECT_EQ(config->storage.databasePath, std::filesystem::path("/tmp/clima/weather.db"));
  EXPECT_EQ(config->charts.hoursWindow, 48);
  EXPECT_EQ(config->server.port, 9090);
}

TEST_F(ConfigTest, Load_EnvironmentOverridesFile) {
  writeConfig(R"(
    [provider]
    api_key = "from-file"

    [location]
    city = "Lisbon"
  )");

  SetEnv("WEATHERBIT_API_KEY", "from-env");
  SetEnv("DEFAULT_CITY", "Porto");
  SetEnv("CLIMA_DB_PATH", "/tmp/other.db");
  SetEnv("HOURS_WINDOW", "12");

  const Result<Config> config = Config::Load(options());

  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->provider.apiKey, "from-env");
  EXPECT_EQ(config->location.city, "Porto");
  EXPECT_EQ(config->storage.databasePath, std::filesystem::path("/tmp/other.db"));
  EXPECT_EQ(config->charts.hoursWindow, 12);
}

TEST_F(ConfigTest, Load_NonIntegerHoursWindowIsConfigurationError) {
  writeConfig("");
  SetEnv("HOURS_WINDOW", "a week");

  const Result<Config> config = Config::Load(options());

  ASSERT_FALSE(config.has_value());
  EXPECT_EQ(config.error().code, ConfigurationError);
}

TEST_F(ConfigTest, Load_InvalidTomlIsConfigurationError) {
  writeConfig("[location\ncity = ");

  const Result<Config> config = Config::Load(options());

  ASSERT_FALSE(config.has_value());
  EXPECT_EQ(config.error().code, ConfigurationError);
}

TEST_F(ConfigTest, Load_MissingExplicitFileIsConfigurationError) {
  const Result<Config> config = Config::Load(options());

  ASSERT_FALSE(config.has_value());
  EXPECT_EQ(config.error().code, ConfigurationError);
}

TEST_F(ConfigTest, Load_MissingKeyIsNotALoadError) {
  writeConfig("[location]\ncity = \"Lisbon\"\n");

  const Result<Config> config = Config::Load(options());

  ASSERT_TRUE(config.has_value());
  EXPECT_FALSE(config->provider.apiKey.has_value());
}

TEST_F(ConfigTest, ToClientConfig_CarriesProviderSettings) {
  Provider provider;
  provider.apiKey = "abc";
  provider.lang   = "en";

  const clima::services::weather::ProviderConfig client = provider.toClientConfig();

  EXPECT_EQ(client.apiKey, "abc");
  EXPECT_EQ(client.lang, "en");
  EXPECT_EQ(client.timeoutSecs, 20);
}
// NOLINTEND(modernize-use-trailing-return-type, cert-err58-cpp)
