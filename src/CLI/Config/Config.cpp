#include "Config.hpp"

#include <charconv>               // std::from_chars
#include <format>                 // std::format
#include <limits>                 // std::numeric_limits
#include <system_error>           // std::error_code
#include <toml++/impl/parser.hpp> // toml::{parse_file, parse_error}

#include <Clima/Utils/Env.hpp>
#include <Clima/Utils/Logging.hpp>
#include <Clima/Utils/Types.hpp>

namespace fs = std::filesystem;

using namespace clima::utils::types;
using clima::utils::error::ClimaError;
using enum clima::utils::error::ClimaErrorCode;

namespace {
  using clima::utils::env::GetEnv;

  fn ParsePositive(const String& name, const String& text) -> Result<i64> {
    i64 value = 0;

    const char* first = text.data();
    const char* last  = text.data() + text.size();

    if (auto [ptr, errc] = std::from_chars(first, last, value); errc != std::errc {} || ptr != last || value <= 0)
      ERR_FMT(ConfigurationError, "{} must be a positive integer, got '{}'", name, text);

    return value;
  }
} // namespace

namespace clima::config {
  fn Provider::fromToml(const toml::table& tbl) -> Provider {
    Provider provider;

    if (Option<String> apiKey = tbl["api_key"].value<String>(); apiKey && !apiKey->empty())
      provider.apiKey = std::move(*apiKey);

    provider.baseUrl     = tbl["base_url"].value_or(provider.baseUrl);
    provider.timeoutSecs = tbl["timeout_secs"].value_or(provider.timeoutSecs);
    provider.lang        = tbl["lang"].value_or(provider.lang);
    provider.units       = tbl["units"].value_or(provider.units);

    return provider;
  }

  fn Provider::toClientConfig() const -> services::weather::ProviderConfig {
    return {
      .apiKey      = apiKey,
      .baseUrl     = baseUrl,
      .timeoutSecs = timeoutSecs,
      .lang        = lang,
      .units       = units,
    };
  }

  fn Location::fromToml(const toml::table& tbl) -> Location {
    Location location;

    location.city    = tbl["city"].value_or(location.city);
    location.country = tbl["country"].value_or(location.country);

    return location;
  }

  fn Storage::fromToml(const toml::table& tbl) -> Storage {
    Storage storage;

    if (Option<String> path = tbl["database_path"].value<String>())
      storage.databasePath = *path;

    return storage;
  }

  fn Charts::fromToml(const toml::table& tbl) -> Charts {
    Charts charts;

    charts.hoursWindow = tbl["hours_window"].value_or(charts.hoursWindow);

    if (Option<String> dir = tbl["output_dir"].value<String>())
      charts.outputDir = *dir;

    return charts;
  }

  fn Server::fromToml(const toml::table& tbl) -> Server {
    Server server;

    if (Option<i64> port = tbl["port"].value<i64>()) {
      if (*port > 0 && *port <= std::numeric_limits<u16>::max())
        server.port = static_cast<u16>(*port);
      else
        warn_log("Ignoring out-of-range server port {}, using {}", *port, server.port);
    }

    return server;
  }

  Config::Config(const toml::table& tbl) {
    const toml::node_view providerTbl = tbl["provider"];
    const toml::node_view locationTbl = tbl["location"];
    const toml::node_view storageTbl  = tbl["storage"];
    const toml::node_view chartsTbl   = tbl["charts"];
    const toml::node_view serverTbl   = tbl["server"];

    this->provider = providerTbl.is_table() ? Provider::fromToml(*providerTbl.as_table()) : Provider {};
    this->location = locationTbl.is_table() ? Location::fromToml(*locationTbl.as_table()) : Location {};
    this->storage  = storageTbl.is_table() ? Storage::fromToml(*storageTbl.as_table()) : Storage {};
    this->charts   = chartsTbl.is_table() ? Charts::fromToml(*chartsTbl.as_table()) : Charts {};
    this->server   = serverTbl.is_table() ? Server::fromToml(*serverTbl.as_table()) : Server {};
  }

  fn Config::applyEnvironment() -> Result<> {
    if (Result<String> key = GetEnv("WEATHERBIT_API_KEY"); key && !key->empty())
      provider.apiKey = *key;

    if (Result<String> city = GetEnv("DEFAULT_CITY"); city && !city->empty())
      location.city = *city;

    if (Result<String> country = GetEnv("DEFAULT_COUNTRY"); country && !country->empty())
      location.country = *country;

    if (Result<String> dbPath = GetEnv("CLIMA_DB_PATH"); dbPath && !dbPath->empty())
      storage.databasePath = *dbPath;

    if (Result<String> hours = GetEnv("HOURS_WINDOW"); hours && !hours->empty()) {
      Result<i64> parsed = ParsePositive("HOURS_WINDOW", *hours);

      if (!parsed)
        return Err(parsed.error());

      charts.hoursWindow = *parsed;
    }

    return {};
  }

  fn Config::FindConfigPath() -> Option<fs::path> {
    Vec<fs::path> possiblePaths;

    if (Result<String> result = GetEnv("XDG_CONFIG_HOME"))
      possiblePaths.emplace_back(fs::path(*result) / "clima" / "config.toml");

    if (Result<String> result = GetEnv("HOME"))
      possiblePaths.emplace_back(fs::path(*result) / ".config" / "clima" / "config.toml");

    possiblePaths.emplace_back(fs::path(".") / "config.toml");

    for (const fs::path& path : possiblePaths)
      if (std::error_code errc; fs::exists(path, errc) && !errc)
        return path;

    return None;
  }

  fn Config::Load(const LoadOptions& options) -> Result<Config> {
    Config config;

    Option<fs::path> configPath = options.configPath;

    if (configPath) {
      if (std::error_code errc; !fs::exists(*configPath, errc))
        ERR_FMT(ConfigurationError, "Config file not found: {}", configPath->string());
    } else {
      configPath = FindConfigPath();
    }

    if (configPath) {
      try {
        const toml::table parsedConfig = toml::parse_file(configPath->string());

        config = Config(parsedConfig);

        debug_log("Config loaded from {}", configPath->string());
      } catch (const toml::parse_error& err) {
        ERR_FMT(ConfigurationError, "Invalid config file {}: {}", configPath->string(), err.description());
      }
    } else {
      debug_log("No config file found, using built-in defaults");
    }

    if (options.useDotenv) {
      if (Result<usize> applied = utils::env::LoadDotEnv(options.dotenvPath))
        debug_log("Loaded {} variable(s) from {}", *applied, options.dotenvPath.string());
      else if (applied.error().code != NotFound)
        warn_at(applied.error());
    }

    if (Result res = config.applyEnvironment(); !res)
      return Err(res.error());

    return config;
  }
} // namespace clima::config
