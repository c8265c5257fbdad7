#pragma once

#include <filesystem>                // std::filesystem::path
#include <toml++/impl/node.hpp>      // toml::node
#include <toml++/impl/node_view.hpp> // toml::node_view
#include <toml++/impl/table.hpp>     // toml::table

#include <Clima/Services/Weather.hpp>
#include <Clima/Utils/Definitions.hpp>
#include <Clima/Utils/Error.hpp>
#include <Clima/Utils/Types.hpp>

namespace clima::config {
  namespace {
    using utils::types::i64;
    using utils::types::None;
    using utils::types::Option;
    using utils::types::Result;
    using utils::types::String;
    using utils::types::u16;
  } // namespace

  /**
   * @struct Provider
   * @brief Weatherbit access settings, [provider].
   */
  struct Provider {
    Option<String> apiKey;
    String         baseUrl     = String(services::weather::DEFAULT_BASE_URL);
    i64            timeoutSecs = services::weather::DEFAULT_TIMEOUT_SECS;
    String         lang        = "pt";
    String         units       = "M";

    static fn fromToml(const toml::table& tbl) -> Provider;

    [[nodiscard]] fn toClientConfig() const -> services::weather::ProviderConfig;
  };

  /**
   * @struct Location
   * @brief The city collected and queried when none is given, [location].
   */
  struct Location {
    String city    = "Rio de Janeiro";
    String country = "BR";

    static fn fromToml(const toml::table& tbl) -> Location;
  };

  struct Storage {
    std::filesystem::path databasePath = "./data/weather.db";

    static fn fromToml(const toml::table& tbl) -> Storage;
  };

  struct Charts {
    i64                   hoursWindow = 168; ///< How far back `plot` looks, in hours.
    std::filesystem::path outputDir   = "./plots";

    static fn fromToml(const toml::table& tbl) -> Charts;
  };

  struct Server {
    u16 port = 8000;

    static fn fromToml(const toml::table& tbl) -> Server;
  };

  /**
   * @brief Where Config::Load looks for its inputs.
   */
  struct LoadOptions {
    Option<std::filesystem::path> configPath = None;    ///< Explicit TOML file; the search path is used when absent.
    std::filesystem::path         dotenvPath = ".env";  ///< dotenv file applied to the environment before overrides.
    bool                          useDotenv  = true;
  };

  /**
   * @struct Config
   * @brief Application settings, built once at startup and passed by reference.
   *
   * Sources, lowest priority first: built-in defaults, the TOML file, the
   * dotenv file (only for variables not already set) and the environment
   * (WEATHERBIT_API_KEY, DEFAULT_CITY, DEFAULT_COUNTRY, HOURS_WINDOW, CLIMA_DB_PATH).
   */
  struct Config {
    Provider provider;
    Location location;
    Storage  storage;
    Charts   charts;
    Server   server;

    Config() = default;

    /**
     * @brief Constructs a Config from a parsed TOML document.
     * @param tbl Root table with optional [provider], [location], [storage], [charts] and [server] tables.
     */
    explicit Config(const toml::table& tbl);

    /**
     * @brief Applies environment variable overrides on top of the current values.
     * @return ConfigurationError when HOURS_WINDOW is not a positive integer.
     */
    fn applyEnvironment() -> Result<>;

    /**
     * @brief Finds the configuration file when none is given explicitly.
     *
     * Checks $XDG_CONFIG_HOME/clima/config.toml, ~/.config/clima/config.toml and ./config.toml.
     */
    static fn FindConfigPath() -> Option<std::filesystem::path>;

    /**
     * @brief Builds the configuration from all sources.
     * @return ConfigurationError for an unreadable or invalid TOML file, an
     *         explicit config path that does not exist, or bad overrides.
     */
    static fn Load(const LoadOptions& options = {}) -> Result<Config>;
  };
} // namespace clima::config
