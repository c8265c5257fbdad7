#include <Clima/Storage/ObservationStore.hpp>

#include <SQLiteCpp/Column.h>    // SQLite::Column
#include <SQLiteCpp/Database.h>  // SQLite::{Database, OPEN_READONLY, OPEN_READWRITE, OPEN_CREATE}
#include <SQLiteCpp/Exception.h> // SQLite::Exception
#include <SQLiteCpp/Statement.h> // SQLite::Statement
#include <filesystem>            // std::filesystem::{create_directories, exists}
#include <format>                // std::format
#include <system_error>          // std::error_code

#include <Clima/Utils/Logging.hpp>

using namespace clima::utils::types;
using clima::services::weather::Observation;
using clima::storage::ObservationStore;
using clima::storage::StoredObservation;
using clima::utils::error::ClimaError;
using enum clima::utils::error::ClimaErrorCode;

namespace {
  constexpr i32 BUSY_TIMEOUT_MS = 5000;

  constexpr PCStr SCHEMA_SQL = R"sql(
    CREATE TABLE IF NOT EXISTS weather_observations (
      id INTEGER PRIMARY KEY AUTOINCREMENT,
      city_name TEXT NOT NULL,
      country_code TEXT NOT NULL,
      lat REAL,
      lon REAL,
      ts_utc INTEGER NOT NULL,
      tz TEXT,
      temp_c REAL,
      feels_like_c REAL,
      humidity INTEGER,
      pressure REAL,
      wind_speed REAL,
      wind_dir INTEGER,
      clouds INTEGER,
      visibility_km REAL,
      weather_description TEXT,
      created_at TEXT DEFAULT (CURRENT_TIMESTAMP),
      UNIQUE(city_name, country_code, ts_utc)
    )
  )sql";

  constexpr PCStr INSERT_SQL = R"sql(
    INSERT OR IGNORE INTO weather_observations (
      city_name, country_code, lat, lon, ts_utc, tz,
      temp_c, feels_like_c, humidity, pressure, wind_speed, wind_dir,
      clouds, visibility_km, weather_description
    ) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
  )sql";

  constexpr PCStr SELECT_COLUMNS = "SELECT id, city_name, country_code, lat, lon, ts_utc, tz, temp_c, feels_like_c, humidity, pressure, "
                                   "wind_speed, wind_dir, clouds, visibility_km, weather_description, created_at "
                                   "FROM weather_observations WHERE city_name = ? AND country_code = ?";

  template <typename T>
  fn BindOptional(SQLite::Statement& stmt, const i32 index, const Option<T>& value) -> Unit {
    if (value)
      stmt.bind(index, *value);
    else
      stmt.bind(index);
  }

  fn ColumnF64(const SQLite::Column& column) -> Option<f64> {
    return column.isNull() ? None : Option<f64>(column.getDouble());
  }

  fn ColumnI64(const SQLite::Column& column) -> Option<i64> {
    return column.isNull() ? None : Option<i64>(column.getInt64());
  }

  fn ColumnString(const SQLite::Column& column) -> Option<String> {
    return column.isNull() ? None : Option<String>(column.getString());
  }

  fn ReadRow(const SQLite::Statement& stmt) -> StoredObservation {
    return StoredObservation {
      .id          = stmt.getColumn(0).getInt64(),
      .observation = Observation {
        .cityName           = ColumnString(stmt.getColumn(1)),
        .countryCode        = ColumnString(stmt.getColumn(2)),
        .lat                = ColumnF64(stmt.getColumn(3)),
        .lon                = ColumnF64(stmt.getColumn(4)),
        .tsUtc              = stmt.getColumn(5).getInt64(),
        .tz                 = ColumnString(stmt.getColumn(6)).value_or("UTC"),
        .tempC              = ColumnF64(stmt.getColumn(7)),
        .feelsLikeC         = ColumnF64(stmt.getColumn(8)),
        .humidity           = ColumnI64(stmt.getColumn(9)),
        .pressure           = ColumnF64(stmt.getColumn(10)),
        .windSpeed          = ColumnF64(stmt.getColumn(11)),
        .windDir            = ColumnI64(stmt.getColumn(12)),
        .clouds             = ColumnI64(stmt.getColumn(13)),
        .visibilityKm       = ColumnF64(stmt.getColumn(14)),
        .weatherDescription = ColumnString(stmt.getColumn(15)),
      },
      .createdAt = ColumnString(stmt.getColumn(16)).value_or(""),
    };
  }

  fn ReadAll(SQLite::Statement& stmt) -> Vec<StoredObservation> {
    Vec<StoredObservation> rows;

    while (stmt.executeStep())
      rows.push_back(ReadRow(stmt));

    return rows;
  }

  /**
   * @brief Opens a per-call connection that waits up to BUSY_TIMEOUT_MS for locks held by other connections.
   */
  fn Open(const std::filesystem::path& path, const i32 flags) -> SQLite::Database {
    return SQLite::Database(path.string(), flags, BUSY_TIMEOUT_MS);
  }

  /**
   * @brief Checks that a database exists before a read opens it.
   *
   * Readers never create the file; an absent database means nothing was collected yet.
   */
  fn RequireExisting(const std::filesystem::path& path) -> Result<> {
    std::error_code errc;

    if (!std::filesystem::exists(path, errc))
      ERR_FMT(StoreUnavailable, "Database not found at {}. Run a collection first.", path.string());

    return {};
  }
} // namespace

namespace clima::storage {
  ObservationStore::ObservationStore(std::filesystem::path databasePath)
    : m_path(std::move(databasePath)) {}

  fn ObservationStore::ensureSchema() const -> Result<> {
    if (const std::filesystem::path parent = m_path.parent_path(); !parent.empty()) {
      std::error_code errc;

      std::filesystem::create_directories(parent, errc);

      if (errc)
        ERR_FMT(StoreUnavailable, "Cannot create database directory '{}': {}", parent.string(), errc.message());
    }

    try {
      SQLite::Database database = Open(m_path, SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE);

      database.exec(SCHEMA_SQL);
    } catch (const SQLite::Exception& e) {
      ERR_FMT(StoreUnavailable, "Failed to prepare schema in '{}': {}", m_path.string(), e.what());
    }

    debug_log("Schema ready in {}", m_path.string());

    return {};
  }

  fn ObservationStore::insert(const Observation& observation) const -> Result<bool> {
    if (!observation.cityName || observation.cityName->empty() || !observation.countryCode || observation.countryCode->empty())
      ERR(InvalidArgument, "Observation has no city or country and cannot be stored");

    try {
      const SQLite::Database database = Open(m_path, SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE);

      SQLite::Statement stmt(database, INSERT_SQL);

      stmt.bind(1, *observation.cityName);
      stmt.bind(2, *observation.countryCode);
      BindOptional(stmt, 3, observation.lat);
      BindOptional(stmt, 4, observation.lon);
      stmt.bind(5, observation.tsUtc);
      stmt.bind(6, observation.tz);
      BindOptional(stmt, 7, observation.tempC);
      BindOptional(stmt, 8, observation.feelsLikeC);
      BindOptional(stmt, 9, observation.humidity);
      BindOptional(stmt, 10, observation.pressure);
      BindOptional(stmt, 11, observation.windSpeed);
      BindOptional(stmt, 12, observation.windDir);
      BindOptional(stmt, 13, observation.clouds);
      BindOptional(stmt, 14, observation.visibilityKm);
      BindOptional(stmt, 15, observation.weatherDescription);

      // INSERT OR IGNORE reports zero changes when the unique key already exists.
      return stmt.exec() > 0;
    } catch (const SQLite::Exception& e) {
      ERR_FMT(StoreUnavailable, "Failed to insert observation into '{}': {}", m_path.string(), e.what());
    }
  }

  fn ObservationStore::fetchLatest(const String& city, const String& country, const i64 limit) const -> Result<Vec<StoredObservation>> {
    if (limit < 0)
      ERR_FMT(InvalidArgument, "Limit must not be negative, got {}", limit);

    if (Result res = RequireExisting(m_path); !res)
      return Err(res.error());

    try {
      const SQLite::Database database = Open(m_path, SQLite::OPEN_READONLY);

      SQLite::Statement stmt(database, std::format("{} ORDER BY ts_utc DESC LIMIT ?", SELECT_COLUMNS));

      stmt.bind(1, city);
      stmt.bind(2, country);
      stmt.bind(3, limit);

      return ReadAll(stmt);
    } catch (const SQLite::Exception& e) {
      ERR_FMT(StoreUnavailable, "Failed to read latest observations from '{}': {}", m_path.string(), e.what());
    }
  }

  fn ObservationStore::fetchRange(const String& city, const String& country, const Option<i64>& startUtc, const Option<i64>& endUtc) const -> Result<Vec<StoredObservation>> {
    if (Result res = RequireExisting(m_path); !res)
      return Err(res.error());

    String sql = SELECT_COLUMNS;

    if (startUtc)
      sql += " AND ts_utc >= ?";

    if (endUtc)
      sql += " AND ts_utc <= ?";

    sql += " ORDER BY ts_utc ASC";

    try {
      const SQLite::Database database = Open(m_path, SQLite::OPEN_READONLY);

      SQLite::Statement stmt(database, sql);

      i32 index = 1;

      stmt.bind(index++, city);
      stmt.bind(index++, country);

      if (startUtc)
        stmt.bind(index++, *startUtc);

      if (endUtc)
        stmt.bind(index++, *endUtc);

      return ReadAll(stmt);
    } catch (const SQLite::Exception& e) {
      ERR_FMT(StoreUnavailable, "Failed to read observation range from '{}': {}", m_path.string(), e.what());
    }
  }

  fn ObservationStore::count(const String& city, const String& country) const -> Result<i64> {
    if (Result res = RequireExisting(m_path); !res)
      return Err(res.error());

    try {
      const SQLite::Database database = Open(m_path, SQLite::OPEN_READONLY);

      SQLite::Statement stmt(database, "SELECT COUNT(*) FROM weather_observations WHERE city_name = ? AND country_code = ?");

      stmt.bind(1, city);
      stmt.bind(2, country);

      if (!stmt.executeStep())
        ERR(StoreUnavailable, "COUNT query returned no rows");

      return stmt.getColumn(0).getInt64();
    } catch (const SQLite::Exception& e) {
      ERR_FMT(StoreUnavailable, "Failed to count observations in '{}': {}", m_path.string(), e.what());
    }
  }
} // namespace clima::storage
