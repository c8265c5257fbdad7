#pragma once

#include <filesystem> // std::filesystem::path

#include "../Services/Weather.hpp"
#include "../Utils/Definitions.hpp"
#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"

namespace clima::storage {
  namespace {
    using services::weather::Observation;

    using utils::types::i64;
    using utils::types::None;
    using utils::types::Option;
    using utils::types::Result;
    using utils::types::String;
    using utils::types::Vec;
  } // namespace

  /**
   * @brief A persisted observation, copied out of the store.
   */
  struct StoredObservation {
    i64         id {};
    Observation observation;
    String      createdAt; ///< "YYYY-MM-DD HH:MM:SS" in UTC, set by the database on insert.
  };

  /**
   * @class ObservationStore
   * @brief SQLite-backed table of observations, unique on (city_name, country_code, ts_utc).
   *
   * Every operation opens its own connection and closes it before returning.
   * Rows are never updated or deleted.
   */
  class ObservationStore {
   public:
    explicit ObservationStore(std::filesystem::path databasePath);

    /**
     * @brief Creates the table if it does not exist, and the database's parent directory if needed.
     * @return StoreUnavailable when the file cannot be created or written.
     */
    [[nodiscard]] fn ensureSchema() const -> Result<>;

    /**
     * @brief Inserts an observation unless one with the same identity exists.
     * @return true when a row was created, false when it was a duplicate;
     *         InvalidArgument when city or country is missing;
     *         StoreUnavailable on database failure.
     */
    [[nodiscard]] fn insert(const Observation& observation) const -> Result<bool>;

    /**
     * @brief The newest `limit` observations for a city, newest first.
     */
    [[nodiscard]] fn fetchLatest(const String& city, const String& country, i64 limit) const -> Result<Vec<StoredObservation>>;

    /**
     * @brief Observations for a city with startUtc <= ts_utc <= endUtc, oldest first.
     *
     * An absent bound leaves that side open.
     */
    [[nodiscard]] fn fetchRange(
      const String&      city,
      const String&      country,
      const Option<i64>& startUtc = None,
      const Option<i64>& endUtc   = None
    ) const -> Result<Vec<StoredObservation>>;

    [[nodiscard]] fn count(const String& city, const String& country) const -> Result<i64>;

    [[nodiscard]] fn path() const -> const std::filesystem::path& {
      return m_path;
    }

   private:
    std::filesystem::path m_path;
  };
} // namespace clima::storage
