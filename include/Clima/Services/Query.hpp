#pragma once

#include "../Storage/ObservationStore.hpp"
#include "../Utils/Definitions.hpp"
#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"

namespace clima::services::query {
  namespace {
    using storage::ObservationStore;
    using storage::StoredObservation;

    using utils::types::f64;
    using utils::types::i64;
    using utils::types::None;
    using utils::types::Option;
    using utils::types::Result;
    using utils::types::String;
    using utils::types::Vec;
  } // namespace

  /**
   * @struct ObservationView
   * @brief Presentation record of a stored observation.
   */
  struct ObservationView {
    String         city;
    String         country;
    i64            tsUtc {};
    String         tsIsoUtc;  ///< e.g. "2023-11-14T22:13:20+00:00"
    String         tz;
    String         localTime; ///< "YYYY-mm-dd HH:MM" in tz, or in UTC when tz is unknown.
    Option<f64>    tempC;
    Option<f64>    feelsLikeC;
    Option<i64>    humidity;
    Option<String> weatherDescription;
    Option<f64>    lat;
    Option<f64>    lon;
    Option<f64>    pressure;
    Option<f64>    windSpeed;
    Option<i64>    windDir;
    Option<i64>    clouds;
    Option<f64>    visibilityKm;
    String         createdAt;
  };

  /**
   * @brief Converts a stored row to its presentation form.
   */
  fn ToView(const StoredObservation& stored) -> ObservationView;

  /**
   * @class QueryFacade
   * @brief Read-side entry point shared by the HTTP API and the CLI.
   *
   * Accepts loosely-typed external parameters, calls the store and returns views.
   */
  class QueryFacade {
   public:
    explicit QueryFacade(const ObservationStore& store)
      : m_store(store) {}

    /**
     * @brief The most recent observation for a city, or None when there is none.
     */
    [[nodiscard]] fn latest(const String& city, const String& country) const -> Result<Option<ObservationView>>;

    [[nodiscard]] fn latestN(const String& city, const String& country, i64 limit) const -> Result<Vec<ObservationView>>;

    /**
     * @brief Observations between two optional bounds, oldest first.
     * @param startText Inclusive lower bound as epoch-seconds text; absent or empty means unbounded.
     * @param endText Inclusive upper bound as epoch-seconds text; absent or empty means unbounded.
     * @return InvalidArgument when a bound is not an integer.
     */
    [[nodiscard]] fn range(
      const String&         city,
      const String&         country,
      const Option<String>& startText = None,
      const Option<String>& endText   = None
    ) const -> Result<Vec<ObservationView>>;

   private:
    const ObservationStore& m_store;
  };
} // namespace clima::services::query
