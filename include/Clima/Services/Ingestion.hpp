#pragma once

#include "../Storage/ObservationStore.hpp"
#include "../Utils/Definitions.hpp"
#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"
#include "Weather.hpp"

namespace clima::services::ingest {
  namespace {
    using storage::ObservationStore;
    using weather::Coords;
    using weather::Observation;
    using weather::WeatherbitClient;

    using utils::types::None;
    using utils::types::Option;
    using utils::types::Result;
    using utils::types::String;
  } // namespace

  struct CollectionOutcome {
    Observation observation;
    bool        inserted {}; ///< false when the observation was already stored.
  };

  /**
   * @class IngestionService
   * @brief Runs one collection: fetch, normalize, store.
   *
   * Errors from any step are returned unchanged; nothing is retried.
   */
  class IngestionService {
   public:
    IngestionService(const WeatherbitClient& client, const ObservationStore& store)
      : m_client(client), m_store(store) {}

    [[nodiscard]] fn collectByCity(const String& city, const Option<String>& country = None) const -> Result<CollectionOutcome>;

    [[nodiscard]] fn collectByCoords(const Coords& coords) const -> Result<CollectionOutcome>;

   private:
    [[nodiscard]] fn store(Result<weather::RawPayload> payload) const -> Result<CollectionOutcome>;

    const WeatherbitClient& m_client;
    const ObservationStore& m_store;
  };
} // namespace clima::services::ingest
