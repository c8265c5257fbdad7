#include <Clima/Services/Ingestion.hpp>
#include <Clima/Utils/DateTime.hpp>
#include <Clima/Utils/Logging.hpp>

using namespace clima::utils::types;

namespace clima::services::ingest {
  fn IngestionService::collectByCity(const String& city, const Option<String>& country) const -> Result<CollectionOutcome> {
    return store(m_client.fetchByCity(city, country));
  }

  fn IngestionService::collectByCoords(const Coords& coords) const -> Result<CollectionOutcome> {
    return store(m_client.fetchByCoords(coords));
  }

  fn IngestionService::store(Result<weather::RawPayload> payload) const -> Result<CollectionOutcome> {
    if (!payload)
      return Err(payload.error());

    Result<Observation> observation = weather::Normalize(*payload);

    if (!observation)
      return Err(observation.error());

    if (Result res = m_store.ensureSchema(); !res)
      return Err(res.error());

    Result<bool> inserted = m_store.insert(*observation);

    if (!inserted)
      return Err(inserted.error());

    const String label = std::format(
      "{}-{} @ {} ({})",
      observation->cityName.value_or("?"),
      observation->countryCode.value_or("?"),
      utils::datetime::FormatLocalTime(observation->tsUtc, observation->tz),
      observation->tz
    );

    if (*inserted)
      info_log("Inserted: {}", label);
    else
      info_log("Ignored duplicate for {}", label);

    return CollectionOutcome { .observation = std::move(*observation), .inserted = *inserted };
  }
} // namespace clima::services::ingest
