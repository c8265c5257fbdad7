#include <algorithm> // std::ranges::transform
#include <iterator>  // std::back_inserter

#include <Clima/Services/Query.hpp>
#include <Clima/Utils/DateTime.hpp>

using namespace clima::utils::types;
using clima::storage::StoredObservation;

namespace {
  namespace dt = clima::utils::datetime;

  fn ParseBound(const Option<String>& text) -> Result<Option<i64>> {
    if (!text || text->empty())
      return None;

    Result<i64> value = dt::ParseEpoch(*text);

    if (!value)
      return Err(value.error());

    return *value;
  }

  fn ToViews(const Vec<StoredObservation>& rows) -> Vec<clima::services::query::ObservationView> {
    Vec<clima::services::query::ObservationView> views;
    views.reserve(rows.size());

    std::ranges::transform(rows, std::back_inserter(views), clima::services::query::ToView);

    return views;
  }
} // namespace

namespace clima::services::query {
  fn ToView(const StoredObservation& stored) -> ObservationView {
    const weather::Observation& obs = stored.observation;

    return ObservationView {
      .city               = obs.cityName.value_or(""),
      .country            = obs.countryCode.value_or(""),
      .tsUtc              = obs.tsUtc,
      .tsIsoUtc           = dt::FormatIsoUtc(obs.tsUtc),
      .tz                 = obs.tz,
      .localTime          = dt::FormatLocalTime(obs.tsUtc, obs.tz),
      .tempC              = obs.tempC,
      .feelsLikeC         = obs.feelsLikeC,
      .humidity           = obs.humidity,
      .weatherDescription = obs.weatherDescription,
      .lat                = obs.lat,
      .lon                = obs.lon,
      .pressure           = obs.pressure,
      .windSpeed          = obs.windSpeed,
      .windDir            = obs.windDir,
      .clouds             = obs.clouds,
      .visibilityKm       = obs.visibilityKm,
      .createdAt          = stored.createdAt,
    };
  }

  fn QueryFacade::latest(const String& city, const String& country) const -> Result<Option<ObservationView>> {
    Result<Vec<StoredObservation>> rows = m_store.fetchLatest(city, country, 1);

    if (!rows)
      return Err(rows.error());

    if (rows->empty())
      return Option<ObservationView>(None);

    return Option<ObservationView>(ToView(rows->front()));
  }

  fn QueryFacade::latestN(const String& city, const String& country, const i64 limit) const -> Result<Vec<ObservationView>> {
    return m_store.fetchLatest(city, country, limit).transform(ToViews);
  }

  fn QueryFacade::range(const String& city, const String& country, const Option<String>& startText, const Option<String>& endText) const -> Result<Vec<ObservationView>> {
    Result<Option<i64>> start = ParseBound(startText);

    if (!start)
      return Err(start.error());

    Result<Option<i64>> end = ParseBound(endText);

    if (!end)
      return Err(end.error());

    return m_store.fetchRange(city, country, *start, *end).transform(ToViews);
  }
} // namespace clima::services::query
