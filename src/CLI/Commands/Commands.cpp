#include "Commands.hpp"

#include <format> // std::format

#include <Clima/Services/Ingestion.hpp>
#include <Clima/Storage/ObservationStore.hpp>
#include <Clima/Utils/DateTime.hpp>
#include <Clima/Utils/Logging.hpp>

#include "Charts/ChartRenderer.hpp"
#include "Server/HttpApi.hpp"

using namespace clima::utils::types;
using clima::config::Config;
using clima::services::query::ObservationView;
using clima::services::query::QueryFacade;
using clima::services::weather::Coords;
using clima::services::weather::WeatherbitClient;
using clima::storage::ObservationStore;
using clima::utils::error::ClimaError;
using clima::utils::logging::Println;
using enum clima::utils::error::ClimaErrorCode;

namespace {
  namespace dt = clima::utils::datetime;

  template <typename T>
  fn OrNone(const Option<T>& value) -> String {
    return value ? std::format("{}", *value) : String("None");
  }

  fn CityOf(const Config& config, const clima::cli::LocationArgs& location) -> String {
    return location.city.value_or(config.location.city);
  }

  fn CountryOf(const Config& config, const clima::cli::LocationArgs& location) -> String {
    return location.country.value_or(config.location.country);
  }

  fn CoordsOf(const clima::cli::LocationArgs& location) -> Result<Option<Coords>> {
    if (location.lat.has_value() != location.lon.has_value())
      ERR(InvalidArgument, "--lat and --lon must be given together");

    if (!location.lat)
      return Option<Coords>(None);

    return Option<Coords>(Coords { .lat = *location.lat, .lon = *location.lon });
  }

  /**
   * @brief Epoch second `hours` before `now`; windows reaching past the epoch are rejected.
   */
  fn WindowStart(const i64 now, const i64 hours) -> Result<i64> {
    if (hours <= 0 || hours > now / 3600)
      ERR_FMT(InvalidArgument, "Hours window must be between 1 and {}, got {}", now / 3600, hours);

    return now - (hours * 3600);
  }
} // namespace

namespace clima::cli {
  fn FormatRow(const ObservationView& view) -> String {
    return std::format(
      "{}-{} | {} ({}) | {}°C (feels {}°C) | {}% humidity | {}",
      view.city,
      view.country,
      view.localTime,
      view.tz,
      OrNone(view.tempC),
      OrNone(view.feelsLikeC),
      OrNone(view.humidity),
      OrNone(view.weatherDescription)
    );
  }

  fn FormatRows(const Vec<ObservationView>& views) -> String {
    if (views.empty())
      return "No records found.";

    String out;

    for (const ObservationView& view : views) {
      if (!out.empty())
        out += '\n';

      out += FormatRow(view);
    }

    return out;
  }

  fn RunCollect(const Config& config, const LocationArgs& location) -> Result<> {
    Result<WeatherbitClient> client = WeatherbitClient::Create(config.provider.toClientConfig());

    if (!client)
      return Err(client.error());

    Result<Option<Coords>> coords = CoordsOf(location);

    if (!coords)
      return Err(coords.error());

    const ObservationStore                   store(config.storage.databasePath);
    const services::ingest::IngestionService ingestion(*client, store);

    Result<services::ingest::CollectionOutcome> outcome = *coords
      ? ingestion.collectByCoords(**coords)
      : ingestion.collectByCity(CityOf(config, location), CountryOf(config, location));

    if (!outcome)
      return Err(outcome.error());

    const String city    = outcome->observation.cityName.value_or("");
    const String country = outcome->observation.countryCode.value_or("");

    if (Result<i64> stored = store.count(city, country))
      debug_log("{} observation(s) stored for {}-{}", *stored, city, country);
    else
      warn_at(stored.error());

    return {};
  }

  fn RunFetch(const Config& config, const LocationArgs& location) -> Result<> {
    Result<WeatherbitClient> client = WeatherbitClient::Create(config.provider.toClientConfig());

    if (!client)
      return Err(client.error());

    Result<Option<Coords>> coords = CoordsOf(location);

    if (!coords)
      return Err(coords.error());

    Result<services::weather::RawPayload> payload = *coords
      ? client->fetchByCoords(**coords)
      : client->fetchByCity(CityOf(config, location), CountryOf(config, location));

    if (!payload)
      return Err(payload.error());

    Println(services::weather::Summarize(*payload));

    return {};
  }

  fn RunLatest(const Config& config, const LocationArgs& location, const i64 limit) -> Result<> {
    if (limit <= 0)
      ERR_FMT(InvalidArgument, "--limit must be positive, got {}", limit);

    const ObservationStore store(config.storage.databasePath);
    const QueryFacade      queries(store);

    Result<Vec<ObservationView>> views = queries.latestN(CityOf(config, location), CountryOf(config, location), limit);

    if (!views)
      return Err(views.error());

    Println(FormatRows(*views));

    return {};
  }

  fn RunRange(const Config& config, const LocationArgs& location, const RangeArgs& range) -> Result<> {
    Option<String> start = range.start;
    Option<String> end   = range.end;

    if (!start && !end) {
      const i64 now = dt::NowUtc();

      Result<i64> from = WindowStart(now, range.hours);

      if (!from)
        return Err(from.error());

      start = std::to_string(*from);
      end   = std::to_string(now);
    }

    const ObservationStore store(config.storage.databasePath);
    const QueryFacade      queries(store);

    Result<Vec<ObservationView>> views = queries.range(CityOf(config, location), CountryOf(config, location), start, end);

    if (!views)
      return Err(views.error());

    Println(FormatRows(*views));

    return {};
  }

  fn RunPlot(const Config& config, const LocationArgs& location, const Option<i64> hours) -> Result<> {
    const i64 now = dt::NowUtc();

    Result<i64> from = WindowStart(now, hours.value_or(config.charts.hoursWindow));

    if (!from)
      return Err(from.error());

    const String city    = CityOf(config, location);
    const String country = CountryOf(config, location);

    const ObservationStore store(config.storage.databasePath);

    Result<Vec<storage::StoredObservation>> rows = store.fetchRange(city, country, *from, now);

    if (!rows)
      return Err(rows.error());

    if (rows->empty()) {
      Println("No data to plot. Run a collection first.");
      return {};
    }

    const Vec<presentation::charts::DailyMean> days = presentation::charts::AggregateDaily(*rows);

    Result<Vec<std::filesystem::path>> written = presentation::charts::RenderDailyCharts(days, std::format("{}-{}", city, country), config.charts.outputDir);

    if (!written)
      return Err(written.error());

    Println("Charts saved to:");

    for (const std::filesystem::path& path : *written)
      Println(" - {}", path.string());

    return {};
  }

  fn RunServe(const Config& config, const Option<u16> port) -> Result<> {
    Result<WeatherbitClient> client = WeatherbitClient::Create(config.provider.toClientConfig());

    // The read endpoints work without a key; /collect reports the error.
    if (!client)
      warn_at(client.error());

    const ObservationStore              store(config.storage.databasePath);
    const presentation::http::WeatherApi api(std::move(client), store, config.location.country);

    return presentation::http::Serve(api, store, port.value_or(config.server.port));
  }
} // namespace clima::cli
