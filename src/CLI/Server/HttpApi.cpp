#include "HttpApi.hpp"

#include <asio/error.hpp>      // asio::error::operation_aborted
#include <asio/io_context.hpp> // asio::io_context
#include <asio/signal_set.hpp> // asio::signal_set
#include <csignal>             // SIGINT, SIGTERM

#ifdef DELETE
  #undef DELETE
#endif

// clang-format off
#include <glaze/glaze.hpp>
#include <glaze/core/meta.hpp>       // glz::meta
#include <glaze/net/http_server.hpp> // glz::{http_server, request, response}
// clang-format on

#include <matchit.hpp> // matchit::{match, is, or_, _}

#include <Clima/Services/Ingestion.hpp>
#include <Clima/Utils/DateTime.hpp>
#include <Clima/Utils/Logging.hpp>

using namespace clima::utils::types;
using clima::services::query::ObservationView;
using clima::utils::error::ClimaError;
using enum clima::utils::error::ClimaErrorCode;

namespace clima::presentation::http::dto {
  struct Detail {
    String detail;
  };

  struct Health {
    String status = "ok";
  };

  struct Collected {
    String city;
    i64    tsUtc {};
    String tsIsoUtc;
    bool   inserted {};
  };

  struct Record {
    String         city;
    String         country;
    i64            tsUtc {};
    String         tsIsoUtc;
    String         tz;
    Option<f64>    tempC;
    Option<f64>    feelsLikeC;
    Option<i64>    humidity;
    Option<String> weatherDescription;
  };

  struct RecordList {
    usize       count {};
    Vec<Record> data;
  };
} // namespace clima::presentation::http::dto

namespace glz {
  template <>
  struct meta<clima::presentation::http::dto::Detail> {
    using T = clima::presentation::http::dto::Detail;

    static constexpr auto value = object("detail", &T::detail);
  };

  template <>
  struct meta<clima::presentation::http::dto::Health> {
    using T = clima::presentation::http::dto::Health;

    static constexpr auto value = object("status", &T::status);
  };

  template <>
  struct meta<clima::presentation::http::dto::Collected> {
    using T = clima::presentation::http::dto::Collected;

    // clang-format off
    static constexpr auto value = object(
      "city",       &T::city,
      "ts_utc",     &T::tsUtc,
      "ts_iso_utc", &T::tsIsoUtc,
      "inserted",   &T::inserted
    );
    // clang-format on
  };

  template <>
  struct meta<clima::presentation::http::dto::Record> {
    using T = clima::presentation::http::dto::Record;

    // clang-format off
    static constexpr auto value = object(
      "city",                &T::city,
      "country",             &T::country,
      "ts_utc",              &T::tsUtc,
      "ts_iso_utc",          &T::tsIsoUtc,
      "tz",                  &T::tz,
      "temp_c",              &T::tempC,
      "feels_like_c",        &T::feelsLikeC,
      "humidity",            &T::humidity,
      "weather_description", &T::weatherDescription
    );
    // clang-format on
  };

  template <>
  struct meta<clima::presentation::http::dto::RecordList> {
    using T = clima::presentation::http::dto::RecordList;

    static constexpr auto value = object("count", &T::count, "data", &T::data);
  };
} // namespace glz

namespace {
  namespace dto = clima::presentation::http::dto;

  using clima::presentation::http::ApiResponse;
  using clima::presentation::http::QueryParams;

  // Missing values are written as null rather than dropped.
  constexpr glz::opts JSON_OPTS { .skip_null_members = false };

  template <typename T>
  fn Json(const i32 status, const T& value) -> ApiResponse {
    String buffer;

    if (const glz::error_ctx errc = glz::write<JSON_OPTS>(value, buffer)) {
      error_log("Failed to serialize response: {}", glz::format_error(errc, buffer));
      return ApiResponse { .status = 500, .body = R"({"detail":"Failed to serialize response."})" };
    }

    return ApiResponse { .status = status, .body = std::move(buffer) };
  }

  fn Fail(const i32 status, String detail) -> ApiResponse {
    return Json(status, dto::Detail { .detail = std::move(detail) });
  }

  fn FailWith(const ClimaError& error) -> ApiResponse {
    warn_at(error);
    return Fail(clima::presentation::http::StatusFor(error), error.message);
  }

  fn ToRecord(const ObservationView& view) -> dto::Record {
    return dto::Record {
      .city               = view.city,
      .country            = view.country,
      .tsUtc              = view.tsUtc,
      .tsIsoUtc           = view.tsIsoUtc,
      .tz                 = view.tz,
      .tempC              = view.tempC,
      .feelsLikeC         = view.feelsLikeC,
      .humidity           = view.humidity,
      .weatherDescription = view.weatherDescription,
    };
  }

  fn Param(const QueryParams& params, const StringView name) -> Option<String> {
    if (auto iter = params.find(name); iter != params.end())
      return iter->second;

    return None;
  }

  fn NonEmptyParam(const QueryParams& params, const StringView name) -> Option<String> {
    Option<String> value = Param(params, name);

    if (value && value->empty())
      return None;

    return value;
  }

  fn Respond(glz::response& res, const ApiResponse& response) -> void {
    res.status(response.status)
      .header("Content-Type", "application/json")
      .body(response.body);
  }

  template <typename Handler>
  fn Route(Handler handler) {
    return [handler = std::move(handler)](const glz::request& req, glz::response& res) {
      debug_log("{} from {}", req.target, req.remote_ip);

      Result<QueryParams> params = clima::presentation::http::ParseQuery(req.target);

      if (!params) {
        Respond(res, FailWith(params.error()));
        return;
      }

      Respond(res, handler(*params));
    };
  }
} // namespace

namespace clima::presentation::http {
  fn ParseQuery(const StringView target) -> Result<QueryParams> {
    QueryParams params;

    const usize question = target.find('?');

    if (question == StringView::npos)
      return params;

    StringView query = target.substr(question + 1);

    if (const usize hash = query.find('#'); hash != StringView::npos)
      query = query.substr(0, hash);

    while (!query.empty()) {
      const usize      amp  = query.find('&');
      const StringView pair = query.substr(0, amp);

      query = amp == StringView::npos ? StringView {} : query.substr(amp + 1);

      if (pair.empty())
        continue;

      const usize eq = pair.find('=');

      Result<String> key   = services::weather::UnescapeQueryValue(String(pair.substr(0, eq)));
      Result<String> value = services::weather::UnescapeQueryValue(eq == StringView::npos ? String {} : String(pair.substr(eq + 1)));

      if (!key || !value)
        ERR_FMT(InvalidArgument, "Malformed query parameter '{}'", pair);

      // The first occurrence of a repeated key wins.
      params.try_emplace(std::move(*key), std::move(*value));
    }

    return params;
  }

  fn StatusFor(const ClimaError& error) -> i32 {
    using namespace matchit;

    return match(error.code)(
      is | InvalidArgument                 = 400,
      is | NotFound                        = 404,
      is | or_(ProviderError, ParseError)  = 502,
      is | or_(StoreUnavailable, Timeout)  = 503,
      is | _                               = 500
    );
  }

  WeatherApi::WeatherApi(Result<WeatherbitClient> client, const ObservationStore& store, String defaultCountry)
    : m_client(std::move(client)), m_store(store), m_queries(store), m_defaultCountry(std::move(defaultCountry)) {}

  fn WeatherApi::collect(const QueryParams& params) const -> ApiResponse {
    const Option<String> city = NonEmptyParam(params, "city");

    if (!city)
      return Fail(400, "Missing required query parameter: city");

    if (!m_client)
      return FailWith(m_client.error());

    const String country = NonEmptyParam(params, "country").value_or(m_defaultCountry);

    const services::ingest::IngestionService ingestion(*m_client, m_store);

    Result<services::ingest::CollectionOutcome> outcome = ingestion.collectByCity(*city, country);

    if (!outcome)
      return FailWith(outcome.error());

    const services::weather::Observation& obs = outcome->observation;

    return Json(200, dto::Collected {
      .city     = std::format("{}-{}", obs.cityName.value_or(""), obs.countryCode.value_or("")),
      .tsUtc    = obs.tsUtc,
      .tsIsoUtc = utils::datetime::FormatIsoUtc(obs.tsUtc),
      .inserted = outcome->inserted,
    });
  }

  fn WeatherApi::latest(const QueryParams& params) const -> ApiResponse {
    const Option<String> city = NonEmptyParam(params, "city");

    if (!city)
      return Fail(400, "Missing required query parameter: city");

    const String country = NonEmptyParam(params, "country").value_or(m_defaultCountry);

    Result<Option<ObservationView>> view = m_queries.latest(*city, country);

    if (!view)
      return FailWith(view.error());

    if (!*view)
      return Fail(404, "No data for this city.");

    return Json(200, ToRecord(**view));
  }

  fn WeatherApi::weather(const QueryParams& params) const -> ApiResponse {
    const Option<String> city = NonEmptyParam(params, "city");

    if (!city)
      return Fail(400, "Missing required query parameter: city");

    const String country = NonEmptyParam(params, "country").value_or(m_defaultCountry);

    Result<Vec<ObservationView>> views = m_queries.range(*city, country, Param(params, "start"), Param(params, "end"));

    if (!views)
      return FailWith(views.error());

    dto::RecordList list;
    list.count = views->size();
    list.data.reserve(views->size());

    for (const ObservationView& view : *views)
      list.data.push_back(ToRecord(view));

    return Json(200, list);
  }

  fn WeatherApi::health() -> ApiResponse {
    return Json(200, dto::Health {});
  }

  fn Serve(const WeatherApi& api, const ObservationStore& store, const u16 port) -> Result<> {
    if (Result res = store.ensureSchema(); !res)
      return Err(res.error());

    glz::http_server server;

    server.on_error([](const std::error_code errc, const std::source_location& loc) {
      if (errc != asio::error::operation_aborted)
        error_log("Server error at {}:{} -> {}", loc.file_name(), loc.line(), errc.message());
    });

    server.post("/collect", Route([&api](const QueryParams& params) { return api.collect(params); }));
    server.get("/latest", Route([&api](const QueryParams& params) { return api.latest(params); }));
    server.get("/weather", Route([&api](const QueryParams& params) { return api.weather(params); }));
    server.get("/health", Route([](const QueryParams&) { return WeatherApi::health(); }));

    server.bind(port);
    server.start();

    info_log("Server started at http://localhost:{}. Press Ctrl+C to exit.", port);

    {
      asio::io_context signalContext;

      asio::signal_set signals(signalContext, SIGINT, SIGTERM);

      signals.async_wait([&](const asio::error_code& error, const i32 signalNumber) {
        if (!error) {
          info_log("Shutdown signal ({}) received. Stopping server...", signalNumber);
          server.stop();
          signalContext.stop();
        }
      });

      signalContext.run();
    }

    info_log("Server stopped.");

    return {};
  }
} // namespace clima::presentation::http
