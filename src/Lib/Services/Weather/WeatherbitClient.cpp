#include <format>      // std::format
#include <matchit.hpp> // matchit::{match, is, or_, _}

#include <Clima/Services/Weather.hpp>
#include <Clima/Utils/Logging.hpp>

#include "DataTransferObjects.hpp"

using namespace clima::utils::types;
using clima::utils::error::ClimaError;
using enum clima::utils::error::ClimaErrorCode;

namespace {
  using clima::services::weather::EscapeQueryValue;

  fn BuildQuery(const Vec<Pair<StringView, String>>& params) -> Result<String> {
    String query;

    for (const auto& [name, value] : params) {
      Result<String> escaped = EscapeQueryValue(value);

      if (!escaped)
        return Err(escaped.error());

      if (!query.empty())
        query += '&';

      query += std::format("{}={}", name, *escaped);
    }

    return query;
  }

  fn DescribeStatus(const i64 status) -> StringView {
    using namespace matchit;

    return match(status)(
      is | 400          = "bad request",
      is | or_(401, 403) = "API key rejected",
      is | 404          = "endpoint not found",
      is | 429          = "rate limit exceeded",
      is | _            = "unexpected status"
    );
  }

  fn ProviderErrorField(const String& body) -> Option<String> {
    namespace dto = clima::services::weather::dto::weatherbit;

    dto::Response response;

    if (const glz::error_ctx errc = dto::Parse(body, response); errc.ec != glz::error_code::none)
      return None;

    return response.error;
  }
} // namespace

namespace clima::services::weather {
  WeatherbitClient::WeatherbitClient(ProviderConfig config, UniquePointer<IHttpTransport> transport)
    : m_config(std::move(config)), m_transport(std::move(transport)) {}

  fn WeatherbitClient::Create(ProviderConfig config, UniquePointer<IHttpTransport> transport) -> Result<WeatherbitClient> {
    if (!config.apiKey || config.apiKey->empty())
      ERR(ConfigurationError, "WEATHERBIT_API_KEY is not set; add it to the environment, .env or the [provider] section of the config file");

    if (config.timeoutSecs <= 0)
      ERR_FMT(ConfigurationError, "Provider timeout must be positive, got {}", config.timeoutSecs);

    if (!transport)
      transport = std::make_unique<CurlTransport>();

    return WeatherbitClient(std::move(config), std::move(transport));
  }

  fn WeatherbitClient::fetchByCity(const String& city, const Option<String>& country, const Option<String>& lang, const Option<String>& units) const -> Result<RawPayload> {
    if (city.empty())
      ERR(InvalidArgument, "City name must not be empty");

    Vec<Pair<StringView, String>> params { { "city", city } };

    if (country && !country->empty())
      params.emplace_back("country", *country);

    params.emplace_back("key", *m_config.apiKey);
    params.emplace_back("lang", lang.value_or(m_config.lang));
    params.emplace_back("units", units.value_or(m_config.units));

    Result<String> query = BuildQuery(params);

    if (!query)
      return Err(query.error());

    debug_log("Fetching current weather for {}{}", city, country ? std::format(", {}", *country) : "");

    return request(*query);
  }

  fn WeatherbitClient::fetchByCoords(const Coords& coords, const Option<String>& lang, const Option<String>& units) const -> Result<RawPayload> {
    const Vec<Pair<StringView, String>> params {
      { "lat", std::format("{}", coords.lat) },
      { "lon", std::format("{}", coords.lon) },
      { "key", *m_config.apiKey },
      { "lang", lang.value_or(m_config.lang) },
      { "units", units.value_or(m_config.units) },
    };

    Result<String> query = BuildQuery(params);

    if (!query)
      return Err(query.error());

    debug_log("Fetching current weather for ({}, {})", coords.lat, coords.lon);

    return request(*query);
  }

  fn WeatherbitClient::request(const String& query) const -> Result<RawPayload> {
    const String url = std::format("{}?{}", m_config.baseUrl, query);

    Result<HttpResponse> response = m_transport->get(url, m_config.timeoutSecs);

    if (!response)
      ERR_FMT(ProviderError, "Weatherbit request failed: {}", response.error().message);

    if (response->status < 200 || response->status >= 300) {
      String message = std::format("Weatherbit returned HTTP {} ({})", response->status, DescribeStatus(response->status));

      if (Option<String> apiError = ProviderErrorField(response->body); apiError && !apiError->empty())
        message += std::format(": {}", *apiError);

      return Err(ClimaError(ProviderError, std::move(message)));
    }

    return RawPayload { .body = std::move(response->body) };
  }
} // namespace clima::services::weather
