#pragma once

#include "../Utils/Definitions.hpp"
#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"

namespace clima::services::weather {
  namespace {
    using utils::types::f64;
    using utils::types::i64;
    using utils::types::None;
    using utils::types::Option;
    using utils::types::Result;
    using utils::types::String;
    using utils::types::StringView;
    using utils::types::UniquePointer;
  } // namespace

  inline constexpr StringView DEFAULT_BASE_URL     = "https://api.weatherbit.io/v2.0/current";
  inline constexpr i64        DEFAULT_TIMEOUT_SECS = 20;

  /**
   * @struct Observation
   * @brief One normalized weather reading.
   *
   * The identity is (cityName, countryCode, tsUtc). Every attribute the
   * provider may omit is optional; tsUtc is always present because an
   * observation without it cannot be stored.
   */
  struct Observation {
    Option<String> cityName;
    Option<String> countryCode;
    Option<f64>    lat;
    Option<f64>    lon;
    i64            tsUtc {}; ///< Epoch seconds, always UTC.
    String         tz = "UTC"; ///< IANA zone name of the city.
    Option<f64>    tempC;
    Option<f64>    feelsLikeC;
    Option<i64>    humidity; ///< Percent.
    Option<f64>    pressure;
    Option<f64>    windSpeed;
    Option<i64>    windDir; ///< Degrees.
    Option<i64>    clouds;  ///< Percent.
    Option<f64>    visibilityKm;
    Option<String> weatherDescription;

    auto operator==(const Observation&) const -> bool = default;
  };

  struct Coords {
    f64 lat;
    f64 lon;
  };

  /**
   * @brief The provider's JSON document, exactly as received.
   */
  struct RawPayload {
    String body;
  };

  struct HttpResponse {
    i64    status {};
    String body;
  };

  /**
   * @brief Blocking HTTP GET used by the provider client.
   *
   * Implementations return an error only when no HTTP response was obtained;
   * any status code (including 4xx/5xx) is a successful transport result.
   */
  class IHttpTransport {
   public:
    IHttpTransport(const IHttpTransport&) = delete;
    IHttpTransport(IHttpTransport&&)      = delete;

    fn operator=(const IHttpTransport&)->IHttpTransport& = delete;
    fn operator=(IHttpTransport&&)->IHttpTransport&      = delete;

    virtual ~IHttpTransport() = default;

    [[nodiscard]] virtual fn get(const String& url, i64 timeoutSecs) -> Result<HttpResponse> = 0;

   protected:
    IHttpTransport() = default;
  };

  /**
   * @brief IHttpTransport backed by a libcurl easy handle per request.
   */
  class CurlTransport final : public IHttpTransport {
   public:
    CurlTransport() = default;

    [[nodiscard]] fn get(const String& url, i64 timeoutSecs) -> Result<HttpResponse> override;
  };

  /**
   * @brief Percent-encodes a query-string value.
   */
  fn EscapeQueryValue(const String& value) -> Result<String>;

  /**
   * @brief Decodes a percent-encoded query-string value ('+' becomes a space).
   */
  fn UnescapeQueryValue(const String& value) -> Result<String>;

  struct ProviderConfig {
    Option<String> apiKey;
    String         baseUrl     = String(DEFAULT_BASE_URL);
    i64            timeoutSecs = DEFAULT_TIMEOUT_SECS;
    String         lang        = "pt";
    String         units       = "M";
  };

  /**
   * @class WeatherbitClient
   * @brief Fetches current conditions from the Weatherbit `current` endpoint.
   *
   * One GET per call, no retries. Transport failures and non-2xx statuses are
   * reported as ProviderError.
   */
  class WeatherbitClient {
   public:
    /**
     * @brief Builds a client.
     * @param config Provider settings; apiKey must be set and non-empty.
     * @param transport HTTP transport; a CurlTransport is used when null.
     * @return ConfigurationError when the API key is missing.
     */
    static fn Create(ProviderConfig config, UniquePointer<IHttpTransport> transport = nullptr) -> Result<WeatherbitClient>;

    /**
     * @brief Fetches current conditions by city name.
     * @param city Display name, must not be empty.
     * @param country ISO-3166-1 alpha-2 code; omitted from the request when absent or empty.
     * @param lang Response language; the configured one when absent.
     * @param units Unit system code; the configured one when absent.
     */
    [[nodiscard]] fn fetchByCity(
      const String&         city,
      const Option<String>& country = None,
      const Option<String>& lang    = None,
      const Option<String>& units   = None
    ) const -> Result<RawPayload>;

    [[nodiscard]] fn fetchByCoords(
      const Coords&         coords,
      const Option<String>& lang  = None,
      const Option<String>& units = None
    ) const -> Result<RawPayload>;

    [[nodiscard]] fn config() const -> const ProviderConfig& {
      return m_config;
    }

   private:
    WeatherbitClient(ProviderConfig config, UniquePointer<IHttpTransport> transport);

    [[nodiscard]] fn request(const String& query) const -> Result<RawPayload>;

    ProviderConfig                m_config;
    UniquePointer<IHttpTransport> m_transport;
  };

  /**
   * @brief Turns a provider payload into an Observation.
   *
   * Uses the first element of `data`; missing fields become None and a
   * missing `timezone` becomes "UTC".
   *
   * @return ParseError for malformed JSON or a payload without `ts`.
   */
  fn Normalize(const RawPayload& payload) -> Result<Observation>;

  /**
   * @brief Renders a human-readable multi-line summary of a payload.
   *
   * A payload without a first result yields "Unexpected API response:" followed by the raw body.
   */
  fn Summarize(const RawPayload& payload) -> String;
} // namespace clima::services::weather
