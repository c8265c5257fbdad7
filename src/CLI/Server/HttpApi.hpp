#pragma once

#include <Clima/Services/Query.hpp>
#include <Clima/Services/Weather.hpp>
#include <Clima/Storage/ObservationStore.hpp>
#include <Clima/Utils/Definitions.hpp>
#include <Clima/Utils/Error.hpp>
#include <Clima/Utils/Types.hpp>

namespace clima::presentation::http {
  namespace {
    using services::weather::WeatherbitClient;
    using storage::ObservationStore;
    using utils::error::ClimaError;

    using utils::types::i32;
    using utils::types::Map;
    using utils::types::Result;
    using utils::types::String;
    using utils::types::StringView;
    using utils::types::u16;
  } // namespace

  using QueryParams = Map<String, String>;

  /**
   * @brief A JSON response ready to be written by the HTTP server.
   */
  struct ApiResponse {
    i32    status = 200;
    String body;
  };

  /**
   * @brief Splits the query string of a request target ("/latest?city=Rio%20de%20Janeiro") into decoded parameters.
   * @return InvalidArgument when a parameter cannot be decoded.
   */
  fn ParseQuery(StringView target) -> Result<QueryParams>;

  /**
   * @brief HTTP status used to report an error of the given category.
   */
  fn StatusFor(const ClimaError& error) -> i32;

  /**
   * @class WeatherApi
   * @brief Request handlers of the HTTP API, independent of the server transport.
   *
   * Every handler answers with a JSON body. Errors are `{"detail": "..."}`.
   */
  class WeatherApi {
   public:
    /**
     * @param client Result of creating the provider client; its error is reported by /collect.
     * @param store The observation store.
     * @param defaultCountry Country used when a request omits `country`.
     */
    WeatherApi(Result<WeatherbitClient> client, const ObservationStore& store, String defaultCountry);

    /**
     * @brief POST /collect?city=&country=
     */
    [[nodiscard]] fn collect(const QueryParams& params) const -> ApiResponse;

    /**
     * @brief GET /latest?city=&country=
     */
    [[nodiscard]] fn latest(const QueryParams& params) const -> ApiResponse;

    /**
     * @brief GET /weather?city=&country=&start=&end=
     */
    [[nodiscard]] fn weather(const QueryParams& params) const -> ApiResponse;

    /**
     * @brief GET /health
     */
    [[nodiscard]] static fn health() -> ApiResponse;

   private:
    Result<WeatherbitClient>    m_client;
    const ObservationStore&     m_store;
    services::query::QueryFacade m_queries;
    String                      m_defaultCountry;
  };

  /**
   * @brief Serves the API until SIGINT or SIGTERM.
   *
   * The store schema is ensured once before the server starts listening.
   */
  fn Serve(const WeatherApi& api, const ObservationStore& store, u16 port) -> Result<>;
} // namespace clima::presentation::http
