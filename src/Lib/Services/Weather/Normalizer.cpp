#include <cmath>  // std::{llround, trunc}
#include <format> // std::format

#include <Clima/Services/Weather.hpp>

#include "DataTransferObjects.hpp"

using namespace clima::utils::types;
using clima::utils::error::ClimaError;
using enum clima::utils::error::ClimaErrorCode;

namespace {
  fn RoundToInteger(const Option<f64>& value) -> Option<i64> {
    if (!value)
      return None;

    return static_cast<i64>(std::llround(*value));
  }
} // namespace

namespace clima::services::weather {
  fn Normalize(const RawPayload& payload) -> Result<Observation> {
    namespace dto = dto::weatherbit;

    dto::Response response;

    if (const glz::error_ctx errc = dto::Parse(payload.body, response); errc.ec != glz::error_code::none)
      ERR_FMT(ParseError, "Failed to parse Weatherbit response: {}", glz::format_error(errc, payload.body));

    // An empty or missing `data` array leaves every field unset.
    const dto::Current current = response.data && !response.data->empty() ? response.data->front() : dto::Current {};

    if (!current.ts)
      ERR(ParseError, "Weatherbit response has no observation timestamp ('ts')");

    return Observation {
      .cityName           = current.cityName,
      .countryCode        = current.countryCode,
      .lat                = current.lat,
      .lon                = current.lon,
      .tsUtc              = static_cast<i64>(std::trunc(*current.ts)),
      .tz                 = current.timezone.value_or("UTC"),
      .tempC              = current.temp,
      .feelsLikeC         = current.appTemp,
      .humidity           = RoundToInteger(current.rh),
      .pressure           = current.pres,
      .windSpeed          = current.windSpd,
      .windDir            = RoundToInteger(current.windDir),
      .clouds             = RoundToInteger(current.clouds),
      .visibilityKm       = current.vis,
      .weatherDescription = current.weather ? current.weather->description : None,
    };
  }
} // namespace clima::services::weather
