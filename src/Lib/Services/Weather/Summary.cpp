#include <cmath>  // std::trunc
#include <format> // std::format

#include <Clima/Services/Weather.hpp>
#include <Clima/Utils/DateTime.hpp>

#include "DataTransferObjects.hpp"

using namespace clima::utils::types;

namespace {
  template <typename T>
  fn OrNone(const Option<T>& value) -> String {
    return value ? std::format("{}", *value) : String("None");
  }
} // namespace

namespace clima::services::weather {
  fn Summarize(const RawPayload& payload) -> String {
    namespace dto = dto::weatherbit;
    namespace dt  = utils::datetime;

    dto::Response response;

    const glz::error_ctx errc = dto::Parse(payload.body, response);

    if (errc.ec != glz::error_code::none || !response.data || response.data->empty() || !response.data->front().ts)
      return "Unexpected API response:\n" + payload.body;

    const dto::Current& current = response.data->front();

    const i64    tsUtc  = static_cast<i64>(std::trunc(*current.ts));
    const String tzName = current.timezone.value_or("UTC");

    const Option<String> description = current.weather ? current.weather->description : None;

    // clang-format off
    return std::format(
      "City: {}, {}\n"
      "Weather: {}\n"
      "Temp: {} °C (feels like {} °C)\n"
      "Humidity: {}%\n"
      "Wind: {} m/s direction {}°\n"
      "Clouds: {}%\n"
      "Visibility: {} km\n"
      "Local time: {} ({})\n"
      "UTC time: {} (UTC)\n"
      "Sunrise (UTC): {}\n"
      "Sunset (UTC): {}",
      OrNone(current.cityName), OrNone(current.countryCode),
      OrNone(description),
      OrNone(current.temp), OrNone(current.appTemp),
      OrNone(current.rh),
      OrNone(current.windSpd), OrNone(current.windDir),
      OrNone(current.clouds),
      OrNone(current.vis),
      dt::FormatLocalTime(tsUtc, tzName), tzName,
      dt::FormatUtcTime(tsUtc),
      OrNone(current.sunrise),
      OrNone(current.sunset)
    );
    // clang-format on
  }
} // namespace clima::services::weather
