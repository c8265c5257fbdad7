#pragma once

// clang-format off
// glaze.hpp has to come first, core/meta.hpp relies on types it pulls in
#include <glaze/glaze.hpp>
#include <glaze/core/meta.hpp>
#include <glaze/json/read.hpp>

#include <Clima/Utils/Definitions.hpp>
#include <Clima/Utils/Types.hpp>
// clang-format on

namespace clima::services::weather::dto::weatherbit {
  namespace {
    using utils::types::f64;
    using utils::types::Option;
    using utils::types::String;
    using utils::types::Vec;
  } // namespace

  struct Condition {
    Option<String> description;
    Option<String> icon;
    Option<f64>    code;
  };

  /**
   * @brief One entry of the `data` array of the `current` endpoint.
   *
   * Every field is optional; the provider omits or nulls fields freely.
   */
  struct Current {
    Option<String>    cityName;
    Option<String>    countryCode;
    Option<f64>       lat;
    Option<f64>       lon;
    Option<f64>       ts;
    Option<String>    timezone;
    Option<f64>       temp;
    Option<f64>       appTemp;
    Option<f64>       rh;
    Option<f64>       pres;
    Option<f64>       windSpd;
    Option<f64>       windDir;
    Option<String>    windCdirFull;
    Option<f64>       clouds;
    Option<f64>       vis;
    Option<String>    sunrise;
    Option<String>    sunset;
    Option<String>    obTime;
    Option<Condition> weather;
  };

  struct Response {
    Option<Vec<Current>> data;
    Option<f64>          count;
    Option<String>       error;
  };
} // namespace clima::services::weather::dto::weatherbit

namespace glz {
  template <>
  struct meta<clima::services::weather::dto::weatherbit::Condition> {
    using T = clima::services::weather::dto::weatherbit::Condition;

    // clang-format off
    static constexpr auto value = object(
      "description", &T::description,
      "icon",        &T::icon,
      "code",        &T::code
    );
    // clang-format on
  };

  template <>
  struct meta<clima::services::weather::dto::weatherbit::Current> {
    using T = clima::services::weather::dto::weatherbit::Current;

    // clang-format off
    static constexpr auto value = object(
      "city_name",      &T::cityName,
      "country_code",   &T::countryCode,
      "lat",            &T::lat,
      "lon",            &T::lon,
      "ts",             &T::ts,
      "timezone",       &T::timezone,
      "temp",           &T::temp,
      "app_temp",       &T::appTemp,
      "rh",             &T::rh,
      "pres",           &T::pres,
      "wind_spd",       &T::windSpd,
      "wind_dir",       &T::windDir,
      "wind_cdir_full", &T::windCdirFull,
      "clouds",         &T::clouds,
      "vis",            &T::vis,
      "sunrise",        &T::sunrise,
      "sunset",         &T::sunset,
      "ob_time",        &T::obTime,
      "weather",        &T::weather
    );
    // clang-format on
  };

  template <>
  struct meta<clima::services::weather::dto::weatherbit::Response> {
    using T = clima::services::weather::dto::weatherbit::Response;

    // clang-format off
    static constexpr auto value = object(
      "data",  &T::data,
      "count", &T::count,
      "error", &T::error
    );
    // clang-format on
  };
} // namespace glz

namespace clima::services::weather::dto::weatherbit {
  /**
   * @brief Parses a `current` response body.
   * @return The glaze error context; `ec == glz::error_code::none` on success.
   */
  inline fn Parse(const String& body, Response& out) -> glz::error_ctx {
    return glz::read<glz::opts { .error_on_unknown_keys = false }>(out, body);
  }
} // namespace clima::services::weather::dto::weatherbit
