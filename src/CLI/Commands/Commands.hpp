#pragma once

#include <Clima/Services/Query.hpp>
#include <Clima/Services/Weather.hpp>
#include <Clima/Utils/Definitions.hpp>
#include <Clima/Utils/Error.hpp>
#include <Clima/Utils/Types.hpp>

#include "Config/Config.hpp"

namespace clima::cli {
  namespace {
    using config::Config;
    using services::query::ObservationView;

    using utils::types::f64;
    using utils::types::i64;
    using utils::types::None;
    using utils::types::Option;
    using utils::types::Result;
    using utils::types::String;
    using utils::types::u16;
    using utils::types::Vec;
  } // namespace

  /**
   * @brief City or coordinates given on the command line; unset fields fall back to the config.
   */
  struct LocationArgs {
    Option<String> city;
    Option<String> country;
    Option<f64>    lat;
    Option<f64>    lon;
  };

  struct RangeArgs {
    i64            hours = 24; ///< Window ending now, used when neither bound is given.
    Option<String> start;
    Option<String> end;
  };

  /**
   * @brief One line per row: `City-CC | YYYY-mm-dd HH:MM (tz) | T°C (feels F°C) | H% humidity | desc`.
   */
  fn FormatRow(const ObservationView& view) -> String;

  /**
   * @brief Formats rows one per line, or "No records found." when empty.
   */
  fn FormatRows(const Vec<ObservationView>& views) -> String;

  /**
   * @brief Fetches and stores one observation.
   */
  fn RunCollect(const Config& config, const LocationArgs& location) -> Result<>;

  /**
   * @brief Fetches and prints a summary without storing anything.
   */
  fn RunFetch(const Config& config, const LocationArgs& location) -> Result<>;

  fn RunLatest(const Config& config, const LocationArgs& location, i64 limit) -> Result<>;

  fn RunRange(const Config& config, const LocationArgs& location, const RangeArgs& range) -> Result<>;

  /**
   * @brief Writes the daily-mean charts for the last `hours` (config value when absent).
   */
  fn RunPlot(const Config& config, const LocationArgs& location, Option<i64> hours) -> Result<>;

  fn RunServe(const Config& config, Option<u16> port) -> Result<>;
} // namespace clima::cli
