#pragma once

#include <filesystem> // std::filesystem::path

#include <Clima/Storage/ObservationStore.hpp>
#include <Clima/Utils/DateTime.hpp>
#include <Clima/Utils/Definitions.hpp>
#include <Clima/Utils/Error.hpp>
#include <Clima/Utils/Types.hpp>

namespace clima::presentation::charts {
  namespace {
    using storage::StoredObservation;
    using utils::datetime::LocalDate;

    using utils::types::f64;
    using utils::types::Option;
    using utils::types::Result;
    using utils::types::String;
    using utils::types::StringView;
    using utils::types::Vec;
  } // namespace

  /**
   * @brief Mean of each numeric column over one local calendar day.
   */
  struct DailyMean {
    LocalDate   date;
    Option<f64> tempC;
    Option<f64> feelsLikeC;
    Option<f64> humidity;
  };

  /**
   * @brief Groups rows by local calendar day and averages temp, feels-like and humidity.
   *
   * The zone of the first row is used for every row. Missing values are left
   * out of the mean; days without rows do not appear. Output is ordered by day.
   */
  fn AggregateDaily(const Vec<StoredObservation>& rows) -> Vec<DailyMean>;

  struct Series {
    String              label;
    Vec<Option<f64>>    values; ///< One per point; None leaves a gap in the line.
  };

  struct LineChart {
    String         title;
    String         xLabel;
    String         yLabel;
    Vec<LocalDate> days; ///< X positions, proportional to calendar distance.
    Vec<Series>    series;
  };

  /**
   * @brief Renders a line chart with markers as a standalone SVG document.
   *
   * X ticks are placed only at the given days and labelled dd/mm.
   *
   * @return InvalidArgument when there are no days, or a series length does not match.
   */
  fn RenderSvg(const LineChart& chart) -> Result<String>;

  /**
   * @brief File-name friendly form of a "City-CC" tag (spaces become underscores).
   */
  fn FileTag(StringView cityTag) -> String;

  /**
   * @brief Writes temp_<tag>.svg, temp_feels_<tag>.svg and humidity_<tag>.svg.
   * @param days Daily means, must not be empty.
   * @param cityTag Display tag, e.g. "Rio de Janeiro-BR".
   * @param outputDir Created when missing.
   * @return The written paths, InvalidArgument for empty input or IoError when a file cannot be written.
   */
  fn RenderDailyCharts(const Vec<DailyMean>& days, StringView cityTag, const std::filesystem::path& outputDir) -> Result<Vec<std::filesystem::path>>;
} // namespace clima::presentation::charts
