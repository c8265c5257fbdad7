#include "ChartRenderer.hpp"

#include <algorithm>    // std::ranges::{minmax_element, replace}
#include <chrono>       // std::chrono::{sys_days, year, month, day}
#include <cmath>        // std::isfinite
#include <format>       // std::{format, format_to}
#include <fstream>      // std::ofstream
#include <iterator>     // std::back_inserter
#include <map>          // std::map
#include <system_error> // std::error_code

#include <Clima/Utils/Logging.hpp>

namespace fs = std::filesystem;

using namespace clima::utils::types;
using clima::utils::datetime::LocalDate;
using clima::utils::error::ClimaError;
using enum clima::utils::error::ClimaErrorCode;

namespace {
  constexpr f64 WIDTH         = 800.0;
  constexpr f64 HEIGHT        = 480.0;
  constexpr f64 MARGIN_LEFT   = 70.0;
  constexpr f64 MARGIN_RIGHT  = 30.0;
  constexpr f64 MARGIN_TOP    = 50.0;
  constexpr f64 MARGIN_BOTTOM = 60.0;
  constexpr i32 Y_TICKS       = 5;

  constexpr Array<StringView, 4> SERIES_COLORS = { "#1f77b4", "#ff7f0e", "#2ca02c", "#d62728" };

  struct Accumulator {
    f64 sum {};
    i64 count {};

    fn add(const Option<f64>& value) -> void {
      if (value) {
        sum += *value;
        ++count;
      }
    }

    [[nodiscard]] fn mean() const -> Option<f64> {
      return count > 0 ? Option<f64>(sum / static_cast<f64>(count)) : None;
    }
  };

  struct DayBucket {
    Accumulator temp;
    Accumulator feels;
    Accumulator humidity;
  };

  fn DayNumber(const LocalDate& date) -> i64 {
    using namespace std::chrono;
    return sys_days { year { date.year } / month { date.month } / day { date.day } }.time_since_epoch().count();
  }

  fn EscapeXml(const StringView text) -> String {
    String out;
    out.reserve(text.size());

    for (const char character : text) {
      switch (character) {
        case '&':  out += "&amp;"; break;
        case '<':  out += "&lt;"; break;
        case '>':  out += "&gt;"; break;
        case '"':  out += "&quot;"; break;
        case '\'': out += "&apos;"; break;
        default:   out += character;
      }
    }

    return out;
  }

  fn WriteFile(const fs::path& path, const String& contents) -> Result<> {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);

    if (!file)
      ERR_FMT(IoError, "Failed to open {} for writing", path.string());

    file << contents;

    if (!file)
      ERR_FMT(IoError, "Failed to write {}", path.string());

    return {};
  }
} // namespace

namespace clima::presentation::charts {
  fn AggregateDaily(const Vec<StoredObservation>& rows) -> Vec<DailyMean> {
    if (rows.empty())
      return {};

    const String& tzName = rows.front().observation.tz;

    std::map<LocalDate, DayBucket> buckets;

    for (const StoredObservation& row : rows) {
      const services::weather::Observation& obs = row.observation;

      DayBucket& bucket = buckets[utils::datetime::ToLocalDate(obs.tsUtc, tzName)];

      bucket.temp.add(obs.tempC);
      bucket.feels.add(obs.feelsLikeC);
      bucket.humidity.add(obs.humidity ? Option<f64>(static_cast<f64>(*obs.humidity)) : None);
    }

    Vec<DailyMean> means;
    means.reserve(buckets.size());

    for (const auto& [date, bucket] : buckets)
      means.push_back(DailyMean {
        .date       = date,
        .tempC      = bucket.temp.mean(),
        .feelsLikeC = bucket.feels.mean(),
        .humidity   = bucket.humidity.mean(),
      });

    return means;
  }

  fn RenderSvg(const LineChart& chart) -> Result<String> {
    if (chart.days.empty())
      ERR_FMT(InvalidArgument, "Cannot render '{}' without data points", chart.title);

    Vec<f64> allValues;

    for (const Series& series : chart.series) {
      if (series.values.size() != chart.days.size())
        ERR_FMT(InvalidArgument, "Series '{}' has {} values for {} days", series.label, series.values.size(), chart.days.size());

      for (const Option<f64>& value : series.values)
        if (value && std::isfinite(*value))
          allValues.push_back(*value);
    }

    f64 yMin = 0.0;
    f64 yMax = 0.0;

    if (!allValues.empty()) {
      const auto [minIt, maxIt] = std::ranges::minmax_element(allValues);

      yMin = *minIt;
      yMax = *maxIt;
    }

    if (yMax - yMin < 1e-9) {
      yMin -= 1.0;
      yMax += 1.0;
    } else {
      const f64 pad = (yMax - yMin) * 0.05;
      yMin -= pad;
      yMax += pad;
    }

    const f64 plotW = WIDTH - MARGIN_LEFT - MARGIN_RIGHT;
    const f64 plotH = HEIGHT - MARGIN_TOP - MARGIN_BOTTOM;

    const i64 firstDay = DayNumber(chart.days.front());
    const i64 lastDay  = DayNumber(chart.days.back());

    auto xAt = [&](const LocalDate& date) -> f64 {
      if (lastDay == firstDay)
        return MARGIN_LEFT + (plotW / 2.0);

      return MARGIN_LEFT + (plotW * static_cast<f64>(DayNumber(date) - firstDay) / static_cast<f64>(lastDay - firstDay));
    };

    auto yAt = [&](const f64 value) -> f64 {
      return MARGIN_TOP + (plotH * (1.0 - ((value - yMin) / (yMax - yMin))));
    };

    String svg;
    auto   out = std::back_inserter(svg);

    std::format_to(out, R"(<svg xmlns="http://www.w3.org/2000/svg" width="{0}" height="{1}" viewBox="0 0 {0} {1}" font-family="sans-serif" font-size="12">)" "\n", WIDTH, HEIGHT);
    std::format_to(out, R"(<rect width="100%" height="100%" fill="white"/>)" "\n");
    std::format_to(out, R"(<text x="{}" y="{}" text-anchor="middle" font-size="16">{}</text>)" "\n", WIDTH / 2.0, MARGIN_TOP / 2.0 + 6.0, EscapeXml(chart.title));

    // Axes
    std::format_to(out, R"(<line x1="{0}" y1="{1}" x2="{0}" y2="{2}" stroke="black"/>)" "\n", MARGIN_LEFT, MARGIN_TOP, MARGIN_TOP + plotH);
    std::format_to(out, R"(<line x1="{0}" y1="{2}" x2="{1}" y2="{2}" stroke="black"/>)" "\n", MARGIN_LEFT, MARGIN_LEFT + plotW, MARGIN_TOP + plotH);

    for (i32 i = 0; i <= Y_TICKS; ++i) {
      const f64 value = yMin + ((yMax - yMin) * static_cast<f64>(i) / Y_TICKS);
      const f64 ypos  = yAt(value);

      std::format_to(out, R"(<line x1="{0}" y1="{2:.1f}" x2="{1}" y2="{2:.1f}" stroke="#dddddd"/>)" "\n", MARGIN_LEFT, MARGIN_LEFT + plotW, ypos);
      std::format_to(out, R"(<text x="{}" y="{:.1f}" text-anchor="end">{:.1f}</text>)" "\n", MARGIN_LEFT - 6.0, ypos + 4.0, value);
    }

    for (const LocalDate& date : chart.days) {
      const f64 xpos = xAt(date);

      std::format_to(out, R"(<line x1="{0:.1f}" y1="{1}" x2="{0:.1f}" y2="{2}" stroke="black"/>)" "\n", xpos, MARGIN_TOP + plotH, MARGIN_TOP + plotH + 5.0);
      std::format_to(out, R"(<text x="{:.1f}" y="{}" text-anchor="middle">{:02}/{:02}</text>)" "\n", xpos, MARGIN_TOP + plotH + 20.0, date.day, date.month);
    }

    std::format_to(out, R"(<text x="{}" y="{}" text-anchor="middle">{}</text>)" "\n", MARGIN_LEFT + plotW / 2.0, HEIGHT - 12.0, EscapeXml(chart.xLabel));
    std::format_to(out, R"(<text x="18" y="{0}" text-anchor="middle" transform="rotate(-90 18 {0})">{1}</text>)" "\n", MARGIN_TOP + plotH / 2.0, EscapeXml(chart.yLabel));

    for (usize idx = 0; idx < chart.series.size(); ++idx) {
      const Series&    series = chart.series[idx];
      const StringView color  = SERIES_COLORS.at(idx % SERIES_COLORS.size());

      // A missing value ends the current polyline.
      String points;

      auto flush = [&]() {
        if (!points.empty())
          std::format_to(out, R"(<polyline fill="none" stroke="{}" stroke-width="2" points="{}"/>)" "\n", color, points);
        points.clear();
      };

      for (usize i = 0; i < chart.days.size(); ++i) {
        const Option<f64>& value = series.values[i];

        if (!value || !std::isfinite(*value)) {
          flush();
          continue;
        }

        const f64 xpos = xAt(chart.days[i]);
        const f64 ypos = yAt(*value);

        if (!points.empty())
          points += ' ';

        points += std::format("{:.1f},{:.1f}", xpos, ypos);

        std::format_to(out, R"(<circle cx="{:.1f}" cy="{:.1f}" r="4" fill="{}"/>)" "\n", xpos, ypos, color);
      }

      flush();

      const f64 legendY = MARGIN_TOP + 14.0 + (18.0 * static_cast<f64>(idx));

      std::format_to(out, R"(<line x1="{0}" y1="{2}" x2="{1}" y2="{2}" stroke="{3}" stroke-width="2"/>)" "\n", MARGIN_LEFT + 10.0, MARGIN_LEFT + 30.0, legendY, color);
      std::format_to(out, R"(<text x="{}" y="{}">{}</text>)" "\n", MARGIN_LEFT + 36.0, legendY + 4.0, EscapeXml(series.label));
    }

    svg += "</svg>\n";

    return svg;
  }

  fn FileTag(const StringView cityTag) -> String {
    String tag(cityTag);
    std::ranges::replace(tag, ' ', '_');
    return tag;
  }

  fn RenderDailyCharts(const Vec<DailyMean>& days, const StringView cityTag, const fs::path& outputDir) -> Result<Vec<fs::path>> {
    if (days.empty())
      ERR(InvalidArgument, "No daily data to plot");

    Vec<LocalDate>   dates;
    Vec<Option<f64>> temp;
    Vec<Option<f64>> feels;
    Vec<Option<f64>> humidity;

    for (const DailyMean& mean : days) {
      dates.push_back(mean.date);
      temp.push_back(mean.tempC);
      feels.push_back(mean.feelsLikeC);
      humidity.push_back(mean.humidity);
    }

    const String tag = FileTag(cityTag);

    const Array<Pair<String, LineChart>, 3> charts = {
      Pair<String, LineChart> {
        std::format("temp_{}.svg", tag),
        LineChart {
          .title  = std::format("Temperature - {} (daily mean)", cityTag),
          .xLabel = "Time",
          .yLabel = "°C",
          .days   = dates,
          .series = { Series { .label = "Temperature (°C)", .values = temp } },
        },
      },
      Pair<String, LineChart> {
        std::format("temp_feels_{}.svg", tag),
        LineChart {
          .title  = std::format("Temp vs feels like - {} (daily mean)", cityTag),
          .xLabel = "Time",
          .yLabel = "°C",
          .days   = dates,
          .series = {
            Series { .label = "Temp (°C)", .values = temp },
            Series { .label = "Feels like (°C)", .values = feels },
          },
        },
      },
      Pair<String, LineChart> {
        std::format("humidity_{}.svg", tag),
        LineChart {
          .title  = std::format("Humidity - {} (daily mean)", cityTag),
          .xLabel = "Time",
          .yLabel = "%",
          .days   = dates,
          .series = { Series { .label = "Humidity (%)", .values = humidity } },
        },
      },
    };

    if (std::error_code errc; !fs::create_directories(outputDir, errc) && errc)
      ERR_FMT(IoError, "Cannot create plots directory '{}': {}", outputDir.string(), errc.message());

    Vec<fs::path> written;

    for (const auto& [fileName, chart] : charts) {
      Result<String> svg = RenderSvg(chart);

      if (!svg)
        return Err(svg.error());

      const fs::path path = outputDir / fileName;

      if (Result res = WriteFile(path, *svg); !res)
        return Err(res.error());

      debug_log("Wrote {}", path.string());
      written.push_back(path);
    }

    return written;
  }
} // namespace clima::presentation::charts
