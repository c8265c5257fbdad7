#include <Clima/Utils/DateTime.hpp>

#include <charconv> // std::from_chars
#include <chrono>   // std::chrono::{sys_seconds, zoned_time, locate_zone, floor, days, year_month_day}
#include <format>   // std::{format, vformat, make_format_args}

#include <Clima/Utils/Logging.hpp>

namespace {
  using namespace clima::utils::types;
  using clima::utils::error::ClimaError;
  using enum clima::utils::error::ClimaErrorCode;

  fn LocateZone(const StringView tzName) -> const std::chrono::time_zone* {
    if (tzName.empty())
      return nullptr;

    try {
      return std::chrono::locate_zone(tzName);
    } catch (const std::runtime_error& err) {
      debug_log("Unknown time zone '{}', using UTC: {}", tzName, err.what());
      return nullptr;
    }
  }

  fn ToSysSeconds(const i64 epochSecs) -> std::chrono::sys_seconds {
    return std::chrono::sys_seconds { std::chrono::seconds { epochSecs } };
  }

  fn FormatChrono(const StringView format, const auto& timePoint) -> String {
    const String spec = std::format("{{:{}}}", format);
    return std::vformat(spec, std::make_format_args(timePoint));
  }
} // namespace

namespace clima::utils::datetime {
  fn NowUtc() -> i64 {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
  }

  fn FormatIsoUtc(const i64 epochSecs) -> String {
    return FormatChrono("%Y-%m-%dT%H:%M:%S+00:00", ToSysSeconds(epochSecs));
  }

  fn FormatUtcTime(const i64 epochSecs, const StringView format) -> String {
    return FormatChrono(format, ToSysSeconds(epochSecs));
  }

  fn FormatLocalTime(const i64 epochSecs, const StringView tzName, const StringView format) -> String {
    const std::chrono::time_zone* zone = LocateZone(tzName);

    if (!zone)
      return FormatUtcTime(epochSecs, format);

    const std::chrono::zoned_time zoned { zone, ToSysSeconds(epochSecs) };

    return FormatChrono(format, zoned.get_local_time());
  }

  fn ToLocalDate(const i64 epochSecs, const StringView tzName) -> LocalDate {
    using namespace std::chrono;

    const time_zone* zone = LocateZone(tzName);

    const year_month_day ymd = zone
      ? year_month_day { floor<days>(zoned_time { zone, ToSysSeconds(epochSecs) }.get_local_time()) }
      : year_month_day { floor<days>(ToSysSeconds(epochSecs)) };

    return LocalDate {
      .year  = static_cast<int>(ymd.year()),
      .month = static_cast<unsigned>(ymd.month()),
      .day   = static_cast<unsigned>(ymd.day()),
    };
  }

  fn ParseEpoch(const StringView text) -> Result<i64> {
    i64 value = 0;

    const char* first = text.data();
    const char* last  = text.data() + text.size();

    if (text.empty())
      ERR(InvalidArgument, "Expected an epoch timestamp, got an empty string");

    if (auto [ptr, errc] = std::from_chars(first, last, value); errc != std::errc {} || ptr != last)
      ERR_FMT(InvalidArgument, "'{}' is not a valid epoch timestamp (integer seconds)", text);

    return value;
  }
} // namespace clima::utils::datetime
