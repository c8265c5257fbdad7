#pragma once

#include "Definitions.hpp"
#include "Error.hpp"
#include "Types.hpp"

namespace clima::utils::datetime {
  namespace {
    using types::i32;
    using types::i64;
    using types::Option;
    using types::Result;
    using types::String;
    using types::StringView;
  } // namespace

  /**
   * @brief A calendar day in some time zone.
   */
  struct LocalDate {
    i32      year;
    unsigned month;
    unsigned day;

    auto operator<=>(const LocalDate&) const = default;
  };

  /**
   * @brief Current time as integer epoch seconds (UTC).
   */
  fn NowUtc() -> i64;

  /**
   * @brief Formats epoch seconds as ISO-8601 UTC with an explicit offset, e.g. "2023-11-14T22:13:20+00:00".
   */
  fn FormatIsoUtc(i64 epochSecs) -> String;

  /**
   * @brief Formats epoch seconds in UTC with a strftime-like chrono format (default "%Y-%m-%d %H:%M").
   */
  fn FormatUtcTime(i64 epochSecs, StringView format = "%Y-%m-%d %H:%M") -> String;

  /**
   * @brief Formats epoch seconds as wall-clock time in the given IANA zone.
   *
   * An unknown zone falls back to UTC.
   */
  fn FormatLocalTime(i64 epochSecs, StringView tzName, StringView format = "%Y-%m-%d %H:%M") -> String;

  /**
   * @brief Returns the calendar day of an instant in the given IANA zone (UTC for an unknown zone).
   */
  fn ToLocalDate(i64 epochSecs, StringView tzName) -> LocalDate;

  /**
   * @brief Parses a string of decimal digits (optional leading '-') as epoch seconds.
   * @return InvalidArgument when the text is empty, has trailing characters or overflows.
   */
  fn ParseEpoch(StringView text) -> Result<i64>;
} // namespace clima::utils::datetime
