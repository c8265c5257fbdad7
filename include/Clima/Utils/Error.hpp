#pragma once

#include <expected>        // std::{expected, unexpected}
#include <format>          // std::format
#include <matchit.hpp>     // matchit::{match, is, or_, _}
#include <source_location> // std::source_location
#include <system_error>    // std::{error_code, errc}

#include "Types.hpp"

namespace clima::utils::error {
  namespace {
    using types::Exception;
    using types::String;
    using types::u8;
  } // namespace

  /**
   * @enum ClimaErrorCode
   * @brief Categories of failure surfaced by the collection pipeline and its front-ends.
   */
  enum class ClimaErrorCode : u8 {
    ConfigurationError, ///< Missing credential, unreadable or invalid configuration.
    InternalError,      ///< An error occurred within Clima++'s own logic.
    InvalidArgument,    ///< An invalid argument was passed to a function or method.
    IoError,            ///< General I/O error (filesystem, pipes, etc.).
    NetworkError,       ///< A network-related error occurred below the provider layer.
    NotFound,           ///< A required resource (file, row, endpoint) was not found.
    Other,              ///< A generic or unclassified error from an external library.
    OutOfMemory,        ///< The system ran out of memory.
    ParseError,         ///< Failed to parse data (provider JSON, numbers, timestamps).
    PermissionDenied,   ///< Insufficient permissions to perform the operation.
    ProviderError,      ///< The weather provider call failed (transport error or non-success status).
    StoreUnavailable,   ///< The observation store could not be opened or queried.
    Timeout,            ///< An operation timed out.
  };

  /**
   * @struct ClimaError
   * @brief Holds structured information about a failure.
   *
   * Used as the error type in Result across the library.
   */
  struct ClimaError {
    String               message;  ///< A descriptive error message.
    std::source_location location; ///< The source location where the error occurred (file, line, function).
    ClimaErrorCode       code;     ///< The general category of the error.

    ClimaError(const ClimaErrorCode errc, String msg, const std::source_location& loc = std::source_location::current())
      : message(std::move(msg)), location(loc), code(errc) {}

    explicit ClimaError(const Exception& exc, const std::source_location& loc = std::source_location::current())
      : message(exc.what()), location(loc), code(ClimaErrorCode::InternalError) {}

    explicit ClimaError(const std::error_code& errc, const std::source_location& loc = std::source_location::current())
      : message(errc.message()), location(loc), code(ClimaErrorCode::Other) {
      using namespace matchit;
      using enum ClimaErrorCode;
      using enum std::errc;

      code = match(errc)(
        is | or_(file_too_large, io_error)                                                = IoError,
        is | invalid_argument                                                             = InvalidArgument,
        is | not_enough_memory                                                            = OutOfMemory,
        is | or_(network_unreachable, network_down, connection_refused)                   = NetworkError,
        is | or_(no_such_file_or_directory, not_a_directory, is_a_directory, file_exists) = NotFound,
        is | permission_denied                                                            = PermissionDenied,
        is | timed_out                                                                    = Timeout,
        is | _                                                                            = Other
      );
    }
  };
} // namespace clima::utils::error

namespace clima::utils::types {
  /**
   * @typedef Result
   * @brief Alias for std::expected<Tp, Er>. Represents a value that can either be
   * a success value of type Tp or an error value of type Er.
   * @tparam Tp The type of the success value.
   * @tparam Er The type of the error value.
   */
  template <typename Tp = void, typename Er = error::ClimaError>
  using Result = std::expected<Tp, Er>;

  /**
   * @typedef Err
   * @brief Alias for std::unexpected<Er>. Used to construct a Result in an error state.
   * @tparam Er The type of the error value.
   */
  template <typename Er = error::ClimaError>
  using Err = std::unexpected<Er>;
} // namespace clima::utils::types

#define ERR(errc, msg)          return ::clima::utils::types::Err(::clima::utils::error::ClimaError(errc, msg))
#define ERR_FMT(errc, fmt, ...) return ::clima::utils::types::Err(::clima::utils::error::ClimaError(errc, std::format(fmt, __VA_ARGS__)))
