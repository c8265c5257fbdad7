#include <Clima/Services/Weather.hpp>

#include <algorithm> // std::{min, ranges::replace}

#include <Clima/Utils/Logging.hpp>

#include "Wrappers/Curl.hpp"

using namespace clima::utils::types;
using clima::utils::error::ClimaError;
using enum clima::utils::error::ClimaErrorCode;

namespace clima::services::weather {
  fn CurlTransport::get(const String& url, const i64 timeoutSecs) -> Result<HttpResponse> {
    String responseBuffer;

    Curl::Easy curl({
      .url                = url,
      .writeBuffer        = &responseBuffer,
      .timeoutSecs        = timeoutSecs,
      .connectTimeoutSecs = std::min<i64>(timeoutSecs, 10),
      .userAgent          = String(CLIMA_USER_AGENT),
    });

    if (!curl) {
      if (const Option<ClimaError>& initError = curl.getInitializationError())
        return Err(*initError);

      ERR(InternalError, "Failed to initialize cURL (Easy handle is invalid after construction)");
    }

    if (Result res = curl.perform(); !res)
      return Err(res.error());

    Result<i64> status = curl.responseCode();

    if (!status)
      return Err(status.error());

    debug_log("GET finished with HTTP {} ({} bytes)", *status, responseBuffer.size());

    return HttpResponse { .status = *status, .body = std::move(responseBuffer) };
  }

  fn EscapeQueryValue(const String& value) -> Result<String> {
    return Curl::Easy::escape(value);
  }

  fn UnescapeQueryValue(const String& value) -> Result<String> {
    String spaced = value;
    std::ranges::replace(spaced, '+', ' ');
    return Curl::Easy::unescape(spaced);
  }
} // namespace clima::services::weather
