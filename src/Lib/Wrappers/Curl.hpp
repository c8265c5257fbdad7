#pragma once

#include <curl/curl.h>
#include <utility> // std::{exchange, move}

#include <Clima/Utils/Error.hpp>
#include <Clima/Utils/Types.hpp>

namespace Curl {
  namespace {
    using clima::utils::error::ClimaError;
    using enum clima::utils::error::ClimaErrorCode;

    using clima::utils::types::Err;
    using clima::utils::types::i32;
    using clima::utils::types::i64;
    using clima::utils::types::None;
    using clima::utils::types::Option;
    using clima::utils::types::RawPointer;
    using clima::utils::types::Result;
    using clima::utils::types::String;
    using clima::utils::types::Unit;
    using clima::utils::types::usize;
  } // namespace

  /**
   * @brief Options for initializing a Curl::Easy handle.
   */
  struct EasyOptions {
    Option<String> url                = None;    ///< URL to set for the transfer
    String*        writeBuffer        = nullptr; ///< Pointer to a string buffer to store the response
    Option<i64>    timeoutSecs        = None;    ///< Timeout for the entire request in seconds
    Option<i64>    connectTimeoutSecs = None;    ///< Timeout for the connection phase in seconds
    Option<String> userAgent          = None;    ///< User-agent string
  };

  /**
   * @brief RAII wrapper for CURL easy handle.
   */
  class Easy {
    CURL*              m_curl      = nullptr;
    Option<ClimaError> m_initError = None; ///< Error raised while applying EasyOptions, reported on perform()

    static fn writeCallback(RawPointer contents, const usize size, const usize nmemb, String* str) -> usize {
      const usize totalSize = size * nmemb;
      str->append(static_cast<char*>(contents), totalSize);
      return totalSize;
    }

    fn apply(Result<> res) -> bool {
      if (!res)
        m_initError = res.error();

      return res.has_value();
    }

   public:
    Easy()
      : m_curl(curl_easy_init()) {
      if (!m_curl)
        m_initError = ClimaError(InternalError, "curl_easy_init() failed");
    }

    /**
     * @brief Initializes a CURL easy handle and applies the given options.
     *
     * The first option that fails is stored and reported by perform().
     */
    explicit Easy(const EasyOptions& options)
      : m_curl(curl_easy_init()) {
      if (!m_curl) {
        m_initError = ClimaError(InternalError, "curl_easy_init() failed");
        return;
      }

      if (options.url && !apply(setUrl(*options.url)))
        return;

      if (options.writeBuffer && !apply(setWriteFunction(options.writeBuffer)))
        return;

      if (options.timeoutSecs && !apply(setTimeout(*options.timeoutSecs)))
        return;

      if (options.connectTimeoutSecs && !apply(setConnectTimeout(*options.connectTimeoutSecs)))
        return;

      if (options.userAgent)
        apply(setUserAgent(*options.userAgent));
    }

    ~Easy() {
      if (m_curl)
        curl_easy_cleanup(m_curl);
    }

    Easy(const Easy&)                = delete;
    fn operator=(const Easy&)->Easy& = delete;

    Easy(Easy&& other) noexcept
      : m_curl(std::exchange(other.m_curl, nullptr)), m_initError(std::move(other.m_initError)) {}

    fn operator=(Easy&& other) noexcept -> Easy& {
      if (this != &other) {
        if (m_curl)
          curl_easy_cleanup(m_curl);

        m_curl      = std::exchange(other.m_curl, nullptr);
        m_initError = std::move(other.m_initError);
      }

      return *this;
    }

    [[nodiscard]] explicit operator bool() const {
      return m_curl != nullptr && !m_initError;
    }

    [[nodiscard]] fn getInitializationError() const -> const Option<ClimaError>& {
      return m_initError;
    }

    [[nodiscard]] fn get() const -> CURL* {
      return m_curl;
    }

    template <typename T>
    fn setOpt(const CURLoption option, T value) -> Result<> {
      if (!m_curl)
        ERR(InternalError, "CURL handle is not initialized or init failed");

      if (const CURLcode res = curl_easy_setopt(m_curl, option, value); res != CURLE_OK)
        ERR_FMT(InternalError, "curl_easy_setopt failed: {}", curl_easy_strerror(res));

      return {};
    }

    /**
     * @brief Performs a blocking transfer.
     * @return Timeout when the transfer timed out, NetworkError for any other transport failure.
     */
    fn perform() -> Result<> {
      if (!m_curl)
        ERR(InternalError, "CURL handle is not initialized or init failed");

      if (m_initError)
        ERR_FMT(InternalError, "Cannot perform request, CURL handle initialization failed: {}", m_initError->message);

      if (const CURLcode res = curl_easy_perform(m_curl); res != CURLE_OK) {
        if (res == CURLE_OPERATION_TIMEDOUT)
          ERR_FMT(Timeout, "curl_easy_perform timed out: {}", curl_easy_strerror(res));

        ERR_FMT(NetworkError, "curl_easy_perform failed: {}", curl_easy_strerror(res));
      }

      return {};
    }

    template <typename T>
    fn getInfo(const CURLINFO info, T* value) -> Result<> {
      if (!m_curl)
        ERR(InternalError, "CURL handle is not initialized or init failed");

      if (const CURLcode res = curl_easy_getinfo(m_curl, info, value); res != CURLE_OK)
        ERR_FMT(InternalError, "curl_easy_getinfo failed: {}", curl_easy_strerror(res));

      return {};
    }

    /**
     * @brief Gets the HTTP status of the last transfer.
     */
    fn responseCode() -> Result<i64> {
      long code = 0;

      if (Result res = getInfo(CURLINFO_RESPONSE_CODE, &code); !res)
        return Err(res.error());

      return static_cast<i64>(code);
    }

    /**
     * @brief Percent-encodes a string for use in a URL query.
     */
    static fn escape(const String& text) -> Result<String> {
      char* escaped = curl_easy_escape(nullptr, text.c_str(), static_cast<int>(text.length()));

      if (!escaped)
        ERR(OutOfMemory, "curl_easy_escape failed");

      String result(escaped);

      curl_free(escaped);

      return result;
    }

    /**
     * @brief Decodes a percent-encoded string. '+' is not treated as a space.
     */
    static fn unescape(const String& text) -> Result<String> {
      int   outLength = 0;
      char* decoded   = curl_easy_unescape(nullptr, text.c_str(), static_cast<int>(text.length()), &outLength);

      if (!decoded)
        ERR(OutOfMemory, "curl_easy_unescape failed");

      String result(decoded, static_cast<usize>(outLength));

      curl_free(decoded);

      return result;
    }

    fn setUrl(const String& url) -> Result<> {
      return setOpt(CURLOPT_URL, url.c_str());
    }

    fn setWriteFunction(String* buffer) -> Result<> {
      if (!buffer)
        ERR(InvalidArgument, "Write buffer cannot be null");

      if (Result res = setOpt(CURLOPT_WRITEFUNCTION, writeCallback); !res)
        return res;

      return setOpt(CURLOPT_WRITEDATA, buffer);
    }

    fn setTimeout(const i64 timeout) -> Result<> {
      return setOpt(CURLOPT_TIMEOUT, static_cast<long>(timeout));
    }

    fn setConnectTimeout(const i64 timeout) -> Result<> {
      return setOpt(CURLOPT_CONNECTTIMEOUT, static_cast<long>(timeout));
    }

    fn setUserAgent(const String& userAgent) -> Result<> {
      return setOpt(CURLOPT_USERAGENT, userAgent.c_str());
    }
  };

  /**
   * @brief Initializes CURL globally. Call once at program start, before any other thread exists.
   */
  inline fn GlobalInit(const i32 flags = CURL_GLOBAL_ALL) -> Result<> {
    if (const CURLcode res = curl_global_init(flags); res != CURLE_OK)
      ERR_FMT(InternalError, "curl_global_init failed: {}", curl_easy_strerror(res));

    return {};
  }

  inline fn GlobalCleanup() -> Unit {
    curl_global_cleanup();
  }
} // namespace Curl
