#pragma once

#ifdef _WIN32
  #include <stdlib.h> // NOLINT(*-deprecated-headers)
#endif

#include <cstdlib>
#include <filesystem> // std::filesystem::{exists, path}
#include <fstream>    // std::ifstream

#include "Definitions.hpp"
#include "Error.hpp"
#include "Types.hpp"

namespace clima::utils::env {
  namespace {
    using types::Err;
    using types::i32;
    using types::PCStr;
    using types::Result;
    using types::String;
    using types::StringView;
    using types::UniquePointer;
    using types::usize;

    using error::ClimaError;
    using enum error::ClimaErrorCode;
  } // namespace

  /**
   * @brief Safely retrieves an environment variable.
   * @param name The name of the environment variable to retrieve.
   * @return A Result containing the value of the environment variable.
   */
  [[nodiscard]] inline fn GetEnv(const PCStr name) -> Result<String> {
#ifdef _WIN32
    char* rawPtr     = nullptr;
    usize bufferSize = 0;

    const i32 err = _dupenv_s(&rawPtr, &bufferSize, name);

    const UniquePointer<char, decltype(&free)> ptrManager(rawPtr, free);

    if (err != 0)
      return Err(ClimaError(PermissionDenied, "Failed to retrieve environment variable"));

    if (!ptrManager)
      return Err(ClimaError(NotFound, "Environment variable not found"));

    return String(ptrManager.get());
#else
    const PCStr value = std::getenv(name);

    if (!value)
      return Err(ClimaError(NotFound, "Environment variable not found"));

    return String(value);
#endif
  }

  /**
   * @brief Safely sets an environment variable.
   * @param name The name of the environment variable to set.
   * @param value The value to set the environment variable to.
   */
  inline fn SetEnv(const PCStr name, const PCStr value) -> void {
#ifdef _WIN32
    _putenv_s(name, value);
#else
    setenv(name, value, 1);
#endif
  }

  /**
   * @brief Safely unsets an environment variable.
   * @param name The name of the environment variable to unset.
   */
  inline fn UnsetEnv(const PCStr name) -> void {
#ifdef _WIN32
    _putenv_s(name, "");
#else
    unsetenv(name);
#endif
  }

  namespace detail {
    inline fn Trim(StringView text) -> StringView {
      constexpr StringView whitespace = " \t\r\n";

      const usize first = text.find_first_not_of(whitespace);

      if (first == StringView::npos)
        return {};

      const usize last = text.find_last_not_of(whitespace);

      return text.substr(first, last - first + 1);
    }

    inline fn Unquote(StringView text) -> StringView {
      if (text.size() >= 2 && (text.front() == '"' || text.front() == '\'') && text.back() == text.front())
        return text.substr(1, text.size() - 2);

      return text;
    }
  } // namespace detail

  /**
   * @brief Loads KEY=VALUE pairs from a dotenv file into the process environment.
   *
   * Blank lines and lines starting with '#' are skipped, an optional leading
   * `export ` is accepted and matching surrounding quotes are stripped.
   * Variables that are already set are left untouched.
   *
   * @param path Path of the dotenv file.
   * @return The number of variables that were set, or NotFound when the file does not exist.
   */
  inline fn LoadDotEnv(const std::filesystem::path& path) -> Result<usize> {
    std::error_code errc;

    if (!std::filesystem::exists(path, errc))
      return Err(ClimaError(NotFound, std::format("No dotenv file at {}", path.string())));

    std::ifstream file(path);

    if (!file)
      return Err(ClimaError(IoError, std::format("Failed to open dotenv file {}", path.string())));

    usize  applied = 0;
    String line;

    while (std::getline(file, line)) {
      StringView view = detail::Trim(line);

      if (view.empty() || view.front() == '#')
        continue;

      if (view.starts_with("export "))
        view = detail::Trim(view.substr(7));

      const usize eq = view.find('=');

      if (eq == StringView::npos)
        continue;

      const String key(detail::Trim(view.substr(0, eq)));
      const String value(detail::Unquote(detail::Trim(view.substr(eq + 1))));

      if (key.empty() || GetEnv(key.c_str()))
        continue;

      SetEnv(key.c_str(), value.c_str());
      ++applied;
    }

    return applied;
  }
} // namespace clima::utils::env
