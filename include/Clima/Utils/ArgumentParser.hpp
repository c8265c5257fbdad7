/**
 * @file ArgumentParser.hpp
 * @brief Small command-line argument parser for Clima++.
 *
 * Supports one leading subcommand (`clima collect ...`), flags, and options
 * whose value is converted to the type of their default (bool, i32, f64 or
 * String). Enum-valued options are backed by magic_enum.
 */

#pragma once

#include <algorithm>                 // std::ranges::{equal, transform}
#include <cctype>                    // std::tolower
#include <charconv>                  // std::from_chars
#include <concepts>                  // std::convertible_to
#include <format>                    // std::format
#include <magic_enum/magic_enum.hpp> // magic_enum::{enum_name, enum_cast, enum_values}
#include <sstream>                   // std::ostringstream
#include <utility>                   // std::forward
#include <variant>                   // std::{variant, get, holds_alternative}

#include "Error.hpp"
#include "Logging.hpp"
#include "Types.hpp"

namespace clima::utils::argparse {
  namespace {
    using error::ClimaError;
    using error::ClimaErrorCode;
    using logging::Println;

    using types::Err;
    using types::f64;
    using types::i32;
    using types::Map;
    using types::Option;
    using types::Result;
    using types::Span;
    using types::String;
    using types::StringView;
    using types::UniquePointer;
    using types::Unit;
    using types::usize;
    using types::Vec;

    inline fn EqualsIgnoreCase(const StringView lhs, const StringView rhs) -> bool {
      return std::ranges::equal(lhs, rhs, [](const char charA, const char charB) {
        return std::tolower(static_cast<unsigned char>(charA)) == std::tolower(static_cast<unsigned char>(charB));
      });
    }

    inline fn ToLower(String text) -> String {
      std::ranges::transform(text, text.begin(), [](const char character) { return static_cast<char>(std::tolower(static_cast<unsigned char>(character))); });
      return text;
    }
  } // namespace

  /**
   * @brief Type alias for argument values.
   */
  using ArgValue = std::variant<bool, i32, f64, String>;

  /**
   * @brief Type alias for allowed choices for enum-style arguments.
   */
  using ArgChoices = Vec<String>;

  /**
   * @brief Generic traits class for enum string conversion using magic_enum.
   * @tparam EnumType The enum type
   */
  template <typename EnumType>
  struct EnumTraits {
    static constexpr bool has_string_conversion = magic_enum::is_scoped_enum_v<EnumType>;

    static fn getChoices() -> ArgChoices {
      static_assert(has_string_conversion, "Enum type must be a scoped enum");

      ArgChoices choices;
      const auto enumValues = magic_enum::enum_values<EnumType>();
      choices.reserve(enumValues.size());

      for (const auto value : enumValues)
        choices.emplace_back(magic_enum::enum_name(value));

      return choices;
    }

    static fn stringToEnum(const String& str) -> EnumType {
      static_assert(has_string_conversion, "Enum type must be a scoped enum");

      if (auto result = magic_enum::enum_cast<EnumType>(str); result.has_value())
        return *result;

      for (const auto value : magic_enum::enum_values<EnumType>())
        if (EqualsIgnoreCase(str, magic_enum::enum_name(value)))
          return value;

      return magic_enum::enum_values<EnumType>()[0];
    }

    static fn enumToString(EnumType value) -> String {
      static_assert(has_string_conversion, "Enum type must be a scoped enum");
      return String(magic_enum::enum_name(value));
    }
  };

  /**
   * @brief Represents a command-line option with its metadata and value.
   */
  class Argument {
   public:
    template <typename... NameTs>
      requires(sizeof...(NameTs) >= 1 && (std::convertible_to<NameTs, String> && ...))
    explicit Argument(NameTs&&... names)
      : m_names { String(std::forward<NameTs>(names))... } {}

    fn help(String help_text) -> Argument& {
      m_helpText = std::move(help_text);
      return *this;
    }

    /**
     * @brief Set the default value for this argument.
     *
     * The default also fixes the type that command-line values are converted to.
     */
    template <typename T>
      requires(!std::is_enum_v<T>)
    fn defaultValue(T value) -> Argument& {
      if constexpr (std::is_convertible_v<T, String> && !std::is_same_v<T, bool>)
        m_defaultValue = String(std::move(value));
      else
        m_defaultValue = std::move(value);
      return *this;
    }

    /**
     * @brief Set the default value for this argument as an enum.
     *
     * The enum's names become the allowed choices.
     */
    template <typename EnumType>
      requires std::is_enum_v<EnumType> && EnumTraits<EnumType>::has_string_conversion
    fn defaultValue(EnumType value) -> Argument& {
      m_defaultValue = EnumTraits<EnumType>::enumToString(value);
      m_choices      = EnumTraits<EnumType>::getChoices();
      return *this;
    }

    fn flag() -> Argument& {
      m_isFlag       = true;
      m_defaultValue = false;
      return *this;
    }

    fn choices(ArgChoices choices) -> Argument& {
      m_choices = std::move(choices);
      return *this;
    }

    /**
     * @brief Get the value of this argument.
     * @tparam T Type to get the value as. Must match the type of the default.
     * @return The argument value, the default value if not provided, or T{}.
     */
    template <typename T>
    fn get() const -> T {
      if (m_isUsed && m_value.has_value() && std::holds_alternative<T>(*m_value))
        return std::get<T>(*m_value);

      if (m_defaultValue.has_value() && std::holds_alternative<T>(*m_defaultValue))
        return std::get<T>(*m_defaultValue);

      return T {};
    }

    template <typename EnumType>
      requires std::is_enum_v<EnumType> && EnumTraits<EnumType>::has_string_conversion
    fn getEnum() const -> EnumType {
      return EnumTraits<EnumType>::stringToEnum(get<String>());
    }

    [[nodiscard]] fn isUsed() const -> bool {
      return m_isUsed;
    }

    [[nodiscard]] fn getPrimaryName() const -> const String& {
      return m_names.back();
    }

    [[nodiscard]] fn getNames() const -> const Vec<String>& {
      return m_names;
    }

    [[nodiscard]] fn getHelpText() const -> const String& {
      return m_helpText;
    }

    [[nodiscard]] fn isFlag() const -> bool {
      return m_isFlag;
    }

    [[nodiscard]] fn hasChoices() const -> bool {
      return m_choices.has_value();
    }

    [[nodiscard]] fn getChoices() const -> ArgChoices {
      return m_choices.value_or(ArgChoices {});
    }

    /**
     * @brief Set the value for this argument from its command-line text.
     *
     * The text is converted to the type of the default value. Options without
     * a default, or with a String default, keep the text as-is.
     *
     * @param text The raw value from the command line
     * @return InvalidArgument when the text cannot be converted or is not an allowed choice
     */
    fn setValue(const String& text) -> Result<> {
      if (hasChoices()) {
        const ArgChoices& choices = *m_choices;

        if (std::ranges::none_of(choices, [&](const String& choice) { return EqualsIgnoreCase(text, choice); })) {
          std::ostringstream choicesStream;

          for (usize i = 0; i < choices.size(); ++i) {
            if (i > 0)
              choicesStream << ", ";
            choicesStream << ToLower(choices[i]);
          }

          return Err(ClimaError(
            ClimaErrorCode::InvalidArgument,
            std::format("Invalid value '{}' for argument '{}'. Allowed values: {}", text, getPrimaryName(), choicesStream.str())
          ));
        }
      }

      Result<ArgValue> converted = convert(text);

      if (!converted)
        return Err(converted.error());

      m_value  = std::move(*converted);
      m_isUsed = true;
      return {};
    }

    fn markUsed() -> Unit {
      m_isUsed = true;

      if (m_isFlag)
        m_value = true;
    }

   private:
    [[nodiscard]] fn convert(const String& text) const -> Result<ArgValue> {
      if (!m_defaultValue)
        return ArgValue(text);

      const char* first = text.data();
      const char* last  = text.data() + text.size();

      if (std::holds_alternative<i32>(*m_defaultValue)) {
        i32 number = 0;

        if (auto [ptr, errc] = std::from_chars(first, last, number); errc != std::errc {} || ptr != last)
          return Err(ClimaError(ClimaErrorCode::InvalidArgument, std::format("Argument {} expects an integer, got '{}'", getPrimaryName(), text)));

        return ArgValue(number);
      }

      if (std::holds_alternative<f64>(*m_defaultValue)) {
        f64 number = 0.0;

        if (auto [ptr, errc] = std::from_chars(first, last, number); errc != std::errc {} || ptr != last)
          return Err(ClimaError(ClimaErrorCode::InvalidArgument, std::format("Argument {} expects a number, got '{}'", getPrimaryName(), text)));

        return ArgValue(number);
      }

      return ArgValue(text);
    }

    Vec<String>        m_names;
    String             m_helpText;
    Option<ArgValue>   m_value;
    Option<ArgValue>   m_defaultValue;
    Option<ArgChoices> m_choices;
    bool               m_isFlag {};
    bool               m_isUsed {};
  };

  /**
   * @brief A named subcommand accepted as the first positional argument.
   */
  struct Command {
    String name;
    String helpText;
  };

  /**
   * @brief Main argument parser class.
   *
   * `--help` and `--version` are ordinary flags; the caller decides what to do
   * when they are set, so parsing never ends the process.
   */
  class ArgumentParser {
   public:
    explicit ArgumentParser(String programName = "", String version = "1.0")
      : m_programName(std::move(programName)), m_version(std::move(version)) {
      addArguments("-h", "--help")
        .help("Show this help message and exit")
        .flag();

      addArguments("--version")
        .help("Show version information and exit")
        .flag();
    }

    /**
     * @brief Add a new option (or multiple aliases) to the parser.
     * @param names One or more option names, e.g. "-c", "--city"
     * @return Reference to the newly created argument
     */
    template <typename... NameTs>
      requires(sizeof...(NameTs) >= 1 && (std::convertible_to<NameTs, String> && ...))
    fn addArguments(NameTs&&... names) -> Argument& {
      m_arguments.emplace_back(std::make_unique<Argument>(std::forward<NameTs>(names)...));
      Argument& arg = *m_arguments.back();

      for (const String& name : arg.getNames())
        m_argumentMap[name] = &arg;

      return arg;
    }

    /**
     * @brief Register a subcommand.
     * @param name The command word
     * @param helpText One-line description shown in the help output
     */
    fn addCommand(String name, String helpText) -> ArgumentParser& {
      m_commands.push_back(Command { .name = std::move(name), .helpText = std::move(helpText) });
      return *this;
    }

    fn parseArgs(Span<const char* const> args) -> Result<> {
      Vec<String> stringArgs;
      stringArgs.reserve(args.size());

      for (const char* arg : args)
        stringArgs.emplace_back(arg);

      return parseArgs(stringArgs);
    }

    /**
     * @brief Parse command-line arguments.
     *
     * The first argument that does not start with '-' is taken as the
     * subcommand and must be one of the registered commands.
     *
     * @param args Argument strings, including the program name at index 0
     * @return InvalidArgument for unknown options, unknown commands or missing values
     */
    fn parseArgs(const Vec<String>& args) -> Result<> {
      if (args.empty())
        return {};

      if (m_programName.empty())
        m_programName = args[0];

      for (usize i = 1; i < args.size(); ++i) {
        const String& arg = args[i];

        if (!arg.starts_with('-')) {
          if (m_command)
            return Err(ClimaError(ClimaErrorCode::InvalidArgument, std::format("Unexpected positional argument: {}", arg)));

          if (std::ranges::none_of(m_commands, [&](const Command& command) { return command.name == arg; }))
            return Err(ClimaError(ClimaErrorCode::InvalidArgument, std::format("Unknown command: {}", arg)));

          m_command = arg;
          continue;
        }

        auto iter = m_argumentMap.find(arg);

        if (iter == m_argumentMap.end())
          return Err(ClimaError(ClimaErrorCode::InvalidArgument, std::format("Unknown argument: {}", arg)));

        Argument* argument = iter->second;

        if (argument->isFlag()) {
          argument->markUsed();
          continue;
        }

        if (i + 1 >= args.size())
          return Err(ClimaError(ClimaErrorCode::InvalidArgument, std::format("Argument {} requires a value", arg)));

        if (Result result = argument->setValue(args[++i]); !result)
          return result;
      }

      return {};
    }

    template <typename T = String>
    fn get(StringView name) const -> T {
      if (auto iter = m_argumentMap.find(name); iter != m_argumentMap.end())
        return iter->second->get<T>();

      return T {};
    }

    template <typename EnumType>
    fn getEnum(StringView name) const -> EnumType {
      static_assert(EnumTraits<EnumType>::has_string_conversion, "Enum type not supported. Add a specialization to EnumTraits.");

      if (auto iter = m_argumentMap.find(name); iter != m_argumentMap.end())
        return iter->second->getEnum<EnumType>();

      return EnumTraits<EnumType>::stringToEnum("");
    }

    /**
     * @brief Get an option's value only when it was given on the command line.
     */
    template <typename T = String>
    fn getIfUsed(StringView name) const -> Option<T> {
      if (!isUsed(name))
        return types::None;

      return get<T>(name);
    }

    [[nodiscard]] fn isUsed(StringView name) const -> bool {
      if (auto iter = m_argumentMap.find(name); iter != m_argumentMap.end())
        return iter->second->isUsed();

      return false;
    }

    [[nodiscard]] fn command() const -> const Option<String>& {
      return m_command;
    }

    [[nodiscard]] fn version() const -> const String& {
      return m_version;
    }

    fn printHelp() const -> Unit {
      Println("Usage: {} <command> [options]", m_programName);
      Println();

      if (!m_commands.empty()) {
        Println("Commands:");

        for (const Command& command : m_commands)
          Println("  {:<10} {}", command.name, command.helpText);

        Println();
      }

      Println("Options:");

      for (const auto& arg : m_arguments) {
        std::ostringstream namesStream;

        for (usize i = 0; i < arg->getNames().size(); ++i) {
          if (i > 0)
            namesStream << ", ";

          namesStream << arg->getNames()[i];
        }

        if (!arg->isFlag())
          namesStream << " VALUE";

        Println("  {}", namesStream.str());

        if (!arg->getHelpText().empty())
          Println("    {}", arg->getHelpText());

        if (arg->hasChoices()) {
          std::ostringstream choicesStream;
          const ArgChoices   choices = arg->getChoices();

          for (usize i = 0; i < choices.size(); ++i) {
            if (i > 0)
              choicesStream << ", ";

            choicesStream << ToLower(choices[i]);
          }

          Println("    Available values: {}", choicesStream.str());
        }
      }
    }

   private:
    String                       m_programName;
    String                       m_version;
    Vec<Command>                 m_commands;
    Option<String>               m_command;
    Vec<UniquePointer<Argument>> m_arguments;
    Map<String, Argument*>       m_argumentMap;
  };
} // namespace clima::utils::argparse
