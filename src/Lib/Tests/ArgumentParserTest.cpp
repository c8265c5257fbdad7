#include <Clima/Utils/ArgumentParser.hpp>
#include <Clima/Utils/Error.hpp>
#include <Clima/Utils/Logging.hpp>
#include <Clima/Utils/Types.hpp>

#include "gtest/gtest.h"

using namespace testing;
using namespace clima::utils::types;
using clima::utils::argparse::ArgumentParser;
using clima::utils::logging::LogLevel;
using enum clima::utils::error::ClimaErrorCode;

class ArgumentParserTest : public Test {
 protected:
  ArgumentParser m_parser { "clima", "0.1.0" };

  fn SetUp() -> void override {
    m_parser
      .addCommand("latest", "Print the most recent stored observations")
      .addCommand("serve", "Run the HTTP API");

    m_parser.addArguments("-V", "--verbose").flag();
    m_parser.addArguments("-l", "--log-level").defaultValue(LogLevel::Info);
    m_parser.addArguments("--city").defaultValue(String(""));
    m_parser.addArguments("-n", "--limit").defaultValue(5);
    m_parser.addArguments("--lat").defaultValue(0.0);
  }
};

// NOLINTBEGIN(modernize-use-trailing-return-type, cert-err58-cpp)
TEST_F(ArgumentParserTest, Defaults_WhenNothingIsGiven) {
  ASSERT_TRUE(m_parser.parseArgs(Vec<String> { "clima" }).has_value());

  EXPECT_FALSE(m_parser.command().has_value());
  EXPECT_FALSE(m_parser.get<bool>("--verbose"));
  EXPECT_EQ(m_parser.get<i32>("--limit"), 5);
  EXPECT_EQ(m_parser.getEnum<LogLevel>("--log-level"), LogLevel::Info);
  EXPECT_FALSE(m_parser.getIfUsed<String>("--city").has_value());
}

TEST_F(ArgumentParserTest, CommandAndTypedOptions) {
  ASSERT_TRUE(m_parser.parseArgs(Vec<String> { "clima", "latest", "--city", "Rio de Janeiro", "-n", "10", "--lat", "-22.9", "-V" }).has_value());

  EXPECT_EQ(m_parser.command(), "latest");
  EXPECT_EQ(m_parser.getIfUsed<String>("--city"), "Rio de Janeiro");
  EXPECT_EQ(m_parser.get<i32>("--limit"), 10);
  EXPECT_DOUBLE_EQ(m_parser.get<f64>("--lat"), -22.9);
  EXPECT_TRUE(m_parser.get<bool>("-V"));
  EXPECT_TRUE(m_parser.get<bool>("--verbose"));
}

TEST_F(ArgumentParserTest, EnumChoicesAreCaseInsensitive) {
  ASSERT_TRUE(m_parser.parseArgs(Vec<String> { "clima", "--log-level", "debug" }).has_value());

  EXPECT_EQ(m_parser.getEnum<LogLevel>("-l"), LogLevel::Debug);
}

TEST_F(ArgumentParserTest, InvalidChoiceIsInvalidArgument) {
  const Result<> result = m_parser.parseArgs(Vec<String> { "clima", "--log-level", "loud" });

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, InvalidArgument);
}

TEST_F(ArgumentParserTest, NonNumericValueIsInvalidArgument) {
  const Result<> result = m_parser.parseArgs(Vec<String> { "clima", "latest", "--limit", "ten" });

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, InvalidArgument);
}

TEST_F(ArgumentParserTest, UnknownCommandIsInvalidArgument) {
  const Result<> result = m_parser.parseArgs(Vec<String> { "clima", "forecast" });

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, InvalidArgument);
}

TEST_F(ArgumentParserTest, UnknownOptionIsInvalidArgument) {
  const Result<> result = m_parser.parseArgs(Vec<String> { "clima", "latest", "--units", "M" });

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, InvalidArgument);
}

TEST_F(ArgumentParserTest, MissingValueIsInvalidArgument) {
  const Result<> result = m_parser.parseArgs(Vec<String> { "clima", "latest", "--city" });

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, InvalidArgument);
}

TEST_F(ArgumentParserTest, HelpAndVersionAreFlags) {
  ASSERT_TRUE(m_parser.parseArgs(Vec<String> { "clima", "--help", "--version" }).has_value());

  EXPECT_TRUE(m_parser.get<bool>("-h"));
  EXPECT_TRUE(m_parser.get<bool>("--version"));
  EXPECT_EQ(m_parser.version(), "0.1.0");
}
// NOLINTEND(modernize-use-trailing-return-type, cert-err58-cpp)

fn main(i32 argc, char** argv) -> i32 {
  InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
