#include <cstdlib> // EXIT_SUCCESS, EXIT_FAILURE

#include <Clima/Utils/ArgumentParser.hpp>
#include <Clima/Utils/Definitions.hpp>
#include <Clima/Utils/Error.hpp>
#include <Clima/Utils/Logging.hpp>
#include <Clima/Utils/Types.hpp>

#include "Commands/Commands.hpp"
#include "Config/Config.hpp"
#include "Wrappers/Curl.hpp"

using namespace clima::utils::types;
using namespace clima::utils::logging;
using clima::config::Config;
using clima::config::LoadOptions;
using clima::utils::argparse::ArgumentParser;

namespace {
  fn BuildParser() -> ArgumentParser {
    ArgumentParser parser("clima", CLIMA_VERSION);

    parser
      .addCommand("collect", "Fetch the current weather and store it")
      .addCommand("fetch", "Fetch the current weather and print a summary without storing it")
      .addCommand("latest", "Print the most recent stored observations")
      .addCommand("range", "Print stored observations in a time window")
      .addCommand("plot", "Write daily-mean SVG charts")
      .addCommand("serve", "Run the HTTP API");

    parser
      .addArguments("-c", "--config")
      .help("Path to a TOML config file.")
      .defaultValue(String(""));

    parser
      .addArguments("-V", "--verbose")
      .help("Enable verbose logging. Overrides --log-level.")
      .flag();

    parser
      .addArguments("-l", "--log-level")
      .help("Set the minimum log level.")
      .defaultValue(LogLevel::Info);

    parser
      .addArguments("--city")
      .help("City name. Defaults to the configured city.")
      .defaultValue(String(""));

    parser
      .addArguments("--country")
      .help("Two-letter country code. Defaults to the configured country.")
      .defaultValue(String(""));

    parser
      .addArguments("--lat")
      .help("Latitude (fetch only, together with --lon).")
      .defaultValue(0.0);

    parser
      .addArguments("--lon")
      .help("Longitude (fetch only, together with --lat).")
      .defaultValue(0.0);

    parser
      .addArguments("-n", "--limit")
      .help("Number of rows printed by latest.")
      .defaultValue(5);

    parser
      .addArguments("--hours")
      .help("Window ending now, in hours (range, plot).")
      .defaultValue(24);

    parser
      .addArguments("--start")
      .help("Range start, epoch seconds (inclusive).")
      .defaultValue(String(""));

    parser
      .addArguments("--end")
      .help("Range end, epoch seconds (inclusive).")
      .defaultValue(String(""));

    parser
      .addArguments("-p", "--port")
      .help("Port for serve. Defaults to the configured port.")
      .defaultValue(0);

    return parser;
  }

  fn LocationFrom(const ArgumentParser& parser) -> clima::cli::LocationArgs {
    return clima::cli::LocationArgs {
      .city    = parser.getIfUsed<String>("--city"),
      .country = parser.getIfUsed<String>("--country"),
      .lat     = parser.getIfUsed<f64>("--lat"),
      .lon     = parser.getIfUsed<f64>("--lon"),
    };
  }

  fn PortFrom(const ArgumentParser& parser) -> Result<Option<u16>> {
    const Option<i32> port = parser.getIfUsed<i32>("--port");

    if (!port)
      return Option<u16>(None);

    if (*port <= 0 || *port > 65535)
      ERR_FMT(clima::utils::error::ClimaErrorCode::InvalidArgument, "--port must be between 1 and 65535, got {}", *port);

    return Option<u16>(static_cast<u16>(*port));
  }

  fn Dispatch(const String& command, const ArgumentParser& parser, const Config& config) -> Result<> {
    const clima::cli::LocationArgs location = LocationFrom(parser);

    if (command == "collect")
      return clima::cli::RunCollect(config, location);

    if (command == "fetch")
      return clima::cli::RunFetch(config, location);

    if (command == "latest")
      return clima::cli::RunLatest(config, location, parser.get<i32>("--limit"));

    if (command == "range")
      return clima::cli::RunRange(
        config,
        location,
        clima::cli::RangeArgs {
          .hours = parser.get<i32>("--hours"),
          .start = parser.getIfUsed<String>("--start"),
          .end   = parser.getIfUsed<String>("--end"),
        }
      );

    if (command == "plot") {
      const Option<i32> hours = parser.getIfUsed<i32>("--hours");

      return clima::cli::RunPlot(config, location, hours ? Option<i64>(*hours) : None);
    }

    Result<Option<u16>> port = PortFrom(parser);

    if (!port)
      return Err(port.error());

    return clima::cli::RunServe(config, *port);
  }
} // namespace

fn main(const i32 argc, CStr* argv[]) -> i32 try {
  ArgumentParser parser = BuildParser();

  if (Result result = parser.parseArgs({ argv, static_cast<usize>(argc) }); !result) {
    error_at(result.error());
    return EXIT_FAILURE;
  }

  if (parser.get<bool>("--help")) {
    parser.printHelp();
    return EXIT_SUCCESS;
  }

  if (parser.get<bool>("--version")) {
    Println("clima {}", parser.version());
    return EXIT_SUCCESS;
  }

  SetRuntimeLogLevel(
    parser.get<bool>("--verbose")
      ? LogLevel::Debug
      : parser.getEnum<LogLevel>("--log-level")
  );

  if (!parser.command()) {
    parser.printHelp();
    return EXIT_FAILURE;
  }

  LoadOptions options;

  if (Option<String> configPath = parser.getIfUsed<String>("--config"))
    options.configPath = *configPath;

  Result<Config> config = Config::Load(options);

  if (!config) {
    error_at(config.error());
    return EXIT_FAILURE;
  }

  if (Result result = Curl::GlobalInit(); !result) {
    error_at(result.error());
    return EXIT_FAILURE;
  }

  const Result<> result = Dispatch(*parser.command(), parser, *config);

  Curl::GlobalCleanup();

  if (!result) {
    error_at(result.error());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
} catch (const Exception& e) {
  error_at(e);
  return EXIT_FAILURE;
}
