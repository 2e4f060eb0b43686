#include <csignal>
#include <cstdint>
#include <cstdio>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

#include "archive/factory.hpp"
#include "core/bench.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

struct CommandLine {
  std::optional<std::string> config_path{};
  std::optional<ammeter_bench::model::device_kind> device{};
  std::optional<std::uint64_t> num_samples{};
  std::optional<double> duration_seconds{};
  std::optional<double> frequency_hz{};
  std::optional<std::string> archive_address{};
  bool no_emulators{false};
  bool verbose{false};
  bool help{false};
};

void print_usage(const char* program) {
  std::cerr << "usage: " << program
            << " [config.yaml] [--device greenlee|entes|circutor] [--samples N] [--duration S] [--frequency HZ]"
               " [--archive PATH|memory|redis://host:port] [--no-emulators] [--verbose]\n";
}

CommandLine parse_command_line(int argc, char** argv) {
  CommandLine cli{};
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    const auto next_value = [&]() -> std::string {
      if (i + 1 >= argc) {
        throw ammeter_bench::core::ConfigError(arg + " requires a value");
      }
      return argv[++i];
    };

    try {
      if (arg == "--help" || arg == "-h") {
        cli.help = true;
      } else if (arg == "--device") {
        cli.device = ammeter_bench::model::parse_device_kind(next_value());
      } else if (arg == "--samples") {
        const auto parsed = std::stoll(next_value());
        if (parsed <= 0) {
          throw ammeter_bench::core::ConfigError("--samples must be greater than 0");
        }
        cli.num_samples = static_cast<std::uint64_t>(parsed);
      } else if (arg == "--duration") {
        cli.duration_seconds = std::stod(next_value());
      } else if (arg == "--frequency") {
        cli.frequency_hz = std::stod(next_value());
      } else if (arg == "--archive") {
        cli.archive_address = next_value();
      } else if (arg == "--no-emulators") {
        cli.no_emulators = true;
      } else if (arg == "--verbose") {
        cli.verbose = true;
      } else if (!arg.empty() && arg.front() != '-' && !cli.config_path.has_value()) {
        cli.config_path = arg;
      } else {
        throw ammeter_bench::core::ConfigError("unknown argument: " + arg);
      }
    } catch (const std::logic_error& ex) {
      throw ammeter_bench::core::ConfigError("invalid value for " + arg + ": " + ex.what());
    }
  }
  return cli;
}

// Command-line sampling fields replace the file's; missing ones are filled from the file until two are known.
void apply_overrides(ammeter_bench::core::BenchConfig& config, const CommandLine& cli) {
  if (cli.device.has_value()) {
    for (auto& [kind, device] : config.devices) {
      device.enabled = kind == *cli.device;
    }
  }
  if (cli.archive_address.has_value()) {
    config.archive.address = *cli.archive_address;
  }

  if (!cli.num_samples.has_value() && !cli.duration_seconds.has_value() && !cli.frequency_hz.has_value()) {
    return;
  }

  ammeter_bench::core::SamplingSpec spec{};
  spec.num_samples = cli.num_samples;
  spec.duration_seconds = cli.duration_seconds;
  spec.frequency_hz = cli.frequency_hz;
  spec.max_consecutive_failures = config.sampling.max_consecutive_failures;

  const auto provided = [&spec]() {
    return static_cast<int>(spec.num_samples.has_value()) +
           static_cast<int>(spec.duration_seconds.has_value() && *spec.duration_seconds != 0.0) +
           static_cast<int>(spec.frequency_hz.has_value());
  };
  if (provided() < 2 && !spec.frequency_hz.has_value()) {
    spec.frequency_hz = config.sampling.frequency_hz;
  }
  if (provided() < 2 && !spec.num_samples.has_value()) {
    spec.num_samples = config.sampling.num_samples;
  }
  config.sampling = ammeter_bench::core::resolve_sampling(spec);
}

std::string format_config_settings(const ammeter_bench::core::BenchConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[bench] loaded config from " << config_path << " | num_samples=" << config.sampling.num_samples
         << " | duration_seconds=" << config.sampling.duration_seconds
         << " | frequency_hz=" << config.sampling.frequency_hz
         << " | max_consecutive_failures=" << config.sampling.max_consecutive_failures
         << " | timeout_ms=" << config.client.timeout.count() << " | max_retries=" << config.client.max_retries
         << " | emulators=" << (config.emulator.enabled ? "true" : "false") << " | devices=";

  bool first = true;
  for (const auto& endpoint : config.enabled_endpoints()) {
    output << (first ? "" : ",") << ammeter_bench::model::to_string(endpoint.kind) << '@' << endpoint.host << ':'
           << endpoint.port;
    first = false;
  }
  output << " | archive=" << config.archive.address;
  return output.str();
}

}  // namespace

int main(int argc, char** argv) {
  using ammeter_bench::core::exit_code;

  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);

  CommandLine cli{};
  ammeter_bench::core::BenchConfig config{};
  std::string config_path = "<defaults>";
  try {
    cli = parse_command_line(argc, argv);
    if (cli.help) {
      print_usage(argv[0]);
      return static_cast<int>(exit_code::SUCCESS);
    }
    if (cli.config_path.has_value()) {
      config_path = *cli.config_path;
      config = ammeter_bench::core::load_bench_config(config_path);
    } else {
      config = ammeter_bench::core::default_bench_config();
    }
    apply_overrides(config, cli);
    if (cli.no_emulators) {
      config.emulator.enabled = false;
    }
  } catch (const ammeter_bench::core::ConfigError& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    print_usage(argv[0]);
    return static_cast<int>(exit_code::INVALID_CONFIG);
  }

  std::cerr << format_config_settings(config, config_path) << '\n';

  std::unique_ptr<ammeter_bench::archive::ResultArchive> archive;
  try {
    archive = ammeter_bench::archive::make_archive(config.archive);
  } catch (const ammeter_bench::core::ConfigError& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return static_cast<int>(exit_code::INVALID_CONFIG);
  } catch (const ammeter_bench::core::ArchiveError& ex) {
    std::cerr << "[archive] unavailable, keeping results in memory: " << ex.what() << '\n';
    ammeter_bench::core::ArchiveSettings fallback = config.archive;
    fallback.address = "memory";
    archive = ammeter_bench::archive::make_archive(fallback);
  }

  ammeter_bench::core::Bench bench{config, std::move(archive),
                                   ammeter_bench::sinks::ConsoleReport{stdout, cli.verbose}};

  if (config.emulator.enabled) {
    try {
      bench.start_emulators();
    } catch (const std::runtime_error& ex) {
      std::cerr << "[bench] failed to start emulators: " << ex.what() << '\n';
      return static_cast<int>(exit_code::CONNECTION_FAILURE);
    }
  }

  const exit_code code = ammeter_bench::core::run_until_shutdown(bench, g_shutdown_requested);
  bench.stop_emulators();

  std::cerr << "[bench] exiting with code " << static_cast<int>(code) << '\n';
  return static_cast<int>(code);
}
