#include "stagehand/app/application.hpp"
#include "stagehand/config/config.hpp"
#include "stagehand/event/event_hub.hpp"
#include "stagehand/event/stream_connection.hpp"
#include "stagehand/util/log.hpp"

#include <unistd.h>

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <thread>

namespace {

std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int) {
  g_shutdown_requested.store(true, std::memory_order_release);
}

void print_usage(const char* prog) {
  std::println("Stagehand - Preview server and permission broker");
  std::println("Usage: {} [OPTIONS]", prog);
  std::println("");
  std::println("Options:");
  std::println("  -c, --config <file>   Config file (YAML)");
  std::println("  --port <port>         API server port (default: 8080)");
  std::println("  --host <host>         API server host (default: 127.0.0.1)");
  std::println("  --db <file>           Request database (default: stagehand.db)");
  std::println("  --log-level <level>   trace, debug, info, warn or error");
  std::println("  --tail <project>      Print the project's event stream to stderr");
  std::println("  -v, --version         Show version and exit");
  std::println("  -h, --help            Show this help message");
  std::println("");
  std::println("Environment:");
  std::println("  PREVIEW_PORT_START, PREVIEW_PORT_END, PORT");
}

void print_version() {
  std::println("Stagehand v0.1.0");
}

struct Options {
  std::string config_file;
  std::optional<std::string> db_file;
  std::optional<std::string> host;
  std::optional<std::uint16_t> port;
  std::optional<std::string> log_level;
  std::string tail_project;
};

auto require_value(int& i, int argc, std::string_view flag) -> void {
  if (++i >= argc) {
    std::println(stderr, "Error: {} requires an argument", flag);
    std::exit(1);
  }
}

auto parse_args(int argc, char* argv[]) -> Options {
  Options opts;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "-v" || arg == "--version") {
      print_version();
      std::exit(0);
    } else if (arg == "-c" || arg == "--config") {
      require_value(i, argc, arg);
      opts.config_file = argv[i];
    } else if (arg == "--port") {
      require_value(i, argc, arg);
      auto port = stagehand::parse_integer(argv[i]);
      if (!port || *port <= 0 || *port > 65535) {
        std::println(stderr, "Error: invalid port: {}", argv[i]);
        std::exit(1);
      }
      opts.port = static_cast<std::uint16_t>(*port);
    } else if (arg == "--host") {
      require_value(i, argc, arg);
      opts.host = argv[i];
    } else if (arg == "--db") {
      require_value(i, argc, arg);
      opts.db_file = argv[i];
    } else if (arg == "--log-level") {
      require_value(i, argc, arg);
      opts.log_level = argv[i];
    } else if (arg == "--tail") {
      require_value(i, argc, arg);
      opts.tail_project = argv[i];
    } else {
      std::println(stderr, "Unknown option: {}", arg);
      print_usage(argv[0]);
      std::exit(1);
    }
  }

  return opts;
}

auto load_config(const Options& opts) -> std::optional<stagehand::Config> {
  stagehand::Config config;
  if (!opts.config_file.empty()) {
    if (!std::filesystem::exists(opts.config_file)) {
      std::println(stderr, "Error: Config file not found: {}",
                   opts.config_file);
      return std::nullopt;
    }
    auto loaded = stagehand::ConfigLoader::load_from_file(opts.config_file);
    if (!loaded) {
      std::println(stderr, "Error: Failed to load config: {}",
                   loaded.error().message());
      return std::nullopt;
    }
    config = std::move(*loaded);
  }

  stagehand::apply_env_overrides(config, stagehand::process_env());

  if (opts.db_file)
    config.storage.db_file = *opts.db_file;
  if (opts.host)
    config.api.host = *opts.host;
  if (opts.port)
    config.api.port = *opts.port;
  if (opts.log_level)
    config.server.log_level = *opts.log_level;
  return config;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto opts = parse_args(argc, argv);

  auto config = load_config(opts);
  if (!config) {
    return 1;
  }

  stagehand::log::set_level(config->server.log_level);
  stagehand::log::start();

  std::signal(SIGPIPE, SIG_IGN);
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  stagehand::Application app(*config);
  if (auto r = app.start(); !r) {
    std::println(stderr, "Error: Failed to start: {}", r.error().message());
    stagehand::log::stop();
    return 1;
  }

  if (!opts.tail_project.empty()) {
    auto id = app.hub().subscribe(
        stagehand::ProjectId{opts.tail_project},
        std::make_unique<stagehand::StreamConnection>(
            STDERR_FILENO, false,
            std::chrono::milliseconds(app.config().stream.write_timeout_ms)),
        "sse");
    if (!id) {
      stagehand::log::warn("Cannot tail {}: {}", opts.tail_project,
                           id.error().message());
    }
  }

  stagehand::log::info("Stagehand running (api {}:{})", app.config().api.host,
                       app.config().api.port);

  while (app.is_running() &&
         !g_shutdown_requested.load(std::memory_order_acquire)) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (g_shutdown_requested.load(std::memory_order_acquire)) {
    stagehand::log::info("Received shutdown signal, stopping...");
  }

  app.stop();
  stagehand::log::info("Stagehand stopped.");
  stagehand::log::stop();
  return 0;
}
