#include "taskwarden/cli/commands.hpp"

#include <charconv>
#include <cstdlib>
#include <print>
#include <string>
#include <string_view>

namespace {

void print_usage(const char* prog) {
  std::println("taskwarden - multi-tenant background task scheduler");
  std::println("Usage: {} <command> [OPTIONS]", prog);
  std::println("");
  std::println("Commands:");
  std::println("  serve      Run the scheduler until SIGINT/SIGTERM");
  std::println("  status     Show storage endpoints and per-owner task state");
  std::println("  validate   Check a config file");
  std::println("");
  std::println("Options:");
  std::println("  -c, --config <file>   Config file (YAML, required)");
  std::println("  --log-file <file>     serve: log to file instead of stdout");
  std::println("  -d, --daemon          serve: run in the background");
  std::println("  -o, --owner <id>      status: show tasks for one owner");
  std::println("  -n, --limit <n>       status: recent tasks to list "
               "(default: 20)");
  std::println("  -p, --print           validate: print the effective config");
  std::println("  -v, --version         Show version and exit");
  std::println("  -h, --help            Show this help message");
  std::println("");
  std::println("Examples:");
  std::println("  {} serve -c taskwarden.yaml", prog);
  std::println("  {} status -c taskwarden.yaml --owner 7", prog);
}

void print_version() {
  std::println("taskwarden v0.1.0");
}

struct Options {
  std::string command;
  std::string config_file;
  std::string log_file;
  std::string owner;
  std::string limit;
  bool daemon = false;
  bool print = false;
};

auto require_value(int& i, int argc, char* argv[], std::string_view flag)
    -> std::string {
  if (++i >= argc) {
    std::println(stderr, "Error: {} requires an argument", flag);
    std::exit(1);
  }
  return argv[i];
}

template <typename T>
auto parse_number(const std::string& text, std::string_view flag) -> T {
  T value{};
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(),
                                   value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    std::println(stderr, "Error: {} expects a number, got '{}'", flag, text);
    std::exit(1);
  }
  return value;
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
      opts.config_file = require_value(i, argc, argv, "--config");
    } else if (arg == "--log-file") {
      opts.log_file = require_value(i, argc, argv, "--log-file");
    } else if (arg == "-d" || arg == "--daemon") {
      opts.daemon = true;
    } else if (arg == "-o" || arg == "--owner") {
      opts.owner = require_value(i, argc, argv, "--owner");
    } else if (arg == "-n" || arg == "--limit") {
      opts.limit = require_value(i, argc, argv, "--limit");
    } else if (arg == "-p" || arg == "--print") {
      opts.print = true;
    } else if (opts.command.empty() && !arg.starts_with('-')) {
      opts.command = arg;
    } else {
      std::println(stderr, "Unknown option: {}", arg);
      print_usage(argv[0]);
      std::exit(1);
    }
  }

  return opts;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto opts = parse_args(argc, argv);

  if (opts.command.empty()) {
    print_usage(argv[0]);
    return 1;
  }
  if (opts.config_file.empty()) {
    std::println(stderr, "Error: {} requires -c <file>", opts.command);
    return 1;
  }

  using namespace taskwarden::cli;

  if (opts.command == "serve") {
    ServeOptions serve{.config_file = opts.config_file,
                       .daemon = opts.daemon};
    if (!opts.log_file.empty()) {
      serve.log_file = opts.log_file;
    }
    return cmd_serve(serve);
  }
  if (opts.command == "status") {
    StatusOptions status{.config_file = opts.config_file};
    if (!opts.owner.empty()) {
      status.owner_id = parse_number<std::int64_t>(opts.owner, "--owner");
    }
    if (!opts.limit.empty()) {
      status.limit = parse_number<std::size_t>(opts.limit, "--limit");
    }
    return cmd_status(status);
  }
  if (opts.command == "validate") {
    return cmd_validate(ValidateOptions{.config_file = opts.config_file,
                                        .print = opts.print});
  }

  std::println(stderr, "Unknown command: {}", opts.command);
  print_usage(argv[0]);
  return 1;
}
