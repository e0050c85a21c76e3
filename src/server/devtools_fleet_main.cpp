#include "devtools-fleet/Logger.hpp"
#include "devtools-fleet/server/CommandHandlers.hpp"
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace dtfleet;

void print_usage() {
  std::cout << "Usage: devtools-fleet [options] <command> [args]\n\n";
  std::cout << "Instance Commands:\n";
  std::cout << "  start [port] [-- args...]   Start an instance (allocates a "
               "port if none given)\n";
  std::cout << "  stop <port>                 Stop an instance and remove its "
               "route\n";
  std::cout << "  stop-all                    Stop every instance and remove "
               "all routes\n";
  std::cout << "  list                        List tracked instances\n";
  std::cout << "\nHealth:\n";
  std::cout << "  health [port]               Check one port, or discover and "
               "check the fleet\n";
  std::cout << "                              Exit code: 0 healthy, 1 "
               "degraded, 2 unhealthy\n";
  std::cout << "\nProxy:\n";
  std::cout << "  generate-config <port>      Render, validate and activate "
               "the route for a port\n";
  std::cout << "\nOptions:\n";
  std::cout << "  --config <path>      YAML configuration (default: "
               "$DEVTOOLS_FLEET_CONFIG)\n";
  std::cout << "  --log-level <level>  trace|debug|info|warn|error\n";
  std::cout << "  -r, --range <S-E>    Port range for start and health\n";
  std::cout << "  --json               Print the JSON response\n";
  std::cout << "  -h, --help           Show this help\n";
  std::cout << "\nExamples:\n";
  std::cout << "  devtools-fleet start\n";
  std::cout << "  devtools-fleet start 48005 -- --window-size=1280,720\n";
  std::cout << "  devtools-fleet health --range 48000-48100\n";
  std::cout << "  devtools-fleet stop 48005\n";
}

struct CliArgs {
  std::string command;
  std::vector<std::string> positional;
  std::vector<std::string> extra_args;
  json params = json::object();
  bool json_output{false};
  bool help{false};
};

// Global options may appear anywhere before "--".
bool parse_args(int argc, char **argv, CliArgs &args) {
  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "--") {
      for (int j = i + 1; j < argc; j++)
        args.extra_args.push_back(argv[j]);
      break;
    }

    if (arg == "--config" || arg == "--log-level" || arg == "--range" ||
        arg == "-r") {
      if (i + 1 >= argc) {
        std::cerr << "Error: " << arg << " needs a value\n";
        return false;
      }
      std::string value = argv[++i];
      if (arg == "--config")
        args.params["config_path"] = value;
      else if (arg == "--log-level")
        args.params["log_level"] = value;
      else
        args.params["range"] = value;
    } else if (arg == "--json") {
      args.json_output = true;
    } else if (arg == "--help" || arg == "-h" || arg == "help") {
      args.help = true;
    } else if (arg.size() > 1 && arg[0] == '-') {
      std::cerr << "Error: unknown option " << arg << "\n";
      return false;
    } else if (args.command.empty()) {
      args.command = arg;
    } else {
      args.positional.push_back(arg);
    }
  }
  return true;
}

void print_failure(const json &out) {
  std::cerr << "Error";
  if (out.contains("error"))
    std::cerr << " [" << out["error"].get<std::string>() << "]";
  std::cerr << ": " << out.value("message", "unknown failure") << "\n";
  if (out.contains("log_tail")) {
    std::cerr << "--- instance log (last lines) ---\n"
              << out["log_tail"].get<std::string>() << "\n";
  }
}

void print_warnings(const json &out) {
  if (!out.contains("warnings"))
    return;
  for (const auto &warning : out["warnings"]) {
    std::cerr << "Warning: " << warning.get<std::string>() << "\n";
  }
}

void print_checks(const json &checks) {
  for (const auto &check : checks) {
    std::cout << "  [" << check["status"].get<std::string>() << "] "
              << check["name"].get<std::string>() << ": "
              << check["message"].get<std::string>() << "\n";
  }
}

void render_text(const std::string &command, const json &out) {
  if (command == "health") {
    if (out.contains("ports")) {
      for (const auto &port : out["ports"]) {
        std::cout << "Port " << port["port"].get<int>();
        if (port.contains("browser"))
          std::cout << " (" << port["browser"].get<std::string>() << ")";
        std::cout << "\n";
        print_checks(port["checks"]);
      }
      if (!out["fleet_checks"].empty()) {
        std::cout << "Fleet\n";
        print_checks(out["fleet_checks"]);
      }
      std::cout << "Overall: " << out["overall"].get<std::string>() << "\n";
    } else {
      print_failure(out);
    }
    return;
  }

  print_warnings(out);
  if (!out.value("ok", false)) {
    print_failure(out);
    return;
  }

  if (command == "start") {
    // Only the port on stdout so callers can capture it
    std::cout << out["port"].get<int>() << "\n";
  } else if (command == "list") {
    const auto &instances = out["instances"];
    if (instances.empty()) {
      std::cout << "No instances running\n";
      return;
    }
    std::cout << "PORT    PID       STATE\n";
    for (const auto &instance : instances) {
      std::cout << fmt::format("{:<7} {:<9} {}\n", instance["port"].get<int>(),
                               instance["pid"].get<int>(),
                               instance["state"].get<std::string>());
    }
  } else if (command == "generate-config") {
    std::cout << out["route"].get<std::string>() << "\n";
  } else {
    std::cout << out.value("message", "") << "\n";
  }
}

int main(int argc, char **argv) {
  CliArgs args;
  if (!parse_args(argc, argv, args)) {
    print_usage();
    return 1;
  }
  if (args.help) {
    print_usage();
    return 0;
  }
  if (args.command.empty()) {
    print_usage();
    return 1;
  }

  const std::string &command = args.command;
  json &params = args.params;
  json out;
  int rc = 1;

  auto require_port = [&](const char *usage) {
    if (args.positional.size() != 1) {
      std::cerr << "Usage: devtools-fleet " << usage << "\n";
      return false;
    }
    params["port"] = args.positional[0];
    return true;
  };

  if (command == "start") {
    if (args.positional.size() > 1) {
      std::cerr << "Usage: devtools-fleet start [port] [-- args...]\n";
      return 1;
    }
    if (!args.positional.empty())
      params["port"] = args.positional[0];
    params["extra_args"] = args.extra_args;
    rc = server::handle_start(params, out);
  } else if (command == "stop") {
    if (!require_port("stop <port>"))
      return 1;
    rc = server::handle_stop(params, out);
  } else if (command == "stop-all") {
    rc = server::handle_stop_all(params, out);
  } else if (command == "list") {
    rc = server::handle_list(params, out);
  } else if (command == "health") {
    if (args.positional.size() > 1) {
      std::cerr << "Usage: devtools-fleet health [port]\n";
      return 2;
    }
    if (!args.positional.empty())
      params["port"] = args.positional[0];
    rc = server::handle_health(params, out);
  } else if (command == "generate-config") {
    if (!require_port("generate-config <port>"))
      return 1;
    rc = server::handle_generate_config(params, out);
  } else {
    std::cerr << "Unknown command: " << command << "\n\n";
    print_usage();
    return 1;
  }

  if (args.json_output) {
    std::cout << out.dump(2) << "\n";
  } else {
    render_text(command, out);
  }

  FleetLogger::instance().shutdown();
  return rc;
}
