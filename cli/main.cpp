#include <cstdlib>
#include <iostream>
#include <string>

#include <picojson.h>

#include "blendlink/config.hpp"
#include "blendlink/dispatcher.hpp"
#include "blendlink/errors.hpp"
#include "blendlink/report.hpp"

static void print_usage(const char* prog) {
  std::cout
      << "Usage: " << prog
      << " [options] <command> [json-params]\n\n"
         "Sends one command to the host add-on and prints the result.\n\n"
         "Examples:\n"
         "  " << prog << " get_scene_info\n"
         "  " << prog << " get_object_info '{\"name\": \"Cube\"}'\n\n"
         "Options:\n"
         "  -H, --host <host>       Host address (default: localhost,\n"
         "                          env BLENDER_HOST)\n"
         "  -p, --port <port>       Host port (default: 9876, env "
         "BLENDER_PORT)\n"
         "  -t, --timeout <secs>    Response timeout (default: 180)\n"
         "  -v, --verbose           Verbose output\n"
         "  -h, --help              Show this help\n";
}

static void print_text(std::ostream& out, const std::string& text) {
  out << text;
  if (text.empty() || text.back() != '\n') {
    out << "\n";
  }
}

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage(argv[0]);
    return 1;
  }

  auto loaded = blendlink::ConfigManager::load_config();
  if (!loaded) {
    std::cerr << "Invalid configuration in "
              << blendlink::ConfigManager::get_config_path()
              << " or BLENDER_PORT\n";
    return 1;
  }
  blendlink::Config config = *loaded;

  std::string command;
  std::string params_text;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-H" || arg == "--host") {
      if (++i < argc) config.host = argv[i];
    } else if (arg == "-p" || arg == "--port") {
      if (++i < argc) config.port = std::atoi(argv[i]);
    } else if (arg == "-t" || arg == "--timeout") {
      if (++i < argc) config.timeout_seconds = std::atoi(argv[i]);
    } else if (arg == "-v" || arg == "--verbose") {
      config.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      return 0;
    } else if (command.empty()) {
      command = arg;
    } else if (params_text.empty()) {
      params_text = arg;
    } else {
      std::cerr << "Unexpected argument: " << arg << "\n";
      return 1;
    }
  }

  if (command.empty()) {
    print_usage(argv[0]);
    return 1;
  }

  if (config.port < 1 || config.port > 65535) {
    std::cerr << "Port must be 1-65535\n";
    return 1;
  }

  if (config.timeout_seconds <= 0) {
    std::cerr << "Timeout must be a positive number of seconds\n";
    return 1;
  }

  picojson::object params;
  if (!params_text.empty()) {
    picojson::value parsed;
    std::string err = picojson::parse(parsed, params_text);
    if (!err.empty() || !parsed.is<picojson::object>()) {
      std::cerr << "Parameters must be a JSON object\n";
      return 1;
    }
    params = parsed.get<picojson::object>();
  }

  auto dispatcher = blendlink::Dispatcher::from_config(config);
  std::string action = "running " + command;

  int status = 1;
  try {
    blendlink::Response response = dispatcher->send(command, params);
    if (response.is_error()) {
      print_text(std::cerr, blendlink::format_response(action, response));
    } else {
      print_text(std::cout, blendlink::format_response(action, response));
      status = 0;
    }
  } catch (const blendlink::BridgeError& e) {
    print_text(std::cerr, blendlink::format_failure(action, e));
  }

  dispatcher->release();
  return status;
}
