#include "blendlink/dispatcher.hpp"

#include <iostream>
#include <utility>

#include "blendlink/errors.hpp"

namespace blendlink {

Dispatcher::Dispatcher(std::unique_ptr<ConnectionManager> connections,
                       std::unique_ptr<FrameReader> reader,
                       DispatchOptions options)
    : connections_(std::move(connections)),
      reader_(std::move(reader)),
      options_(std::move(options)) {}

std::unique_ptr<Dispatcher> Dispatcher::from_config(const Config& config) {
  Endpoint endpoint;
  endpoint.host = config.host;
  endpoint.port = config.port;

  DispatchOptions options;
  options.timeout = std::chrono::seconds(config.timeout_seconds);
  options.health_check_command = config.health_check_command;
  options.verbose = config.verbose;

  auto connections = std::make_unique<ConnectionManager>(
      endpoint, open_tcp_channel, DEFAULT_CONNECT_TIMEOUT, config.verbose);
  auto reader =
      std::make_unique<JsonFrameReader>(config.chunk_size, config.verbose);

  return std::make_unique<Dispatcher>(std::move(connections), std::move(reader),
                                      options);
}

Response Dispatcher::send(const std::string& command_type,
                          const picojson::object& params) {
  std::lock_guard<std::mutex> lock(mutex_);

  Command command{command_type, params};

  HealthProbe probe;
  if (!options_.health_check_command.empty()) {
    probe = [this](Channel& channel) {
      exchange(channel, Command{options_.health_check_command, {}});
    };
  }

  Channel& channel = connections_->acquire(probe);

  try {
    return exchange(channel, command);
  } catch (const BridgeError& e) {
    if (options_.verbose) {
      std::cerr << "Command " << command_type << " failed ("
                << error_kind_name(e.kind()) << "): " << e.what() << "\n";
    }
    connections_->release();
    throw;
  }
}

Response Dispatcher::exchange(Channel& channel, const Command& command) {
  std::string request = encode_command(command);

  if (options_.verbose) {
    std::cout << "Sending: " << command.type << " ("
              << request.size() << " bytes)\n";
  }

  channel.write_all(request, options_.timeout);

  std::string data = reader_->read_frame(channel, options_.timeout);

  if (options_.verbose) {
    std::cout << "Received " << data.size() << " bytes\n";
  }

  auto response = decode_response(data);
  if (!response) {
    if (options_.verbose) {
      std::cerr << "Raw response (first 200 bytes): " << data.substr(0, 200)
                << "\n";
    }
    throw BridgeError(ErrorKind::MalformedResponse,
                      "Invalid response from host: expected a JSON object "
                      "with a \"status\" field");
  }

  if (options_.verbose) {
    std::cout << "Response parsed, status: " << response->status << "\n";
  }

  return *response;
}

void Dispatcher::release() {
  std::lock_guard<std::mutex> lock(mutex_);
  connections_->release();
}

bool Dispatcher::is_connected() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connections_->is_connected();
}

}  // namespace blendlink
