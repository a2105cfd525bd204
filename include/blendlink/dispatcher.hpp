#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include "config.hpp"
#include "connection.hpp"
#include "frame_reader.hpp"
#include "protocol.hpp"

namespace blendlink {

struct DispatchOptions {
  std::chrono::milliseconds timeout = DEFAULT_TIMEOUT;
  std::string health_check_command = DEFAULT_HEALTH_CHECK_COMMAND;
  bool verbose = false;
};

// Sends one command at a time to the host and waits for its response.
//
// All calls are serialized under one lock, so there is never more than one
// request in flight on the connection. Any transport failure drops the
// connection; the next send() reconnects. A timeout means the outcome on the
// host side is unknown. Nothing is retried here.
class Dispatcher {
 public:
  Dispatcher(std::unique_ptr<ConnectionManager> connections,
             std::unique_ptr<FrameReader> reader, DispatchOptions options);

  // TCP connection and JSON framing configured from config.
  static std::unique_ptr<Dispatcher> from_config(const Config& config);

  Dispatcher(const Dispatcher&) = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;

  // Returns the host's response as-is, including status "error" responses.
  // Throws BridgeError for transport and framing failures.
  Response send(const std::string& command_type,
                const picojson::object& params = picojson::object());

  // Drop the connection (shutdown, or forcing a fresh one).
  void release();

  bool is_connected() const;
  const DispatchOptions& options() const { return options_; }

 private:
  // One write + read cycle on an already acquired channel. Caller holds
  // mutex_ and is responsible for dropping the channel on failure.
  Response exchange(Channel& channel, const Command& command);

  mutable std::mutex mutex_;
  std::unique_ptr<ConnectionManager> connections_;
  std::unique_ptr<FrameReader> reader_;
  DispatchOptions options_;
};

}  // namespace blendlink
