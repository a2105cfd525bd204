#pragma once

#include <chrono>
#include <functional>
#include <memory>

#include "channel.hpp"

namespace blendlink {

constexpr std::chrono::milliseconds DEFAULT_CONNECT_TIMEOUT{5000};

using ChannelFactory = std::function<std::unique_ptr<Channel>(
    const Endpoint&, std::chrono::milliseconds, bool)>;

// Run against a cached channel before reuse; throws if the channel is dead.
using HealthProbe = std::function<void(Channel&)>;

// Owns the single channel to the host. Not thread-safe on its own: the
// Dispatcher holding it serializes every call under its lock.
class ConnectionManager {
 public:
  explicit ConnectionManager(
      Endpoint endpoint, ChannelFactory factory = open_tcp_channel,
      std::chrono::milliseconds connect_timeout = DEFAULT_CONNECT_TIMEOUT,
      bool verbose = false);
  ~ConnectionManager();

  ConnectionManager(const ConnectionManager&) = delete;
  ConnectionManager& operator=(const ConnectionManager&) = delete;

  // Return an open channel. A cached channel is reused only if probe
  // succeeds on it; otherwise it is dropped and a new one is opened. Throws
  // BridgeError(ConnectionFailure) if opening fails.
  Channel& acquire(const HealthProbe& probe = nullptr);

  // Close and forget the cached channel. Never throws.
  void release() noexcept;

  bool is_connected() const { return channel_ != nullptr; }
  const Endpoint& endpoint() const { return endpoint_; }

 private:
  Endpoint endpoint_;
  ChannelFactory factory_;
  std::chrono::milliseconds connect_timeout_;
  bool verbose_;
  std::unique_ptr<Channel> channel_;
};

}  // namespace blendlink
