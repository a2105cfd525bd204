#include "blendlink/connection.hpp"

#include <exception>
#include <iostream>
#include <utility>

#include "blendlink/errors.hpp"

namespace blendlink {

ConnectionManager::ConnectionManager(Endpoint endpoint, ChannelFactory factory,
                                     std::chrono::milliseconds connect_timeout,
                                     bool verbose)
    : endpoint_(std::move(endpoint)),
      factory_(std::move(factory)),
      connect_timeout_(connect_timeout),
      verbose_(verbose) {}

ConnectionManager::~ConnectionManager() {
  release();
}

Channel& ConnectionManager::acquire(const HealthProbe& probe) {
  if (channel_ && !channel_->is_open()) {
    release();
  }

  if (channel_ && probe) {
    try {
      probe(*channel_);
      return *channel_;
    } catch (const std::exception& e) {
      if (verbose_) {
        std::cerr << "Existing connection is no longer valid: " << e.what()
                  << "\n";
      }
      release();
    }
  }

  if (!channel_) {
    std::unique_ptr<Channel> channel =
        factory_(endpoint_, connect_timeout_, verbose_);
    if (!channel || !channel->is_open()) {
      throw BridgeError(ErrorKind::ConnectionFailure,
                        "Could not connect to host at " +
                            endpoint_.to_string() +
                            ". Make sure the host add-on is running.");
    }
    channel_ = std::move(channel);
    if (verbose_) {
      std::cout << "Created new persistent connection to "
                << endpoint_.to_string() << "\n";
    }
  }

  return *channel_;
}

void ConnectionManager::release() noexcept {
  if (!channel_) {
    return;
  }

  try {
    channel_->close();
  } catch (const std::exception& e) {
    if (verbose_) {
      std::cerr << "Error disconnecting from host: " << e.what() << "\n";
    }
  }
  channel_.reset();
}

}  // namespace blendlink
