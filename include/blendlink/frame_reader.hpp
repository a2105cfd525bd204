#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include "channel.hpp"

namespace blendlink {

constexpr size_t DEFAULT_CHUNK_SIZE = 8192;

// Extracts one complete message from a channel.
class FrameReader {
 public:
  virtual ~FrameReader() = default;

  // Block until one whole message has arrived or timeout elapses. Throws
  // BridgeError (ConnectionClosed, IncompleteMessage, ConnectionFailure).
  virtual std::string read_frame(Channel& channel,
                                 std::chrono::milliseconds timeout) const = 0;
};

// The host sends bare JSON with no length prefix or delimiter, so the only
// way to find the end of a message is to try decoding what has arrived.
// A buffer with anything but whitespace after the document does not count as
// a complete message. Reading stops at the deadline even while bytes keep
// arriving.
class JsonFrameReader : public FrameReader {
 public:
  explicit JsonFrameReader(size_t chunk_size = DEFAULT_CHUNK_SIZE,
                           bool verbose = false);

  std::string read_frame(Channel& channel,
                         std::chrono::milliseconds timeout) const override;

  size_t chunk_size() const { return chunk_size_; }

 private:
  size_t chunk_size_;
  bool verbose_;
};

}  // namespace blendlink
