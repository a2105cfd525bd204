#include "blendlink/frame_reader.hpp"

#include <iostream>
#include <vector>

#include "blendlink/errors.hpp"
#include "blendlink/protocol.hpp"

namespace blendlink {

JsonFrameReader::JsonFrameReader(size_t chunk_size, bool verbose)
    : chunk_size_(chunk_size > 0 ? chunk_size : DEFAULT_CHUNK_SIZE),
      verbose_(verbose) {}

std::string JsonFrameReader::read_frame(
    Channel& channel, std::chrono::milliseconds timeout) const {
  using Clock = std::chrono::steady_clock;

  std::string buffer;
  DocumentBoundary boundary;
  std::vector<uint8_t> chunk(chunk_size_);
  auto deadline = Clock::now() + timeout;

  while (true) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - Clock::now());
    if (left.count() <= 0) {
      if (verbose_) {
        std::cerr << "Receive deadline passed (" << buffer.size()
                  << " bytes so far)\n";
      }
      break;
    }

    ReadResult rr = channel.read_some(chunk.data(), chunk.size(), left);

    if (rr.status == ReadStatus::Closed) {
      if (buffer.empty()) {
        throw BridgeError(ErrorKind::ConnectionClosed,
                          "Connection closed by host before receiving any "
                          "data");
      }
      if (verbose_) {
        std::cerr << "Host closed the connection after " << buffer.size()
                  << " bytes\n";
      }
      break;
    }

    if (rr.status == ReadStatus::Timeout) {
      if (verbose_) {
        std::cerr << "Timed out during chunked receive (" << buffer.size()
                  << " bytes so far)\n";
      }
      break;
    }

    const char* bytes = reinterpret_cast<const char*>(chunk.data());
    buffer.append(bytes, rr.bytes);
    boundary.feed(bytes, rr.bytes);

    if (boundary.may_be_complete() && try_decode_document(buffer)) {
      if (verbose_) {
        std::cout << "Received complete response (" << buffer.size()
                  << " bytes)\n";
      }
      return buffer;
    }
  }

  // Timed out, or the host closed mid-message: use what we have if it parses
  if (!buffer.empty() && try_decode_document(buffer)) {
    return buffer;
  }

  if (buffer.empty()) {
    throw BridgeError(ErrorKind::IncompleteMessage,
                      "Timeout waiting for host response - try simplifying "
                      "your request");
  }
  throw BridgeError(ErrorKind::IncompleteMessage,
                    "Incomplete response received from host (" +
                        std::to_string(buffer.size()) + " bytes)");
}

}  // namespace blendlink
