#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace blendlink {

constexpr const char* DEFAULT_HOST = "localhost";
constexpr int DEFAULT_PORT = 9876;

struct Endpoint {
  std::string host = DEFAULT_HOST;
  int port = DEFAULT_PORT;

  std::string to_string() const { return host + ":" + std::to_string(port); }
};

enum class ReadStatus { Data, Closed, Timeout };

struct ReadResult {
  ReadStatus status;
  size_t bytes;
};

// A connected duplex byte stream with no message boundaries.
class Channel {
 public:
  virtual ~Channel() = default;

  // Write every byte of data or throw BridgeError(ConnectionFailure).
  virtual void write_all(const std::string& data,
                         std::chrono::milliseconds timeout) = 0;

  // Wait up to timeout for at least one byte and read at most len bytes.
  // An orderly close or a reset by the peer is reported as Closed.
  virtual ReadResult read_some(uint8_t* buf, size_t len,
                               std::chrono::milliseconds timeout) = 0;

  // Best-effort; never throws.
  virtual void close() = 0;
  virtual bool is_open() const = 0;
};

class TcpChannel : public Channel {
 public:
  // Throws BridgeError(ConnectionFailure) if the connection is refused or
  // does not complete within connect_timeout.
  TcpChannel(const Endpoint& endpoint,
             std::chrono::milliseconds connect_timeout, bool verbose = false);
  ~TcpChannel() override;

  TcpChannel(const TcpChannel&) = delete;
  TcpChannel& operator=(const TcpChannel&) = delete;

  void write_all(const std::string& data,
                 std::chrono::milliseconds timeout) override;
  ReadResult read_some(uint8_t* buf, size_t len,
                       std::chrono::milliseconds timeout) override;
  void close() override;
  bool is_open() const override { return fd_ >= 0; }

  const Endpoint& endpoint() const { return endpoint_; }

 private:
  Endpoint endpoint_;
  bool verbose_;
  int fd_ = -1;
};

std::unique_ptr<Channel> open_tcp_channel(
    const Endpoint& endpoint, std::chrono::milliseconds connect_timeout,
    bool verbose);

}  // namespace blendlink
