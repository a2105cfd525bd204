#include "blendlink/channel.hpp"

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>

#include "blendlink/errors.hpp"

namespace blendlink {

namespace {

using Clock = std::chrono::steady_clock;

int remaining_ms(Clock::time_point deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                  deadline - Clock::now())
                  .count();
  if (left <= 0) return 0;
  return static_cast<int>(std::min<long long>(left, 0x7fffffff));
}

// Wait for events on fd until deadline. Returns poll()'s result, retrying
// on EINTR.
int wait_for(int fd, short events, Clock::time_point deadline) {
  struct pollfd pfd;
  pfd.fd = fd;
  pfd.events = events;
  pfd.revents = 0;

  while (true) {
    int ret = poll(&pfd, 1, remaining_ms(deadline));
    if (ret < 0 && errno == EINTR) {
      continue;
    }
    return ret;
  }
}

bool set_nonblocking(int fd) {
  int flags = fcntl(fd, F_GETFL, 0);
  if (flags < 0) return false;
  return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

std::string connect_error(const Endpoint& endpoint, const std::string& why) {
  return "Could not connect to host at " + endpoint.to_string() + " (" + why +
         "). Make sure the host add-on is running.";
}

}  // namespace

TcpChannel::TcpChannel(const Endpoint& endpoint,
                       std::chrono::milliseconds connect_timeout, bool verbose)
    : endpoint_(endpoint), verbose_(verbose) {
  struct addrinfo hints;
  memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  struct addrinfo* addrs = nullptr;
  std::string port = std::to_string(endpoint_.port);
  int gai = getaddrinfo(endpoint_.host.c_str(), port.c_str(), &hints, &addrs);
  if (gai != 0) {
    throw BridgeError(ErrorKind::ConnectionFailure,
                      connect_error(endpoint_, gai_strerror(gai)));
  }

  auto deadline = Clock::now() + connect_timeout;
  std::string last_error = "no usable address";

  for (struct addrinfo* ai = addrs; ai != nullptr; ai = ai->ai_next) {
    int fd = socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC,
                    ai->ai_protocol);
    if (fd < 0) {
      last_error = strerror(errno);
      continue;
    }

    if (!set_nonblocking(fd)) {
      last_error = strerror(errno);
      ::close(fd);
      continue;
    }

    int ret = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
    if (ret < 0 && errno == EINPROGRESS) {
      ret = wait_for(fd, POLLOUT, deadline);
      if (ret == 0) {
        last_error = "timed out";
        ::close(fd);
        continue;
      }
      int so_error = 0;
      socklen_t len = sizeof(so_error);
      if (ret < 0 || getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0) {
        last_error = strerror(errno);
        ::close(fd);
        continue;
      }
      if (so_error != 0) {
        last_error = strerror(so_error);
        ::close(fd);
        continue;
      }
    } else if (ret < 0) {
      last_error = strerror(errno);
      ::close(fd);
      continue;
    }

    int one = 1;
    if (setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)) != 0 &&
        verbose_) {
      std::cerr << "TCP_NODELAY not set: " << strerror(errno) << "\n";
    }
    fd_ = fd;
    break;
  }

  freeaddrinfo(addrs);

  if (fd_ < 0) {
    if (verbose_) {
      std::cerr << "Failed to connect to " << endpoint_.to_string() << ": "
                << last_error << "\n";
    }
    throw BridgeError(ErrorKind::ConnectionFailure,
                      connect_error(endpoint_, last_error));
  }

  if (verbose_) {
    std::cout << "Connected to " << endpoint_.to_string() << "\n";
  }
}

TcpChannel::~TcpChannel() {
  close();
}

void TcpChannel::close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
    if (verbose_) {
      std::cout << "Disconnected from " << endpoint_.to_string() << "\n";
    }
  }
}

void TcpChannel::write_all(const std::string& data,
                           std::chrono::milliseconds timeout) {
  if (fd_ < 0) {
    throw BridgeError(ErrorKind::ConnectionFailure,
                      "Not connected to host at " + endpoint_.to_string());
  }

  auto deadline = Clock::now() + timeout;
  size_t offset = 0;

  while (offset < data.size()) {
    ssize_t n = send(fd_, data.data() + offset, data.size() - offset,
                     MSG_NOSIGNAL);
    if (n > 0) {
      offset += static_cast<size_t>(n);
      continue;
    }

    if (n < 0 && errno == EINTR) {
      continue;
    }

    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      int ret = wait_for(fd_, POLLOUT, deadline);
      if (ret == 0) {
        throw BridgeError(ErrorKind::ConnectionFailure,
                          "Timed out sending command to host at " +
                              endpoint_.to_string());
      }
      if (ret < 0) {
        throw BridgeError(ErrorKind::ConnectionFailure,
                          std::string("Connection to host lost: ") +
                              strerror(errno));
      }
      continue;
    }

    throw BridgeError(ErrorKind::ConnectionFailure,
                      std::string("Connection to host lost: ") +
                          strerror(errno));
  }
}

ReadResult TcpChannel::read_some(uint8_t* buf, size_t len,
                                 std::chrono::milliseconds timeout) {
  if (fd_ < 0) {
    return {ReadStatus::Closed, 0};
  }

  auto deadline = Clock::now() + timeout;

  while (true) {
    int ret = wait_for(fd_, POLLIN, deadline);
    if (ret == 0) {
      return {ReadStatus::Timeout, 0};
    }
    if (ret < 0) {
      throw BridgeError(ErrorKind::ConnectionFailure,
                        std::string("Connection to host lost: ") +
                            strerror(errno));
    }

    ssize_t n = recv(fd_, buf, len, 0);
    if (n > 0) {
      return {ReadStatus::Data, static_cast<size_t>(n)};
    }
    if (n == 0) {
      return {ReadStatus::Closed, 0};
    }
    if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
      continue;
    }
    if (errno == ECONNRESET) {
      return {ReadStatus::Closed, 0};
    }
    throw BridgeError(ErrorKind::ConnectionFailure,
                      std::string("Connection to host lost: ") +
                          strerror(errno));
  }
}

std::unique_ptr<Channel> open_tcp_channel(
    const Endpoint& endpoint, std::chrono::milliseconds connect_timeout,
    bool verbose) {
  return std::make_unique<TcpChannel>(endpoint, connect_timeout, verbose);
}

}  // namespace blendlink
