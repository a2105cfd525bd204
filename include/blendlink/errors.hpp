#pragma once

#include <stdexcept>
#include <string>

namespace blendlink {

enum class ErrorKind {
  ConnectionFailure,
  ConnectionClosed,
  IncompleteMessage,
  MalformedResponse,
};

// Short stable name for logs ("connection_failure", ...)
const char* error_kind_name(ErrorKind kind);

// Transport-level failure. what() is a full sentence that can be shown to a
// user as-is.
class BridgeError : public std::runtime_error {
 public:
  BridgeError(ErrorKind kind, const std::string& message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }

 private:
  ErrorKind kind_;
};

}  // namespace blendlink
