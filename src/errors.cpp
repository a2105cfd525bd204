#include "blendlink/errors.hpp"

namespace blendlink {

const char* error_kind_name(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::ConnectionFailure:
      return "connection_failure";
    case ErrorKind::ConnectionClosed:
      return "connection_closed";
    case ErrorKind::IncompleteMessage:
      return "incomplete_message";
    case ErrorKind::MalformedResponse:
      return "malformed_response";
  }
  return "unknown";
}

}  // namespace blendlink
