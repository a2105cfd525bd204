#include "blendlink/report.hpp"

namespace blendlink {

std::string format_response(const std::string& action,
                            const Response& response) {
  if (response.is_error()) {
    std::string message =
        response.message.empty() ? "Unknown error" : response.message;
    return "Error " + action + ": " + message;
  }

  if (response.result) {
    return response.result->serialize(true);
  }

  // No result field; show whatever the host sent
  picojson::value doc;
  if (picojson::parse(doc, response.raw).empty()) {
    return doc.serialize(true);
  }
  return response.raw;
}

std::string format_failure(const std::string& action, const BridgeError& error) {
  return "Error " + action + ": " + error.what();
}

}  // namespace blendlink
