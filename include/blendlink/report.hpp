#pragma once

#include <string>

#include "errors.hpp"
#include "protocol.hpp"

namespace blendlink {

// Success: the result, pretty-printed. Error status:
// "Error <action>: <message>".
std::string format_response(const std::string& action,
                            const Response& response);

std::string format_failure(const std::string& action, const BridgeError& error);

}  // namespace blendlink
