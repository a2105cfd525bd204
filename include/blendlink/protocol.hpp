#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include <picojson.h>

namespace blendlink {

constexpr const char* STATUS_SUCCESS = "success";
constexpr const char* STATUS_ERROR = "error";

struct Command {
  std::string type;
  picojson::object params;
};

struct Response {
  std::string raw;
  std::string status;
  std::optional<picojson::value> result;
  std::string message;

  bool is_success() const { return status == STATUS_SUCCESS; }
  bool is_error() const { return status == STATUS_ERROR; }
};

// Serialize a command as {"params":{...},"type":"..."}
std::string encode_command(const Command& command);

// Parse one complete JSON document. Returns nullopt if the text is not (yet)
// a complete document, or if anything but whitespace follows it.
std::optional<picojson::value> try_decode_document(const std::string& text);

// False when the last non-whitespace byte cannot end a JSON text, so a decode
// attempt would certainly fail.
bool may_end_document(const std::string& text);

// Follows string and bracket nesting across chunks, so a decode is only
// attempted once the top-level value may have closed. Never reports a
// complete document as incomplete.
class DocumentBoundary {
 public:
  void feed(const char* data, size_t len);

  // False while inside a string or an open object/array, or when the last
  // non-whitespace byte cannot end a JSON text.
  bool may_be_complete() const;

  int depth() const { return depth_; }

 private:
  int depth_ = 0;
  bool in_string_ = false;
  bool escape_ = false;
  char last_ = 0;
};

// Build a Response from a decoded document. Returns nullopt if the document
// is not an object with a string "status".
std::optional<Response> decode_response(const std::string& text);

}  // namespace blendlink
