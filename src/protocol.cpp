#include "blendlink/protocol.hpp"

#include <cctype>

namespace blendlink {

namespace {

bool is_json_space(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

// Closing brace/bracket, end of a string, a number, or true/false/null
bool may_end_value(char c) {
  return c == '}' || c == ']' || c == '"' || c == 'e' || c == 'l' ||
         std::isdigit(static_cast<unsigned char>(c));
}

}  // namespace

std::string encode_command(const Command& command) {
  picojson::object doc;
  doc["type"] = picojson::value(command.type);
  doc["params"] = picojson::value(command.params);
  return picojson::value(doc).serialize();
}

bool may_end_document(const std::string& text) {
  size_t end = text.size();
  while (end > 0 && is_json_space(text[end - 1])) {
    --end;
  }
  if (end == 0) {
    return false;
  }

  return may_end_value(text[end - 1]);
}

std::optional<picojson::value> try_decode_document(const std::string& text) {
  if (!may_end_document(text)) {
    return std::nullopt;
  }

  picojson::value doc;
  std::string err;
  auto end = picojson::parse(doc, text.begin(), text.end(), &err);
  if (!err.empty()) {
    return std::nullopt;
  }
  for (; end != text.end(); ++end) {
    if (!is_json_space(*end)) {
      return std::nullopt;
    }
  }
  return doc;
}

void DocumentBoundary::feed(const char* data, size_t len) {
  for (size_t i = 0; i < len; ++i) {
    char c = data[i];
    if (in_string_) {
      if (escape_) {
        escape_ = false;
      } else if (c == '\\') {
        escape_ = true;
      } else if (c == '"') {
        in_string_ = false;
      }
      last_ = c;
      continue;
    }

    if (is_json_space(c)) {
      continue;
    }
    if (c == '"') {
      in_string_ = true;
    } else if (c == '{' || c == '[') {
      ++depth_;
    } else if (c == '}' || c == ']') {
      --depth_;
    }
    last_ = c;
  }
}

bool DocumentBoundary::may_be_complete() const {
  return !in_string_ && depth_ <= 0 && last_ != 0 && may_end_value(last_);
}

std::optional<Response> decode_response(const std::string& text) {
  auto doc = try_decode_document(text);
  if (!doc || !doc->is<picojson::object>()) {
    return std::nullopt;
  }

  const auto& obj = doc->get<picojson::object>();
  auto status = obj.find("status");
  if (status == obj.end() || !status->second.is<std::string>()) {
    return std::nullopt;
  }

  Response response;
  response.raw = text;
  response.status = status->second.get<std::string>();

  auto result = obj.find("result");
  if (result != obj.end()) {
    response.result = result->second;
  }

  auto message = obj.find("message");
  if (message != obj.end() && message->second.is<std::string>()) {
    response.message = message->second.get<std::string>();
  }

  return response;
}

}  // namespace blendlink
