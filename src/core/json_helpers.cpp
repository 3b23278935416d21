/// @file
/// @brief Implementation of the minimal JSON writer.

#include "core/json_helpers.h"

#include <cmath>
#include <cstdio>
#include <sstream>

namespace stylec {

void JsonWriter::separate() {
  if (after_key_) {
    after_key_ = false;
    return;
  }
  if (!has_element_.empty() && has_element_.back()) {
    buffer_ += ',';
  }
}

void JsonWriter::markWritten() {
  if (!has_element_.empty()) has_element_.back() = true;
}

void JsonWriter::open(char bracket) {
  separate();
  buffer_ += bracket;
  has_element_.push_back(false);
}

void JsonWriter::close(char bracket) {
  buffer_ += bracket;
  if (!has_element_.empty()) has_element_.pop_back();
  markWritten();
}

void JsonWriter::beginObject() { open('{'); }
void JsonWriter::endObject() { close('}'); }
void JsonWriter::beginArray() { open('['); }
void JsonWriter::endArray() { close(']'); }

void JsonWriter::key(std::string_view name) {
  separate();
  buffer_ += '"';
  appendEscaped(buffer_, name);
  buffer_ += "\":";
  markWritten();
  after_key_ = true;
}

void JsonWriter::value(std::string_view val) {
  separate();
  buffer_ += '"';
  appendEscaped(buffer_, val);
  buffer_ += '"';
  markWritten();
}

void JsonWriter::value(int val) {
  separate();
  buffer_ += std::to_string(val);
  markWritten();
}

void JsonWriter::value(uint32_t val) {
  separate();
  buffer_ += std::to_string(val);
  markWritten();
}

void JsonWriter::value(double val) {
  separate();
  if (std::isfinite(val)) {
    std::ostringstream oss;
    oss << val;
    buffer_ += oss.str();
  } else {
    buffer_ += "null";
  }
  markWritten();
}

void JsonWriter::value(bool val) {
  separate();
  buffer_ += val ? "true" : "false";
  markWritten();
}

void JsonWriter::valueNull() {
  separate();
  buffer_ += "null";
  markWritten();
}

void JsonWriter::appendEscaped(std::string& out, std::string_view input) {
  for (char chr : input) {
    switch (chr) {
      case '"':  out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      default:
        if (static_cast<unsigned char>(chr) < 0x20) {
          char hex[8];
          std::snprintf(hex, sizeof(hex), "\\u%04x", static_cast<unsigned>(chr));
          out += hex;
        } else {
          out += chr;
        }
        break;
    }
  }
}

}  // namespace stylec
