// Minimal JSON serialization writer (no external dependencies).
//
// Builds JSON output via a string-builder approach for the optional events
// dump written next to the MIDI file.

#ifndef STYLEC_CORE_JSON_HELPERS_H
#define STYLEC_CORE_JSON_HELPERS_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace stylec {

/// @brief Simple JSON writer that builds a JSON string incrementally.
///
/// Usage:
/// @code
///   JsonWriter writer;
///   writer.beginObject();
///   writer.key("pitch");
///   writer.value(60);
///   writer.endObject();
///   std::string json = writer.toString();  // {"pitch":60}
/// @endcode
///
/// Commas are inserted automatically. The caller must match begin/end pairs.
class JsonWriter {
 public:
  JsonWriter() = default;

  void beginObject();
  void endObject();
  void beginArray();
  void endArray();

  /// @brief Write an object key (must be followed by a value call).
  void key(std::string_view name);

  /// @brief Write a string value (JSON-escaped).
  void value(std::string_view val);
  void value(const char* val) { value(std::string_view(val)); }
  void value(int val);
  void value(uint32_t val);

  /// @brief Write a floating-point value; NaN and infinity become null.
  void value(double val);
  void value(bool val);
  void valueNull();

  /// @brief Get the accumulated JSON string.
  std::string toString() const { return buffer_; }

 private:
  /// Emit a separating comma if the current container already has an element.
  void separate();

  /// Mark the current container as non-empty.
  void markWritten();

  void open(char bracket);
  void close(char bracket);

  static void appendEscaped(std::string& out, std::string_view input);

  std::string buffer_;
  std::vector<bool> has_element_;  // One entry per open container
  bool after_key_ = false;
};

}  // namespace stylec

#endif  // STYLEC_CORE_JSON_HELPERS_H
