#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace lanlink::util {

void append_double(std::string& out, double v);
void append_uint(std::string& out, uint64_t v);
void append_int(std::string& out, int64_t v);
// JSON string body escaping (no surrounding quotes).
void append_json_escaped(std::string& out, std::string_view sv);

// Streaming writer; commas and key/value separators are handled here.
class JsonWriter {
public:
  JsonWriter& begin_object();
  JsonWriter& end_object();
  JsonWriter& begin_array();
  JsonWriter& end_array();
  JsonWriter& key(std::string_view k);

  JsonWriter& value(std::string_view s);
  JsonWriter& value(const char* s) { return value(std::string_view(s)); }
  JsonWriter& value(const std::string& s) { return value(std::string_view(s)); }
  JsonWriter& value(bool b);
  JsonWriter& value(int v) { return value(static_cast<int64_t>(v)); }
  JsonWriter& value(int64_t v);
  JsonWriter& value(uint64_t v);
  JsonWriter& value(double v);
  JsonWriter& null();

  [[nodiscard]] const std::string& str() const { return out_; }
  [[nodiscard]] std::string take() { return std::move(out_); }

private:
  void before_value();

  std::string out_;
  std::vector<bool> first_;  // per open container: no element written yet
  bool after_key_{false};
};

} // namespace lanlink::util
