#pragma once

#include "slotwatch/common/result.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace slotwatch::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Unescape the body of a JSON string literal (\n, \r, \t, \", \\, \/, \uXXXX).
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Skip whitespace starting at pos, returning the first non-whitespace position.
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Find matching bracket/brace for nested JSON structures.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

enum class JsonKind { String, Number, Bool, Null, Object, Array };

struct JsonValue {
  JsonKind kind = JsonKind::Null;
  // Unescaped content for strings, raw text (brackets included) for everything else.
  std::string text;

  [[nodiscard]] bool is_string() const { return kind == JsonKind::String; }
  [[nodiscard]] bool is_null() const { return kind == JsonKind::Null; }
};

/// Top-level members of a JSON object. Nested objects and arrays are kept as raw text.
using JsonFlatMap = std::unordered_map<std::string, JsonValue>;

/// Parse the top level of a JSON object. Fails on anything that is not a well-formed object.
[[nodiscard]] Result<JsonFlatMap> json_parse_flat(const std::string &json);

/// Split a JSON array of objects into individual object strings.
[[nodiscard]] Result<std::vector<std::string>>
json_split_top_level_objects(const std::string &array_json);

} // namespace slotwatch::common
