#include "slotwatch/common/json_util.hpp"

#include "slotwatch/common/fs.hpp"

#include <cctype>
#include <cstdint>

namespace slotwatch::common {

namespace {

void append_utf8(std::string &out, std::uint32_t codepoint) {
  if (codepoint < 0x80) {
    out.push_back(static_cast<char>(codepoint));
  } else if (codepoint < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (codepoint >> 6)));
    out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
  } else if (codepoint < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (codepoint >> 12)));
    out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (codepoint >> 18)));
    out.push_back(static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
  }
}

bool parse_hex4(const std::string &raw, std::size_t pos, std::uint32_t &out) {
  if (pos + 4 > raw.size()) {
    return false;
  }
  out = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const char ch = raw[i];
    out <<= 4;
    if (ch >= '0' && ch <= '9') {
      out |= static_cast<std::uint32_t>(ch - '0');
    } else if (ch >= 'a' && ch <= 'f') {
      out |= static_cast<std::uint32_t>(ch - 'a' + 10);
    } else if (ch >= 'A' && ch <= 'F') {
      out |= static_cast<std::uint32_t>(ch - 'A' + 10);
    } else {
      return false;
    }
  }
  return true;
}

// Scalar literal: number, true, false or null. Returns the position after the token.
std::size_t scan_scalar(const std::string &json, std::size_t pos) {
  while (pos < json.size() && json[pos] != ',' && json[pos] != '}' && json[pos] != ']' &&
         std::isspace(static_cast<unsigned char>(json[pos])) == 0) {
    ++pos;
  }
  return pos;
}

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        static constexpr char kHex[] = "0123456789abcdef";
        escaped += "\\u00";
        escaped.push_back(kHex[(ch >> 4) & 0x0F]);
        escaped.push_back(kHex[ch & 0x0F]);
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char next = raw[++i];
    switch (next) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u': {
      std::uint32_t codepoint = 0;
      if (!parse_hex4(raw, i + 1, codepoint)) {
        out.push_back('u');
        break;
      }
      i += 4;
      if (codepoint >= 0xD800 && codepoint <= 0xDBFF && i + 2 < raw.size() &&
          raw.compare(i + 1, 2, "\\u") == 0) {
        std::uint32_t low = 0;
        if (parse_hex4(raw, i + 3, low) && low >= 0xDC00 && low <= 0xDFFF) {
          codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
          i += 6;
        }
      }
      append_utf8(out, codepoint);
      break;
    }
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (!escaped && ch == '"') {
      return i;
    }
    if (!escaped && ch == '\\') {
      escaped = true;
      continue;
    }
    escaped = false;
  }
  return std::string::npos;
}

std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                      const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  bool in_string = false;
  bool escaped = false;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (in_string) {
      if (!escaped && ch == '"') {
        in_string = false;
      } else if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      escaped = false;
      continue;
    }
    if (ch == '"') {
      in_string = true;
      escaped = false;
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      if (depth == 0) {
        return std::string::npos;
      }
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

Result<JsonFlatMap> json_parse_flat(const std::string &input) {
  const std::string json = trim(input);
  if (json.size() < 2 || json.front() != '{' || json.back() != '}') {
    return Result<JsonFlatMap>::failure("expected a JSON object");
  }

  JsonFlatMap result;
  std::size_t pos = json_skip_ws(json, 1);
  if (json[pos] == '}') {
    return Result<JsonFlatMap>::success(std::move(result));
  }

  while (pos < json.size()) {
    pos = json_skip_ws(json, pos);
    if (pos >= json.size() || json[pos] != '"') {
      return Result<JsonFlatMap>::failure("expected key at offset " + std::to_string(pos));
    }
    const auto key_end = json_find_string_end(json, pos);
    if (key_end == std::string::npos) {
      return Result<JsonFlatMap>::failure("unterminated key");
    }
    const std::string key = json_unescape(json.substr(pos + 1, key_end - pos - 1));

    pos = json_skip_ws(json, key_end + 1);
    if (pos >= json.size() || json[pos] != ':') {
      return Result<JsonFlatMap>::failure("expected ':' after key " + key);
    }
    pos = json_skip_ws(json, pos + 1);
    if (pos >= json.size()) {
      return Result<JsonFlatMap>::failure("missing value for key " + key);
    }

    JsonValue value;
    const char lead = json[pos];
    if (lead == '"') {
      const auto val_end = json_find_string_end(json, pos);
      if (val_end == std::string::npos) {
        return Result<JsonFlatMap>::failure("unterminated string for key " + key);
      }
      value.kind = JsonKind::String;
      value.text = json_unescape(json.substr(pos + 1, val_end - pos - 1));
      pos = val_end + 1;
    } else if (lead == '{' || lead == '[') {
      const char close = (lead == '{') ? '}' : ']';
      const auto end = json_find_matching_token(json, pos, lead, close);
      if (end == std::string::npos) {
        return Result<JsonFlatMap>::failure("unbalanced value for key " + key);
      }
      value.kind = (lead == '{') ? JsonKind::Object : JsonKind::Array;
      value.text = json.substr(pos, end - pos + 1);
      pos = end + 1;
    } else {
      const std::size_t end = scan_scalar(json, pos);
      value.text = json.substr(pos, end - pos);
      if (value.text == "null") {
        value.kind = JsonKind::Null;
      } else if (value.text == "true" || value.text == "false") {
        value.kind = JsonKind::Bool;
      } else if (!value.text.empty() &&
                 (lead == '-' || std::isdigit(static_cast<unsigned char>(lead)) != 0)) {
        value.kind = JsonKind::Number;
      } else {
        return Result<JsonFlatMap>::failure("invalid literal for key " + key);
      }
      pos = end;
    }
    result[key] = std::move(value);

    pos = json_skip_ws(json, pos);
    if (pos >= json.size()) {
      break;
    }
    if (json[pos] == ',') {
      ++pos;
      continue;
    }
    if (json[pos] == '}' && pos + 1 == json.size()) {
      return Result<JsonFlatMap>::success(std::move(result));
    }
    return Result<JsonFlatMap>::failure("unexpected character at offset " + std::to_string(pos));
  }

  return Result<JsonFlatMap>::failure("unterminated object");
}

Result<std::vector<std::string>> json_split_top_level_objects(const std::string &input) {
  const std::string array_json = trim(input);
  if (array_json.size() < 2 || array_json.front() != '[' || array_json.back() != ']') {
    return Result<std::vector<std::string>>::failure("expected a JSON array");
  }

  std::vector<std::string> out;
  std::size_t pos = json_skip_ws(array_json, 1);
  const std::size_t last = array_json.size() - 1;
  while (pos < last) {
    if (array_json[pos] != '{') {
      return Result<std::vector<std::string>>::failure("array element at offset " +
                                                       std::to_string(pos) +
                                                       " is not an object");
    }
    const auto end = json_find_matching_token(array_json, pos, '{', '}');
    if (end == std::string::npos || end >= last) {
      return Result<std::vector<std::string>>::failure("unbalanced object in array");
    }
    out.push_back(array_json.substr(pos, end - pos + 1));
    pos = json_skip_ws(array_json, end + 1);
    if (pos < last) {
      if (array_json[pos] != ',') {
        return Result<std::vector<std::string>>::failure("expected ',' at offset " +
                                                         std::to_string(pos));
      }
      pos = json_skip_ws(array_json, pos + 1);
    }
  }
  return Result<std::vector<std::string>>::success(std::move(out));
}

} // namespace slotwatch::common
