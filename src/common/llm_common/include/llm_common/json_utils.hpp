#pragma once

#include <cstdio>
#include <string>

namespace llm_common
{

/// JSON 문자열 값에 들어갈 특수문자를 이스케이프 처리
inline std::string json_escape(const std::string & value)
{
  std::string out;
  out.reserve(value.size() + 16);
  for (const char c : value) {
    switch (c) {
      case '\"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\b':
        out += "\\b";
        break;
      case '\f':
        out += "\\f";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(c));
          out += buf;
        } else {
          out.push_back(c);
        }
        break;
    }
  }
  return out;
}

namespace detail
{

inline void append_utf8(unsigned int cp, std::string & out)
{
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

inline bool parse_hex4(const std::string & json, size_t pos, unsigned int & out)
{
  if (pos + 4 > json.size()) {
    return false;
  }
  out = 0;
  for (size_t i = pos; i < pos + 4; ++i) {
    const char c = json[i];
    out <<= 4;
    if (c >= '0' && c <= '9') {
      out |= static_cast<unsigned int>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      out |= static_cast<unsigned int>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
      out |= static_cast<unsigned int>(c - 'A' + 10);
    } else {
      return false;
    }
  }
  return true;
}

/// pos 는 여는 따옴표 다음 위치. 닫는 따옴표 다음 위치를 end 에 저장
inline bool read_json_string(const std::string & json, size_t pos, std::string & out, size_t & end)
{
  out.clear();
  for (size_t i = pos; i < json.size(); ++i) {
    const char c = json[i];
    if (c == '"') {
      end = i + 1;
      return true;
    }
    if (c != '\\') {
      out.push_back(c);
      continue;
    }
    if (++i >= json.size()) {
      return false;
    }
    switch (json[i]) {
      case '"':
      case '\\':
      case '/':
        out.push_back(json[i]);
        break;
      case 'b':
        out.push_back('\b');
        break;
      case 'f':
        out.push_back('\f');
        break;
      case 'n':
        out.push_back('\n');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'u': {
          unsigned int cp = 0;
          if (!parse_hex4(json, i + 1, cp)) {
            return false;
          }
          i += 4;
          // surrogate pair
          if (cp >= 0xD800 && cp <= 0xDBFF && i + 6 < json.size() &&
            json[i + 1] == '\\' && json[i + 2] == 'u')
          {
            unsigned int low = 0;
            if (parse_hex4(json, i + 3, low) && low >= 0xDC00 && low <= 0xDFFF) {
              cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
              i += 6;
            }
          }
          append_utf8(cp, out);
          break;
        }
      default:
        return false;
    }
  }
  return false;
}

inline size_t skip_ws(const std::string & json, size_t pos)
{
  while (pos < json.size() &&
    (json[pos] == ' ' || json[pos] == '\t' || json[pos] == '\n' || json[pos] == '\r'))
  {
    ++pos;
  }
  return pos;
}

}  // namespace detail

/// 문자열 전체가 하나의 JSON 객체인지 구조적으로 검사 (괄호 균형, 문자열 종료, 후행 문자)
/// 숫자/리터럴 문법까지 검증하지는 않는다
inline bool is_json_object(const std::string & json)
{
  size_t pos = detail::skip_ws(json, 0);
  if (pos >= json.size() || json[pos] != '{') {
    return false;
  }

  std::string stack;
  for (; pos < json.size(); ++pos) {
    const char c = json[pos];
    if (c == '"') {
      std::string ignored;
      size_t end = 0;
      if (!detail::read_json_string(json, pos + 1, ignored, end)) {
        return false;
      }
      pos = end - 1;
      continue;
    }
    if (c == '{' || c == '[') {
      stack.push_back(c);
      continue;
    }
    if (c == '}' || c == ']') {
      const char open = c == '}' ? '{' : '[';
      if (stack.empty() || stack.back() != open) {
        return false;
      }
      stack.pop_back();
      if (stack.empty()) {
        return detail::skip_ws(json, pos + 1) == json.size();
      }
    }
  }
  return false;
}

/// JSON 객체의 최상위 키 중 field 에 해당하는 문자열 값을 추출 (경량 파서, 외부 라이브러리 불필요)
/// 중첩 객체 안의 같은 이름 키나 문자열 값 안의 "field" 는 무시한다
inline bool extract_json_string_field(
  const std::string & json, const std::string & field, std::string & out)
{
  int depth = 0;
  bool expect_key = false;
  for (size_t i = 0; i < json.size(); ++i) {
    const char c = json[i];
    if (c == '{') {
      ++depth;
      expect_key = depth == 1;
      continue;
    }
    if (c == '[') {
      ++depth;
      continue;
    }
    if (c == '}' || c == ']') {
      --depth;
      continue;
    }
    if (c == ',' && depth == 1) {
      expect_key = true;
      continue;
    }
    if (c != '"') {
      continue;
    }

    std::string token;
    size_t end = 0;
    if (!detail::read_json_string(json, i + 1, token, end)) {
      return false;
    }
    i = end - 1;
    if (!expect_key || depth != 1) {
      continue;
    }
    expect_key = false;

    size_t colon = detail::skip_ws(json, end);
    if (colon >= json.size() || json[colon] != ':') {
      return false;
    }
    if (token != field) {
      i = colon;
      continue;
    }
    const size_t value = detail::skip_ws(json, colon + 1);
    if (value >= json.size() || json[value] != '"') {
      return false;
    }
    size_t value_end = 0;
    std::string decoded;
    if (!detail::read_json_string(json, value + 1, decoded, value_end)) {
      return false;
    }
    out = decoded;
    return true;
  }
  return false;
}

}  // namespace llm_common
