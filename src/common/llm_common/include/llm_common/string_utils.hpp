#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>
#include <vector>

namespace llm_common
{

/// 문자열 전체를 소문자로 변환
inline std::string to_lower(std::string value)
{
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

/// 문자열 양 끝 공백 제거
inline std::string trim(const std::string & value)
{
  size_t start = 0;
  while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start])) != 0) {
    ++start;
  }
  size_t end = value.size();
  while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1])) != 0) {
    --end;
  }
  return value.substr(start, end - start);
}

inline bool starts_with(const std::string & value, const std::string & prefix)
{
  return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

/// 셸 명령용 작은따옴표 이스케이프 (예: "it's" → "'it'\''s'")
inline std::string shell_escape_single_quote(const std::string & value)
{
  std::string out = "'";
  for (char c : value) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out.push_back(c);
    }
  }
  out += "'";
  return out;
}

/// argv 를 로그 출력용 한 줄 명령으로 합침
inline std::string join_command(const std::vector<std::string> & argv)
{
  std::string out;
  for (const auto & arg : argv) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += shell_escape_single_quote(arg);
  }
  return out;
}

/// 선행 "~" 또는 "~/" 를 $HOME 으로 치환
inline std::string expand_user(const std::string & path)
{
  if (path.empty() || path[0] != '~') {
    return path;
  }
  if (path.size() > 1 && path[1] != '/') {
    return path;
  }
  const char * home = std::getenv("HOME");
  if (!home) {
    return path;
  }
  return std::string(home) + path.substr(1);
}

/// 문자열을 구분자로 분할 (빈 항목 제외)
inline std::vector<std::string> split(const std::string & value, char delim)
{
  std::vector<std::string> out;
  size_t start = 0;
  while (start <= value.size()) {
    size_t end = value.find(delim, start);
    if (end == std::string::npos) {
      end = value.size();
    }
    if (end > start) {
      out.push_back(value.substr(start, end - start));
    }
    start = end + 1;
  }
  return out;
}

}  // namespace llm_common
