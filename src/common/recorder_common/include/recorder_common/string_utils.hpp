#pragma once

#include <cctype>
#include <string>
#include <vector>

namespace recorder_common
{

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

/// 키워드 중 하나라도 포함되어 있는지 (대소문자 구분)
inline bool contains_any(const std::string & text, const std::vector<std::string> & keywords)
{
  for (const auto & k : keywords) {
    if (!k.empty() && text.find(k) != std::string::npos) {
      return true;
    }
  }
  return false;
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

/// 파일 경로에 그대로 쓸 수 있도록 식별자에서 경로 구분자 등을 치환
inline std::string sanitize_file_component(const std::string & value)
{
  std::string out;
  out.reserve(value.size());
  for (const char c : value) {
    const unsigned char uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc) != 0 || c == '-' || c == '_' || c == '.') {
      out.push_back(c);
    } else {
      out.push_back('_');
    }
  }
  if (out.empty() || out == "." || out == "..") {
    out = "_";
  }
  return out;
}

}  // namespace recorder_common
