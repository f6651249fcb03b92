#include <tabledep/escaping.h>

#include <unordered_map>

namespace tabledep {

std::string EscapeCsvField(const std::string &value) {
  if (value.find_first_of(",\"\r\n") == std::string::npos) {
    return value;
  }
  std::string escaped;
  escaped.reserve(value.size() + 2);
  escaped.push_back('"');
  for (const auto character : value) {
    if (character == '"') {
      escaped.push_back('"');
    }
    escaped.push_back(character);
  }
  escaped.push_back('"');
  return escaped;
}

std::string EscapeJsonString(const std::string &value) {
  static const std::unordered_map<char, std::string> replacements{
      {'"', "\\\""},
      {'\\', "\\\\"},
      {'\n', "\\n"},
      {'\r', "\\r"},
      {'\t', "\\t"}};

  std::string escaped;
  escaped.reserve(value.size());
  for (const auto character : value) {
    const auto replacement = replacements.find(character);
    if (replacement != replacements.end()) {
      escaped.append(replacement->second);
    } else {
      escaped.push_back(character);
    }
  }
  return escaped;
}

std::string EscapeMarkdownCell(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size());
  for (const auto character : value) {
    if (character == '|') {
      escaped.append("\\|");
      continue;
    }
    if (character == '\n' || character == '\r') {
      escaped.push_back(' ');
      continue;
    }
    escaped.push_back(character);
  }
  return escaped;
}

} // namespace tabledep
