#include <tabledep/scanners/scanner_support.h>

#include <tabledep/interfaces.h>

#include <cctype>
#include <iterator>
#include <utility>

namespace tabledep {

std::string EscapeRegex(const std::string &value) {
  static const std::string kSpecial = R"(\^$.|?*+()[]{})";
  std::string escaped;
  escaped.reserve(value.size() * 2);
  for (const auto character : value) {
    if (kSpecial.find(character) != std::string::npos) {
      escaped.push_back('\\');
    }
    escaped.push_back(character);
  }
  return escaped;
}

std::string Trim(const std::string &value) {
  std::size_t begin = 0;
  std::size_t end = value.size();
  while (begin < end &&
         std::isspace(static_cast<unsigned char>(value[begin])) != 0) {
    ++begin;
  }
  while (end > begin &&
         std::isspace(static_cast<unsigned char>(value[end - 1])) != 0) {
    --end;
  }
  return value.substr(begin, end - begin);
}

std::string MakeSnippet(const std::string &text) {
  return Trim(text).substr(0, kMaxSnippetLength);
}

Evidence MakeEvidence(const std::string &path, int line_number,
                      std::string table, std::string column,
                      ReferenceKind kind, const std::string &line,
                      Confidence confidence) {
  Evidence evidence;
  evidence.file_path = path;
  evidence.line_number = line_number;
  evidence.table_name = std::move(table);
  evidence.column_name = std::move(column);
  evidence.kind = kind;
  evidence.snippet = MakeSnippet(line);
  evidence.confidence = confidence;
  return evidence;
}

std::string SearchGroup(const std::string &text, const std::regex &pattern,
                        std::size_t group) {
  std::smatch match;
  if (!std::regex_search(text, match, pattern) || group >= match.size()) {
    return {};
  }
  return match[group].str();
}

bool Contains(const std::string &text, const std::regex &pattern) {
  return std::regex_search(text, pattern);
}

std::string ToLowerAscii(const std::string &value) {
  std::string lowered;
  lowered.reserve(value.size());
  for (const auto character : value) {
    lowered.push_back(static_cast<char>(
        std::tolower(static_cast<unsigned char>(character))));
  }
  return lowered;
}

std::size_t FindWordStart(const std::string &text, const std::string &needle,
                          std::size_t from) {
  if (needle.empty()) {
    return std::string::npos;
  }
  for (auto position = text.find(needle, from); position != std::string::npos;
       position = text.find(needle, position + 1)) {
    if (position == 0) {
      return position;
    }
    const auto previous = static_cast<unsigned char>(text[position - 1]);
    if (std::isalnum(previous) == 0 && previous != '_') {
      return position;
    }
  }
  return std::string::npos;
}

std::vector<Evidence> Scanner::ScanAll(const CategorizedFiles &files,
                                       const LoadedSources &sources) const {
  std::vector<Evidence> evidence;
  for (const auto category : Categories()) {
    const auto paths = files.find(category);
    if (paths == files.end()) {
      continue;
    }
    for (const auto &path : paths->second) {
      const auto *lines = sources.Find(path);
      if (lines == nullptr) {
        continue;
      }
      auto found = ScanFile(path, *lines, category);
      evidence.insert(evidence.end(), std::make_move_iterator(found.begin()),
                      std::make_move_iterator(found.end()));
    }
  }
  return evidence;
}

} // namespace tabledep
