#include <tabledep/scanners/raw_query_scanner.h>

#include <cctype>
#include <optional>
#include <utility>

namespace tabledep {

namespace {

constexpr auto kIgnoreCase =
    std::regex::ECMAScript | std::regex::icase;

bool IsWordCharacter(char character) {
  return std::isalnum(static_cast<unsigned char>(character)) != 0 ||
         character == '_';
}

// Delimiter of a heredoc opened on `line` (`<<SQL`, `<<-SQL`, `<<~SQL`)
// whose name contains "SQL", or an empty string.
std::string FindSqlHeredocDelimiter(const std::string &line) {
  for (auto position = line.find("<<"); position != std::string::npos;
       position = line.find("<<", position + 1)) {
    auto begin = position + 2;
    if (begin < line.size() && (line[begin] == '-' || line[begin] == '~')) {
      ++begin;
    }
    auto end = begin;
    while (end < line.size() && IsWordCharacter(line[end])) {
      ++end;
    }
    auto delimiter = line.substr(begin, end - begin);
    if (delimiter.find("SQL") != std::string::npos) {
      return delimiter;
    }
  }
  return {};
}

struct OpenHeredoc {
  int start_line = 0;
  std::regex terminator;
  std::string content;
};

} // namespace

RawQueryScanner::RawQueryScanner(ScanTarget target)
    : TargetedScanner(std::move(target)),
      lowered_singular_(ToLowerAscii(target_.singular)) {
  const auto table = EscapeRegex(target_.table);
  const auto singular = EscapeRegex(target_.singular);
  const auto foreign_key = EscapeRegex(target_.foreign_key);

  column_reference_ = std::regex(
      R"re(\b)re" + table + R"re(\.id\b|\b)re" + foreign_key + R"re(\b)re",
      kIgnoreCase);
  table_statement_ = std::regex(
      R"re(\b(?:FROM|UPDATE|INSERT\s+INTO|DELETE\s+FROM)\s+[`"]?)re" + table +
          R"re([`"]?\b)re",
      kIgnoreCase);
  join_ = std::regex(R"re(\bJOIN\s+[`"]?)re" + table +
                         R"re([`"]?\s+ON\s+(\w+)\.(\w+)\s*=\s*)re" + table +
                         R"re(\.(\w+))re",
                     kIgnoreCase);
  query_method_ = std::regex(
      R"re(\.(where|joins|includes|eager_load|preload|references)\b)re",
      kIgnoreCase);
}

// A query-builder call followed by the singular name right after a symbol,
// paren or quote.
bool RawQueryScanner::MentionsInQueryMethod(const std::string &line) const {
  std::smatch match;
  if (!std::regex_search(line, match, query_method_)) {
    return false;
  }
  const auto lowered = ToLowerAscii(line);
  const auto from = static_cast<std::size_t>(match.position(0) +
                                             match.length(0)) + 1;
  for (auto position = lowered.find(lowered_singular_, from);
       position != std::string::npos;
       position = lowered.find(lowered_singular_, position + 1)) {
    const auto opener = lowered[position - 1];
    if (opener == ':' || opener == '(' || opener == '\'' || opener == '"') {
      return true;
    }
  }
  return false;
}

// The singular name inside a `#{...}` interpolation.
bool RawQueryScanner::MentionsInInterpolation(const std::string &line) const {
  const auto lowered = ToLowerAscii(line);
  const auto open = lowered.find("#{");
  if (open == std::string::npos) {
    return false;
  }
  const auto name = lowered.find(lowered_singular_, open + 2);
  if (name == std::string::npos) {
    return false;
  }
  return lowered.find('}', name + lowered_singular_.size()) !=
         std::string::npos;
}

std::vector<Evidence> RawQueryScanner::ScanLine(const std::string &path,
                                                int line_number,
                                                const std::string &line) const {
  std::smatch match;
  if (std::regex_search(line, match, join_)) {
    return {MakeEvidence(path, line_number, match[1].str(), match[2].str(),
                         ReferenceKind::kRawSqlJoin, line,
                         Confidence::kMedium)};
  }
  if (Contains(line, table_statement_)) {
    return {MakeEvidence(path, line_number, target_.table, "",
                         ReferenceKind::kRawSqlTableReference, line,
                         Confidence::kHigh)};
  }
  if (Contains(line, column_reference_)) {
    return {MakeEvidence(path, line_number, target_.table,
                         target_.foreign_key,
                         ReferenceKind::kRawSqlColumnReference, line,
                         Confidence::kHigh)};
  }
  if (MentionsInQueryMethod(line)) {
    return {MakeEvidence(path, line_number, target_.table, "",
                         ReferenceKind::kRawSqlQueryMethod, line,
                         Confidence::kMedium)};
  }
  if (MentionsInInterpolation(line)) {
    return {MakeEvidence(path, line_number, target_.table, "",
                         ReferenceKind::kRawSqlInterpolation, line,
                         Confidence::kLow)};
  }
  return {};
}

std::vector<Evidence>
RawQueryScanner::ScanBlock(const std::string &path, int start_line,
                           const std::string &block) const {
  std::vector<Evidence> evidence;
  std::smatch match;
  if (std::regex_search(block, match, join_)) {
    evidence.push_back(MakeEvidence(path, start_line, match[1].str(),
                                    match[2].str(),
                                    ReferenceKind::kRawSqlJoin, block,
                                    Confidence::kMedium));
  }
  if (Contains(block, table_statement_)) {
    evidence.push_back(MakeEvidence(path, start_line, target_.table, "",
                                    ReferenceKind::kRawSqlTableReference,
                                    block, Confidence::kHigh));
  }
  if (Contains(block, column_reference_)) {
    evidence.push_back(MakeEvidence(path, start_line, target_.table,
                                    target_.foreign_key,
                                    ReferenceKind::kRawSqlColumnReference,
                                    block, Confidence::kHigh));
  }
  return evidence;
}

std::vector<Evidence>
RawQueryScanner::ScanFile(const std::string &path,
                          const std::vector<std::string> &lines,
                          FileCategory) const {
  std::vector<Evidence> evidence;
  std::optional<OpenHeredoc> heredoc;

  const auto append = [&evidence](std::vector<Evidence> found) {
    for (auto &item : found) {
      evidence.push_back(std::move(item));
    }
  };

  for (std::size_t i = 0; i < lines.size(); ++i) {
    const auto &line = lines[i];
    const auto line_number = static_cast<int>(i + 1);

    if (!heredoc) {
      const auto delimiter = FindSqlHeredocDelimiter(line);
      if (!delimiter.empty()) {
        heredoc = OpenHeredoc{
            line_number,
            std::regex(R"re(^\s*)re" + EscapeRegex(delimiter) +
                       R"re(\s*$)re"),
            line};
        continue;
      }
    }

    if (heredoc) {
      heredoc->content.append("\n").append(line);
      if (std::regex_match(line, heredoc->terminator)) {
        append(ScanBlock(path, heredoc->start_line, heredoc->content));
        heredoc.reset();
      }
      continue;
    }

    append(ScanLine(path, line_number, line));
  }

  // An unterminated heredoc still holds SQL worth reporting.
  if (heredoc) {
    append(ScanBlock(path, heredoc->start_line, heredoc->content));
  }
  return evidence;
}

} // namespace tabledep
