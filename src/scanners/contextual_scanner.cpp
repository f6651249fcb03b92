#include <tabledep/scanners/contextual_scanner.h>

#include <utility>

namespace tabledep {

namespace {

constexpr auto kIgnoreCase = std::regex::ECMAScript | std::regex::icase;

} // namespace

ContextualScanner::ContextualScanner(ScanTarget target)
    : TargetedScanner(std::move(target)),
      lowered_singular_(ToLowerAscii(target_.singular)) {
  const auto singular = EscapeRegex(target_.singular);
  identifier_ = std::regex(R"re(\b)re" + singular, kIgnoreCase);
  query_keyword_ = std::regex(
      R"re(\b(query|execute|select|where|find_by|pluck|update_all|delete_all|sql|connection)\b)re",
      kIgnoreCase);
  schema_keyword_ = std::regex(
      R"re(\b(table|column|foreign[_ ]?key|fk|migration|schema|index)\b)re",
      kIgnoreCase);
}

// The singular name starting a word somewhere after the first '#'.
bool ContextualScanner::MentionsInComment(const std::string &line) const {
  const auto hash = line.find('#');
  if (hash == std::string::npos) {
    return false;
  }
  return FindWordStart(ToLowerAscii(line), lowered_singular_, hash + 1) !=
         std::string::npos;
}

std::vector<Evidence>
ContextualScanner::ScanFile(const std::string &path,
                            const std::vector<std::string> &lines,
                            FileCategory) const {
  std::vector<Evidence> evidence;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    const auto &line = lines[i];
    const auto line_number = static_cast<int>(i + 1);

    if (Contains(line, identifier_) && Contains(line, query_keyword_)) {
      evidence.push_back(MakeEvidence(path, line_number, target_.table, "",
                                      ReferenceKind::kContextualVariable,
                                      line, Confidence::kLow));
      continue;
    }
    if (MentionsInComment(line) && Contains(line, schema_keyword_)) {
      evidence.push_back(MakeEvidence(path, line_number, target_.table, "",
                                      ReferenceKind::kContextualComment, line,
                                      Confidence::kLow));
    }
  }
  return evidence;
}

} // namespace tabledep
