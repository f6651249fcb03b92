#include <tabledep/scanners/schema_scanner.h>

#include <optional>
#include <utility>

namespace tabledep {

SchemaScanner::SchemaScanner(ScanTarget target)
    : TargetedScanner(std::move(target)),
      create_table_(R"re(create_table\s+"(\w+)")re"),
      column_(R"re(t\.(integer|bigint|references)\s+"?:?()re" +
              EscapeRegex(target_.singular) + R"re((?:_id)?)"?)re"),
      reference_(R"re(t\.references\s+:()re" + EscapeRegex(target_.singular) +
                 R"re()\b)re") {}

std::vector<Evidence>
SchemaScanner::ScanFile(const std::string &path,
                        const std::vector<std::string> &lines,
                        FileCategory) const {
  std::vector<Evidence> evidence;
  std::optional<std::string> current_table;

  for (std::size_t i = 0; i < lines.size(); ++i) {
    const auto &line = lines[i];
    const auto line_number = static_cast<int>(i + 1);

    std::smatch match;
    if (std::regex_search(line, match, create_table_)) {
      current_table = match[1].str();
    }
    const auto table = current_table.value_or("unknown");

    if (Contains(line, reference_)) {
      evidence.push_back(MakeEvidence(path, line_number, table,
                                      target_.foreign_key,
                                      ReferenceKind::kSchemaReference, line,
                                      Confidence::kHigh));
      continue;
    }

    if (!std::regex_search(line, match, column_)) {
      continue;
    }
    if (match[1].str() == "references") {
      continue;
    }
    auto column = match[2].str();
    if (column == target_.singular) {
      column = target_.foreign_key;
    }
    evidence.push_back(MakeEvidence(path, line_number, table,
                                    std::move(column),
                                    ReferenceKind::kSchemaColumn, line,
                                    Confidence::kHigh));
  }
  return evidence;
}

} // namespace tabledep
