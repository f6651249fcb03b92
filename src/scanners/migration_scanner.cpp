#include <tabledep/scanners/migration_scanner.h>

#include <optional>
#include <utility>

namespace tabledep {

MigrationScanner::MigrationScanner(ScanTarget target)
    : TargetedScanner(std::move(target)) {
  const auto singular = EscapeRegex(target_.singular);
  const auto table = EscapeRegex(target_.table);
  const auto foreign_key = EscapeRegex(target_.foreign_key);

  create_table_ = std::regex(R"re(create_table\s+[:"](\w+))re");
  add_reference_ =
      std::regex(R"re(add_reference\s+:(\w+)\s*,\s*:()re" + singular +
                 R"re()\b)re");
  add_column_ = std::regex(R"re(add_column\s+:(\w+)\s*,\s*:()re" +
                           foreign_key + R"re()\s*,)re");
  add_foreign_key_ =
      std::regex(R"re(add_foreign_key\s+:(\w+)\s*,\s*:()re" + table +
                 R"re()\b)re");
  inline_reference_ =
      std::regex(R"re(t\.references\s+:()re" + singular + R"re()\b)re");
  remove_reference_ =
      std::regex(R"re(remove_reference\s+:(\w+)\s*,\s*:()re" + singular +
                 R"re()\b)re");
  remove_column_ = std::regex(R"re(remove_column\s+:(\w+)\s*,\s*:()re" +
                              foreign_key + R"re()\b)re");
}

std::vector<Evidence>
MigrationScanner::ScanFile(const std::string &path,
                           const std::vector<std::string> &lines,
                           FileCategory) const {
  std::vector<Evidence> evidence;
  // Migrations nest blocks freely, so the table context is only replaced by
  // the next create_table and never closed by `end`.
  std::optional<std::string> current_table;

  const auto emit = [&](int line_number, std::string table,
                        ReferenceKind kind, const std::string &line,
                        Confidence confidence) {
    evidence.push_back(MakeEvidence(path, line_number, std::move(table),
                                    target_.foreign_key, kind, line,
                                    confidence));
  };

  for (std::size_t i = 0; i < lines.size(); ++i) {
    const auto &line = lines[i];
    const auto line_number = static_cast<int>(i + 1);

    std::smatch match;
    if (std::regex_search(line, match, create_table_)) {
      current_table = match[1].str();
    }

    if (std::regex_search(line, match, add_reference_)) {
      emit(line_number, match[1].str(), ReferenceKind::kMigrationAddReference,
           line, Confidence::kHigh);
      continue;
    }
    if (std::regex_search(line, match, add_column_)) {
      emit(line_number, match[1].str(), ReferenceKind::kMigrationAddColumn,
           line, Confidence::kHigh);
      continue;
    }
    if (std::regex_search(line, match, add_foreign_key_)) {
      emit(line_number, match[1].str(),
           ReferenceKind::kMigrationAddForeignKey, line, Confidence::kHigh);
      continue;
    }
    if (Contains(line, inline_reference_)) {
      emit(line_number, current_table.value_or("unknown"),
           ReferenceKind::kMigrationCreateTableReference, line,
           Confidence::kHigh);
      continue;
    }
    if (std::regex_search(line, match, remove_reference_) ||
        std::regex_search(line, match, remove_column_)) {
      emit(line_number, match[1].str(), ReferenceKind::kMigrationRemove, line,
           Confidence::kMedium);
    }
  }
  return evidence;
}

} // namespace tabledep
