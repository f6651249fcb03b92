#include <tabledep/scanners/association_scanner.h>

#include <tabledep/inflector.h>

#include <optional>
#include <utility>

namespace tabledep {

std::string ResolveClassTable(const std::string &class_name,
                              const std::set<std::string> &known_tables) {
  if (class_name.empty()) {
    return "unknown";
  }
  const auto candidate = ClassNameToTableName(class_name);
  if (known_tables.empty() || known_tables.count(candidate) > 0) {
    return candidate;
  }

  for (auto separator = candidate.find('_'); separator != std::string::npos;
       separator = candidate.find('_', separator + 1)) {
    const auto tail = candidate.substr(separator + 1);
    if (known_tables.count(tail) > 0) {
      return tail;
    }
  }
  return candidate;
}

AssociationScanner::AssociationScanner(ScanTarget target,
                                       std::set<std::string> known_tables)
    : TargetedScanner(std::move(target)),
      known_tables_(std::move(known_tables)) {
  const auto singular = EscapeRegex(target_.singular);
  const auto table = EscapeRegex(target_.table);

  class_ = std::regex(R"re(class\s+(\w+(?:::\w+)*)\s*<)re");
  belongs_to_ =
      std::regex(R"re(belongs_to\s+:()re" + singular + R"re()\b)re");
  has_many_ = std::regex(R"re(has_many\s+:()re" + table + R"re()\b)re");
  has_one_ = std::regex(R"re(has_one\s+:()re" + singular + R"re()\b)re");
  indirect_ = std::regex(R"re(belongs_to\s+:(\w+).*class_name:\s*['"])re" +
                         EscapeRegex(target_.class_name) + R"re(['"])re");
  foreign_key_ = std::regex(R"re(foreign_key:\s*['"](\w+)['"])re");
  through_ = std::regex(R"re(has_many\s+:(\w+)\s*,.*through:\s*:()re" +
                        table + R"re()\b)re");
}

std::string
AssociationScanner::ForeignKeyOption(const std::string &line,
                                     const std::string &fallback) const {
  auto explicit_key = SearchGroup(line, foreign_key_, 1);
  if (explicit_key.empty()) {
    return fallback;
  }
  return explicit_key;
}

std::vector<Evidence>
AssociationScanner::ScanFile(const std::string &path,
                             const std::vector<std::string> &lines,
                             FileCategory) const {
  std::vector<Evidence> evidence;
  std::optional<std::string> current_class;

  for (std::size_t i = 0; i < lines.size(); ++i) {
    const auto &line = lines[i];
    const auto line_number = static_cast<int>(i + 1);

    std::smatch match;
    if (std::regex_search(line, match, class_)) {
      current_class = match[1].str();
    }

    const auto owner =
        current_class ? ResolveClassTable(*current_class, known_tables_)
                      : std::string("unknown");
    const auto owner_foreign_key = Singularize(owner) + "_id";

    // Join-table traversal: neither side's foreign key is named here.
    if (Contains(line, through_)) {
      evidence.push_back(MakeEvidence(
          path, line_number, owner, "", ReferenceKind::kModelHasManyThrough,
          line, Confidence::kMedium));
      continue;
    }

    if (std::regex_search(line, match, indirect_)) {
      evidence.push_back(MakeEvidence(
          path, line_number, owner,
          ForeignKeyOption(line, match[1].str() + "_id"),
          ReferenceKind::kModelIndirectAssociation, line,
          Confidence::kMedium));
      continue;
    }

    if (Contains(line, belongs_to_)) {
      evidence.push_back(MakeEvidence(
          path, line_number, owner,
          ForeignKeyOption(line, target_.foreign_key),
          ReferenceKind::kModelBelongsTo, line, Confidence::kHigh));
      continue;
    }

    if (Contains(line, has_many_)) {
      evidence.push_back(MakeEvidence(
          path, line_number, target_.table,
          ForeignKeyOption(line, owner_foreign_key),
          ReferenceKind::kModelHasManyReverse, line, Confidence::kHigh));
      continue;
    }

    if (Contains(line, has_one_)) {
      evidence.push_back(MakeEvidence(
          path, line_number, target_.table,
          ForeignKeyOption(line, owner_foreign_key),
          ReferenceKind::kModelHasOneReverse, line, Confidence::kHigh));
    }
  }
  return evidence;
}

} // namespace tabledep
