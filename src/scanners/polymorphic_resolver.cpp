#include <tabledep/scanners/polymorphic_resolver.h>

#include <algorithm>
#include <map>
#include <optional>
#include <regex>
#include <set>
#include <utility>

namespace tabledep {

namespace {

const std::vector<FileCategory> &CorroborationCategories() {
  static const std::vector<FileCategory> kCategories = {
      FileCategory::kModel, FileCategory::kOtherSource, FileCategory::kTemplate,
      FileCategory::kRawSql, FileCategory::kMigration};
  return kCategories;
}

const std::vector<std::string> &FilesOf(const CategorizedFiles &files,
                                        FileCategory category) {
  static const std::vector<std::string> kNone;
  const auto it = files.find(category);
  return it == files.end() ? kNone : it->second;
}

struct IdColumn {
  int line = 0;
  std::string text;
};

// Column declarations seen inside one create_table block.
struct TableBlock {
  std::string table;
  std::vector<std::string> type_prefixes;
  std::map<std::string, IdColumn> id_columns;
};

void RecordPair(std::vector<PolymorphicPair> &pairs, PolymorphicPair pair) {
  const auto existing =
      std::find_if(pairs.begin(), pairs.end(), [&](const auto &candidate) {
        return candidate.table == pair.table && candidate.prefix == pair.prefix;
      });
  if (existing != pairs.end()) {
    *existing = std::move(pair);
    return;
  }
  pairs.push_back(std::move(pair));
}

void FlushBlock(const std::string &path, const TableBlock &block,
                std::vector<PolymorphicPair> &pairs) {
  for (const auto &prefix : block.type_prefixes) {
    const auto id = block.id_columns.find(prefix);
    if (id == block.id_columns.end()) {
      continue;
    }
    RecordPair(pairs, PolymorphicPair{path, block.table, prefix,
                                      id->second.line, id->second.text});
  }
}

void AddTypePrefix(TableBlock &block, const std::string &prefix) {
  if (std::find(block.type_prefixes.begin(), block.type_prefixes.end(),
                prefix) == block.type_prefixes.end()) {
    block.type_prefixes.push_back(prefix);
  }
}

} // namespace

std::vector<PolymorphicPair>
CollectPolymorphicPairs(const ScanTarget &target, const CategorizedFiles &files,
                        const LoadedSources &sources) {
  const std::regex create_table(R"re(create_table\s+"(\w+)")re");
  const std::regex type_column(R"re(t\.string\s+"(\w+)_type")re");
  const std::regex id_column(R"re(t\.(integer|bigint)\s+"(\w+)_id")re");
  const std::regex polymorphic_reference(
      R"re(t\.references\s+[":](\w+)"?\s*,.*polymorphic:\s*true)re");

  std::vector<PolymorphicPair> pairs;
  for (const auto &path : FilesOf(files, FileCategory::kSchema)) {
    const auto *lines = sources.Find(path);
    if (lines == nullptr) {
      continue;
    }

    std::optional<TableBlock> block;
    for (std::size_t i = 0; i < lines->size(); ++i) {
      const auto &line = (*lines)[i];
      const auto line_number = static_cast<int>(i + 1);

      std::smatch match;
      if (std::regex_search(line, match, create_table)) {
        if (block) {
          FlushBlock(path, *block, pairs);
        }
        block = TableBlock{match[1].str(), {}, {}};
        continue;
      }
      if (!block || block->table == target.table) {
        continue;
      }

      if (std::regex_search(line, match, polymorphic_reference)) {
        const auto prefix = match[1].str();
        AddTypePrefix(*block, prefix);
        block->id_columns[prefix] = IdColumn{line_number, MakeSnippet(line)};
        continue;
      }
      if (std::regex_search(line, match, type_column)) {
        AddTypePrefix(*block, match[1].str());
      }
      if (std::regex_search(line, match, id_column)) {
        block->id_columns[match[2].str()] =
            IdColumn{line_number, MakeSnippet(line)};
      }
    }
    if (block) {
      FlushBlock(path, *block, pairs);
    }
  }
  return pairs;
}

std::vector<Evidence> ResolvePolymorphicPairs(const ScanTarget &target,
                                              const CategorizedFiles &files,
                                              const LoadedSources &sources) {
  const auto pairs = CollectPolymorphicPairs(target, files, sources);
  if (pairs.empty()) {
    return {};
  }

  const std::regex inverse_declaration(
      R"re((?:has_many|has_one)\s+:()re" + EscapeRegex(target.table) + "|" +
      EscapeRegex(target.singular) + R"re()\s*,.*as:\s*:(\w+))re");

  std::set<std::string> confirmed;
  for (const auto &path : FilesOf(files, FileCategory::kModel)) {
    const auto *lines = sources.Find(path);
    if (lines == nullptr) {
      continue;
    }
    for (const auto &line : *lines) {
      std::smatch match;
      if (std::regex_search(line, match, inverse_declaration)) {
        confirmed.insert(match[2].str());
      }
    }
  }

  std::set<std::string> unconfirmed;
  for (const auto &pair : pairs) {
    if (confirmed.count(pair.prefix) == 0) {
      unconfirmed.insert(pair.prefix);
    }
  }

  std::set<std::string> corroborated;
  for (const auto category : CorroborationCategories()) {
    for (const auto &path : FilesOf(files, category)) {
      if (unconfirmed.empty()) {
        break;
      }
      const auto *lines = sources.Find(path);
      if (lines == nullptr) {
        continue;
      }
      for (const auto &line : *lines) {
        if (unconfirmed.empty()) {
          break;
        }
        if (line.find(target.class_name) == std::string::npos) {
          continue;
        }
        for (auto it = unconfirmed.begin(); it != unconfirmed.end();) {
          if (line.find(*it + "_type") != std::string::npos) {
            corroborated.insert(*it);
            it = unconfirmed.erase(it);
          } else {
            ++it;
          }
        }
      }
    }
  }

  std::vector<Evidence> evidence;
  for (const auto &pair : pairs) {
    const auto column = pair.prefix + "_id";
    if (confirmed.count(pair.prefix) > 0) {
      evidence.push_back(MakeEvidence(
          pair.schema_path, pair.id_line, pair.table, column,
          ReferenceKind::kPolymorphicModel, pair.id_line_text,
          Confidence::kHigh));
    } else if (corroborated.count(pair.prefix) > 0) {
      evidence.push_back(MakeEvidence(
          pair.schema_path, pair.id_line, pair.table, column,
          ReferenceKind::kPolymorphicSchema, pair.id_line_text,
          Confidence::kMedium));
    }
  }
  return evidence;
}

std::vector<Evidence>
PolymorphicResolver::ScanFile(const std::string &,
                              const std::vector<std::string> &,
                              FileCategory) const {
  return {};
}

std::vector<Evidence>
PolymorphicResolver::ScanAll(const CategorizedFiles &files,
                             const LoadedSources &sources) const {
  return ResolvePolymorphicPairs(target_, files, sources);
}

} // namespace tabledep
