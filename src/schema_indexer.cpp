#include <tabledep/schema_indexer.h>

#include <optional>
#include <regex>
#include <utility>

namespace tabledep {

namespace {

const std::regex &CreateTablePattern() {
  static const std::regex pattern(R"re(create_table\s+"(\w+)")re");
  return pattern;
}

const std::regex &ColumnPattern() {
  static const std::regex pattern(R"(\bt\.(\w+)\s+[":](\w+))");
  return pattern;
}

bool IsIgnoredDeclaration(const std::string &declaration) {
  return declaration == "index" || declaration == "timestamps" ||
         declaration == "primary_key";
}

} // namespace

void IndexSchemaLines(const std::vector<std::string> &lines,
                      SchemaIndex &index) {
  std::optional<std::string> current_table;
  for (const auto &line : lines) {
    std::smatch match;
    if (std::regex_search(line, match, CreateTablePattern())) {
      current_table = match[1].str();
      index.known_tables.insert(*current_table);
      index.columns[*current_table];
      continue;
    }
    if (!current_table) {
      continue;
    }
    if (!std::regex_search(line, match, ColumnPattern())) {
      continue;
    }

    const auto declaration = match[1].str();
    const auto name = match[2].str();
    if (IsIgnoredDeclaration(declaration)) {
      continue;
    }

    auto &columns = index.columns[*current_table];
    if (declaration == "references") {
      columns[name + "_id"] = "bigint";
      if (line.find("polymorphic:") != std::string::npos) {
        columns[name + "_type"] = "string";
      }
      continue;
    }
    columns[name] = declaration;
  }
}

RailsSchemaIndexer::RailsSchemaIndexer(std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {}

SchemaIndex RailsSchemaIndexer::BuildIndex(const CategorizedFiles &files,
                                           const LoadedSources &sources) {
  SchemaIndex index;
  const auto schema_files = files.find(FileCategory::kSchema);
  if (schema_files == files.end()) {
    logger_->Log(LogLevel::kInfo, "No schema definition found; validation "
                                  "will pass evidence through");
    return index;
  }

  for (const auto &path : schema_files->second) {
    const auto *lines = sources.Find(path);
    if (lines == nullptr) {
      continue;
    }
    IndexSchemaLines(*lines, index);
  }

  std::size_t column_count = 0;
  for (const auto &[table, columns] : index.columns) {
    column_count += columns.size();
  }
  logger_->Log(LogLevel::kInfo, "Indexed schema",
               {{"tables", std::to_string(index.known_tables.size())},
                {"columns", std::to_string(column_count)}});
  return index;
}

} // namespace tabledep
