#include <tabledep/models.h>

#include <tabledep/inflector.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace tabledep {

std::string ConfidenceName(Confidence confidence) {
  switch (confidence) {
  case Confidence::kHigh:
    return "HIGH";
  case Confidence::kMedium:
    return "MEDIUM";
  case Confidence::kLow:
    return "LOW";
  }
  return "LOW";
}

Confidence ParseConfidence(const std::string &value) {
  std::string normalized = value;
  std::transform(
      normalized.begin(), normalized.end(), normalized.begin(),
      [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  if (normalized == "HIGH") {
    return Confidence::kHigh;
  }
  if (normalized == "MEDIUM") {
    return Confidence::kMedium;
  }
  if (normalized == "LOW") {
    return Confidence::kLow;
  }
  throw std::invalid_argument("Unknown confidence level: " + value +
                              " (expected HIGH, MEDIUM or LOW)");
}

int ConfidenceRank(Confidence confidence) {
  return static_cast<int>(confidence);
}

std::string ReferenceKindName(ReferenceKind kind) {
  switch (kind) {
  case ReferenceKind::kSchemaColumn:
    return "schema_column";
  case ReferenceKind::kSchemaReference:
    return "schema_reference";
  case ReferenceKind::kMigrationAddReference:
    return "migration_add_reference";
  case ReferenceKind::kMigrationAddColumn:
    return "migration_add_column";
  case ReferenceKind::kMigrationAddForeignKey:
    return "migration_add_foreign_key";
  case ReferenceKind::kMigrationCreateTableReference:
    return "migration_create_table_ref";
  case ReferenceKind::kMigrationRemove:
    return "migration_remove";
  case ReferenceKind::kModelBelongsTo:
    return "model_belongs_to";
  case ReferenceKind::kModelHasManyThrough:
    return "model_has_many_through";
  case ReferenceKind::kModelIndirectAssociation:
    return "model_indirect_association";
  case ReferenceKind::kModelHasManyReverse:
    return "model_has_many_reverse";
  case ReferenceKind::kModelHasOneReverse:
    return "model_has_one_reverse";
  case ReferenceKind::kRawSqlColumnReference:
    return "raw_sql_column_ref";
  case ReferenceKind::kRawSqlTableReference:
    return "raw_sql_table_ref";
  case ReferenceKind::kRawSqlJoin:
    return "raw_sql_join";
  case ReferenceKind::kRawSqlQueryMethod:
    return "raw_sql_query_method";
  case ReferenceKind::kRawSqlInterpolation:
    return "raw_sql_interpolation";
  case ReferenceKind::kConfigTableReference:
    return "config_table_ref";
  case ReferenceKind::kContextualVariable:
    return "contextual_variable";
  case ReferenceKind::kContextualComment:
    return "contextual_comment";
  case ReferenceKind::kPolymorphicSchema:
    return "polymorphic_schema";
  case ReferenceKind::kPolymorphicModel:
    return "polymorphic_model";
  }
  return "unknown";
}

bool IsReverseAssociation(ReferenceKind kind) {
  switch (kind) {
  case ReferenceKind::kModelHasManyReverse:
  case ReferenceKind::kModelHasOneReverse:
    return true;
  case ReferenceKind::kSchemaColumn:
  case ReferenceKind::kSchemaReference:
  case ReferenceKind::kMigrationAddReference:
  case ReferenceKind::kMigrationAddColumn:
  case ReferenceKind::kMigrationAddForeignKey:
  case ReferenceKind::kMigrationCreateTableReference:
  case ReferenceKind::kMigrationRemove:
  case ReferenceKind::kModelBelongsTo:
  case ReferenceKind::kModelHasManyThrough:
  case ReferenceKind::kModelIndirectAssociation:
  case ReferenceKind::kRawSqlColumnReference:
  case ReferenceKind::kRawSqlTableReference:
  case ReferenceKind::kRawSqlJoin:
  case ReferenceKind::kRawSqlQueryMethod:
  case ReferenceKind::kRawSqlInterpolation:
  case ReferenceKind::kConfigTableReference:
  case ReferenceKind::kContextualVariable:
  case ReferenceKind::kContextualComment:
  case ReferenceKind::kPolymorphicSchema:
  case ReferenceKind::kPolymorphicModel:
    return false;
  }
  return false;
}

std::string FileCategoryName(FileCategory category) {
  switch (category) {
  case FileCategory::kSchema:
    return "schema";
  case FileCategory::kMigration:
    return "migration";
  case FileCategory::kModel:
    return "model";
  case FileCategory::kOtherSource:
    return "ruby_other";
  case FileCategory::kRawSql:
    return "sql";
  case FileCategory::kTemplate:
    return "erb";
  case FileCategory::kConfig:
    return "yml";
  }
  return "unknown";
}

std::string ScanPhaseName(ScanPhase phase) {
  switch (phase) {
  case ScanPhase::kCollecting:
    return "collecting";
  case ScanPhase::kIndexingSchema:
    return "parsing_schema";
  case ScanPhase::kScanning:
    return "scanning";
  case ScanPhase::kPostProcessing:
    return "processing";
  }
  return "unknown";
}

const std::vector<std::string> *
LoadedSources::Find(const std::string &path) const {
  const auto found = lines_by_path.find(path);
  if (found == lines_by_path.end()) {
    return nullptr;
  }
  return &found->second;
}

ScanTarget MakeScanTarget(const std::string &table,
                          const std::string &foreign_key_override,
                          const std::string &primary_key) {
  ScanTarget target;
  target.table = table;
  target.singular = Singularize(table);
  if (!foreign_key_override.empty()) {
    target.foreign_key = foreign_key_override;
  } else if (!primary_key.empty()) {
    target.foreign_key = target.singular + "_" + primary_key;
  } else {
    target.foreign_key = target.singular + "_id";
  }
  target.class_name = TableNameToClassName(table);
  return target;
}

} // namespace tabledep
