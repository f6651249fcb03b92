#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <vector>

namespace tabledep {

enum class Confidence { kLow = 0, kMedium = 1, kHigh = 2 };

// Closed taxonomy of the patterns that produce evidence. Consumers switch
// over it without a default branch so that new kinds fail to compile until
// every consumer handles them.
enum class ReferenceKind {
  kSchemaColumn,
  kSchemaReference,
  kMigrationAddReference,
  kMigrationAddColumn,
  kMigrationAddForeignKey,
  kMigrationCreateTableReference,
  kMigrationRemove,
  kModelBelongsTo,
  kModelHasManyThrough,
  kModelIndirectAssociation,
  kModelHasManyReverse,
  kModelHasOneReverse,
  kRawSqlColumnReference,
  kRawSqlTableReference,
  kRawSqlJoin,
  kRawSqlQueryMethod,
  kRawSqlInterpolation,
  kConfigTableReference,
  kContextualVariable,
  kContextualComment,
  kPolymorphicSchema,
  kPolymorphicModel,
};

enum class FileCategory {
  kSchema,
  kMigration,
  kModel,
  kOtherSource,
  kRawSql,
  kTemplate,
  kConfig,
};

enum class ValidationMode { kLenient, kStrict };

std::string ConfidenceName(Confidence confidence);
Confidence ParseConfidence(const std::string &value);
int ConfidenceRank(Confidence confidence);

std::string ReferenceKindName(ReferenceKind kind);
bool IsReverseAssociation(ReferenceKind kind);

std::string FileCategoryName(FileCategory category);

struct Evidence {
  std::string file_path;
  int line_number = 0;
  std::string table_name;
  std::string column_name;
  ReferenceKind kind = ReferenceKind::kContextualVariable;
  std::string snippet;
  Confidence confidence = Confidence::kLow;
  bool schema_verified = true;
  std::optional<std::string> column_datatype;

  using Key = std::tuple<std::string, int, ReferenceKind>;
  Key IdentityKey() const { return {file_path, line_number, kind}; }
};

using CategorizedFiles = std::map<FileCategory, std::vector<std::string>>;

struct LoadedSources {
  std::map<std::string, std::vector<std::string>> lines_by_path;

  const std::vector<std::string> *Find(const std::string &path) const;
};

struct SchemaIndex {
  std::set<std::string> known_tables;
  std::map<std::string, std::map<std::string, std::string>> columns;
};

struct ScanTarget {
  std::string table;
  std::string singular;
  std::string foreign_key;
  std::string class_name;
};

ScanTarget MakeScanTarget(const std::string &table,
                          const std::string &foreign_key_override = "",
                          const std::string &primary_key = "");

enum class ScanPhase { kCollecting, kIndexingSchema, kScanning, kPostProcessing };

std::string ScanPhaseName(ScanPhase phase);

using ProgressObserver =
    std::function<void(ScanPhase phase, const std::string &detail)>;
using CancellationPredicate = std::function<bool()>;

struct ScanRequest {
  std::string root_path;
  std::string table_name;
  std::string foreign_key;
  std::string primary_key;
  Confidence min_confidence = Confidence::kLow;
  ValidationMode validation = ValidationMode::kLenient;
  ProgressObserver on_progress;
  CancellationPredicate is_cancelled;
};

struct ScanStatistics {
  std::size_t total_files_scanned = 0;
  std::size_t raw_hits = 0;
  std::size_t after_dedup = 0;
  std::size_t after_validation = 0;
  std::size_t after_filter = 0;
  std::map<std::string, std::size_t> scanner_hits;
};

enum class ScanStatus { kCompleted, kCancelled };

struct ScanOutcome {
  ScanStatus status = ScanStatus::kCompleted;
  std::vector<Evidence> evidence;
  ScanStatistics statistics;
};

struct ReportConfig {
  std::string root_path;
  std::string table_name;
  Confidence min_confidence = Confidence::kLow;
  std::vector<std::string> formats;
};

struct Report {
  std::string csv;
  std::string markdown;
  std::string json;
};

} // namespace tabledep
